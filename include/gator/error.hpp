#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace gator {

enum class ErrorKind {
    network,
    http_status,
    range_mismatch,
    disk,
    resume_fingerprint_mismatch,
    cancelled,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

// Network and HTTP status failures may succeed on another attempt; everything
// else repeats deterministically or is job-fatal.
[[nodiscard]] constexpr bool isRetryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::network || kind == ErrorKind::http_status;
}

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace gator
