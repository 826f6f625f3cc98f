#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace gator {

inline constexpr std::uint64_t kDefaultSegmentSize = 1024 * 1024;
inline constexpr std::uint64_t kDefaultSmallFileThreshold = 10 * 1024 * 1024;

struct JobConfig {
    std::uint64_t segment_size{kDefaultSegmentSize};
    std::uint64_t small_file_threshold{kDefaultSmallFileThreshold};
    // 0 selects max(16, hardware_concurrency * 4).
    std::size_t worker_count{0};
    int max_attempts{3};
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds attempt_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(15)};
    std::chrono::seconds low_speed_time{30};
    bool keep_partial{true};
};

[[nodiscard]] std::size_t defaultWorkerCount() noexcept;

// Identifies the remote content and the plan a completion record was
// written against. Segment ids only mean the same bytes when every field,
// including the number of planned segments, matches.
struct Fingerprint {
    std::string url;
    std::uint64_t total_size{0};
    std::uint64_t segment_size{0};
    std::string validator;
    std::uint32_t segment_count{0};

    friend bool operator==(const Fingerprint& lhs, const Fingerprint& rhs) {
        return lhs.url == rhs.url && lhs.total_size == rhs.total_size &&
               lhs.segment_size == rhs.segment_size && lhs.validator == rhs.validator &&
               lhs.segment_count == rhs.segment_count;
    }
    friend bool operator!=(const Fingerprint& lhs, const Fingerprint& rhs) { return !(lhs == rhs); }
};

class DownloadJob {
public:
    DownloadJob(std::string url,
                std::filesystem::path destination,
                std::optional<std::uint64_t> total_size,
                bool supports_ranges,
                std::uint64_t segment_size,
                std::string validator = {})
        : url_(std::move(url)),
          destination_(std::move(destination)),
          total_size_(total_size),
          supports_ranges_(supports_ranges),
          segment_size_(segment_size),
          validator_(std::move(validator)) {}

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] std::optional<std::uint64_t> totalSize() const noexcept { return total_size_; }
    [[nodiscard]] bool supportsRanges() const noexcept { return supports_ranges_; }
    [[nodiscard]] std::uint64_t segmentSize() const noexcept { return segment_size_; }
    [[nodiscard]] const std::string& validator() const noexcept { return validator_; }

    // A resource of unknown length cannot be resumed. `segment_count` is
    // the size of the plan the record will describe.
    [[nodiscard]] std::optional<Fingerprint> fingerprint(std::uint32_t segment_count = 0) const {
        if (!total_size_) {
            return std::nullopt;
        }
        return Fingerprint{url_, *total_size_, segment_size_, validator_, segment_count};
    }

private:
    std::string url_;
    std::filesystem::path destination_;
    std::optional<std::uint64_t> total_size_;
    bool supports_ranges_;
    std::uint64_t segment_size_;
    std::string validator_;
};

} // namespace gator
