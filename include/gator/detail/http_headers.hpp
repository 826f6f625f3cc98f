#pragma once

#include "gator/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gator::detail {

[[nodiscard]] std::string toLower(std::string_view text);
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view text) noexcept;

// Feeds one raw header line as delivered by libcurl. A status line starts a
// new response (redirect hops) and clears what was collected so far.
void parseHeaderLine(std::string_view line, Headers& headers);

struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> complete_length;
};

// "bytes <first>-<last>/<length|*>"
[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value) noexcept;

[[nodiscard]] bool acceptsByteRanges(const Headers& headers);

// Strong ETag, else Last-Modified, else empty. Weak ETags do not guarantee
// byte-identical content and are skipped.
[[nodiscard]] std::string selectValidator(const Headers& headers);

} // namespace gator::detail
