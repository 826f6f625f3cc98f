#include "gator/detail/http_headers.hpp"

#include <cctype>
#include <charconv>

namespace gator::detail {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    for (auto& ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return lowered;
}

std::string_view trim(std::string_view text) noexcept {
    const auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint64_t> parseUnsigned(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

void parseHeaderLine(std::string_view line, Headers& headers) {
    line = trim(line);
    if (line.empty()) {
        return;
    }
    if (line.substr(0, 5) == "HTTP/") {
        headers.clear();
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return;
    }
    headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
}

std::optional<ContentRange> parseContentRange(std::string_view value) noexcept {
    value = trim(value);
    constexpr std::string_view unit = "bytes ";
    if (value.size() <= unit.size() || value.substr(0, unit.size()) != unit) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    const auto first = parseUnsigned(value.substr(0, dash));
    const auto last = parseUnsigned(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last = *last;

    const auto length = trim(value.substr(slash + 1));
    if (length != "*") {
        range.complete_length = parseUnsigned(length);
        if (!range.complete_length) {
            return std::nullopt;
        }
    }
    return range;
}

bool acceptsByteRanges(const Headers& headers) {
    const auto it = headers.find("accept-ranges");
    return it != headers.end() && toLower(trim(it->second)) == "bytes";
}

std::string selectValidator(const Headers& headers) {
    const auto etag = headers.find("etag");
    if (etag != headers.end() && !etag->second.empty() && etag->second.rfind("W/", 0) != 0) {
        return etag->second;
    }
    const auto modified = headers.find("last-modified");
    if (modified != headers.end()) {
        return modified->second;
    }
    return {};
}

} // namespace gator::detail
