#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace gator {

enum class SegmentState {
    pending,
    in_flight,
    done,
    failed,
};

[[nodiscard]] std::string_view toString(SegmentState state) noexcept;

struct Segment {
    std::uint32_t id{0};
    std::uint64_t start{0};
    // Inclusive. Empty for the single unbounded segment of a resource whose
    // length is unknown.
    std::optional<std::uint64_t> end;
    SegmentState state{SegmentState::pending};

    [[nodiscard]] bool bounded() const noexcept { return end.has_value(); }

    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept {
        if (!end) {
            return std::nullopt;
        }
        return *end - start + 1;
    }
};

} // namespace gator
