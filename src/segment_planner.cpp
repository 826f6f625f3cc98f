#include "gator/segment_planner.hpp"

#include <limits>
#include <stdexcept>

namespace gator {

std::string_view toString(SegmentState state) noexcept {
    switch (state) {
    case SegmentState::pending:
        return "pending";
    case SegmentState::in_flight:
        return "in-flight";
    case SegmentState::done:
        return "done";
    case SegmentState::failed:
        return "failed";
    }
    return "unknown";
}

SegmentPlanner::SegmentPlanner(std::uint64_t segment_size, std::uint64_t small_file_threshold)
    : segment_size_(segment_size), small_file_threshold_(small_file_threshold) {
    if (segment_size_ == 0) {
        throw std::invalid_argument("segment size must be positive");
    }
}

std::vector<Segment> SegmentPlanner::plan(std::optional<std::uint64_t> total_size,
                                          bool supports_ranges) const {
    std::vector<Segment> segments;

    // Nothing to tile: stream whatever the server sends.
    if (!total_size || *total_size == 0) {
        segments.push_back(Segment{0, 0, std::nullopt, SegmentState::pending});
        return segments;
    }

    const std::uint64_t total = *total_size;
    if (!supports_ranges || total < small_file_threshold_) {
        segments.push_back(Segment{0, 0, total - 1, SegmentState::pending});
        return segments;
    }

    const std::uint64_t count = (total + segment_size_ - 1) / segment_size_;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("segment size too small for resource length");
    }
    segments.reserve(static_cast<std::size_t>(count));

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t end = (i == count - 1) ? total - 1 : offset + segment_size_ - 1;
        segments.push_back(Segment{static_cast<std::uint32_t>(i), offset, end, SegmentState::pending});
        offset = end + 1;
    }

    return segments;
}

} // namespace gator
