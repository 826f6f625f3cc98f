#pragma once

#include "download_job.hpp"
#include "segment.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace gator {

class SegmentPlanner {
public:
    SegmentPlanner(std::uint64_t segment_size = kDefaultSegmentSize,
                   std::uint64_t small_file_threshold = kDefaultSmallFileThreshold);

    // Segments are returned Pending, in ascending offset order, and tile
    // [0, total_size) exactly.
    [[nodiscard]] std::vector<Segment> plan(std::optional<std::uint64_t> total_size,
                                            bool supports_ranges) const;

    [[nodiscard]] std::vector<Segment> plan(const DownloadJob& job) const {
        return plan(job.totalSize(), job.supportsRanges());
    }

    [[nodiscard]] std::uint64_t segmentSize() const noexcept { return segment_size_; }

private:
    std::uint64_t segment_size_;
    std::uint64_t small_file_threshold_;
};

} // namespace gator
