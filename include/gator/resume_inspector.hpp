#pragma once

#include "download_job.hpp"
#include "segment.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace gator {

struct ResumePlan {
    // Full plan with Done marked, used for final validation.
    std::vector<Segment> segments;
    // Segments still requiring work, ascending offset order.
    std::vector<Segment> pending;
    // True when a prior completion record matched the current resource.
    bool resumed{false};
    std::uint64_t resumed_bytes{0};
};

class ResumeInspector {
public:
    [[nodiscard]] ResumePlan inspect(const std::filesystem::path& destination,
                                     std::vector<Segment> plan,
                                     const std::optional<Fingerprint>& fingerprint) const;

private:
    [[nodiscard]] static ResumePlan freshPlan(std::vector<Segment> plan);
};

} // namespace gator
