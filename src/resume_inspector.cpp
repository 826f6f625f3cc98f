#include "gator/resume_inspector.hpp"
#include "gator/completion_record.hpp"
#include "gator/error.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace gator {

ResumePlan ResumeInspector::freshPlan(std::vector<Segment> plan) {
    ResumePlan result;
    for (auto& segment : plan) {
        segment.state = SegmentState::pending;
    }
    result.pending = plan;
    result.segments = std::move(plan);
    return result;
}

ResumePlan ResumeInspector::inspect(const std::filesystem::path& destination,
                                    std::vector<Segment> plan,
                                    const std::optional<Fingerprint>& fingerprint) const {
    const auto record_path = CompletionRecord::pathFor(destination);

    if (!fingerprint) {
        CompletionRecord::discard(record_path);
        return freshPlan(std::move(plan));
    }

    std::error_code ec;
    const auto existing_size = std::filesystem::file_size(destination, ec);
    if (ec || existing_size != fingerprint->total_size) {
        if (std::filesystem::exists(record_path, ec)) {
            spdlog::info("Output {} does not match the recorded download, starting over",
                         destination.string());
        }
        CompletionRecord::discard(record_path);
        return freshPlan(std::move(plan));
    }

    const auto contents = CompletionRecord::load(record_path);
    if (!contents) {
        CompletionRecord::discard(record_path);
        return freshPlan(std::move(plan));
    }

    // A record written for a differently shaped plan cannot vouch for any
    // segment of this one, even where the ids overlap.
    bool ids_known = contents->fingerprint.segment_count == plan.size();
    for (const auto id : contents->done) {
        if (id >= plan.size()) {
            ids_known = false;
            break;
        }
    }

    if (contents->fingerprint != *fingerprint || !ids_known) {
        spdlog::warn("{}: download changed since the last attempt (size {} -> {}, validator '{}' -> '{}', "
                     "segments {} -> {}), discarding {} completed segments",
                     toString(ErrorKind::resume_fingerprint_mismatch),
                     contents->fingerprint.total_size,
                     fingerprint->total_size,
                     contents->fingerprint.validator,
                     fingerprint->validator,
                     contents->fingerprint.segment_count,
                     plan.size(),
                     contents->done.size());
        CompletionRecord::discard(record_path);
        return freshPlan(std::move(plan));
    }

    ResumePlan result;
    result.resumed = true;
    for (auto& segment : plan) {
        if (contents->done.count(segment.id) != 0) {
            segment.state = SegmentState::done;
            result.resumed_bytes += segment.size().value_or(0);
        } else {
            segment.state = SegmentState::pending;
            result.pending.push_back(segment);
        }
    }
    result.segments = std::move(plan);

    spdlog::info("Resuming {}: {} of {} segments already complete",
                 destination.string(),
                 result.segments.size() - result.pending.size(),
                 result.segments.size());
    return result;
}

} // namespace gator
