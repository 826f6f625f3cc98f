#include "gator/job_coordinator.hpp"
#include "gator/completion_record.hpp"
#include "gator/file_preallocator.hpp"
#include "gator/resume_inspector.hpp"
#include "gator/segment_planner.hpp"
#include "gator/segment_queue.hpp"
#include "gator/worker_pool.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gator {

std::string_view toString(JobState state) noexcept {
    switch (state) {
    case JobState::idle:
        return "idle";
    case JobState::planning:
        return "planning";
    case JobState::resuming:
        return "resuming";
    case JobState::preallocating:
        return "preallocating";
    case JobState::downloading:
        return "downloading";
    case JobState::finalizing:
        return "finalizing";
    case JobState::succeeded:
        return "succeeded";
    case JobState::failed:
        return "failed";
    }
    return "unknown";
}

JobCoordinator::JobCoordinator(TransportPtr transport, ProgressSinkPtr progress, JobConfig config)
    : transport_(std::move(transport)),
      progress_(progress ? std::move(progress) : std::make_shared<NullProgressSink>()),
      config_(config) {}

DownloadJob JobCoordinator::describe(const std::string& url,
                                     const std::filesystem::path& destination,
                                     const ResourceInfo& info,
                                     const JobConfig& config) {
    return DownloadJob{url, destination, info.total_size, info.supports_ranges, config.segment_size,
                       info.validator};
}

JobOutcome JobCoordinator::run(const std::string& url, const std::filesystem::path& destination) {
    ResourceInfo info;
    try {
        info = transport_->probe(url);
    } catch (const DownloadError& ex) {
        spdlog::error("Probe of {} failed: {}", url, ex.what());
        transition(JobState::failed);
        return JobOutcome::failure(ex.kind(), ex.what());
    }
    return run(describe(url, destination, info, config_));
}

JobOutcome JobCoordinator::run(const DownloadJob& job) {
    if (cancellation_.isCancelled()) {
        transition(JobState::failed);
        return JobOutcome::failure(ErrorKind::cancelled, "Download cancelled");
    }

    transition(JobState::planning);
    const SegmentPlanner planner(job.segmentSize(), config_.small_file_threshold);
    auto plan = planner.plan(job);
    const bool ranged = plan.size() > 1;

    transition(JobState::resuming);
    const auto fingerprint = job.fingerprint(static_cast<std::uint32_t>(plan.size()));
    ResumePlan resume = ResumeInspector{}.inspect(job.destination(), std::move(plan), fingerprint);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        segments_ = resume.segments;
    }

    transition(JobState::preallocating);
    CompletionRecord record(CompletionRecord::pathFor(job.destination()));
    try {
        FilePreallocator{}.preallocate(job.destination(), job.totalSize());
        if (fingerprint) {
            if (resume.resumed) {
                record.reopen();
            } else {
                record.create(*fingerprint);
            }
        }
    } catch (const DownloadError& ex) {
        return fail(job, ex.kind(), ex.what());
    }

    transition(JobState::downloading);
    progress_->onPlanned(resume.segments.size(), resume.pending.size(),
                         WorkerPool::poolSize(config_.worker_count, resume.pending.size()));
    progress_->onJobStarted(job.totalSize(), resume.resumed_bytes);

    if (!resume.pending.empty()) {
        SegmentQueue queue(resume.pending);

        WorkerPool::Callbacks callbacks;
        callbacks.on_started = [this](const Segment& segment) {
            setSegmentState(segment.id, SegmentState::in_flight);
        };
        callbacks.on_done = [this, &record, &fingerprint](const Segment& segment) {
            // Single serialization point for the record.
            std::lock_guard<std::mutex> lock(mutex_);
            if (fingerprint) {
                record.markDone(segment.id);
            }
            segments_[segment.id].state = SegmentState::done;
        };
        callbacks.on_failed = [this, &queue](const Segment& segment, const DownloadError& error) {
            setSegmentState(segment.id, SegmentState::failed);
            if (error.kind() != ErrorKind::cancelled) {
                spdlog::error("Segment {} failed: {}", segment.id, error.what());
                recordFirstError(error.kind(), error.what());
            }
            queue.close();
            cancellation_.cancel();
        };

        WorkerPool pool(transport_, progress_, config_);
        pool.run(job, queue, ranged, cancellation_, callbacks);
        worker_count_ = pool.lastWorkerCount();
    }

    transition(JobState::finalizing);
    const auto incomplete = incompleteSegments();
    if (!incomplete.empty()) {
        ErrorKind kind = ErrorKind::cancelled;
        std::string message = "Download cancelled";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (first_error_) {
                kind = *first_error_;
                message = first_error_message_;
            }
        }
        return fail(job, kind, message);
    }

    if (const auto total = job.totalSize()) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(job.destination(), ec);
        if (ec || size != *total) {
            return fail(job, ErrorKind::disk,
                        fmt::format("Output {} has {} bytes, expected {}", job.destination().string(),
                                    ec ? 0 : size, *total));
        }
    }

    record.remove();
    progress_->onJobFinished(true);
    transition(JobState::succeeded);
    spdlog::info("Download of {} complete", job.destination().string());
    return JobOutcome::succeeded();
}

void JobCoordinator::cancel() {
    spdlog::info("Cancellation requested");
    cancellation_.cancel();
}

std::vector<Segment> JobCoordinator::segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_;
}

void JobCoordinator::transition(JobState next) {
    const JobState previous = state_.exchange(next, std::memory_order_acq_rel);
    spdlog::debug("Job state {} -> {}", toString(previous), toString(next));
}

JobOutcome JobCoordinator::fail(const DownloadJob& job, ErrorKind kind, std::string message) {
    cancellation_.cancel();
    auto incomplete = incompleteSegments();

    if (!config_.keep_partial) {
        CompletionRecord::discard(CompletionRecord::pathFor(job.destination()));
        std::error_code ec;
        std::filesystem::remove(job.destination(), ec);
        if (ec) {
            spdlog::warn("Cannot remove partial file {}: {}", job.destination().string(), ec.message());
        }
    }

    spdlog::error("Download of {} failed ({}): {}; {} segments incomplete",
                  job.url(), toString(kind), message, incomplete.size());
    progress_->onJobFinished(false);
    transition(JobState::failed);
    return JobOutcome::failure(kind, std::move(message), std::move(incomplete));
}

void JobCoordinator::setSegmentState(std::uint32_t id, SegmentState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id < segments_.size()) {
        segments_[id].state = state;
    }
}

void JobCoordinator::recordFirstError(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_error_) {
        first_error_ = kind;
        first_error_message_ = message;
    }
}

std::vector<std::uint32_t> JobCoordinator::incompleteSegments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> incomplete;
    for (const auto& segment : segments_) {
        if (segment.state != SegmentState::done) {
            incomplete.push_back(segment.id);
        }
    }
    return incomplete;
}

} // namespace gator
