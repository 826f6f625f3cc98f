#pragma once

#include "cancellation.hpp"
#include "download_job.hpp"
#include "error.hpp"
#include "progress.hpp"
#include "segment.hpp"
#include "transport.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gator {

enum class JobState {
    idle,
    planning,
    resuming,
    preallocating,
    downloading,
    finalizing,
    succeeded,
    failed,
};

[[nodiscard]] std::string_view toString(JobState state) noexcept;

struct JobOutcome {
    bool success{false};
    std::optional<ErrorKind> error;
    std::string message;
    std::vector<std::uint32_t> incomplete_segments;

    [[nodiscard]] static JobOutcome succeeded() { return JobOutcome{true, std::nullopt, {}, {}}; }

    [[nodiscard]] static JobOutcome failure(ErrorKind kind,
                                            std::string message,
                                            std::vector<std::uint32_t> incomplete = {}) {
        return JobOutcome{false, kind, std::move(message), std::move(incomplete)};
    }

    explicit operator bool() const noexcept { return success; }
};

// Runs one download job end to end and owns its completion record. One
// coordinator per job; cancel() may be called from any thread.
class JobCoordinator {
public:
    JobCoordinator(TransportPtr transport, ProgressSinkPtr progress, JobConfig config = {});

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    [[nodiscard]] static DownloadJob describe(const std::string& url,
                                              const std::filesystem::path& destination,
                                              const ResourceInfo& info,
                                              const JobConfig& config);

    // Probes the resource, then runs the job.
    [[nodiscard]] JobOutcome run(const std::string& url, const std::filesystem::path& destination);

    [[nodiscard]] JobOutcome run(const DownloadJob& job);

    void cancel();

    [[nodiscard]] JobState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Segment list of the current or last run with per-segment states.
    [[nodiscard]] std::vector<Segment> segments() const;

    // Threads the worker pool used in the last run.
    [[nodiscard]] std::size_t workerCount() const noexcept { return worker_count_; }

private:
    void transition(JobState next);
    [[nodiscard]] JobOutcome fail(const DownloadJob& job, ErrorKind kind, std::string message);
    void setSegmentState(std::uint32_t id, SegmentState state);
    void recordFirstError(ErrorKind kind, const std::string& message);
    [[nodiscard]] std::vector<std::uint32_t> incompleteSegments() const;

    TransportPtr transport_;
    ProgressSinkPtr progress_;
    JobConfig config_;
    Cancellation cancellation_;

    std::atomic<JobState> state_{JobState::idle};
    std::size_t worker_count_{0};

    mutable std::mutex mutex_;
    std::vector<Segment> segments_;
    std::optional<ErrorKind> first_error_;
    std::string first_error_message_;
};

} // namespace gator
