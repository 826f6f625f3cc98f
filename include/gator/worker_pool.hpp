#pragma once

#include "download_job.hpp"
#include "error.hpp"
#include "progress.hpp"
#include "segment.hpp"
#include "segment_queue.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

namespace gator {

class Cancellation;

class WorkerPool {
public:
    struct Callbacks {
        // Called when a worker takes the segment off the queue.
        std::function<void(const Segment&)> on_started;
        // Called once the segment's bytes are all written.
        std::function<void(const Segment&)> on_done;
        // Called once per segment that will not complete in this run, either
        // after its retry budget is spent or because the job was cancelled.
        std::function<void(const Segment&, const DownloadError&)> on_failed;
    };

    WorkerPool(TransportPtr transport, ProgressSinkPtr progress, const JobConfig& config);

    // Blocks until every worker has exited. A worker exits when the queue
    // yields nothing more, when cancellation is requested, or after reporting
    // a failed segment. ranged selects byte-range requests (multi-segment
    // plans) over a plain GET of the whole resource.
    void run(const DownloadJob& job,
             SegmentQueue& queue,
             bool ranged,
             Cancellation& cancellation,
             const Callbacks& callbacks);

    // Threads started by the last run().
    [[nodiscard]] std::size_t lastWorkerCount() const noexcept { return last_worker_count_; }

    [[nodiscard]] static std::size_t poolSize(std::size_t configured, std::size_t queued) noexcept;

private:
    void workerLoop(const DownloadJob& job,
                    SegmentQueue& queue,
                    bool ranged,
                    Cancellation& cancellation,
                    const Callbacks& callbacks);

    class SegmentWriter;

    TransportPtr transport_;
    ProgressSinkPtr progress_;
    JobConfig config_;
    std::size_t last_worker_count_{0};
};

} // namespace gator
