#include "gator/worker_pool.hpp"
#include "gator/cancellation.hpp"
#include "gator/detail/http_headers.hpp"
#include "gator/file_preallocator.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gator {

std::size_t defaultWorkerCount() noexcept {
    const std::size_t cores = std::thread::hardware_concurrency();
    return std::max<std::size_t>(16, cores * 4);
}

// Streams one response into the segment's region of the output file. Errors
// are stored rather than thrown, since these callbacks run inside libcurl.
class WorkerPool::SegmentWriter final : public ResponseHandler {
public:
    SegmentWriter(OutputFile& file, const Segment& segment, bool ranged, ProgressSink& progress)
        : file_(file), segment_(segment), ranged_(ranged), progress_(progress) {}

    bool onResponse(long status, const Headers& headers) override {
        if (ranged_) {
            if (status == 200) {
                return reject(ErrorKind::range_mismatch,
                              fmt::format("Server ignored range {}-{} and sent the full resource",
                                          segment_.start, segment_.end.value_or(0)));
            }
            if (status != 206) {
                return rejectStatus(status);
            }
            const auto it = headers.find("content-range");
            if (it != headers.end()) {
                const auto range = detail::parseContentRange(it->second);
                if (!range || range->first != segment_.start ||
                    (segment_.end && range->last != *segment_.end)) {
                    return reject(ErrorKind::range_mismatch,
                                  fmt::format("Server answered range {}-{} with '{}'",
                                              segment_.start, segment_.end.value_or(0), it->second));
                }
            }
            return true;
        }

        if (status == 206) {
            return reject(ErrorKind::range_mismatch, "Server sent partial content for a full request");
        }
        if (status != 200) {
            return rejectStatus(status);
        }
        return true;
    }

    bool onBody(const char* data, std::size_t size) override {
        if (error_) {
            return false;
        }

        const auto expected = segment_.size();
        if (expected && written_ + size > *expected) {
            return reject(ErrorKind::range_mismatch,
                          fmt::format("Server sent more than the {} bytes of segment {}",
                                      *expected, segment_.id));
        }

        try {
            file_.writeAt(segment_.start + written_, data, size);
        } catch (const DownloadError& ex) {
            error_ = std::make_unique<DownloadError>(ex);
            return false;
        }

        written_ += size;
        progress_.publish(ProgressEvent{size, segment_.id, false});
        return true;
    }

    // Throws the first error seen while streaming, or a short-body error.
    void verify(const FetchResult& result, const Cancellation& cancellation) const {
        if (error_) {
            throw *error_;
        }
        if (cancellation.isCancelled()) {
            throw DownloadError(ErrorKind::cancelled,
                                fmt::format("Segment {} abandoned by cancellation", segment_.id));
        }

        switch (result.code) {
        case FetchCode::ok:
            break;
        case FetchCode::timeout:
            throw DownloadError(ErrorKind::network,
                                fmt::format("Segment {} timed out: {}", segment_.id, result.message));
        case FetchCode::network_error:
        case FetchCode::aborted:
            throw DownloadError(ErrorKind::network,
                                fmt::format("Segment {} transfer failed: {}", segment_.id, result.message));
        }

        const auto expected = segment_.size();
        if (expected && written_ != *expected) {
            throw DownloadError(ErrorKind::network,
                                fmt::format("Segment {} ended after {} of {} bytes",
                                            segment_.id, written_, *expected));
        }
    }

private:
    bool reject(ErrorKind kind, std::string message) {
        if (!error_) {
            error_ = std::make_unique<DownloadError>(kind, message);
        }
        return false;
    }

    bool rejectStatus(long status) {
        return reject(ErrorKind::http_status,
                      fmt::format("Segment {} failed with HTTP status {}", segment_.id, status));
    }

    OutputFile& file_;
    const Segment& segment_;
    bool ranged_;
    ProgressSink& progress_;
    std::uint64_t written_{0};
    std::unique_ptr<DownloadError> error_;
};

WorkerPool::WorkerPool(TransportPtr transport, ProgressSinkPtr progress, const JobConfig& config)
    : transport_(std::move(transport)),
      progress_(progress ? std::move(progress) : std::make_shared<NullProgressSink>()),
      config_(config) {}

std::size_t WorkerPool::poolSize(std::size_t configured, std::size_t queued) noexcept {
    const std::size_t wanted = configured > 0 ? configured : defaultWorkerCount();
    return std::min(wanted, queued);
}

void WorkerPool::run(const DownloadJob& job,
                     SegmentQueue& queue,
                     bool ranged,
                     Cancellation& cancellation,
                     const Callbacks& callbacks) {
    last_worker_count_ = poolSize(config_.worker_count, queue.size());
    spdlog::info("Spawning {} workers for {} segments", last_worker_count_, queue.size());

    std::vector<std::thread> workers;
    workers.reserve(last_worker_count_);
    for (std::size_t i = 0; i < last_worker_count_; ++i) {
        workers.emplace_back([this, &job, &queue, ranged, &cancellation, &callbacks]() {
            workerLoop(job, queue, ranged, cancellation, callbacks);
        });
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::workerLoop(const DownloadJob& job,
                            SegmentQueue& queue,
                            bool ranged,
                            Cancellation& cancellation,
                            const Callbacks& callbacks) {
    std::unique_ptr<OutputFile> file;

    while (!cancellation.isCancelled()) {
        auto next = queue.takeNext();
        if (!next) {
            return;
        }
        const Segment segment = *next;
        if (callbacks.on_started) {
            callbacks.on_started(segment);
        }

        try {
            if (!file) {
                file = std::make_unique<OutputFile>(job.destination());
            }

            auto backoff = config_.initial_backoff;
            for (int attempt = 1;; ++attempt) {
                FetchRequest request;
                request.url = job.url();
                if (ranged && segment.end) {
                    request.range = ByteRange{segment.start, *segment.end};
                }
                request.timeout = config_.attempt_timeout;
                request.connect_timeout = config_.connect_timeout;
                request.low_speed_time = config_.low_speed_time;
                request.cancellation = &cancellation;

                SegmentWriter writer(*file, segment, ranged, *progress_);
                try {
                    const FetchResult result = transport_->fetch(request, writer);
                    writer.verify(result, cancellation);
                    break;
                } catch (const DownloadError& ex) {
                    if (!isRetryable(ex.kind()) || attempt >= config_.max_attempts) {
                        throw;
                    }
                    spdlog::warn("{} (attempt {}/{}), retrying in {} ms",
                                 ex.what(), attempt, config_.max_attempts, backoff.count());
                }

                if (cancellation.waitFor(backoff)) {
                    throw DownloadError(ErrorKind::cancelled,
                                        fmt::format("Segment {} abandoned by cancellation", segment.id));
                }
                backoff *= 2;
            }

            callbacks.on_done(segment);
            progress_->publish(ProgressEvent{0, segment.id, true});
        } catch (const DownloadError& ex) {
            callbacks.on_failed(segment, ex);
            return;
        } catch (const std::exception& ex) {
            callbacks.on_failed(segment, DownloadError(ErrorKind::network, ex.what()));
            return;
        }
    }
}

} // namespace gator
