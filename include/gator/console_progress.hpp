#pragma once

#include "progress.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace gator {

// Terminal progress bar. publish() only bumps counters; a separate thread
// samples them and redraws, so a slow terminal never stalls a worker.
class ConsoleProgress final : public ProgressSink {
public:
    ConsoleProgress(std::string filename, std::ostream& out);
    ~ConsoleProgress() override;

    void onPlanned(std::size_t segments, std::size_t pending, std::size_t workers) override;
    void onJobStarted(std::optional<std::uint64_t> total_bytes, std::uint64_t resumed_bytes) override;
    void publish(const ProgressEvent& event) override;
    void onJobFinished(bool success) override;

    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    // "m:ss", or "h:mm:ss" from one hour on.
    [[nodiscard]] static std::string formatDuration(std::chrono::seconds duration);

    struct Snapshot {
        std::optional<std::uint64_t> total_bytes;
        std::uint64_t downloaded_bytes{0};
        std::uint64_t resumed_bytes{0};
        std::uint64_t segments_done{0};
        double bytes_per_second{0.0};
        std::chrono::seconds elapsed{0};
    };

    [[nodiscard]] static std::string formatLine(const std::string& filename, const Snapshot& snapshot);

private:
    void renderLoop();
    [[nodiscard]] Snapshot snapshot() const;
    void redraw(const std::string& line);
    void stop();

    std::string filename_;
    std::ostream& out_;

    std::atomic<std::uint64_t> downloaded_bytes_{0};
    std::atomic<std::uint64_t> segments_done_{0};
    std::optional<std::uint64_t> total_bytes_;
    std::uint64_t resumed_bytes_{0};
    std::chrono::steady_clock::time_point started_at_{};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::thread renderer_;
    std::size_t previous_lines_{0};
};

} // namespace gator
