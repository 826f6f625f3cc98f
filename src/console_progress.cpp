#include "gator/console_progress.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace gator {

ConsoleProgress::ConsoleProgress(std::string filename, std::ostream& out)
    : filename_(std::move(filename)), out_(out) {}

ConsoleProgress::~ConsoleProgress() { stop(); }

void ConsoleProgress::onPlanned(std::size_t segments, std::size_t pending, std::size_t workers) {
    if (pending < segments) {
        out_ << fmt::format("Resuming: {} of {} segments already complete\n", segments - pending, segments);
    }
    out_ << fmt::format("Downloading in {} segments\n", segments);
    if (workers > 0) {
        out_ << fmt::format("Spawning {} workers\n", workers);
    }
    out_ << std::flush;
}

void ConsoleProgress::onJobStarted(std::optional<std::uint64_t> total_bytes, std::uint64_t resumed_bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_bytes_ = total_bytes;
        resumed_bytes_ = resumed_bytes;
        started_at_ = std::chrono::steady_clock::now();
        stopping_ = false;
    }
    if (!renderer_.joinable()) {
        renderer_ = std::thread([this] { renderLoop(); });
    }
}

void ConsoleProgress::publish(const ProgressEvent& event) {
    downloaded_bytes_.fetch_add(event.bytes_written, std::memory_order_relaxed);
    if (event.terminal) {
        segments_done_.fetch_add(1, std::memory_order_relaxed);
    }
}

void ConsoleProgress::onJobFinished(bool success) {
    stop();
    const auto final_state = snapshot();
    std::string line = formatLine(filename_, final_state);
    line.append(success ? "  Done" : "  Failed");
    redraw(line);
    out_ << std::flush;
}

void ConsoleProgress::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (renderer_.joinable()) {
        renderer_.join();
    }
}

void ConsoleProgress::renderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        redraw(formatLine(filename_, snapshot()));
        lock.lock();
        cv_.wait_for(lock, std::chrono::milliseconds(200), [this] { return stopping_; });
    }
}

ConsoleProgress::Snapshot ConsoleProgress::snapshot() const {
    Snapshot snap;
    snap.total_bytes = total_bytes_;
    snap.resumed_bytes = resumed_bytes_;
    snap.downloaded_bytes = resumed_bytes_ + downloaded_bytes_.load(std::memory_order_relaxed);
    snap.segments_done = segments_done_.load(std::memory_order_relaxed);
    if (snap.total_bytes) {
        // Bytes from abandoned attempts are published too; never show more
        // than the whole file.
        snap.downloaded_bytes = std::min(snap.downloaded_bytes, *snap.total_bytes);
    }

    const auto since_start = std::chrono::steady_clock::now() - started_at_;
    snap.elapsed = std::chrono::duration_cast<std::chrono::seconds>(since_start);
    const auto elapsed = std::chrono::duration<double>(since_start).count();
    if (elapsed > 0.0) {
        snap.bytes_per_second = static_cast<double>(snap.downloaded_bytes - snap.resumed_bytes) / elapsed;
    }
    return snap;
}

std::string ConsoleProgress::formatLine(const std::string& filename, const Snapshot& snapshot) {
    std::string display_name = std::filesystem::path{filename}.filename().string();
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }

    const double mb_per_sec = snapshot.bytes_per_second / (1024.0 * 1024.0);

    if (!snapshot.total_bytes || *snapshot.total_bytes == 0) {
        return fmt::format("{:<20} {} {:.2f} MB/s {}", display_name, formatSize(snapshot.downloaded_bytes),
                           mb_per_sec, formatDuration(snapshot.elapsed));
    }

    std::string eta = "--:--";
    if (snapshot.bytes_per_second > 0.0 && snapshot.downloaded_bytes <= *snapshot.total_bytes) {
        const double remaining = static_cast<double>(*snapshot.total_bytes - snapshot.downloaded_bytes);
        eta = formatDuration(std::chrono::seconds(static_cast<std::int64_t>(remaining / snapshot.bytes_per_second)));
    }

    const double ratio = static_cast<double>(snapshot.downloaded_bytes) /
                         static_cast<double>(*snapshot.total_bytes);
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    return fmt::format("{:<20} [{}] {:>3}% ({}/{}) {:.2f} MB/s {} ETA {}",
                       display_name,
                       bar,
                       percent,
                       formatSize(snapshot.downloaded_bytes),
                       formatSize(*snapshot.total_bytes),
                       mb_per_sec,
                       formatDuration(snapshot.elapsed),
                       eta);
}

std::string ConsoleProgress::formatDuration(std::chrono::seconds duration) {
    const auto total = std::max<std::int64_t>(0, duration.count());
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{}:{:02}", minutes, seconds);
}

std::string ConsoleProgress::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsoleProgress::redraw(const std::string& line) {
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << line << '\n' << std::flush;
    previous_lines_ = 1;
}

} // namespace gator
