#pragma once

#include "segment.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace gator {

// Pending segments in ascending offset order. Workers pull from the front on
// demand; nothing is assigned to a worker ahead of time.
class SegmentQueue {
public:
    SegmentQueue() = default;
    explicit SegmentQueue(const std::vector<Segment>& segments);

    void push(const Segment& segment);

    // Each segment is handed to exactly one caller, marked InFlight. Empty
    // once the queue is exhausted or closed.
    [[nodiscard]] std::optional<Segment> takeNext();

    // Stops yielding segments; what is left stays queued.
    void close();

    [[nodiscard]] bool isExhausted() const;
    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<Segment> segments_;
    bool closed_{false};
};

} // namespace gator
