#include "gator/segment_queue.hpp"

namespace gator {

SegmentQueue::SegmentQueue(const std::vector<Segment>& segments) {
    for (const auto& segment : segments) {
        push(segment);
    }
}

void SegmentQueue::push(const Segment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.push_back(segment);
    segments_.back().state = SegmentState::pending;
}

std::optional<Segment> SegmentQueue::takeNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || segments_.empty()) {
        return std::nullopt;
    }

    Segment next = segments_.front();
    segments_.pop_front();
    next.state = SegmentState::in_flight;
    return next;
}

void SegmentQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool SegmentQueue::isExhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || segments_.empty();
}

bool SegmentQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t SegmentQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.size();
}

} // namespace gator
