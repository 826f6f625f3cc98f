#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace gator {

struct ProgressEvent {
    std::uint64_t bytes_written{0};
    std::uint32_t segment_id{0};
    // Set on the last event of a segment that reached Done.
    bool terminal{false};
};

// Publishers call from worker threads; implementations must accept
// concurrent calls and must not block on slow consumers.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // Called once before onJobStarted; `pending` excludes segments already
    // completed by an earlier run.
    virtual void onPlanned(std::size_t /*segments*/, std::size_t /*pending*/, std::size_t /*workers*/) {}
    virtual void onJobStarted(std::optional<std::uint64_t> /*total_bytes*/, std::uint64_t /*resumed_bytes*/) {}
    virtual void publish(const ProgressEvent& event) = 0;
    virtual void onJobFinished(bool /*success*/) {}
};

class NullProgressSink final : public ProgressSink {
public:
    void publish(const ProgressEvent&) override {}
};

using ProgressSinkPtr = std::shared_ptr<ProgressSink>;

} // namespace gator
