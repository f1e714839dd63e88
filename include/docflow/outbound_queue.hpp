#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace docflow {

struct OutboundQueueEntry {
    std::string payload;
    std::chrono::steady_clock::time_point enqueued_at;
};

/**
 * Bounded FIFO of messages written while the channel is not connected.
 *
 * On overflow the oldest entry is evicted, never the newest. Not internally
 * synchronized; the owning channel guards it with its own lock.
 */
class OutboundQueue {
public:
    explicit OutboundQueue(size_t capacity);

    // Returns the evicted entry when the queue was already full
    std::optional<OutboundQueueEntry> push(std::string payload);

    // Removes and returns every entry in enqueue order
    std::deque<OutboundQueueEntry> drain();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return capacity_; }
    void clear() { entries_.clear(); }

private:
    size_t capacity_;
    std::deque<OutboundQueueEntry> entries_;
};

} // namespace docflow
