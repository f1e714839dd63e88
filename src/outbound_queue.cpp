#include "docflow/outbound_queue.hpp"
#include "docflow/error.hpp"
#include <utility>

namespace docflow {

OutboundQueue::OutboundQueue(size_t capacity) : capacity_(capacity) {
    DOCFLOW_CHECK_ARGUMENT(capacity > 0, "outbound queue capacity must be positive");
}

std::optional<OutboundQueueEntry> OutboundQueue::push(std::string payload) {
    std::optional<OutboundQueueEntry> evicted;
    if (entries_.size() >= capacity_) {
        evicted = std::move(entries_.front());
        entries_.pop_front();
    }
    entries_.push_back(OutboundQueueEntry{std::move(payload), std::chrono::steady_clock::now()});
    return evicted;
}

std::deque<OutboundQueueEntry> OutboundQueue::drain() {
    std::deque<OutboundQueueEntry> drained;
    drained.swap(entries_);
    return drained;
}

} // namespace docflow
