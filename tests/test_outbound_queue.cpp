#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "docflow/error.hpp"
#include "docflow/outbound_queue.hpp"

namespace {

std::vector<std::string> payloads(const std::deque<docflow::OutboundQueueEntry>& entries) {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        result.push_back(entry.payload);
    }
    return result;
}

} // namespace

TEST(OutboundQueueTest, DrainsInEnqueueOrder) {
    docflow::OutboundQueue queue(5);
    queue.push("a");
    queue.push("b");
    queue.push("c");

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(payloads(queue.drain()), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(queue.empty());
}

TEST(OutboundQueueTest, OverflowEvictsOldest) {
    docflow::OutboundQueue queue(3);
    std::vector<std::string> evicted;
    for (const char* payload : {"1", "2", "3", "4", "5"}) {
        if (auto dropped = queue.push(payload)) {
            evicted.push_back(dropped->payload);
        }
    }

    EXPECT_EQ(queue.size(), queue.capacity());
    EXPECT_EQ(evicted, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(payloads(queue.drain()), (std::vector<std::string>{"3", "4", "5"}));
}

TEST(OutboundQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(docflow::OutboundQueue(0), docflow::InvalidArgumentError);
}

TEST(OutboundQueueTest, ClearDropsEverything) {
    docflow::OutboundQueue queue(2);
    queue.push("x");
    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.drain().empty());
}
