#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "docflow/error.hpp"
#include "docflow/metrics.hpp"
#include "docflow/transfer_session_registry.hpp"

using namespace std::chrono_literals;

class TransferSessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        docflow::Metrics::getInstance().reset();
        now_ = std::chrono::steady_clock::time_point{} + 1h;
    }

    docflow::TransferSessionRegistry::Clock clock() {
        return [this]() { return now_; };
    }

    std::chrono::steady_clock::time_point now_;
};

TEST_F(TransferSessionRegistryTest, GetOrCreateReturnsExistingSession) {
    docflow::TransferSessionRegistry registry(clock());
    auto created = registry.get_or_create("t1", 3);
    EXPECT_EQ(created.transfer_id, "t1");
    EXPECT_EQ(created.total_count, 3u);
    EXPECT_EQ(created.received, 0u);
    EXPECT_EQ(created.created_at, now_);

    registry.add_fragment("t1", 0, 3, "abc");
    now_ += 5s;
    auto existing = registry.get_or_create("t1", 3);
    EXPECT_EQ(existing.received, 1u);
    EXPECT_EQ(existing.created_at, created.created_at);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(TransferSessionRegistryTest, CompletesWhenEveryIndexArrived) {
    docflow::TransferSessionRegistry registry(clock());
    EXPECT_FALSE(registry.add_fragment("t1", 1, 2, "world"));
    EXPECT_FALSE(registry.is_complete("t1"));
    EXPECT_FALSE(registry.reassemble("t1").has_value());

    EXPECT_TRUE(registry.add_fragment("t1", 0, 2, "hello "));
    EXPECT_TRUE(registry.is_complete("t1"));

    auto payload = registry.reassemble("t1");
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, "hello world");

    // Reassembly removes the session
    EXPECT_FALSE(registry.find("t1").has_value());
    EXPECT_FALSE(registry.is_complete("t1"));
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("transfers_completed"), 1);
}

TEST_F(TransferSessionRegistryTest, LateDuplicateAfterCompletionIsIgnored) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("f2", 0, 2, "ab");
    ASSERT_TRUE(registry.add_fragment("f2", 1, 2, "cd"));
    ASSERT_EQ(*registry.reassemble("f2"), "abcd");

    EXPECT_FALSE(registry.add_fragment("f2", 0, 2, "ab"));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.find("f2").has_value());
    EXPECT_FALSE(registry.reassemble("f2").has_value());
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("fragments_duplicated"), 1);

    auto info = registry.get_or_create("f2", 2);
    EXPECT_TRUE(info.completed);
    EXPECT_EQ(registry.size(), 0u);

    // The duplicate left nothing behind for the sweep to report
    now_ += 10min;
    EXPECT_TRUE(registry.sweep_expired(5min).empty());
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("transfers_expired"), 0);
}

TEST_F(TransferSessionRegistryTest, CompletionRecordExpiresWithSweep) {
    docflow::TransferSessionRegistry registry(clock());
    ASSERT_TRUE(registry.add_fragment("f1", 0, 1, "payload"));
    ASSERT_TRUE(registry.reassemble("f1").has_value());

    now_ += 4min;
    registry.sweep_expired(5min);
    EXPECT_FALSE(registry.add_fragment("f1", 0, 2, "again"));
    EXPECT_EQ(registry.size(), 0u);

    now_ += 2min;
    registry.sweep_expired(5min);

    // Once the record is gone the id starts a new transfer
    EXPECT_FALSE(registry.add_fragment("f1", 0, 2, "again"));
    EXPECT_EQ(registry.find("f1")->received, 1u);
}

TEST_F(TransferSessionRegistryTest, DuplicateFragmentIsNoOp) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("t1", 0, 2, "first");
    registry.add_fragment("t1", 0, 2, "second copy");

    EXPECT_EQ(registry.find("t1")->received, 1u);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("fragments_duplicated"), 1);

    registry.add_fragment("t1", 1, 2, "!");
    EXPECT_EQ(*registry.reassemble("t1"), "first!");
}

TEST_F(TransferSessionRegistryTest, IndexOutsideTotalIsRejected) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("t1", 0, 2, "a");

    EXPECT_THROW(registry.add_fragment("t1", 2, 2, "b"), docflow::ReassemblyError);
    EXPECT_FALSE(registry.find("t1").has_value());
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("fragments_rejected"), 1);
}

TEST_F(TransferSessionRegistryTest, ZeroTotalIsRejected) {
    docflow::TransferSessionRegistry registry(clock());
    EXPECT_THROW(registry.get_or_create("t1", 0), docflow::ReassemblyError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(TransferSessionRegistryTest, ConflictingTotalDiscardsTransfer) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("t1", 0, 3, "a");

    try {
        registry.add_fragment("t1", 1, 4, "b");
        FAIL() << "conflicting total was accepted";
    } catch (const docflow::ReassemblyError& e) {
        EXPECT_EQ(e.code(), docflow::ErrorCode::CONFLICTING_TOTAL);
        EXPECT_EQ(e.transfer_id(), "t1");
    }
    EXPECT_FALSE(registry.find("t1").has_value());

    // The client restarts the transfer from scratch
    EXPECT_EQ(registry.get_or_create("t1", 4).received, 0u);
}

TEST_F(TransferSessionRegistryTest, OtherTransfersAreUnaffectedByRejection) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("good", 0, 2, "x");
    registry.add_fragment("bad", 0, 2, "y");

    EXPECT_THROW(registry.add_fragment("bad", 7, 2, "z"), docflow::ReassemblyError);
    EXPECT_TRUE(registry.add_fragment("good", 1, 2, "y"));
    EXPECT_EQ(*registry.reassemble("good"), "xy");
}

TEST_F(TransferSessionRegistryTest, SweepRemovesStaleIncompleteSession) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("stale", 0, 5, "a");
    registry.add_fragment("stale", 1, 5, "b");

    now_ += 2min;
    registry.add_fragment("fresh", 0, 2, "c");

    now_ += 4min;
    auto expired = registry.sweep_expired(5min);

    EXPECT_EQ(expired, (std::vector<std::string>{"stale"}));
    EXPECT_FALSE(registry.find("stale").has_value());
    EXPECT_FALSE(registry.is_complete("stale"));
    EXPECT_TRUE(registry.find("fresh").has_value());
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("transfers_expired"), 1);

    // A new get_or_create starts an empty session, as if it never existed
    auto restarted = registry.get_or_create("stale", 5);
    EXPECT_EQ(restarted.received, 0u);
    EXPECT_EQ(restarted.created_at, now_);
}

TEST_F(TransferSessionRegistryTest, CancelRemovesSession) {
    docflow::TransferSessionRegistry registry(clock());
    registry.add_fragment("t1", 0, 2, "a");

    EXPECT_TRUE(registry.cancel("t1"));
    EXPECT_FALSE(registry.cancel("t1"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(TransferSessionRegistryTest, ConcurrentDeliveryYieldsOnePayload) {
    constexpr uint32_t kTotal = 64;
    constexpr int kFeeders = 4;
    docflow::TransferSessionRegistry registry;

    std::string expected;
    for (uint32_t i = 0; i < kTotal; ++i) {
        expected += std::to_string(i) + ";";
    }

    std::atomic<int> payloads{0};
    std::atomic<bool> feeding{true};
    std::mutex result_mutex;
    std::string result;

    std::thread sweeper([&]() {
        while (feeding.load()) {
            EXPECT_TRUE(registry.sweep_expired(1h).empty());
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> feeders;
    for (int f = 0; f < kFeeders; ++f) {
        feeders.emplace_back([&, f]() {
            std::vector<uint32_t> order(kTotal);
            for (uint32_t i = 0; i < kTotal; ++i) {
                order[i] = i;
            }
            std::mt19937 engine(static_cast<unsigned>(f + 1));
            std::shuffle(order.begin(), order.end(), engine);

            for (uint32_t index : order) {
                if (registry.add_fragment("shared", index, kTotal, std::to_string(index) + ";")) {
                    if (auto payload = registry.reassemble("shared")) {
                        payloads.fetch_add(1);
                        std::lock_guard<std::mutex> lock(result_mutex);
                        result = *payload;
                    }
                }
            }
        });
    }
    for (auto& feeder : feeders) {
        feeder.join();
    }
    feeding = false;
    sweeper.join();

    EXPECT_EQ(payloads.load(), 1);
    EXPECT_EQ(result, expected);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.find("shared").has_value());
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("transfers_completed"), 1);
}
