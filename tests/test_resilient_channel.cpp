#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "docflow/config.hpp"
#include "docflow/metrics.hpp"
#include "docflow/resilient_channel.hpp"
#include "docflow/wire_protocol.hpp"
#include "fake_transport.hpp"

using namespace std::chrono_literals;
using docflow::ChannelState;
using docflow::testing::FakeTransport;
using docflow::testing::FakeTransportFactory;

class ResilientChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        docflow::Metrics::getInstance().reset();

        config_ = docflow::default_config().channel;
        config_.max_retries = 3;
        config_.initial_retry_delay_ms = 1;
        config_.max_retry_delay_ms = 4;
        config_.jitter_ratio = 0.0;
        config_.heartbeat_interval_ms = 60000;
        config_.heartbeat_timeout_ms = 60000;
        config_.message_queue_size = 10;
    }

    std::shared_ptr<docflow::ResilientChannel> make_channel(FakeTransport::Mode mode) {
        factory_ = std::make_unique<FakeTransportFactory>(ioc_.get_executor(), mode);
        channel_ = std::make_shared<docflow::ResilientChannel>(
            ioc_.get_executor(), factory_->factory(), config_,
            docflow::BackoffPolicy::from_config(config_, []() { return 0.0; }));
        channel_->on_state_change([this](ChannelState current, ChannelState) { states_.push_back(current); });
        channel_->on_message([this](const std::string& text) { messages_.push_back(text); });
        return channel_;
    }

    boost::asio::io_context ioc_;
    docflow::ChannelConfig config_;
    std::unique_ptr<FakeTransportFactory> factory_;
    std::shared_ptr<docflow::ResilientChannel> channel_;
    std::vector<ChannelState> states_;
    std::vector<std::string> messages_;
};

TEST_F(ResilientChannelTest, ConnectReachesConnected) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    EXPECT_EQ(channel->state(), ChannelState::DISCONNECTED);

    channel->connect();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTING);
    ASSERT_EQ(factory_->transports.size(), 1u);
    EXPECT_TRUE(factory_->last()->opened);

    factory_->last()->accept();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
    EXPECT_EQ(states_, (std::vector<ChannelState>{ChannelState::CONNECTING, ChannelState::CONNECTED}));

    channel->send("hello");
    EXPECT_EQ(factory_->last()->written, (std::vector<std::string>{"hello"}));
}

TEST_F(ResilientChannelTest, QueuedMessagesFlushBeforeLaterSends) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->send("first");
    channel->send("second");
    channel->send("third");
    EXPECT_EQ(channel->queued(), 3u);

    channel->connect();
    factory_->last()->accept();
    channel->send("fourth");

    EXPECT_EQ(channel->queued(), 0u);
    EXPECT_EQ(factory_->last()->written,
              (std::vector<std::string>{"first", "second", "third", "fourth"}));
}

TEST_F(ResilientChannelTest, FullQueueDropsOldest) {
    config_.message_queue_size = 2;
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->send("1");
    channel->send("2");
    channel->send("3");

    EXPECT_EQ(channel->queued(), 2u);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("channel_messages_dropped"), 1);

    channel->connect();
    factory_->last()->accept();
    EXPECT_EQ(factory_->last()->written, (std::vector<std::string>{"2", "3"}));
}

TEST_F(ResilientChannelTest, OfflineAfterExactlyMaxRetries) {
    auto channel = make_channel(FakeTransport::Mode::FailOnOpen);
    channel->connect();
    ioc_.run_for(2s);

    EXPECT_EQ(channel->state(), ChannelState::OFFLINE);
    // The initial attempt plus one per retry
    EXPECT_EQ(factory_->transports.size(), 4u);
    EXPECT_EQ(channel->attempt(), 3u);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("channel_reconnect_attempts"), 3);
    ASSERT_FALSE(states_.empty());
    EXPECT_EQ(states_.back(), ChannelState::OFFLINE);
    EXPECT_EQ(std::count(states_.begin(), states_.end(), ChannelState::OFFLINE), 1);
}

TEST_F(ResilientChannelTest, NotOfflineBeforeMaxRetries) {
    auto channel = make_channel(FakeTransport::Mode::FailOnOpen);
    // Three failures, then the fourth attempt stays pending
    factory_->queue_modes({FakeTransport::Mode::FailOnOpen, FakeTransport::Mode::FailOnOpen,
                           FakeTransport::Mode::FailOnOpen, FakeTransport::Mode::Manual});
    channel->connect();
    ioc_.run_for(2s);

    EXPECT_EQ(channel->state(), ChannelState::RECONNECTING);
    ASSERT_EQ(factory_->transports.size(), 4u);

    factory_->last()->accept();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
    EXPECT_EQ(channel->attempt(), 0u);
}

TEST_F(ResilientChannelTest, ConnectIsIgnoredWhileOfflineButReconnectRestarts) {
    auto channel = make_channel(FakeTransport::Mode::FailOnOpen);
    channel->connect();
    ioc_.run_for(2s);
    ASSERT_EQ(channel->state(), ChannelState::OFFLINE);
    size_t attempts = factory_->transports.size();

    channel->connect();
    EXPECT_EQ(channel->state(), ChannelState::OFFLINE);
    EXPECT_EQ(factory_->transports.size(), attempts);

    factory_->queue_modes({FakeTransport::Mode::Manual});
    channel->reconnect();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTING);
    EXPECT_EQ(channel->attempt(), 0u);
    ASSERT_EQ(factory_->transports.size(), attempts + 1);
    factory_->last()->accept();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
}

TEST_F(ResilientChannelTest, DropWhileConnectedReconnectsAndFlushes) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    auto first = factory_->last();
    first->accept();

    first->drop("connection reset");
    EXPECT_EQ(channel->state(), ChannelState::RECONNECTING);
    EXPECT_EQ(channel->attempt(), 1u);

    channel->send("while away");
    EXPECT_EQ(channel->queued(), 1u);

    ioc_.run_for(500ms);
    ASSERT_EQ(factory_->transports.size(), 2u);
    auto second = factory_->last();
    second->accept();

    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
    EXPECT_EQ(second->written, (std::vector<std::string>{"while away"}));
    EXPECT_TRUE(first->written.empty());
}

TEST_F(ResilientChannelTest, CleanCloseDoesNotReconnect) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    factory_->last()->accept();

    factory_->last()->finish_cleanly("server shutting down");
    EXPECT_EQ(channel->state(), ChannelState::DISCONNECTED);

    ioc_.run_for(50ms);
    EXPECT_EQ(factory_->transports.size(), 1u);
    EXPECT_EQ(channel->state(), ChannelState::DISCONNECTED);
}

TEST_F(ResilientChannelTest, DisconnectKeepsQueueForNextConnect) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    channel->send("pending");

    channel->disconnect("user request");
    EXPECT_EQ(channel->state(), ChannelState::DISCONNECTED);
    EXPECT_TRUE(factory_->transports[0]->closed);
    EXPECT_EQ(channel->queued(), 1u);

    // A late open from the abandoned transport changes nothing
    factory_->transports[0]->accept();
    EXPECT_EQ(channel->state(), ChannelState::DISCONNECTED);

    channel->connect();
    factory_->last()->accept();
    EXPECT_EQ(factory_->last()->written, (std::vector<std::string>{"pending"}));
}

TEST_F(ResilientChannelTest, StaleTransportCallbacksAreIgnored) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    auto stale = factory_->last();

    channel->reconnect();
    ASSERT_EQ(factory_->transports.size(), 2u);
    EXPECT_TRUE(stale->closed);

    stale->accept();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTING);
    stale->drop("late failure");
    EXPECT_EQ(channel->state(), ChannelState::CONNECTING);

    factory_->last()->accept();
    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
}

TEST_F(ResilientChannelTest, HeartbeatTimeoutForcesReconnect) {
    config_.heartbeat_interval_ms = 5;
    config_.heartbeat_timeout_ms = 5;
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    auto silent = factory_->last();
    silent->accept();

    // The peer never answers; the retry then leaves a pending transport
    ioc_.run_for(1s);

    ASSERT_FALSE(silent->written.empty());
    EXPECT_TRUE(docflow::wire::is_ping(silent->written.front()));
    EXPECT_TRUE(silent->closed);
    EXPECT_EQ(factory_->transports.size(), 2u);
    EXPECT_EQ(channel->state(), ChannelState::RECONNECTING);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("channel_heartbeat_timeouts"), 1);
}

TEST_F(ResilientChannelTest, PongIsConsumedAndKeepsConnectionAlive) {
    config_.heartbeat_interval_ms = 10;
    config_.heartbeat_timeout_ms = 1000;
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    auto transport = factory_->last();
    transport->accept();

    for (int i = 0; i < 100 && transport->written.empty(); ++i) {
        ioc_.run_one_for(50ms);
    }
    ASSERT_FALSE(transport->written.empty());

    transport->receive(docflow::wire::make_pong());
    transport->receive("{\"fileID\":\"f1\",\"status\":\"DONE\"}");
    ioc_.run_for(30ms);

    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
    EXPECT_EQ(messages_, (std::vector<std::string>{"{\"fileID\":\"f1\",\"status\":\"DONE\"}"}));
    EXPECT_EQ(factory_->transports.size(), 1u);
}

TEST_F(ResilientChannelTest, ProgressDuringLongUploadCountsAsLiveness) {
    config_.heartbeat_interval_ms = 10;
    config_.heartbeat_timeout_ms = 50;
    config_.message_queue_size = 1000;
    auto channel = make_channel(FakeTransport::Mode::Manual);
    channel->connect();
    auto transport = factory_->last();
    transport->accept();

    // The server is busy draining fragments and never gets to the pings, but
    // answers with progress every few milliseconds
    for (uint32_t i = 0; i < 500; ++i) {
        channel->send(docflow::wire::encode_fragment(docflow::TransferFragment{"big", i, 500, i == 499, "x"}));
    }
    boost::asio::steady_timer progress(ioc_);
    uint32_t reported = 0;
    std::function<void()> report = [&]() {
        progress.expires_after(5ms);
        progress.async_wait([&](const boost::system::error_code& ec) {
            if (ec || reported == 60) return;
            ++reported;
            transport->receive(docflow::wire::encode_progress({"big", reported, 500}));
            report();
        });
    };
    report();
    ioc_.run_for(300ms);

    EXPECT_EQ(channel->state(), ChannelState::CONNECTED);
    EXPECT_EQ(factory_->transports.size(), 1u);
    EXPECT_FALSE(transport->closed);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("channel_heartbeat_timeouts"), 0);
    EXPECT_EQ(messages_.size(), static_cast<size_t>(reported));
}

TEST_F(ResilientChannelTest, ThrowingSubscriberDoesNotStopOthers) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    std::vector<ChannelState> seen;
    channel->on_state_change([](ChannelState, ChannelState) { throw std::runtime_error("observer bug"); });
    channel->on_state_change([&seen](ChannelState current, ChannelState) { seen.push_back(current); });

    channel->connect();
    factory_->last()->accept();

    EXPECT_EQ(seen, (std::vector<ChannelState>{ChannelState::CONNECTING, ChannelState::CONNECTED}));
    EXPECT_EQ(states_.size(), 2u);
}

TEST_F(ResilientChannelTest, RemovedListenerIsNotCalled) {
    auto channel = make_channel(FakeTransport::Mode::Manual);
    int calls = 0;
    auto id = channel->on_message([&calls](const std::string&) { ++calls; });
    channel->connect();
    factory_->last()->accept();

    factory_->last()->receive("one");
    channel->remove_message_listener(id);
    factory_->last()->receive("two");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(messages_.size(), 2u);
}
