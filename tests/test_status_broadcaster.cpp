#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "docflow/builtin_stages.hpp"
#include "docflow/config.hpp"
#include "docflow/metrics.hpp"
#include "docflow/orchestrator.hpp"
#include "docflow/status_broadcaster.hpp"
#include "docflow/wire_protocol.hpp"

namespace {

class RecordingObserver : public docflow::StatusObserver {
public:
    void deliver(const std::string& text) override { received.push_back(text); }

    std::vector<std::string> received;
};

class ThrowingObserver : public docflow::StatusObserver {
public:
    void deliver(const std::string&) override { throw std::runtime_error("socket gone"); }
};

docflow::StatusEvent event(const std::string& file_id, docflow::IngestionState state) {
    docflow::StatusEvent event;
    event.file_id = file_id;
    event.state = state;
    event.stage_name = state.stage_name;
    event.message = "update";
    return event;
}

std::string file_of(const std::string& text) {
    return docflow::wire::decode_status(docflow::wire::decode(text).body).file_id;
}

} // namespace

class StatusBroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        docflow::Metrics::getInstance().reset();
        docflow::register_builtin_stages(registry_, std::make_shared<docflow::InMemoryVectorStore>());
        orchestrator_ = std::make_unique<docflow::IngestionOrchestrator>(
            ioc_.get_executor(), registry_,
            [this](const docflow::StatusEvent& e) { broadcaster_->publish(e); });
        broadcaster_ = std::make_unique<docflow::StatusBroadcaster>(*orchestrator_);
    }

    void TearDown() override {
        broadcaster_.reset();
        orchestrator_.reset();
        docflow::Metrics::getInstance().reset();
    }

    void import_file(const std::string& file_id, const std::string& text) {
        docflow::IngestionRecord record;
        record.file_id = file_id;
        record.display_name = file_id;
        record.raw_payload = text;
        record.pipeline_config = docflow::wire::default_pipeline(docflow::default_config().pipeline);
        ASSERT_TRUE(orchestrator_->submit(record));
        ioc_.restart();
        ioc_.run();
    }

    boost::asio::io_context ioc_;
    docflow::StageRegistry registry_;
    std::unique_ptr<docflow::IngestionOrchestrator> orchestrator_;
    std::unique_ptr<docflow::StatusBroadcaster> broadcaster_;
};

TEST_F(StatusBroadcasterTest, ObserversReceiveOnlyWatchedFiles) {
    auto first = std::make_shared<RecordingObserver>();
    auto second = std::make_shared<RecordingObserver>();
    auto everything = std::make_shared<RecordingObserver>();

    auto first_id = broadcaster_->subscribe(first);
    auto second_id = broadcaster_->subscribe(second);
    broadcaster_->subscribe(everything);
    broadcaster_->watch(first_id, "f1");
    broadcaster_->watch(second_id, "f2");

    EXPECT_EQ(broadcaster_->publish(event("f1", docflow::IngestionState::waiting())), 2u);

    ASSERT_EQ(first->received.size(), 1u);
    EXPECT_EQ(file_of(first->received[0]), "f1");
    EXPECT_TRUE(second->received.empty());
    EXPECT_EQ(everything->received.size(), 1u);
}

TEST_F(StatusBroadcasterTest, FailingObserverDoesNotStopDelivery) {
    auto failing = std::make_shared<ThrowingObserver>();
    auto healthy = std::make_shared<RecordingObserver>();
    broadcaster_->subscribe(failing);
    broadcaster_->subscribe(healthy);

    EXPECT_EQ(broadcaster_->publish(event("f1", docflow::IngestionState::done())), 1u);
    EXPECT_EQ(healthy->received.size(), 1u);
}

TEST_F(StatusBroadcasterTest, GoneObserversArePruned) {
    auto observer = std::make_shared<RecordingObserver>();
    broadcaster_->subscribe(observer);
    EXPECT_EQ(broadcaster_->observer_count(), 1u);

    observer.reset();
    EXPECT_EQ(broadcaster_->publish(event("f1", docflow::IngestionState::done())), 0u);
    EXPECT_EQ(broadcaster_->observer_count(), 0u);
}

TEST_F(StatusBroadcasterTest, UnobservedEventsAreDropped) {
    EXPECT_EQ(broadcaster_->publish(event("f1", docflow::IngestionState::waiting())), 0u);
    EXPECT_EQ(docflow::Metrics::getInstance().counter_value("status_events_dropped"), 1);

    auto observer = std::make_shared<RecordingObserver>();
    auto id = broadcaster_->subscribe(observer);
    EXPECT_TRUE(observer->received.empty());

    EXPECT_TRUE(broadcaster_->unsubscribe(id));
    EXPECT_FALSE(broadcaster_->unsubscribe(id));
    EXPECT_EQ(broadcaster_->publish(event("f1", docflow::IngestionState::done())), 0u);
    EXPECT_TRUE(observer->received.empty());
}

TEST_F(StatusBroadcasterTest, SnapshotReportsStateReachedWhileAway) {
    import_file("f1", "Every event of this import is published while nobody listens.");

    auto snapshot = broadcaster_->snapshot({"f1", "ghost"});
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_TRUE(snapshot[0].known);
    EXPECT_EQ(snapshot[0].state.phase, docflow::IngestionPhase::DONE);
    EXPECT_EQ(snapshot[0].message, "Stored 1 chunks");
    EXPECT_FALSE(snapshot[1].known);

    auto everything = broadcaster_->snapshot({});
    ASSERT_EQ(everything.size(), 1u);
    EXPECT_EQ(everything[0].file_id, "f1");
    EXPECT_GT(docflow::Metrics::getInstance().counter_value("status_events_dropped"), 0);
}

TEST_F(StatusBroadcasterTest, DerivedFilesJoinTheOriginalsWatchList) {
    auto watcher = std::make_shared<RecordingObserver>();
    auto other = std::make_shared<RecordingObserver>();
    auto watcher_id = broadcaster_->subscribe(watcher);
    auto other_id = broadcaster_->subscribe(other);
    broadcaster_->watch(watcher_id, "f1");
    broadcaster_->watch(other_id, "f2");

    EXPECT_EQ(broadcaster_->publish_derived({"f1_1", "f1", "part two"}), 1u);
    ASSERT_EQ(watcher->received.size(), 1u);
    auto notice = docflow::wire::decode_derived(docflow::wire::decode(watcher->received[0]).body);
    EXPECT_EQ(notice.new_file_id, "f1_1");
    EXPECT_EQ(notice.original_file_id, "f1");

    EXPECT_EQ(broadcaster_->publish(event("f1_1", docflow::IngestionState::done())), 1u);
    EXPECT_EQ(watcher->received.size(), 2u);
    EXPECT_TRUE(other->received.empty());
}
