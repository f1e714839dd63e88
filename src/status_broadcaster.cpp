#include "docflow/status_broadcaster.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include <utility>

namespace docflow {

StatusBroadcaster::StatusBroadcaster(const IngestionOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {}

ObserverId StatusBroadcaster::subscribe(std::weak_ptr<StatusObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    ObserverId id = ++last_id_;
    subscriptions_[id] = Subscription{std::move(observer), {}};
    Metrics::getInstance().set_gauge("observers_connected", static_cast<double>(subscriptions_.size()));
    return id;
}

bool StatusBroadcaster::unsubscribe(ObserverId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = subscriptions_.erase(id) > 0;
    Metrics::getInstance().set_gauge("observers_connected", static_cast<double>(subscriptions_.size()));
    return removed;
}

void StatusBroadcaster::watch(ObserverId id, const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it != subscriptions_.end()) {
        it->second.files.insert(file_id);
    }
}

size_t StatusBroadcaster::publish(const StatusEvent& event) {
    size_t delivered = deliver_to(event.file_id, wire::encode_status(event));
    if (delivered == 0) {
        DOCFLOW_LOG_TRACE("No observer for " + event.file_id + ", status " + status_name(event.state) + " dropped");
        Metrics::getInstance().increment_counter("status_events_dropped");
    }
    return delivered;
}

size_t StatusBroadcaster::publish_derived(const DerivedFileNotice& notice) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, subscription] : subscriptions_) {
            if (subscription.files.count(notice.original_file_id) > 0) {
                subscription.files.insert(notice.new_file_id);
            }
        }
    }
    return deliver_to(notice.original_file_id, wire::encode_derived(notice));
}

std::vector<wire::FileStatus> StatusBroadcaster::snapshot(const std::vector<std::string>& file_ids) const {
    std::vector<std::string> ids = file_ids.empty() ? orchestrator_.file_ids() : file_ids;

    std::vector<wire::FileStatus> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        wire::FileStatus status;
        status.file_id = id;
        auto record = orchestrator_.get_record(id);
        if (!record) {
            status.known = false;
        } else {
            status.state = record->state;
            status.message = record->status_message;
        }
        result.push_back(std::move(status));
    }
    return result;
}

size_t StatusBroadcaster::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

size_t StatusBroadcaster::deliver_to(const std::string& file_id, const std::string& text) {
    std::vector<std::pair<ObserverId, std::shared_ptr<StatusObserver>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
            auto observer = it->second.observer.lock();
            if (!observer) {
                it = subscriptions_.erase(it);
                continue;
            }
            if (it->second.files.empty() || it->second.files.count(file_id) > 0) {
                targets.emplace_back(it->first, std::move(observer));
            }
            ++it;
        }
    }

    size_t delivered = 0;
    for (const auto& [id, observer] : targets) {
        try {
            observer->deliver(text);
            ++delivered;
        } catch (const std::exception& e) {
            DOCFLOW_LOG_ERROR("Observer " + std::to_string(id) + " failed to receive update for " + file_id +
                              ": " + e.what());
        }
    }
    return delivered;
}

} // namespace docflow
