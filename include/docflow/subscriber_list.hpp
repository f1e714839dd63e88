#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "docflow/logging.hpp"

namespace docflow {

using SubscriptionId = uint64_t;

/**
 * Ordered list of callbacks for one event type.
 *
 * dispatch() calls subscribers synchronously in registration order, on a
 * snapshot taken under the lock, so subscribers may add or remove entries
 * while being called. An exception thrown by one subscriber is logged and
 * does not prevent delivery to the rest.
 */
template<typename... Args>
class SubscriberList {
public:
    using Callback = std::function<void(Args...)>;

    explicit SubscriberList(std::string event_name) : event_name_(std::move(event_name)) {}

    SubscriptionId add(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = ++last_id_;
        entries_.emplace_back(id, std::move(callback));
        return id;
    }

    bool remove(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == id) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void dispatch(Args... args) const {
        std::vector<std::pair<SubscriptionId, Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = entries_;
        }
        for (const auto& [id, callback] : snapshot) {
            try {
                callback(args...);
            } catch (const std::exception& e) {
                DOCFLOW_LOG_ERROR("Subscriber " + std::to_string(id) + " failed handling " +
                                  event_name_ + ": " + e.what());
            }
        }
    }

private:
    std::string event_name_;
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Callback>> entries_;
    SubscriptionId last_id_ = 0;
};

} // namespace docflow
