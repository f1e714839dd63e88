#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "docflow/orchestrator.hpp"
#include "docflow/types.hpp"
#include "docflow/wire_protocol.hpp"

namespace docflow {

using ObserverId = uint64_t;

// A connected peer that receives encoded wire messages
class StatusObserver {
public:
    virtual ~StatusObserver() = default;

    // Must not block; implementations queue the text for transmission
    virtual void deliver(const std::string& text) = 0;
};

/**
 * Fans status events out to the currently connected observers.
 *
 * Nothing is buffered: an event published while no observer is interested is
 * dropped. Observers that were away call snapshot() to catch up. Observers
 * are held weakly and pruned once they are gone.
 */
class StatusBroadcaster {
public:
    explicit StatusBroadcaster(const IngestionOrchestrator& orchestrator);

    StatusBroadcaster(const StatusBroadcaster&) = delete;
    StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

    ObserverId subscribe(std::weak_ptr<StatusObserver> observer);
    bool unsubscribe(ObserverId id);

    // Limits an observer to the files it watches; an observer that watches
    // nothing receives every event
    void watch(ObserverId id, const std::string& file_id);

    // Returns the number of observers the event reached
    size_t publish(const StatusEvent& event);

    // Delivered to observers of the original file, which then also watch the new one
    size_t publish_derived(const DerivedFileNotice& notice);

    // Current state of the given files; an empty list means every known file
    std::vector<wire::FileStatus> snapshot(const std::vector<std::string>& file_ids) const;

    size_t observer_count() const;

private:
    struct Subscription {
        std::weak_ptr<StatusObserver> observer;
        std::set<std::string> files;
    };

    size_t deliver_to(const std::string& file_id, const std::string& text);

    const IngestionOrchestrator& orchestrator_;
    mutable std::mutex mutex_;
    std::map<ObserverId, Subscription> subscriptions_;
    ObserverId last_id_ = 0;
};

} // namespace docflow
