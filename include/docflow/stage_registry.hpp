#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "docflow/pipeline_stage.hpp"

namespace docflow {

using StageHandle = std::shared_ptr<const PipelineStageDescriptor>;

/**
 * Registration table of pipeline stages keyed by (kind, name).
 *
 * Populated at startup by explicit registration calls; descriptors are
 * immutable once registered and handles stay valid for the registry's
 * lifetime.
 */
class StageRegistry {
public:
    StageRegistry() = default;

    StageRegistry(const StageRegistry&) = delete;
    StageRegistry& operator=(const StageRegistry&) = delete;

    // Throws DuplicateStageError when (kind, name) is taken
    void register_stage(PipelineStageDescriptor descriptor);

    // Throws UnknownStageError when nothing matches
    StageHandle resolve(StageKind kind, const std::string& name) const;

    bool contains(StageKind kind, const std::string& name) const;

    // Snapshot of the current registrations of one kind, ordered by name
    std::vector<StageHandle> list_available(StageKind kind) const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<StageKind, std::string>, StageHandle> stages_;
};

} // namespace docflow
