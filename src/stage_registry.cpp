#include "docflow/stage_registry.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"

namespace docflow {

void StageRegistry::register_stage(PipelineStageDescriptor descriptor) {
    DOCFLOW_CHECK_ARGUMENT(!descriptor.name.empty(), "stage name must not be empty");
    DOCFLOW_CHECK_ARGUMENT(static_cast<bool>(descriptor.process), "stage must have a process function");

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(descriptor.kind, descriptor.name);
    if (stages_.count(key) > 0) {
        throw DuplicateStageError(std::string(to_string(descriptor.kind)) + " '" + descriptor.name +
                                  "' is already registered");
    }

    DOCFLOW_LOG_DEBUG(std::string("Registered ") + to_string(descriptor.kind) + " stage " + descriptor.name);
    stages_.emplace(std::move(key), std::make_shared<const PipelineStageDescriptor>(std::move(descriptor)));
}

StageHandle StageRegistry::resolve(StageKind kind, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stages_.find(std::make_pair(kind, name));
    if (it == stages_.end()) {
        throw UnknownStageError(std::string("No ") + to_string(kind) + " named '" + name + "'");
    }
    return it->second;
}

bool StageRegistry::contains(StageKind kind, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stages_.count(std::make_pair(kind, name)) > 0;
}

std::vector<StageHandle> StageRegistry::list_available(StageKind kind) const {
    std::vector<StageHandle> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, handle] : stages_) {
        if (key.first == kind) {
            result.push_back(handle);
        }
    }
    return result;
}

size_t StageRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stages_.size();
}

} // namespace docflow
