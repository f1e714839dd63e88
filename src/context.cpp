#include "docflow/context.hpp"
#include "docflow/logging.hpp"
#include <algorithm>

namespace docflow {

Context::Context(const Config& config)
    : config_(config),
      store_(std::make_shared<InMemoryVectorStore>()),
      codec_(sessions_),
      pool_(std::max<uint32_t>(1, config.pipeline.worker_threads)) {
    register_builtin_stages(stages_, store_);

    orchestrator_ = std::make_unique<IngestionOrchestrator>(
        pool_.get_executor(),
        stages_,
        [this](const StatusEvent& event) {
            if (broadcaster_) broadcaster_->publish(event);
        },
        [this](const DerivedFileNotice& notice) {
            if (broadcaster_) broadcaster_->publish_derived(notice);
        });
    broadcaster_ = std::make_unique<StatusBroadcaster>(*orchestrator_);

    DOCFLOW_LOG_INFO("Context ready with " + std::to_string(stages_.size()) + " stages and " +
                     std::to_string(std::max<uint32_t>(1, config.pipeline.worker_threads)) + " pipeline workers");
}

Context::~Context() {
    stop();
}

void Context::start_sweeper(boost::asio::any_io_executor executor) {
    if (sweeper_) {
        return;
    }
    sweeper_ = std::make_shared<PeriodicTimer>(
        std::move(executor),
        std::chrono::milliseconds(config_.transfer.sweep_interval_ms),
        "session sweep",
        [this]() { sweep_sessions(); });
    sweeper_->start();
    DOCFLOW_LOG_INFO("Sweeping transfers older than " + std::to_string(config_.transfer.session_max_age_ms) +
                     "ms every " + std::to_string(config_.transfer.sweep_interval_ms) + "ms");
}

void Context::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (sweeper_) {
        sweeper_->stop();
        sweeper_.reset();
    }
    pool_.stop();
    pool_.join();
    DOCFLOW_LOG_INFO("Pipeline workers stopped");
}

std::vector<std::string> Context::sweep_sessions() {
    auto swept = sessions_.sweep_expired(std::chrono::milliseconds(config_.transfer.session_max_age_ms));
    std::vector<std::string> expired;
    for (const auto& transfer_id : swept) {
        if (orchestrator_->get_state(transfer_id)) {
            DOCFLOW_LOG_DEBUG("Dropped leftover fragments of " + transfer_id + " without reporting");
            continue;
        }
        expired.push_back(transfer_id);
        StatusEvent event;
        event.file_id = transfer_id;
        event.state = IngestionState::error();
        event.message = "Transfer expired before all fragments arrived";
        event.timestamp = std::chrono::system_clock::now();
        broadcaster_->publish(event);
    }
    return expired;
}

} // namespace docflow
