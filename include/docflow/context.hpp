#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>
#include "docflow/builtin_stages.hpp"
#include "docflow/chunk_codec.hpp"
#include "docflow/config.hpp"
#include "docflow/orchestrator.hpp"
#include "docflow/periodic_timer.hpp"
#include "docflow/stage_registry.hpp"
#include "docflow/status_broadcaster.hpp"
#include "docflow/transfer_session_registry.hpp"

namespace docflow {

/**
 * Everything the import server shares between connections, built once at
 * process start and passed by reference.
 *
 * Stage runs execute on a private thread pool of pipeline.worker_threads
 * threads. The pool is stopped and joined before any component it touches
 * is destroyed.
 */
class Context {
public:
    explicit Context(const Config& config);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Starts the periodic sweep of stale transfer sessions on `executor`
    void start_sweeper(boost::asio::any_io_executor executor);

    // Stops the sweeper and waits for running stages to finish. Call before
    // the sweeper's executor is destroyed.
    void stop();

    // Runs one sweep now and reports each expired transfer as ERROR to its
    // observers; returns the reported transfer ids. A transfer whose file the
    // orchestrator already tracks keeps the state the pipeline gave it.
    std::vector<std::string> sweep_sessions();

    const Config& config() const { return config_; }
    StageRegistry& stages() { return stages_; }
    InMemoryVectorStore& store() { return *store_; }
    TransferSessionRegistry& sessions() { return sessions_; }
    ChunkCodec& codec() { return codec_; }
    IngestionOrchestrator& orchestrator() { return *orchestrator_; }
    StatusBroadcaster& broadcaster() { return *broadcaster_; }

private:
    Config config_;
    StageRegistry stages_;
    std::shared_ptr<InMemoryVectorStore> store_;
    TransferSessionRegistry sessions_;
    ChunkCodec codec_;
    boost::asio::thread_pool pool_;
    std::unique_ptr<IngestionOrchestrator> orchestrator_;
    std::unique_ptr<StatusBroadcaster> broadcaster_;
    std::shared_ptr<PeriodicTimer> sweeper_;
    bool stopped_ = false;
};

} // namespace docflow
