/**
 * Ingestion Orchestrator
 * ======================
 *
 * One state machine per file:
 *
 *   WAITING -> RUNNING(Loader) -> RUNNING(Splitter) -> RUNNING(Vectorizer)
 *           -> RUNNING(Sink) -> DONE
 *
 * Any stage failure ends the run in ERROR; stages already applied are not
 * rolled back. Each stage is a separate task posted to the executor, so files
 * never wait behind each other, and a stage that completes asynchronously
 * holds no worker while it waits. Stage errors (and anything else a stage
 * throws or completes with) are converted to ERROR at the invocation boundary.
 *
 * Status events for one file are emitted under that file's lock, so each
 * file's event stream is ordered. The event sink must not call back into the
 * orchestrator.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include "docflow/pipeline_stage.hpp"
#include "docflow/stage_registry.hpp"
#include "docflow/types.hpp"

namespace docflow {

class IngestionOrchestrator {
public:
    using EventSink = std::function<void(const StatusEvent&)>;
    using DerivedSink = std::function<void(const DerivedFileNotice&)>;

    // Handlers posted to `executor` must not run after the orchestrator is
    // destroyed; stop the executor first
    IngestionOrchestrator(boost::asio::any_io_executor executor,
                          const StageRegistry& registry,
                          EventSink events,
                          DerivedSink derived = {});

    IngestionOrchestrator(const IngestionOrchestrator&) = delete;
    IngestionOrchestrator& operator=(const IngestionOrchestrator&) = delete;

    // Starts a fresh run; returns false while the file is WAITING or RUNNING
    bool submit(IngestionRecord record);

    // Moves a non-terminal file to ERROR("cancelled"); an in-flight stage
    // result is discarded when it returns
    bool cancel(const std::string& file_id);

    std::optional<IngestionState> get_state(const std::string& file_id) const;
    std::optional<IngestionRecord> get_record(const std::string& file_id) const;
    std::vector<std::string> file_ids() const;

    // Forgets a terminal file
    bool remove(const std::string& file_id);

    // Forgets every terminal file; returns how many were dropped
    size_t reset();

    size_t active() const;

private:
    struct FileRun {
        mutable std::mutex mutex;
        IngestionRecord record;
        PipelineWork work;
        uint64_t run_id = 0;
        std::chrono::steady_clock::time_point started;
        size_t derived_count = 0;
    };

    void schedule(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind);
    void run_stage(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind);
    // Continues the run once the stage invoked by run_stage has completed
    void finish_stage(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind,
                      const std::string& stage_name, std::chrono::steady_clock::time_point stage_start,
                      std::string summary, std::exception_ptr error);
    void spawn_derived(const std::shared_ptr<FileRun>& run, std::vector<LoadedDocument> documents);

    // Expects run.mutex held; also records the message on the record
    StatusEvent make_event(FileRun& run, const std::string& message) const;
    void emit(const StatusEvent& event) const;

    std::shared_ptr<FileRun> find(const std::string& file_id) const;

    boost::asio::any_io_executor executor_;
    const StageRegistry& registry_;
    EventSink events_;
    DerivedSink derived_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FileRun>> runs_;
    std::atomic<uint64_t> next_run_id_{0};
};

} // namespace docflow
