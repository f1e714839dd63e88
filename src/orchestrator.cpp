#include "docflow/orchestrator.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include <boost/asio/post.hpp>
#include <iterator>

namespace docflow {

namespace {

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

IngestionOrchestrator::IngestionOrchestrator(boost::asio::any_io_executor executor,
                                             const StageRegistry& registry,
                                             EventSink events,
                                             DerivedSink derived)
    : executor_(std::move(executor)),
      registry_(registry),
      events_(std::move(events)),
      derived_(std::move(derived)) {}

bool IngestionOrchestrator::submit(IngestionRecord record) {
    DOCFLOW_CHECK_ARGUMENT(!record.file_id.empty(), "file id must not be empty");

    auto run = std::make_shared<FileRun>();
    std::unique_lock<std::mutex> run_lock(run->mutex);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(record.file_id);
        if (it != runs_.end()) {
            std::lock_guard<std::mutex> previous_lock(it->second->mutex);
            if (!it->second->record.state.is_terminal()) {
                DOCFLOW_LOG_WARNING("File " + record.file_id + " is already being imported, submission ignored");
                return false;
            }
        }

        record.state = IngestionState::waiting();
        record.stage_history.clear();
        record.status_message.clear();
        if (record.created_at == std::chrono::system_clock::time_point{}) {
            record.created_at = std::chrono::system_clock::now();
        }

        run->run_id = ++next_run_id_;
        run->started = std::chrono::steady_clock::now();
        run->work.file_id = record.file_id;
        run->work.display_name = record.display_name;
        run->work.raw_payload = record.raw_payload;
        run->work.metadata = record.metadata;
        if (record.preloaded) {
            run->work.documents.push_back(*record.preloaded);
        }
        run->record = std::move(record);
        runs_[run->record.file_id] = run;
    }

    DOCFLOW_LOG_INFO("Importing " + run->record.display_name + " (" + run->record.file_id + ")");
    Metrics::getInstance().increment_counter("files_submitted");
    emit(make_event(*run, "Waiting for import"));

    // Derived files arrive already loaded
    StageKind first = run->record.preloaded ? StageKind::Splitter : StageKind::Loader;
    uint64_t run_id = run->run_id;
    run_lock.unlock();

    schedule(run, run_id, first);
    return true;
}

bool IngestionOrchestrator::cancel(const std::string& file_id) {
    auto run = find(file_id);
    if (!run) {
        return false;
    }

    std::lock_guard<std::mutex> lock(run->mutex);
    if (run->record.state.is_terminal()) {
        return false;
    }
    run->record.state = IngestionState::error(run->record.state.stage, run->record.state.stage_name);
    DOCFLOW_LOG_INFO("Import of " + file_id + " cancelled");
    Metrics::getInstance().increment_counter("files_cancelled");
    emit(make_event(*run, "cancelled"));
    return true;
}

std::optional<IngestionState> IngestionOrchestrator::get_state(const std::string& file_id) const {
    auto run = find(file_id);
    if (!run) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(run->mutex);
    return run->record.state;
}

std::optional<IngestionRecord> IngestionOrchestrator::get_record(const std::string& file_id) const {
    auto run = find(file_id);
    if (!run) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(run->mutex);
    return run->record;
}

std::vector<std::string> IngestionOrchestrator::file_ids() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(runs_.size());
    for (const auto& [id, run] : runs_) {
        ids.push_back(id);
    }
    return ids;
}

bool IngestionOrchestrator::remove(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(file_id);
    if (it == runs_.end()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> run_lock(it->second->mutex);
        if (!it->second->record.state.is_terminal()) {
            return false;
        }
    }
    runs_.erase(it);
    return true;
}

size_t IngestionOrchestrator::reset() {
    size_t dropped = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = runs_.begin(); it != runs_.end();) {
        bool terminal;
        {
            std::lock_guard<std::mutex> run_lock(it->second->mutex);
            terminal = it->second->record.state.is_terminal();
        }
        if (terminal) {
            it = runs_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    DOCFLOW_LOG_INFO("Reset dropped " + std::to_string(dropped) + " finished imports");
    return dropped;
}

size_t IngestionOrchestrator::active() const {
    size_t count = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, run] : runs_) {
        std::lock_guard<std::mutex> run_lock(run->mutex);
        if (!run->record.state.is_terminal()) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Stage execution
// =============================================================================

void IngestionOrchestrator::schedule(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind) {
    boost::asio::post(executor_, [this, run, run_id, kind]() {
        run_stage(run, run_id, kind);
    });
}

void IngestionOrchestrator::run_stage(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind) {
    StageSelection selection;
    std::string file_id;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (run->run_id != run_id || run->record.state.is_terminal()) {
            return;
        }
        auto it = run->record.pipeline_config.stages.find(kind);
        if (it != run->record.pipeline_config.stages.end()) {
            selection = it->second;
        }
        file_id = run->record.file_id;

        run->record.state = IngestionState::running(kind, selection.name);
        run->record.stage_history.push_back(
            StageHistoryEntry{kind, selection.name, StageOutcome::RUNNING, "", elapsed_ms_since(run->started)});
        emit(make_event(*run, std::string("Running ") + to_string(kind) + " " + selection.name));
    }

    DOCFLOW_LOG_DEBUG(std::string("Starting ") + to_string(kind) + " " + selection.name + " for " + file_id);
    auto stage_start = std::chrono::steady_clock::now();

    // Only the invoked stage touches run->work until it completes
    auto completed = std::make_shared<std::atomic<bool>>(false);
    StageCompletion done = [this, run, run_id, kind, name = selection.name, stage_start,
                            completed](std::string summary, std::exception_ptr error) {
        if (completed->exchange(true)) {
            DOCFLOW_LOG_WARNING(std::string(to_string(kind)) + " " + name + " completed more than once");
            return;
        }
        finish_stage(run, run_id, kind, name, stage_start, std::move(summary), error);
    };

    try {
        if (selection.name.empty()) {
            throw UnknownStageError(std::string("No ") + to_string(kind) + " selected");
        }
        StageHandle stage = registry_.resolve(kind, selection.name);
        StageConfig config = with_defaults(stage->config_schema, selection.config);
        stage->process(run->work, config, done);
    } catch (const std::exception&) {
        done({}, std::current_exception());
    }
}

void IngestionOrchestrator::finish_stage(const std::shared_ptr<FileRun>& run, uint64_t run_id, StageKind kind,
                                         const std::string& stage_name,
                                         std::chrono::steady_clock::time_point stage_start,
                                         std::string summary, std::exception_ptr error) {
    bool succeeded = !error;
    std::string message = std::move(summary);
    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const DocflowException& e) {
            message = e.what();
        } catch (const std::exception& e) {
            message = std::string("Unexpected failure: ") + e.what();
        }
    }

    std::string file_id = run->work.file_id;
    int64_t stage_ms = elapsed_ms_since(stage_start);
    Metrics::getInstance().record_histogram("stage_latency_ms", static_cast<double>(stage_ms),
                                            {{"stage", to_string(kind)}});
    DOCFLOW_LOG_DEBUG(std::string("Finished ") + to_string(kind) + " " + stage_name + " for " + file_id +
                      " in " + std::to_string(stage_ms) + "ms");

    std::vector<LoadedDocument> extra_documents;
    std::optional<StageKind> next;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        StageHistoryEntry& entry = run->record.stage_history.back();
        entry.elapsed_ms = elapsed_ms_since(run->started);
        entry.message = message;

        if (run->run_id != run_id || run->record.state.is_terminal()) {
            entry.outcome = StageOutcome::DISCARDED;
            DOCFLOW_LOG_INFO("Discarding " + std::string(to_string(kind)) + " result for " + file_id +
                             ", import already finished");
            return;
        }

        if (!succeeded) {
            entry.outcome = StageOutcome::FAILED;
            run->record.state = IngestionState::error(kind, stage_name);
            DOCFLOW_LOG_ERROR("Import of " + file_id + " failed in " + to_string(kind) + " " +
                              stage_name + ": " + message);
            Metrics::getInstance().increment_counter("files_error");
            emit(make_event(*run, message));
            return;
        }

        entry.outcome = StageOutcome::COMPLETED;
        if (kind == StageKind::Loader && run->work.documents.size() > 1) {
            auto first_extra = run->work.documents.begin() + 1;
            extra_documents.assign(std::make_move_iterator(first_extra),
                                   std::make_move_iterator(run->work.documents.end()));
            run->work.documents.erase(first_extra, run->work.documents.end());
        }

        next = next_stage(kind);
        if (!next) {
            run->record.state = IngestionState::done();
            DOCFLOW_LOG_INFO("Import of " + file_id + " done in " +
                             std::to_string(elapsed_ms_since(run->started)) + "ms");
            Metrics::getInstance().increment_counter("files_done");
            emit(make_event(*run, message));
        }
    }

    if (!extra_documents.empty()) {
        spawn_derived(run, std::move(extra_documents));
    }
    if (next) {
        schedule(run, run_id, *next);
    }
}

void IngestionOrchestrator::spawn_derived(const std::shared_ptr<FileRun>& run,
                                          std::vector<LoadedDocument> documents) {
    std::string original_id;
    std::string display_name;
    PipelineConfig pipeline;
    boost::json::object metadata;
    size_t base = 0;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        original_id = run->record.file_id;
        display_name = run->record.display_name;
        pipeline = run->record.pipeline_config;
        metadata = run->record.metadata;
        base = run->derived_count;
        run->derived_count += documents.size();
    }

    for (size_t i = 0; i < documents.size(); ++i) {
        std::string number = std::to_string(base + i + 1);
        LoadedDocument& document = documents[i];

        IngestionRecord derived;
        derived.file_id = original_id + "_" + number;
        derived.display_name = document.title.empty() ? display_name + " (" + number + ")" : document.title;
        derived.raw_payload = document.text;
        derived.pipeline_config = pipeline;
        derived.metadata = metadata;
        derived.metadata["original_file_id"] = original_id;
        derived.created_at = std::chrono::system_clock::now();
        derived.preloaded = std::move(document);

        DerivedFileNotice notice{derived.file_id, original_id, derived.display_name};
        if (derived_) {
            try {
                derived_(notice);
            } catch (const std::exception& e) {
                DOCFLOW_LOG_ERROR("Derived file notification for " + notice.new_file_id + " failed: " + e.what());
            }
        }
        Metrics::getInstance().increment_counter("files_derived");

        if (!submit(std::move(derived))) {
            DOCFLOW_LOG_WARNING("Derived file " + notice.new_file_id + " is still importing, not resubmitted");
        }
    }
}

StatusEvent IngestionOrchestrator::make_event(FileRun& run, const std::string& message) const {
    run.record.status_message = message;
    StatusEvent event;
    event.file_id = run.record.file_id;
    event.state = run.record.state;
    event.stage_name = run.record.state.stage_name;
    event.message = message;
    event.elapsed_ms = elapsed_ms_since(run.started);
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

void IngestionOrchestrator::emit(const StatusEvent& event) const {
    if (!events_) {
        return;
    }
    try {
        events_(event);
    } catch (const std::exception& e) {
        DOCFLOW_LOG_ERROR("Status event for " + event.file_id + " could not be delivered: " + e.what());
    }
}

std::shared_ptr<IngestionOrchestrator::FileRun> IngestionOrchestrator::find(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(file_id);
    return it == runs_.end() ? nullptr : it->second;
}

} // namespace docflow
