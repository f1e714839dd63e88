/**
 * Core data model shared by the transport, reassembly and pipeline layers.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/json.hpp>

namespace docflow {

// =============================================================================
// Channel
// =============================================================================

enum class ChannelState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    OFFLINE
};

const char* to_string(ChannelState state);

// =============================================================================
// Pipeline stages
// =============================================================================

enum class StageKind {
    Loader,
    Splitter,
    Vectorizer,
    Sink
};

// Strict execution order within one file
constexpr std::array<StageKind, 4> kPipelineOrder = {
    StageKind::Loader, StageKind::Splitter, StageKind::Vectorizer, StageKind::Sink
};

const char* to_string(StageKind kind);
std::optional<StageKind> parse_stage_kind(const std::string& name);
std::optional<StageKind> next_stage(StageKind kind);

// One document produced by a Loader
struct LoadedDocument {
    std::string title;
    std::string text;
    boost::json::object meta;
};

struct TextChunk {
    size_t index = 0;
    std::string text;
};

using Embedding = std::vector<float>;

struct StoreAck {
    size_t stored = 0;
};

// Stage settings are flat key/value pairs, e.g. {"units": 250, "overlap": 50}
using StageConfig = boost::json::object;

struct StageSelection {
    std::string name;
    StageConfig config;
};

struct PipelineConfig {
    std::map<StageKind, StageSelection> stages;

    bool has(StageKind kind) const { return stages.count(kind) > 0; }
    const StageSelection& at(StageKind kind) const { return stages.at(kind); }
};

// =============================================================================
// Ingestion state machine
// =============================================================================

enum class IngestionPhase {
    WAITING,
    RUNNING,
    DONE,
    ERROR
};

struct IngestionState {
    IngestionPhase phase = IngestionPhase::WAITING;
    std::optional<StageKind> stage;   // set while RUNNING, and on ERROR when a stage failed
    std::string stage_name;

    bool is_terminal() const {
        return phase == IngestionPhase::DONE || phase == IngestionPhase::ERROR;
    }

    static IngestionState waiting() { return IngestionState{}; }
    static IngestionState running(StageKind kind, const std::string& name) {
        return IngestionState{IngestionPhase::RUNNING, kind, name};
    }
    static IngestionState done() { return IngestionState{IngestionPhase::DONE, std::nullopt, ""}; }
    static IngestionState error(std::optional<StageKind> kind = std::nullopt, const std::string& name = "") {
        return IngestionState{IngestionPhase::ERROR, kind, name};
    }

    bool operator==(const IngestionState& other) const {
        return phase == other.phase && stage == other.stage && stage_name == other.stage_name;
    }
    bool operator!=(const IngestionState& other) const { return !(*this == other); }
};

const char* to_string(IngestionPhase phase);

// Status name used on the wire: WAITING, LOADING, CHUNKING, EMBEDDING, INGESTING, DONE, ERROR
const char* status_name(const IngestionState& state);

enum class StageOutcome {
    RUNNING,
    COMPLETED,
    FAILED,
    DISCARDED
};

const char* to_string(StageOutcome outcome);

struct StageHistoryEntry {
    StageKind kind = StageKind::Loader;
    std::string stage_name;
    StageOutcome outcome = StageOutcome::RUNNING;
    std::string message;
    int64_t elapsed_ms = 0;
};

struct IngestionRecord {
    std::string file_id;
    std::string display_name;
    std::string raw_payload;
    PipelineConfig pipeline_config;
    IngestionState state;
    std::vector<StageHistoryEntry> stage_history;
    std::chrono::system_clock::time_point created_at{};

    // Message of the latest status event
    std::string status_message;

    // Descriptor fields handed to the Sink (extension, labels, source, ...)
    boost::json::object metadata;

    // Derived files arrive already loaded and start at the Splitter
    std::optional<LoadedDocument> preloaded;
};

struct StatusEvent {
    std::string file_id;
    IngestionState state;
    std::string stage_name;
    std::string message;
    int64_t elapsed_ms = 0;
    std::chrono::system_clock::time_point timestamp{};
};

// Server-side processing produced a new file under a new identifier
struct DerivedFileNotice {
    std::string new_file_id;
    std::string original_file_id;
    std::string filename;
};

} // namespace docflow
