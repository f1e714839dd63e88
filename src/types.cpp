#include "docflow/types.hpp"

namespace docflow {

const char* to_string(ChannelState state) {
    switch (state) {
        case ChannelState::DISCONNECTED: return "DISCONNECTED";
        case ChannelState::CONNECTING: return "CONNECTING";
        case ChannelState::CONNECTED: return "CONNECTED";
        case ChannelState::RECONNECTING: return "RECONNECTING";
        case ChannelState::OFFLINE: return "OFFLINE";
    }
    return "UNKNOWN";
}

const char* to_string(StageKind kind) {
    switch (kind) {
        case StageKind::Loader: return "Loader";
        case StageKind::Splitter: return "Splitter";
        case StageKind::Vectorizer: return "Vectorizer";
        case StageKind::Sink: return "Sink";
    }
    return "Unknown";
}

std::optional<StageKind> parse_stage_kind(const std::string& name) {
    // Accept both the stage kind names and the rag_config component names
    if (name == "Loader" || name == "Reader") return StageKind::Loader;
    if (name == "Splitter" || name == "Chunker") return StageKind::Splitter;
    if (name == "Vectorizer" || name == "Embedder") return StageKind::Vectorizer;
    if (name == "Sink") return StageKind::Sink;
    return std::nullopt;
}

std::optional<StageKind> next_stage(StageKind kind) {
    switch (kind) {
        case StageKind::Loader: return StageKind::Splitter;
        case StageKind::Splitter: return StageKind::Vectorizer;
        case StageKind::Vectorizer: return StageKind::Sink;
        case StageKind::Sink: return std::nullopt;
    }
    return std::nullopt;
}

const char* to_string(IngestionPhase phase) {
    switch (phase) {
        case IngestionPhase::WAITING: return "WAITING";
        case IngestionPhase::RUNNING: return "RUNNING";
        case IngestionPhase::DONE: return "DONE";
        case IngestionPhase::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* status_name(const IngestionState& state) {
    switch (state.phase) {
        case IngestionPhase::WAITING: return "WAITING";
        case IngestionPhase::DONE: return "DONE";
        case IngestionPhase::ERROR: return "ERROR";
        case IngestionPhase::RUNNING:
            break;
    }
    if (!state.stage) {
        return "RUNNING";
    }
    switch (*state.stage) {
        case StageKind::Loader: return "LOADING";
        case StageKind::Splitter: return "CHUNKING";
        case StageKind::Vectorizer: return "EMBEDDING";
        case StageKind::Sink: return "INGESTING";
    }
    return "RUNNING";
}

const char* to_string(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::RUNNING: return "running";
        case StageOutcome::COMPLETED: return "completed";
        case StageOutcome::FAILED: return "failed";
        case StageOutcome::DISCARDED: return "discarded";
    }
    return "unknown";
}

} // namespace docflow
