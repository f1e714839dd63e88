#include "docflow/wire_protocol.hpp"
#include "docflow/error.hpp"
#include <cmath>
#include <limits>

namespace docflow {
namespace wire {

namespace json = boost::json;

namespace {

std::string to_std(const json::string& s) {
    return std::string(s.data(), s.size());
}

const json::value& require(const json::object& body, const char* key) {
    const json::value* value = body.if_contains(key);
    if (!value) {
        throw ProtocolError(std::string("Missing field '") + key + "'");
    }
    return *value;
}

std::string require_string(const json::object& body, const char* key) {
    const json::value& value = require(body, key);
    if (!value.is_string()) {
        throw ProtocolError(std::string("Field '") + key + "' must be a string");
    }
    return to_std(value.get_string());
}

std::string optional_string(const json::object& body, const char* key, const std::string& fallback = "") {
    const json::value* value = body.if_contains(key);
    if (!value || !value->is_string()) {
        return fallback;
    }
    return to_std(value->get_string());
}

int64_t require_integer(const json::object& body, const char* key) {
    const json::value& value = require(body, key);
    if (value.is_int64()) {
        return value.get_int64();
    }
    if (value.is_uint64() && value.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(value.get_uint64());
    }
    if (value.is_double()) {
        double d = value.get_double();
        if (std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return static_cast<int64_t>(d);
        }
    }
    throw ProtocolError(std::string("Field '") + key + "' must be an integer");
}

uint32_t require_count(const json::object& body, const char* key) {
    int64_t value = require_integer(body, key);
    if (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ProtocolError(std::string("Field '") + key + "' out of range");
    }
    return static_cast<uint32_t>(value);
}

double number_or(const json::value* value, double fallback) {
    if (!value) return fallback;
    if (value->is_double()) return value->get_double();
    if (value->is_int64()) return static_cast<double>(value->get_int64());
    if (value->is_uint64()) return static_cast<double>(value->get_uint64());
    return fallback;
}

std::string type_of(const json::object& body) {
    return optional_string(body, "type");
}

double took_seconds(int64_t elapsed_ms) {
    return std::round(static_cast<double>(elapsed_ms) / 10.0) / 100.0;
}

const char* rag_key(StageKind kind) {
    switch (kind) {
        case StageKind::Loader: return "Reader";
        case StageKind::Splitter: return "Chunker";
        case StageKind::Vectorizer: return "Embedder";
        case StageKind::Sink: return "Sink";
    }
    return "";
}

const std::string& default_stage_name(StageKind kind, const PipelineDefaults& defaults) {
    switch (kind) {
        case StageKind::Loader: return defaults.loader;
        case StageKind::Splitter: return defaults.splitter;
        case StageKind::Vectorizer: return defaults.vectorizer;
        case StageKind::Sink: break;
    }
    return defaults.sink;
}

json::object status_object(const std::string& file_id, const IngestionState& state, const std::string& message) {
    json::object body;
    body["fileID"] = file_id;
    body["status"] = status_name(state);
    body["stage"] = state.stage_name;
    body["message"] = message;
    return body;
}

void append_unicode_escape(std::string& out, uint32_t unit) {
    static const char* digits = "0123456789abcdef";
    out += "\\u";
    for (int shift = 12; shift >= 0; shift -= 4) {
        out += digits[(unit >> shift) & 0xF];
    }
}

// Serialized JSON only carries non-ASCII bytes inside strings, so escaping
// them keeps the document valid and lets fragments cut at any byte offset.
// Invalid sequences are escaped byte by byte.
std::string escape_non_ascii(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto byte = static_cast<unsigned char>(text[i]);
        if (byte < 0x80) {
            out += static_cast<char>(byte);
            ++i;
            continue;
        }

        size_t length = byte >= 0xF0 ? 4 : byte >= 0xE0 ? 3 : byte >= 0xC0 ? 2 : 0;
        uint32_t code_point = length == 4 ? (byte & 0x07u) : length == 3 ? (byte & 0x0Fu) : (byte & 0x1Fu);
        bool valid = length > 0 && i + length <= text.size();
        for (size_t k = 1; valid && k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            valid = (next & 0xC0) == 0x80;
            code_point = (code_point << 6) | (next & 0x3Fu);
        }
        if (!valid || code_point > 0x10FFFF) {
            append_unicode_escape(out, byte);
            ++i;
            continue;
        }

        if (code_point >= 0x10000) {
            code_point -= 0x10000;
            append_unicode_escape(out, 0xD800 + (code_point >> 10));
            append_unicode_escape(out, 0xDC00 + (code_point & 0x3FF));
        } else {
            append_unicode_escape(out, code_point);
        }
        i += length;
    }
    return out;
}

StatusMessage status_from_object(const json::object& body) {
    StatusMessage status;
    status.file_id = require_string(body, "fileID");
    status.status = require_string(body, "status");
    status.stage = optional_string(body, "stage");
    status.message = optional_string(body, "message");
    status.took = number_or(body.if_contains("took"), 0.0);
    return status;
}

} // namespace

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Ping: return "ping";
        case MessageType::Pong: return "pong";
        case MessageType::Fragment: return "fragment";
        case MessageType::Status: return "status";
        case MessageType::Derived: return "derived";
        case MessageType::Snapshot: return "snapshot";
        case MessageType::Cancel: return "cancel";
        case MessageType::Metrics: return "metrics";
        case MessageType::Progress: return "progress";
        case MessageType::Unknown: return "unknown";
    }
    return "unknown";
}

Message decode(const std::string& text) {
    boost::system::error_code ec;
    json::value parsed = json::parse(text, ec);
    if (ec) {
        throw ProtocolError("Invalid JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw ProtocolError("Message must be a JSON object");
    }

    Message message;
    message.body = std::move(parsed.get_object());
    const json::object& body = message.body;

    std::string type = type_of(body);
    if (type == "ping") {
        message.type = MessageType::Ping;
    } else if (type == "pong") {
        message.type = MessageType::Pong;
    } else if (type == "snapshot") {
        message.type = MessageType::Snapshot;
    } else if (type == "cancel") {
        message.type = MessageType::Cancel;
    } else if (type == "metrics") {
        message.type = MessageType::Metrics;
    } else if (type == "progress") {
        message.type = MessageType::Progress;
    } else if (body.contains("chunk")) {
        message.type = MessageType::Fragment;
    } else if (body.contains("new_file_id")) {
        message.type = MessageType::Derived;
    } else if (body.contains("fileID") && body.contains("status")) {
        message.type = MessageType::Status;
    }
    return message;
}

std::string make_ping() {
    return json::serialize(json::object{{"type", "ping"}});
}

std::string make_pong() {
    return json::serialize(json::object{{"type", "pong"}});
}

bool is_ping(const std::string& text) {
    boost::system::error_code ec;
    json::value parsed = json::parse(text, ec);
    return !ec && parsed.is_object() && type_of(parsed.get_object()) == "ping";
}

bool is_pong(const std::string& text) {
    boost::system::error_code ec;
    json::value parsed = json::parse(text, ec);
    return !ec && parsed.is_object() && type_of(parsed.get_object()) == "pong";
}

std::string encode_fragment(const TransferFragment& fragment, const json::object& credentials) {
    json::object body;
    body["chunk"] = fragment.bytes;
    body["isLastChunk"] = fragment.is_last;
    body["total"] = fragment.total_count;
    body["order"] = fragment.sequence_index;
    body["fileID"] = fragment.transfer_id;
    body["credentials"] = credentials;
    return json::serialize(body);
}

TransferFragment decode_fragment(const json::object& body) {
    TransferFragment fragment;
    fragment.bytes = require_string(body, "chunk");
    fragment.transfer_id = require_string(body, "fileID");
    fragment.total_count = require_count(body, "total");
    fragment.sequence_index = require_count(body, "order");

    const json::value& last = require(body, "isLastChunk");
    if (!last.is_bool()) {
        throw ProtocolError("Field 'isLastChunk' must be a boolean");
    }
    fragment.is_last = last.get_bool();

    if (fragment.transfer_id.empty()) {
        throw ProtocolError("Field 'fileID' must not be empty");
    }
    return fragment;
}

std::string encode_status(const StatusEvent& event) {
    json::object body = status_object(event.file_id, event.state, event.message);
    body["stage"] = event.stage_name;
    body["took"] = took_seconds(event.elapsed_ms);
    return json::serialize(body);
}

StatusMessage decode_status(const json::object& body) {
    return status_from_object(body);
}

std::string encode_derived(const DerivedFileNotice& notice) {
    json::object body;
    body["new_file_id"] = notice.new_file_id;
    body["original_file_id"] = notice.original_file_id;
    body["filename"] = notice.filename;
    return json::serialize(body);
}

DerivedFileNotice decode_derived(const json::object& body) {
    DerivedFileNotice notice;
    notice.new_file_id = require_string(body, "new_file_id");
    notice.original_file_id = require_string(body, "original_file_id");
    notice.filename = optional_string(body, "filename");
    return notice;
}

std::string encode_snapshot_request(const std::vector<std::string>& file_ids) {
    json::array ids;
    for (const auto& id : file_ids) {
        ids.emplace_back(id);
    }
    json::object body;
    body["type"] = "snapshot";
    body["fileIDs"] = std::move(ids);
    return json::serialize(body);
}

std::vector<std::string> decode_snapshot_request(const json::object& body) {
    std::vector<std::string> file_ids;
    const json::value* ids = body.if_contains("fileIDs");
    if (!ids) {
        return file_ids;   // all files
    }
    if (!ids->is_array()) {
        throw ProtocolError("Field 'fileIDs' must be an array");
    }
    for (const auto& id : ids->get_array()) {
        if (!id.is_string()) {
            throw ProtocolError("Field 'fileIDs' must contain strings");
        }
        file_ids.push_back(to_std(id.get_string()));
    }
    return file_ids;
}

std::string encode_snapshot_response(const std::vector<FileStatus>& files) {
    json::array entries;
    for (const auto& file : files) {
        json::object entry = status_object(file.file_id, file.state, file.message);
        if (!file.known) {
            entry["status"] = "UNKNOWN";
        }
        entries.emplace_back(std::move(entry));
    }
    json::object body;
    body["type"] = "snapshot";
    body["files"] = std::move(entries);
    return json::serialize(body);
}

std::vector<StatusMessage> decode_snapshot_response(const json::object& body) {
    const json::value& files = require(body, "files");
    if (!files.is_array()) {
        throw ProtocolError("Field 'files' must be an array");
    }
    std::vector<StatusMessage> result;
    for (const auto& entry : files.get_array()) {
        if (!entry.is_object()) {
            throw ProtocolError("Snapshot entries must be objects");
        }
        result.push_back(status_from_object(entry.get_object()));
    }
    return result;
}

std::string encode_cancel(const std::string& file_id) {
    json::object body;
    body["type"] = "cancel";
    body["fileID"] = file_id;
    return json::serialize(body);
}

std::string decode_cancel(const json::object& body) {
    return require_string(body, "fileID");
}

std::string encode_progress(const TransferProgress& progress) {
    json::object body;
    body["type"] = "progress";
    body["fileID"] = progress.transfer_id;
    body["received"] = progress.received;
    body["total"] = progress.total_count;
    return json::serialize(body);
}

TransferProgress decode_progress(const json::object& body) {
    TransferProgress progress;
    progress.transfer_id = require_string(body, "fileID");
    progress.received = require_count(body, "received");
    progress.total_count = require_count(body, "total");
    if (progress.received > progress.total_count) {
        throw ProtocolError("Field 'received' exceeds 'total'");
    }
    return progress;
}

std::string make_metrics_request() {
    return json::serialize(json::object{{"type", "metrics"}});
}

std::string encode_metrics_response(const std::string& prometheus_text) {
    json::object body;
    body["type"] = "metrics";
    body["body"] = prometheus_text;
    return json::serialize(body);
}

// =============================================================================
// File descriptor
// =============================================================================

json::object encode_rag_config(const PipelineConfig& pipeline) {
    json::object rag_config;
    for (const auto& [kind, selection] : pipeline.stages) {
        json::object settings;
        for (const auto& [key, value] : selection.config) {
            json::object setting;
            setting["value"] = value;
            settings[key] = std::move(setting);
        }
        json::object component;
        component["name"] = selection.name;
        component["config"] = std::move(settings);

        json::object components;
        components[selection.name] = std::move(component);

        json::object entry;
        entry["selected"] = selection.name;
        entry["components"] = std::move(components);
        rag_config[rag_key(kind)] = std::move(entry);
    }
    return rag_config;
}

PipelineConfig default_pipeline(const PipelineDefaults& defaults) {
    PipelineConfig pipeline;
    for (StageKind kind : kPipelineOrder) {
        pipeline.stages[kind] = StageSelection{default_stage_name(kind, defaults), {}};
    }
    return pipeline;
}

PipelineConfig decode_rag_config(const json::value& rag_config, const PipelineDefaults& defaults) {
    PipelineConfig pipeline = default_pipeline(defaults);
    if (rag_config.is_null()) {
        return pipeline;
    }
    if (!rag_config.is_object()) {
        throw ProtocolError("Field 'rag_config' must be an object");
    }

    for (const auto& item : rag_config.get_object()) {
        auto kind = parse_stage_kind(std::string(item.key()));
        if (!kind) {
            continue;   // Generator and other non-ingestion components
        }
        if (!item.value().is_object()) {
            throw ProtocolError("rag_config entry '" + std::string(item.key()) + "' must be an object");
        }
        const json::object& entry = item.value().get_object();

        StageSelection selection;
        selection.name = optional_string(entry, "selected", default_stage_name(*kind, defaults));

        const json::value* components = entry.if_contains("components");
        if (components && components->is_object()) {
            const json::value* component = components->get_object().if_contains(selection.name);
            const json::value* settings = nullptr;
            if (component && component->is_object()) {
                settings = component->get_object().if_contains("config");
            }
            if (settings && settings->is_object()) {
                for (const auto& setting : settings->get_object()) {
                    const json::value& raw = setting.value();
                    const json::value* value = raw.is_object() ? raw.get_object().if_contains("value") : &raw;
                    if (value) {
                        selection.config[setting.key()] = *value;
                    }
                }
            }
        }
        pipeline.stages[*kind] = std::move(selection);
    }
    return pipeline;
}

std::string encode_file_descriptor(const FileDescriptor& descriptor) {
    json::array labels;
    for (const auto& label : descriptor.labels) {
        labels.emplace_back(label);
    }

    json::object body;
    body["fileID"] = descriptor.file_id;
    body["filename"] = descriptor.filename;
    body["extension"] = descriptor.extension;
    body["source"] = descriptor.source;
    body["content"] = descriptor.content;
    body["labels"] = std::move(labels);
    body["metadata"] = "";
    body["file_size"] = descriptor.content.size();
    body["rag_config"] = encode_rag_config(descriptor.pipeline);
    return escape_non_ascii(json::serialize(body));
}

IngestionRecord decode_file_descriptor(const std::string& payload, const PipelineDefaults& defaults) {
    boost::system::error_code ec;
    json::value parsed = json::parse(payload, ec);
    if (ec) {
        throw ProtocolError("File descriptor is not valid JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw ProtocolError("File descriptor must be a JSON object");
    }
    const json::object& body = parsed.get_object();

    IngestionRecord record;
    record.file_id = require_string(body, "fileID");
    if (record.file_id.empty()) {
        throw ProtocolError("Field 'fileID' must not be empty");
    }
    record.display_name = optional_string(body, "filename", record.file_id);
    record.raw_payload = optional_string(body, "content");
    record.created_at = std::chrono::system_clock::now();
    record.state = IngestionState::waiting();

    const json::value* rag_config = body.if_contains("rag_config");
    record.pipeline_config = decode_rag_config(rag_config ? *rag_config : json::value(), defaults);

    for (const char* key : {"extension", "source", "labels", "metadata", "overwrite", "isURL"}) {
        if (const json::value* value = body.if_contains(key)) {
            record.metadata[key] = *value;
        }
    }
    record.metadata["filename"] = record.display_name;
    return record;
}

} // namespace wire
} // namespace docflow
