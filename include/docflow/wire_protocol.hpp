/**
 * Wire Protocol
 * =============
 *
 * JSON text messages exchanged over the duplex channel:
 *
 *   {"type":"ping"} / {"type":"pong"}                         keepalive
 *   {chunk, isLastChunk, total, order, fileID, credentials}   fragment, client -> server
 *   {fileID, status, message, took, stage}                    status, server -> client
 *   {new_file_id, original_file_id, filename}                 derived file, server -> client
 *   {"type":"snapshot","fileIDs":[...]}                       snapshot request
 *   {"type":"snapshot","files":[{fileID,status,stage,message}]}
 *   {"type":"cancel","fileID":...}
 *   {"type":"progress","fileID","received","total"}          upload progress, server -> client
 *   {"type":"metrics"} / {"type":"metrics","body":...}
 *
 * Decoders throw ProtocolError for anything that does not have the expected
 * shape.
 */

#pragma once

#include <string>
#include <vector>
#include <boost/json.hpp>
#include "docflow/chunk_codec.hpp"
#include "docflow/config.hpp"
#include "docflow/types.hpp"

namespace docflow {
namespace wire {

enum class MessageType {
    Ping,
    Pong,
    Fragment,
    Status,
    Derived,
    Snapshot,
    Cancel,
    Metrics,
    Progress,
    Unknown
};

const char* to_string(MessageType type);

struct Message {
    MessageType type = MessageType::Unknown;
    boost::json::object body;
};

// Parses and classifies one inbound text message
Message decode(const std::string& text);

// Keepalive
std::string make_ping();
std::string make_pong();
bool is_ping(const std::string& text);
bool is_pong(const std::string& text);

// Fragments
std::string encode_fragment(const TransferFragment& fragment,
                            const boost::json::object& credentials = {});
TransferFragment decode_fragment(const boost::json::object& body);

// Status as seen by a client
struct StatusMessage {
    std::string file_id;
    std::string status;
    std::string stage;
    std::string message;
    double took = 0.0;

    bool is_terminal() const { return status == "DONE" || status == "ERROR"; }
};

std::string encode_status(const StatusEvent& event);
StatusMessage decode_status(const boost::json::object& body);

std::string encode_derived(const DerivedFileNotice& notice);
DerivedFileNotice decode_derived(const boost::json::object& body);

// Snapshot of one file for a reconnecting observer
struct FileStatus {
    std::string file_id;
    IngestionState state;
    std::string message;
    bool known = true;
};

std::string encode_snapshot_request(const std::vector<std::string>& file_ids);
std::vector<std::string> decode_snapshot_request(const boost::json::object& body);
std::string encode_snapshot_response(const std::vector<FileStatus>& files);
std::vector<StatusMessage> decode_snapshot_response(const boost::json::object& body);

std::string encode_cancel(const std::string& file_id);
std::string decode_cancel(const boost::json::object& body);

// Sent while a transfer is still incomplete; also serves as liveness for the
// uploading peer's heartbeat
struct TransferProgress {
    std::string transfer_id;
    size_t received = 0;
    uint32_t total_count = 0;
};

std::string encode_progress(const TransferProgress& progress);
TransferProgress decode_progress(const boost::json::object& body);

std::string make_metrics_request();
std::string encode_metrics_response(const std::string& prometheus_text);

// =============================================================================
// File descriptor carried by a reassembled transfer
// =============================================================================

struct FileDescriptor {
    std::string file_id;
    std::string filename;
    std::string extension;
    std::string content;
    std::vector<std::string> labels;
    std::string source;
    PipelineConfig pipeline;
};

// rag_config: {"Reader": {"selected": name, "components": {name: {"config": {key: {"value": v}}}}}, ...}
boost::json::object encode_rag_config(const PipelineConfig& pipeline);
PipelineConfig decode_rag_config(const boost::json::value& rag_config, const PipelineDefaults& defaults);

// Fills every stage from the defaults
PipelineConfig default_pipeline(const PipelineDefaults& defaults);

// Output is pure ASCII (non-ASCII escaped as \uXXXX) so fragment boundaries
// never split a UTF-8 sequence
std::string encode_file_descriptor(const FileDescriptor& descriptor);

// Builds a WAITING record from a reassembled payload
IngestionRecord decode_file_descriptor(const std::string& payload, const PipelineDefaults& defaults);

} // namespace wire
} // namespace docflow
