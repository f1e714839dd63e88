#include "docflow/import_handler.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"

namespace docflow {

void ImportHandler::handle(StatusObserver& peer, ObserverId id, const std::string& text) {
    try {
        wire::Message message = wire::decode(text);
        switch (message.type) {
            case wire::MessageType::Ping:
                peer.deliver(wire::make_pong());
                break;
            case wire::MessageType::Pong:
                break;
            case wire::MessageType::Fragment:
                handle_fragment(peer, id, message.body);
                break;
            case wire::MessageType::Snapshot:
                handle_snapshot(peer, id, message.body);
                break;
            case wire::MessageType::Cancel:
                handle_cancel(peer, message.body);
                break;
            case wire::MessageType::Metrics:
                peer.deliver(wire::encode_metrics_response(Metrics::getInstance().export_prometheus()));
                break;
            default:
                DOCFLOW_LOG_WARNING(std::string("Ignoring unexpected ") + wire::to_string(message.type) +
                                    " message from observer " + std::to_string(id));
                Metrics::getInstance().increment_counter("messages_ignored");
                break;
        }
    } catch (const ProtocolError& e) {
        DOCFLOW_LOG_WARNING("Malformed message from observer " + std::to_string(id) + ": " + e.what());
        Metrics::getInstance().increment_counter("messages_malformed");
    } catch (const DocflowException& e) {
        DOCFLOW_LOG_ERROR("Message from observer " + std::to_string(id) + " could not be handled: " + e.describe());
    }
}

void ImportHandler::handle_fragment(StatusObserver& peer, ObserverId id, const boost::json::object& body) {
    TransferFragment fragment = wire::decode_fragment(body);
    context_.broadcaster().watch(id, fragment.transfer_id);

    std::optional<std::string> payload;
    try {
        payload = context_.codec().feed(fragment);
    } catch (const ReassemblyError& e) {
        DOCFLOW_LOG_WARNING("Transfer " + fragment.transfer_id + " rejected: " + e.describe());
        report_failure(peer, fragment.transfer_id, e.what());
        return;
    }

    if (payload) {
        start_import(peer, id, fragment.transfer_id, *payload);
    } else {
        report_progress(peer, fragment.transfer_id);
    }
}

void ImportHandler::report_progress(StatusObserver& peer, const std::string& transfer_id) {
    auto now = std::chrono::steady_clock::now();
    if (now - last_progress_ < std::chrono::milliseconds(context_.config().transfer.progress_interval_ms)) {
        return;
    }
    auto session = context_.sessions().find(transfer_id);
    if (!session) {
        return;
    }
    last_progress_ = now;
    peer.deliver(wire::encode_progress(wire::TransferProgress{transfer_id, session->received, session->total_count}));
}

void ImportHandler::start_import(StatusObserver& peer, ObserverId id, const std::string& transfer_id,
                                 const std::string& payload) {
    IngestionRecord record;
    try {
        record = wire::decode_file_descriptor(payload, context_.config().pipeline);
    } catch (const ProtocolError& e) {
        DOCFLOW_LOG_WARNING("Transfer " + transfer_id + " does not carry a valid file descriptor: " + e.what());
        report_failure(peer, transfer_id, e.what());
        return;
    }

    if (record.file_id != transfer_id) {
        context_.broadcaster().watch(id, record.file_id);
    }

    std::string file_id = record.file_id;
    if (!context_.orchestrator().submit(std::move(record))) {
        // Still running from an earlier transfer; show the peer where it is
        peer.deliver(wire::encode_snapshot_response(context_.broadcaster().snapshot({file_id})));
    }
}

void ImportHandler::handle_snapshot(StatusObserver& peer, ObserverId id, const boost::json::object& body) {
    std::vector<std::string> file_ids = wire::decode_snapshot_request(body);
    for (const auto& file_id : file_ids) {
        context_.broadcaster().watch(id, file_id);
    }
    auto files = context_.broadcaster().snapshot(file_ids);
    DOCFLOW_LOG_DEBUG("Snapshot of " + std::to_string(files.size()) + " files for observer " + std::to_string(id));
    peer.deliver(wire::encode_snapshot_response(files));
}

void ImportHandler::handle_cancel(StatusObserver& peer, const boost::json::object& body) {
    std::string file_id = wire::decode_cancel(body);

    bool transfer_cancelled = context_.sessions().cancel(file_id);
    bool run_cancelled = context_.orchestrator().cancel(file_id);

    if (transfer_cancelled && !run_cancelled) {
        report_failure(peer, file_id, "cancelled");
    } else if (!transfer_cancelled && !run_cancelled) {
        DOCFLOW_LOG_DEBUG("Nothing to cancel for " + file_id);
    }
}

void ImportHandler::report_failure(StatusObserver& peer, const std::string& file_id, const std::string& message) {
    StatusEvent event;
    event.file_id = file_id;
    event.state = IngestionState::error();
    event.message = message;
    event.timestamp = std::chrono::system_clock::now();
    peer.deliver(wire::encode_status(event));
}

} // namespace docflow
