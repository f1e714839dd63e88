#pragma once

#include <chrono>
#include <string>
#include "docflow/context.hpp"
#include "docflow/status_broadcaster.hpp"
#include "docflow/wire_protocol.hpp"

namespace docflow {

/**
 * Server side of the wire protocol for one inbound text message.
 *
 * Replies go straight to the sending peer; pipeline progress reaches it
 * through the broadcaster once the peer watches the file. Malformed messages
 * are logged and dropped, the connection is never closed from here.
 * While a transfer is incomplete the peer gets a progress reply at most
 * once per transfer.progress_interval_ms.
 */
class ImportHandler {
public:
    explicit ImportHandler(Context& context)
        : context_(context), last_progress_(std::chrono::steady_clock::now()) {}

    void handle(StatusObserver& peer, ObserverId id, const std::string& text);

private:
    void handle_fragment(StatusObserver& peer, ObserverId id, const boost::json::object& body);
    void handle_snapshot(StatusObserver& peer, ObserverId id, const boost::json::object& body);
    void handle_cancel(StatusObserver& peer, const boost::json::object& body);
    void start_import(StatusObserver& peer, ObserverId id, const std::string& transfer_id,
                      const std::string& payload);
    void report_progress(StatusObserver& peer, const std::string& transfer_id);

    // ERROR status for a file that never reached the orchestrator
    static void report_failure(StatusObserver& peer, const std::string& file_id, const std::string& message);

    Context& context_;
    std::chrono::steady_clock::time_point last_progress_;
};

} // namespace docflow
