#include "docflow/backoff_policy.hpp"
#include "docflow/chunk_codec.hpp"
#include "docflow/config.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/resilient_channel.hpp"
#include "docflow/websocket_transport.hpp"
#include "docflow/wire_protocol.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct UploadEntry {
    std::string name;
    std::string payload;   // encoded descriptor; empty for derived files
    std::string status = "PENDING";
    bool sent = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE] [--url ws://host:port/path] FILE...\n"
              << "\n"
              << "Uploads files to docflowd and follows their import until every file is DONE.\n"
              << "Exits with 1 when any file ends in ERROR or the server stays unreachable.\n";
}

std::string default_url(const docflow::ServerConfig& server) {
    std::string host = server.host == "0.0.0.0" ? "127.0.0.1" : server.host;
    return "ws://" + host + ":" + std::to_string(server.port) + server.path;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw docflow::InvalidArgumentError("Cannot open file", path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

/**
 * Client side of one upload run: sends every file once connected, follows
 * status and derived-file messages, and catches up with a snapshot after each
 * reconnect. Runs entirely on the io_context thread.
 */
class Uploader {
public:
    Uploader(boost::asio::io_context& ioc, const docflow::Config& config, const docflow::WebSocketEndpoint& endpoint)
        : ioc_(ioc),
          fragment_size_(config.transfer.fragment_size) {
        channel_ = std::make_shared<docflow::ResilientChannel>(
            ioc.get_executor(),
            docflow::WebSocketTransport::factory(ioc, endpoint),
            config.channel,
            docflow::BackoffPolicy::from_config(config.channel));
    }

    void add_file(const std::string& path, const docflow::PipelineDefaults& defaults) {
        std::filesystem::path file(path);

        docflow::wire::FileDescriptor descriptor;
        descriptor.file_id = boost::uuids::to_string(uuid_generator_());
        descriptor.filename = file.filename().string();
        descriptor.extension = file.has_extension() ? file.extension().string().substr(1) : "";
        descriptor.content = read_file(path);
        descriptor.labels = {"Document"};
        descriptor.source = std::filesystem::absolute(file).string();
        descriptor.pipeline = docflow::wire::default_pipeline(defaults);

        UploadEntry entry;
        entry.name = descriptor.filename;
        entry.payload = docflow::wire::encode_file_descriptor(descriptor);
        order_.push_back(descriptor.file_id);
        entries_[descriptor.file_id] = std::move(entry);
    }

    int run() {
        channel_->on_state_change([this](docflow::ChannelState current, docflow::ChannelState previous) {
            on_state(current, previous);
        });
        channel_->on_message([this](const std::string& text) { on_message(text); });
        channel_->connect();

        ioc_.run();
        return exit_code_;
    }

private:
    void on_state(docflow::ChannelState current, docflow::ChannelState previous) {
        std::cout << "[channel] " << docflow::to_string(previous) << " -> " << docflow::to_string(current)
                  << std::endl;

        if (current == docflow::ChannelState::CONNECTED) {
            if (connected_once_) {
                request_snapshot();
            }
            connected_once_ = true;
            send_pending();
        } else if (current == docflow::ChannelState::OFFLINE) {
            std::cerr << "Server unreachable after " << channel_->attempt() << " retries, giving up" << std::endl;
            exit_code_ = 1;
            ioc_.stop();
        }
    }

    void send_pending() {
        for (const auto& file_id : order_) {
            UploadEntry& entry = entries_[file_id];
            if (!entry.sent && !entry.payload.empty()) {
                send_transfer(file_id, entry);
            }
        }
    }

    void send_transfer(const std::string& file_id, UploadEntry& entry) {
        auto fragments = docflow::ChunkCodec::split(file_id, entry.payload, fragment_size_);
        while (auto fragment = fragments.next()) {
            channel_->send(docflow::wire::encode_fragment(*fragment));
        }
        entry.sent = true;
        std::cout << "[upload] " << entry.name << " sent in " << fragments.total() << " fragments" << std::endl;
    }

    void request_snapshot() {
        std::vector<std::string> open;
        for (const auto& [file_id, entry] : entries_) {
            if (!is_terminal(entry.status)) {
                open.push_back(file_id);
            }
        }
        if (!open.empty()) {
            channel_->send(docflow::wire::encode_snapshot_request(open));
        }
    }

    void on_message(const std::string& text) {
        try {
            docflow::wire::Message message = docflow::wire::decode(text);
            switch (message.type) {
                case docflow::wire::MessageType::Status:
                    apply(docflow::wire::decode_status(message.body));
                    break;
                case docflow::wire::MessageType::Derived:
                    apply(docflow::wire::decode_derived(message.body));
                    break;
                case docflow::wire::MessageType::Snapshot:
                    for (const auto& status : docflow::wire::decode_snapshot_response(message.body)) {
                        apply_snapshot(status);
                    }
                    break;
                case docflow::wire::MessageType::Progress: {
                    auto progress = docflow::wire::decode_progress(message.body);
                    DOCFLOW_LOG_DEBUG("Server holds " + std::to_string(progress.received) + "/" +
                                      std::to_string(progress.total_count) + " fragments of " +
                                      progress.transfer_id);
                    break;
                }
                default:
                    DOCFLOW_LOG_DEBUG(std::string("Ignoring ") + docflow::wire::to_string(message.type) + " message");
                    break;
            }
        } catch (const docflow::ProtocolError& e) {
            DOCFLOW_LOG_WARNING(std::string("Malformed message from server: ") + e.what());
        }
        check_finished();
    }

    void apply(const docflow::wire::StatusMessage& status) {
        auto it = entries_.find(status.file_id);
        if (it == entries_.end()) {
            return;
        }
        it->second.status = status.status;

        std::ostringstream line;
        line << "[" << it->second.name << "] " << status.status;
        if (!status.stage.empty()) {
            line << " " << status.stage;
        }
        if (!status.message.empty()) {
            line << ": " << status.message;
        }
        line << " (" << std::fixed << std::setprecision(2) << status.took << "s)";
        (status.status == "ERROR" ? std::cerr : std::cout) << line.str() << std::endl;
    }

    void apply(const docflow::DerivedFileNotice& notice) {
        UploadEntry entry;
        entry.name = notice.filename.empty() ? notice.new_file_id : notice.filename;
        entry.sent = true;
        auto original = entries_.find(notice.original_file_id);
        std::string origin = original == entries_.end() ? notice.original_file_id : original->second.name;
        std::cout << "[" << origin << "] produced " << entry.name << " (" << notice.new_file_id << ")" << std::endl;

        if (entries_.count(notice.new_file_id) == 0) {
            order_.push_back(notice.new_file_id);
        }
        entries_[notice.new_file_id] = std::move(entry);
    }

    void apply_snapshot(const docflow::wire::StatusMessage& status) {
        auto it = entries_.find(status.file_id);
        if (it == entries_.end()) {
            return;
        }
        if (status.status == "UNKNOWN") {
            // The transfer never completed on the server; start it over
            if (!it->second.payload.empty()) {
                std::cout << "[" << it->second.name << "] transfer lost, resending" << std::endl;
                send_transfer(status.file_id, it->second);
            }
            return;
        }
        apply(status);
    }

    void check_finished() {
        if (finished_ || entries_.empty()) {
            return;
        }
        bool failed = false;
        for (const auto& [file_id, entry] : entries_) {
            if (!is_terminal(entry.status)) {
                return;
            }
            failed = failed || entry.status == "ERROR";
        }

        finished_ = true;
        exit_code_ = failed ? 1 : 0;
        std::cout << (failed ? "Some imports failed" : "All imports done") << std::endl;
        channel_->disconnect("upload complete");
    }

    static bool is_terminal(const std::string& status) {
        return status == "DONE" || status == "ERROR";
    }

    boost::asio::io_context& ioc_;
    size_t fragment_size_;
    std::shared_ptr<docflow::ResilientChannel> channel_;
    boost::uuids::random_generator uuid_generator_;

    std::map<std::string, UploadEntry> entries_;
    std::vector<std::string> order_;
    bool connected_once_ = false;
    bool finished_ = false;
    int exit_code_ = 1;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config.yaml";
    std::string url;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto config = docflow::load_config(config_file);
        docflow::initialize_logging(config.logging);

        auto endpoint = docflow::parse_websocket_url(url.empty() ? default_url(config.server) : url);

        boost::asio::io_context ioc;
        Uploader uploader(ioc, config, endpoint);
        for (const auto& file : files) {
            uploader.add_file(file, config.pipeline);
        }
        return uploader.run();

    } catch (const docflow::DocflowException& e) {
        std::cerr << "Error: " << e.describe() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
