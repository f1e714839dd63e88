#include "docflow/import_server.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace docflow {

// =============================================================================
// ImportSession
// =============================================================================

ImportSession::ImportSession(tcp::socket&& socket, Context& context, std::string path)
    : ws_(std::move(socket)),
      context_(context),
      handler_(context),
      path_(std::move(path)) {
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remote_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

ImportSession::~ImportSession() {
    if (id_ != 0) {
        context_.broadcaster().unsubscribe(id_);
    }
}

void ImportSession::run() {
    // Start on the connection's strand
    asio::dispatch(ws_.get_executor(), beast::bind_front_handler(&ImportSession::on_run, shared_from_this()));
}

void ImportSession::on_run() {
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    http::async_read(ws_.next_layer(), buffer_, request_,
                     beast::bind_front_handler(&ImportSession::on_request, shared_from_this()));
}

void ImportSession::on_request(beast::error_code ec, std::size_t) {
    if (ec) {
        DOCFLOW_LOG_DEBUG("Connection from " + remote_ + " closed before upgrade: " + ec.message());
        return finish("no upgrade");
    }

    std::string target(request_.target());
    if (!websocket::is_upgrade(request_) || target != path_) {
        DOCFLOW_LOG_WARNING("Rejecting " + std::string(request_.method_string()) + " " + target + " from " + remote_);
        rejection_ = http::response<http::string_body>(http::status::not_found, request_.version());
        rejection_.set(http::field::server, "docflow");
        rejection_.set(http::field::content_type, "text/plain");
        rejection_.keep_alive(false);
        rejection_.body() = "Not found\n";
        rejection_.prepare_payload();
        http::async_write(ws_.next_layer(), rejection_,
                          beast::bind_front_handler(&ImportSession::on_rejected, shared_from_this()));
        return;
    }

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "docflow");
    }));
    ws_.async_accept(request_, beast::bind_front_handler(&ImportSession::on_accept, shared_from_this()));
}

void ImportSession::on_rejected(beast::error_code, std::size_t) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
    finish("rejected");
}

void ImportSession::on_accept(beast::error_code ec) {
    if (ec) {
        DOCFLOW_LOG_WARNING("WebSocket accept from " + remote_ + " failed: " + ec.message());
        return finish("accept failed");
    }
    if (finished_) {
        return;
    }

    accepted_ = true;
    ws_.text(true);
    id_ = context_.broadcaster().subscribe(weak_from_this());
    DOCFLOW_LOG_INFO("Observer " + std::to_string(id_) + " connected from " + remote_);
    Metrics::getInstance().increment_counter("connections_accepted");

    do_read();
    if (!outbox_.empty() && !writing_) {
        do_write();
    }
}

void ImportSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&ImportSession::on_read, shared_from_this()));
}

void ImportSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            return finish("closed by peer");
        }
        if (!finished_) {
            DOCFLOW_LOG_WARNING("Observer " + std::to_string(id_) + " read failed: " + ec.message());
        }
        return finish(ec.message());
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    handler_.handle(*this, id_, text);

    if (!finished_) {
        do_read();
    }
}

void ImportSession::deliver(const std::string& text) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), text]() {
        if (self->finished_ || self->closing_) {
            return;
        }
        self->outbox_.push_back(text);
        if (self->accepted_ && !self->writing_) {
            self->do_write();
        }
    });
}

void ImportSession::do_write() {
    writing_ = true;
    ws_.async_write(asio::buffer(outbox_.front()),
                    beast::bind_front_handler(&ImportSession::on_write, shared_from_this()));
}

void ImportSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (finished_) {
        return;
    }
    if (ec) {
        DOCFLOW_LOG_WARNING("Observer " + std::to_string(id_) + " write failed: " + ec.message());
        return finish(ec.message());
    }
    outbox_.pop_front();
    if (closing_) {
        do_close();
    } else if (!outbox_.empty()) {
        do_write();
    }
}

void ImportSession::close() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->finished_) {
            return;
        }
        if (!self->accepted_) {
            beast::error_code ignored;
            beast::get_lowest_layer(self->ws_).socket().close(ignored);
            return self->finish("server stopping");
        }
        self->closing_ = true;
        if (!self->writing_) {
            self->do_close();
        }
    });
}

void ImportSession::do_close() {
    auto self = shared_from_this();
    ws_.async_close(websocket::close_reason(websocket::close_code::going_away, "server stopping"),
                    [self](beast::error_code) { self->finish("server stopping"); });
}

void ImportSession::finish(const std::string& reason) {
    if (finished_) {
        return;
    }
    finished_ = true;

    if (id_ != 0) {
        context_.broadcaster().unsubscribe(id_);
        DOCFLOW_LOG_INFO("Observer " + std::to_string(id_) + " disconnected (" + reason + ")");
        id_ = 0;
    }
}

// =============================================================================
// ImportServer
// =============================================================================

ImportServer::ImportServer(asio::io_context& ioc, Context& context, const ServerConfig& config)
    : ioc_(ioc),
      acceptor_(asio::make_strand(ioc)),
      context_(context),
      config_(config) {}

void ImportServer::start() {
    beast::error_code ec;
    auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        throw TransportError("Invalid listen address: " + ec.message(), config_.host,
                             ErrorCode::CONNECTION_FAILED);
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw TransportError("Cannot listen on " + config_.host + ":" + std::to_string(config_.port) + ": " +
                             ec.message(), config_.host, ErrorCode::CONNECTION_FAILED);
    }

    DOCFLOW_LOG_INFO("Accepting imports on ws://" + config_.host + ":" + std::to_string(port()) + config_.path);
    do_accept();
}

void ImportServer::stop() {
    std::vector<std::shared_ptr<ImportSession>> open_sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                open_sessions.push_back(std::move(session));
            }
        }
        sessions_.clear();
    }

    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ignored;
        self->acceptor_.close(ignored);
    });
    for (auto& session : open_sessions) {
        session->close();
    }
    DOCFLOW_LOG_INFO("Import server stopped, closed " + std::to_string(open_sessions.size()) + " connections");
}

uint16_t ImportServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.port : endpoint.port();
}

size_t ImportServer::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(sessions_.begin(), sessions_.end(),
                         [](const std::weak_ptr<ImportSession>& weak) { return !weak.expired(); });
}

void ImportServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&ImportServer::on_accept, shared_from_this()));
}

void ImportServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        DOCFLOW_LOG_WARNING("Accept failed: " + ec.message());
    } else {
        auto session = std::make_shared<ImportSession>(std::move(socket), context_, config_.path);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const std::weak_ptr<ImportSession>& weak) { return weak.expired(); }),
                            sessions_.end());
            sessions_.push_back(session);
        }
        session->run();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
    }
    do_accept();
}

} // namespace docflow
