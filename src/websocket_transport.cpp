#include "docflow/websocket_transport.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <chrono>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace docflow {

namespace {

// RFC 6455 limits the close reason to 123 bytes
constexpr size_t kMaxCloseReason = 123;

} // namespace

WebSocketEndpoint parse_websocket_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw InvalidArgumentError("Only ws:// URLs are supported", url);
    }

    std::string rest = url.substr(scheme.size());
    WebSocketEndpoint endpoint;
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = "80";
    } else {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    }
    if (endpoint.host.empty() || endpoint.port.empty()) {
        throw InvalidArgumentError("Malformed WebSocket URL", url);
    }
    return endpoint;
}

WebSocketTransport::WebSocketTransport(asio::io_context& ioc, WebSocketEndpoint endpoint)
    : strand_(asio::make_strand(ioc)),
      resolver_(strand_),
      ws_(strand_),
      endpoint_(std::move(endpoint)) {}

TransportFactory WebSocketTransport::factory(asio::io_context& ioc, const WebSocketEndpoint& endpoint) {
    return [&ioc, endpoint]() -> std::shared_ptr<Transport> {
        return std::make_shared<WebSocketTransport>(ioc, endpoint);
    };
}

void WebSocketTransport::open(Handlers handlers) {
    auto self = shared_from_this();
    asio::post(strand_, [self, handlers = std::move(handlers)]() mutable {
        self->handlers_ = std::move(handlers);
        if (self->closing_) {
            self->finish(CloseInfo{true, self->close_reason_});
            return;
        }
        DOCFLOW_LOG_DEBUG("Resolving " + self->endpoint_.host + ":" + self->endpoint_.port);
        self->resolver_.async_resolve(self->endpoint_.host, self->endpoint_.port,
                                      beast::bind_front_handler(&WebSocketTransport::on_resolve, self));
    });
}

void WebSocketTransport::write(std::string text) {
    auto self = shared_from_this();
    asio::post(strand_, [self, text = std::move(text)]() mutable {
        if (self->finished_ || self->closing_) {
            return;
        }
        self->outbox_.push_back(std::move(text));
        if (self->open_ && !self->writing_) {
            self->do_write();
        }
    });
}

void WebSocketTransport::close(const std::string& reason) {
    auto self = shared_from_this();
    asio::post(strand_, [self, reason]() {
        if (self->finished_ || self->closing_) {
            return;
        }
        self->closing_ = true;
        self->close_reason_ = reason.substr(0, kMaxCloseReason);
        if (!self->open_) {
            // Still connecting: abort the pending operation, reported as clean
            self->resolver_.cancel();
            beast::get_lowest_layer(self->ws_).cancel();
            return;
        }
        if (!self->writing_) {
            self->do_close();
        }
    });
}

void WebSocketTransport::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail(ec, "resolve");
    }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&WebSocketTransport::on_connect, shared_from_this()));
}

void WebSocketTransport::on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) {
        return fail(ec, "connect");
    }

    // The websocket stream has its own timeout system
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "docflow");
    }));

    ws_.async_handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target,
                        beast::bind_front_handler(&WebSocketTransport::on_handshake, shared_from_this()));
}

void WebSocketTransport::on_handshake(beast::error_code ec) {
    if (ec) {
        return fail(ec, "handshake");
    }
    if (closing_) {
        open_ = true;
        do_close();
        return;
    }

    open_ = true;
    ws_.text(true);
    if (handlers_.on_open) {
        handlers_.on_open();
    }
    do_read();
    if (!outbox_.empty() && !writing_) {
        do_write();
    }
}

void WebSocketTransport::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketTransport::on_read, shared_from_this()));
}

void WebSocketTransport::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            return finish(CloseInfo{true, std::string(ws_.reason().reason.c_str())});
        }
        if (closing_) {
            return finish(CloseInfo{true, close_reason_});
        }
        return fail(ec, "read");
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (handlers_.on_message) {
        handlers_.on_message(text);
    }
    if (!finished_) {
        do_read();
    }
}

void WebSocketTransport::do_write() {
    writing_ = true;
    ws_.async_write(asio::buffer(outbox_.front()),
                    beast::bind_front_handler(&WebSocketTransport::on_write, shared_from_this()));
}

void WebSocketTransport::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (finished_) {
        return;
    }
    if (ec) {
        return fail(ec, "write");
    }
    outbox_.pop_front();

    if (closing_) {
        do_close();
    } else if (!outbox_.empty()) {
        do_write();
    }
}

void WebSocketTransport::do_close() {
    if (close_sent_ || finished_) {
        return;
    }
    close_sent_ = true;
    outbox_.clear();
    auto self = shared_from_this();
    ws_.async_close(websocket::close_reason(websocket::close_code::normal, close_reason_),
                    [self](beast::error_code ec) {
                        if (ec) {
                            beast::error_code ignored;
                            beast::get_lowest_layer(self->ws_).socket().close(ignored);
                        }
                        self->finish(CloseInfo{true, self->close_reason_});
                    });
}

void WebSocketTransport::fail(beast::error_code ec, const char* what) {
    if (closing_) {
        return finish(CloseInfo{true, close_reason_});
    }
    DOCFLOW_LOG_WARNING(std::string("WebSocket ") + what + " failed: " + ec.message());
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    finish(CloseInfo{false, std::string(what) + ": " + ec.message()});
}

void WebSocketTransport::finish(const CloseInfo& info) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_ = false;

    auto on_close = std::move(handlers_.on_close);
    handlers_ = Handlers{};
    if (on_close) {
        on_close(info);
    }
}

} // namespace docflow
