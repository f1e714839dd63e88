#pragma once

#include <deque>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "docflow/transport.hpp"

namespace docflow {

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Parses ws://host[:port][/path]; throws InvalidArgumentError
WebSocketEndpoint parse_websocket_url(const std::string& url);

/**
 * Beast WebSocket client: resolve -> connect -> handshake -> read loop.
 *
 * All socket work runs on a private strand. Outbound text frames are queued
 * and written one at a time. A close frame from the peer, or a close()
 * requested locally, ends the connection cleanly; any other I/O error is an
 * abnormal close.
 */
class WebSocketTransport : public Transport,
                           public std::enable_shared_from_this<WebSocketTransport> {
public:
    WebSocketTransport(boost::asio::io_context& ioc, WebSocketEndpoint endpoint);

    void open(Handlers handlers) override;
    void write(std::string text) override;
    void close(const std::string& reason) override;

    static TransportFactory factory(boost::asio::io_context& ioc, const WebSocketEndpoint& endpoint);

private:
    void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type);
    void on_handshake(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
    void fail(boost::beast::error_code ec, const char* what);
    void finish(const CloseInfo& info);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    WebSocketEndpoint endpoint_;
    Handlers handlers_;

    std::deque<std::string> outbox_;
    std::string close_reason_;
    bool open_ = false;
    bool writing_ = false;
    bool closing_ = false;
    bool close_sent_ = false;
    bool finished_ = false;
};

} // namespace docflow
