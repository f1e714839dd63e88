#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "docflow/config.hpp"
#include "docflow/context.hpp"
#include "docflow/import_handler.hpp"
#include "docflow/status_broadcaster.hpp"

namespace docflow {

/**
 * One accepted WebSocket connection.
 *
 * Reads the HTTP upgrade request, answers 404 for any path other than the
 * import path, then subscribes to the broadcaster and hands every text frame
 * to the ImportHandler. All socket work runs on the connection's strand;
 * deliver() may be called from any thread.
 */
class ImportSession : public StatusObserver,
                      public std::enable_shared_from_this<ImportSession> {
public:
    ImportSession(boost::asio::ip::tcp::socket&& socket, Context& context, std::string path);
    ~ImportSession() override;

    void run();
    void deliver(const std::string& text) override;
    void close();

    ObserverId id() const { return id_; }

private:
    void on_run();
    void on_request(boost::beast::error_code ec, std::size_t bytes_transferred);
    void on_rejected(boost::beast::error_code ec, std::size_t bytes_transferred);
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
    void finish(const std::string& reason);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    boost::beast::http::response<boost::beast::http::string_body> rejection_;
    Context& context_;
    ImportHandler handler_;
    std::string path_;
    std::string remote_;

    ObserverId id_ = 0;
    std::deque<std::string> outbox_;
    bool accepted_ = false;
    bool writing_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

/**
 * Accepts connections on server.host:server.port and runs an ImportSession
 * for each. The io_context must outlive the server.
 */
class ImportServer : public std::enable_shared_from_this<ImportServer> {
public:
    ImportServer(boost::asio::io_context& ioc, Context& context, const ServerConfig& config);

    // Binds and starts accepting; throws TransportError when the address is unusable
    void start();

    // Stops accepting and closes every open session
    void stop();

    // Bound port; differs from the configured one when that was 0
    uint16_t port() const;

    size_t session_count() const;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Context& context_;
    ServerConfig config_;

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<ImportSession>> sessions_;
    bool stopped_ = false;
};

} // namespace docflow
