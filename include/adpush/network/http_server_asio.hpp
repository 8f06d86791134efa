#pragma once

#include "adpush/network/http_parser.hpp"
#include "adpush/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace adpush {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief What a request handler hands back to the connection
 *
 * A non-zero delay holds the response back on a timer without blocking
 * the event loop. The loopback endpoint uses it to simulate a stalled
 * intermediary.
 */
struct ServerReply {
    ServerReply(HttpResponse r, std::chrono::milliseconds d = std::chrono::milliseconds(0))
        : response(std::move(r)), delay(d) {}

    HttpResponse response;
    std::chrono::milliseconds delay;
};

using HttpRequestHandler = std::function<ServerReply(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Each complete request is handed to the handler and answered
 * 4. Keep-alive requests loop back to 3; otherwise the socket is shut down
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();

    /// Feeds @p len bytes to the parser; dispatches the request once complete
    void on_data(const char* data, std::size_t len);

    void dispatch(const HttpRequest& request);

    void do_write(HttpResponse response, bool keep_alive);

    void handle_error(const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpRequestParser parser_;
    asio::steady_timer delay_timer_;
    std::array<char, 16 * 1024> buffer_{};
    std::string pending_;              // Bytes received after the end of the current request
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Serves the loopback upload endpoint. Requests on one connection are
 * answered in order; HTTP/1.1 connections stay open between requests so
 * the client's connection pool is exercised the same way as against a
 * real edge.
 *
 * Thread safety:
 * - The handler is called from io_context thread(s)
 * - stop() must be called from an io_context thread or before run()
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "127.0.0.1", 0);   // port 0: pick a free port
 * server.set_handler([](const HttpRequest& req) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("{}");
 *     return res;
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Boost.Asio event loop (must outlive this server)
     * @param address Local address to bind, e.g. "127.0.0.1"
     * @param port Port to listen on; 0 lets the OS choose
     */
    HttpServerAsio(asio::io_context& io_context, const std::string& address, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /// The bound port (the OS-chosen one when constructed with 0)
    uint16_t port() const { return port_; }

    /// Stops accepting new connections
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace adpush
