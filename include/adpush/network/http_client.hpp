#pragma once

#include "adpush/core/cancellation.hpp"
#include "adpush/core/result.hpp"
#include "adpush/network/http_types.hpp"
#include "adpush/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace adpush {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Why a request produced no HTTP response
 */
struct TransportError {
    enum class Kind {
        Resolve,    // DNS lookup failed
        Connect,    // TCP connect refused / unreachable
        Tls,        // Handshake or certificate failure
        Timeout,    // Per-request deadline expired; connection was closed
        Reset,      // Peer reset or closed mid-exchange
        Cancelled,  // Caller's CancellationToken fired
        Protocol    // Response could not be parsed
    };

    Kind kind = Kind::Reset;
    std::string message;
};

const char* to_string(TransportError::Kind kind) noexcept;

struct HttpClientOptions {
    std::size_t max_idle_per_host = 4;
    /// Idle connections older than this are discarded instead of reused.
    /// Kept below the intermediary's idle-reset ceiling.
    std::chrono::milliseconds idle_reuse_limit{30000};
    bool verify_peer = true;
    std::string ca_file;               ///< Empty: system default trust store
    std::string user_agent = "adpush/1.0";
};

/**
 * @brief Shared, thread-safe HTTP/1.1 client over Boost.Asio
 *
 * One HttpClient is meant to be shared by every upload in the process.
 * It owns an io_context driven by a single background thread; send() may
 * be called concurrently from any number of threads and blocks the calling
 * thread only.
 *
 * Each send() has its own deadline. When it expires the connection is
 * closed, so a stalled transfer can never keep a socket open past the
 * intermediary's idle ceiling. A CancellationToken passed to send() aborts
 * the in-flight exchange the same way.
 *
 * Connections are pooled per scheme/host/port and reused while fresh.
 *
 * Usage:
 * ```cpp
 * auto client = std::make_shared<HttpClient>();
 * HttpRequest req;
 * req.method = HttpMethod::GET;
 * auto res = client->send(parse_url("http://127.0.0.1:8080/x").value(), req,
 *                         std::chrono::seconds(5));
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Perform one request/response exchange
     *
     * @param url Scheme, host and port to talk to; request.url is replaced by url.target
     * @param request Method, headers and body; Host/Content-Length are filled in
     * @param timeout Deadline for the whole exchange (connect + write + read)
     * @param cancel Optional token polled while the exchange is in flight
     */
    Result<HttpResponse, TransportError> send(const Url& url,
                                              HttpRequest request,
                                              std::chrono::milliseconds timeout,
                                              const CancellationToken* cancel = nullptr);

    std::size_t idle_connection_count() const;

private:
    class Connection;
    class PlainConnection;
    class TlsConnection;
    struct Exchange;

    struct IdleConnection {
        std::unique_ptr<Connection> connection;
        std::chrono::steady_clock::time_point since;
    };

    std::unique_ptr<Connection> checkout(const Url& url);
    void checkin(const Url& url, std::unique_ptr<Connection> connection);
    std::unique_ptr<Connection> make_connection(const Url& url);

    static void begin(const std::shared_ptr<Exchange>& exchange);
    static void connect(const std::shared_ptr<Exchange>& exchange);
    static void handshake(const std::shared_ptr<Exchange>& exchange);
    static void write(const std::shared_ptr<Exchange>& exchange);
    static void read(const std::shared_ptr<Exchange>& exchange);

    HttpClientOptions options_;
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::ssl::context tls_context_;
    std::thread io_thread_;

    mutable std::mutex pool_mutex_;
    std::unordered_map<std::string, std::deque<IdleConnection>> idle_;
};

} // namespace network
} // namespace adpush
