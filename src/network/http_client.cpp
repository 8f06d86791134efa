#include "adpush/network/http_client.hpp"

#include "adpush/network/http_parser.hpp"

#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <future>

namespace adpush {
namespace network {

using IoHandler = std::function<void(boost::system::error_code, std::size_t)>;

const char* to_string(TransportError::Kind kind) noexcept {
    switch (kind) {
        case TransportError::Kind::Resolve: return "resolve";
        case TransportError::Kind::Connect: return "connect";
        case TransportError::Kind::Tls: return "tls";
        case TransportError::Kind::Timeout: return "timeout";
        case TransportError::Kind::Reset: return "reset";
        case TransportError::Kind::Cancelled: return "cancelled";
        case TransportError::Kind::Protocol: return "protocol";
    }
    return "unknown";
}

// ──────────────────────────────────────────────────────────
// Connections: plain TCP and TLS behind one interface
// ──────────────────────────────────────────────────────────

class HttpClient::Connection {
public:
    virtual ~Connection() = default;

    virtual tcp::socket& socket() = 0;
    virtual void async_handshake(const std::string& host,
                                 std::function<void(boost::system::error_code)> handler) = 0;
    virtual void async_write(const std::vector<uint8_t>& data, IoHandler handler) = 0;
    virtual void async_read_some(asio::mutable_buffer buffer, IoHandler handler) = 0;

    bool is_open() { return socket().is_open(); }

    void close() {
        boost::system::error_code ignored;
        socket().shutdown(tcp::socket::shutdown_both, ignored);
        socket().close(ignored);
    }
};

class HttpClient::PlainConnection : public HttpClient::Connection {
public:
    explicit PlainConnection(asio::io_context& io) : socket_(io) {}

    tcp::socket& socket() override { return socket_; }

    void async_handshake(const std::string&,
                         std::function<void(boost::system::error_code)> handler) override {
        asio::post(socket_.get_executor(), [handler = std::move(handler)] {
            handler(boost::system::error_code{});
        });
    }

    void async_write(const std::vector<uint8_t>& data, IoHandler handler) override {
        asio::async_write(socket_, asio::buffer(data), std::move(handler));
    }

    void async_read_some(asio::mutable_buffer buffer, IoHandler handler) override {
        socket_.async_read_some(buffer, std::move(handler));
    }

private:
    tcp::socket socket_;
};

class HttpClient::TlsConnection : public HttpClient::Connection {
public:
    TlsConnection(asio::io_context& io, asio::ssl::context& context, bool verify_peer)
        : stream_(io, context), verify_peer_(verify_peer) {}

    tcp::socket& socket() override { return stream_.next_layer(); }

    void async_handshake(const std::string& host,
                         std::function<void(boost::system::error_code)> handler) override {
        // SNI: virtual-hosted edges pick the certificate by server name
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str())) {
            boost::system::error_code ec{static_cast<int>(::ERR_get_error()),
                                         asio::error::get_ssl_category()};
            asio::post(socket().get_executor(), [handler = std::move(handler), ec] { handler(ec); });
            return;
        }
        if (verify_peer_) {
            stream_.set_verify_mode(asio::ssl::verify_peer);
            stream_.set_verify_callback(asio::ssl::host_name_verification(host));
        } else {
            stream_.set_verify_mode(asio::ssl::verify_none);
        }
        stream_.async_handshake(asio::ssl::stream_base::client, std::move(handler));
    }

    void async_write(const std::vector<uint8_t>& data, IoHandler handler) override {
        asio::async_write(stream_, asio::buffer(data), std::move(handler));
    }

    void async_read_some(asio::mutable_buffer buffer, IoHandler handler) override {
        stream_.async_read_some(buffer, std::move(handler));
    }

private:
    asio::ssl::stream<tcp::socket> stream_;
    bool verify_peer_;
};

// ──────────────────────────────────────────────────────────
// Exchange: state of one in-flight request, owned by its handlers
// ──────────────────────────────────────────────────────────

struct HttpClient::Exchange {
    explicit Exchange(asio::io_context& io) : resolver(io), timer(io) {}

    std::unique_ptr<Connection> connection;
    bool reused = false;
    Url url;
    std::vector<uint8_t> wire;
    bool head_request = false;
    HttpResponseParser parser;
    std::array<char, 16 * 1024> buffer{};
    tcp::resolver resolver;
    asio::steady_timer timer;
    std::promise<Result<HttpResponse, TransportError>> promise;
    bool done = false;  // Only touched on the io thread

    void succeed(HttpResponse response) {
        if (done) {
            return;
        }
        done = true;
        timer.cancel();
        promise.set_value(Ok(std::move(response)));
    }

    void fail(TransportError::Kind kind, std::string message) {
        if (done) {
            return;
        }
        done = true;
        timer.cancel();
        resolver.cancel();
        if (connection) {
            connection->close();
        }
        promise.set_value(Err<HttpResponse>(TransportError{kind, std::move(message)}));
    }
};

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options))
    , work_(asio::make_work_guard(io_))
    , tls_context_(asio::ssl::context::tls_client) {

    boost::system::error_code ec;
    if (options_.ca_file.empty()) {
        tls_context_.set_default_verify_paths(ec);
    } else {
        tls_context_.load_verify_file(options_.ca_file, ec);
    }
    if (ec) {
        spdlog::warn("HttpClient: could not load trust store: {}", ec.message());
    }

    io_thread_ = std::thread([this] { io_.run(); });
    spdlog::debug("HttpClient started (max_idle_per_host={}, idle_reuse_limit={}ms)",
                  options_.max_idle_per_host, options_.idle_reuse_limit.count());
}

HttpClient::~HttpClient() {
    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    std::lock_guard lock(pool_mutex_);
    idle_.clear();
}

Result<HttpResponse, TransportError> HttpClient::send(const Url& url,
                                                      HttpRequest request,
                                                      std::chrono::milliseconds timeout,
                                                      const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) {
        return Err<HttpResponse>(TransportError{TransportError::Kind::Cancelled,
                                                "cancelled before sending"});
    }

    request.url = url.target;
    request.version = HttpVersion::HTTP_1_1;
    request.set_header("Host", url.host_header());
    if (!request.has_header("User-Agent")) {
        request.set_header("User-Agent", options_.user_agent);
    }
    if (!request.has_header("Connection")) {
        request.set_header("Connection", "keep-alive");
    }

    auto exchange = std::make_shared<Exchange>(io_);
    exchange->url = url;
    exchange->wire = request.serialize();
    exchange->head_request = request.method == HttpMethod::HEAD;
    exchange->parser.expect_head_response(exchange->head_request);
    exchange->connection = checkout(url);
    exchange->reused = exchange->connection != nullptr;
    if (!exchange->connection) {
        exchange->connection = make_connection(url);
    }

    auto future = exchange->promise.get_future();

    asio::post(io_, [exchange, timeout] {
        exchange->timer.expires_after(timeout);
        exchange->timer.async_wait([exchange, timeout](boost::system::error_code ec) {
            if (!ec) {
                exchange->fail(TransportError::Kind::Timeout,
                               "no complete response within " + std::to_string(timeout.count()) + "ms");
            }
        });
        begin(exchange);
    });

    bool cancel_posted = false;
    while (future.wait_for(std::chrono::milliseconds(20)) != std::future_status::ready) {
        if (!cancel_posted && cancel && cancel->is_cancelled()) {
            cancel_posted = true;
            asio::post(io_, [exchange] {
                exchange->fail(TransportError::Kind::Cancelled, "cancelled while in flight");
            });
        }
    }

    auto result = future.get();
    if (result.is_ok()) {
        const auto& response = result.value();
        const bool delimited = exchange->parser.state() == ParseState::COMPLETE &&
                               (response.has_header("Content-Length") ||
                                response.has_header("Transfer-Encoding") ||
                                exchange->head_request);
        if (response.keep_alive() && delimited && exchange->connection &&
            exchange->connection->is_open()) {
            checkin(url, std::move(exchange->connection));
        }
        spdlog::debug("{} {}{} -> {} ({} bytes{})",
                      HttpMethodUtils::to_string(request.method), url.authority_key(), url.target,
                      response.status_code, response.body.size(),
                      exchange->reused ? ", reused connection" : "");
    } else {
        spdlog::debug("{} {}{} failed: {} ({})",
                      HttpMethodUtils::to_string(request.method), url.authority_key(), url.target,
                      to_string(result.error().kind), result.error().message);
    }
    return result;
}

std::size_t HttpClient::idle_connection_count() const {
    std::lock_guard lock(pool_mutex_);
    std::size_t count = 0;
    for (const auto& [key, connections] : idle_) {
        count += connections.size();
    }
    return count;
}

std::unique_ptr<HttpClient::Connection> HttpClient::checkout(const Url& url) {
    std::lock_guard lock(pool_mutex_);
    auto it = idle_.find(url.authority_key());
    if (it == idle_.end()) {
        return nullptr;
    }

    const auto now = std::chrono::steady_clock::now();
    auto& connections = it->second;
    while (!connections.empty()) {
        IdleConnection candidate = std::move(connections.back());
        connections.pop_back();
        if (now - candidate.since < options_.idle_reuse_limit && candidate.connection->is_open()) {
            return std::move(candidate.connection);
        }
        // Too old: the intermediary may already have reset it
    }
    return nullptr;
}

void HttpClient::checkin(const Url& url, std::unique_ptr<Connection> connection) {
    if (options_.max_idle_per_host == 0) {
        return;
    }
    std::lock_guard lock(pool_mutex_);
    auto& connections = idle_[url.authority_key()];
    connections.push_back(IdleConnection{std::move(connection), std::chrono::steady_clock::now()});
    while (connections.size() > options_.max_idle_per_host) {
        connections.pop_front();
    }
}

std::unique_ptr<HttpClient::Connection> HttpClient::make_connection(const Url& url) {
    if (url.is_tls()) {
        return std::make_unique<TlsConnection>(io_, tls_context_, options_.verify_peer);
    }
    return std::make_unique<PlainConnection>(io_);
}

void HttpClient::begin(const std::shared_ptr<Exchange>& exchange) {
    if (exchange->done) {
        return;
    }
    if (exchange->reused) {
        write(exchange);
    } else {
        connect(exchange);
    }
}

void HttpClient::connect(const std::shared_ptr<Exchange>& exchange) {
    exchange->resolver.async_resolve(
        exchange->url.host, std::to_string(exchange->url.port),
        [exchange](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (exchange->done) {
                return;
            }
            if (ec) {
                exchange->fail(TransportError::Kind::Resolve, ec.message());
                return;
            }
            asio::async_connect(exchange->connection->socket(), endpoints,
                [exchange](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    if (exchange->done) {
                        return;
                    }
                    if (connect_ec) {
                        exchange->fail(TransportError::Kind::Connect, connect_ec.message());
                        return;
                    }
                    boost::system::error_code ignored;
                    exchange->connection->socket().set_option(tcp::no_delay(true), ignored);
                    handshake(exchange);
                });
        });
}

void HttpClient::handshake(const std::shared_ptr<Exchange>& exchange) {
    exchange->connection->async_handshake(exchange->url.host,
        [exchange](boost::system::error_code ec) {
            if (exchange->done) {
                return;
            }
            if (ec) {
                exchange->fail(TransportError::Kind::Tls, ec.message());
                return;
            }
            write(exchange);
        });
}

void HttpClient::write(const std::shared_ptr<Exchange>& exchange) {
    exchange->connection->async_write(exchange->wire,
        [exchange](boost::system::error_code ec, std::size_t) {
            if (exchange->done) {
                return;
            }
            if (ec) {
                exchange->fail(TransportError::Kind::Reset, "write failed: " + ec.message());
                return;
            }
            read(exchange);
        });
}

void HttpClient::read(const std::shared_ptr<Exchange>& exchange) {
    exchange->connection->async_read_some(asio::buffer(exchange->buffer),
        [exchange](boost::system::error_code ec, std::size_t bytes) {
            if (exchange->done) {
                return;
            }

            if (bytes > 0) {
                auto parsed = exchange->parser.parse(exchange->buffer.data(), bytes);
                if (parsed.is_error()) {
                    exchange->fail(TransportError::Kind::Protocol, parsed.error());
                    return;
                }
                if (parsed.value()) {
                    exchange->succeed(exchange->parser.get_response());
                    return;
                }
            }

            if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
                auto finished = exchange->parser.finish_on_eof();
                if (finished.is_ok()) {
                    exchange->connection->close();
                    exchange->succeed(exchange->parser.get_response());
                } else {
                    exchange->fail(TransportError::Kind::Reset, finished.error());
                }
                return;
            }
            if (ec) {
                exchange->fail(TransportError::Kind::Reset, "read failed: " + ec.message());
                return;
            }
            read(exchange);
        });
}

} // namespace network
} // namespace adpush
