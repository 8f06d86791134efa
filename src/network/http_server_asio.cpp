#include "adpush/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace adpush {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , delay_timer_(socket_.get_executor()) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    if (!pending_.empty()) {
        // A pipelined request arrived together with the previous one
        std::string leftover;
        leftover.swap(pending_);
        on_data(leftover.data(), leftover.size());
        return;
    }

    auto self = shared_from_this();
    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                on_data(buffer_.data(), bytes_transferred);
            } else if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                spdlog::debug("Read error: {}", ec.message());
            }
        });
}

void HttpConnection::on_data(const char* data, std::size_t len) {
    auto parse_result = parser_.parse(data, len);
    if (parse_result.is_error()) {
        handle_error("Parse error: " + parse_result.error());
        return;
    }

    if (!parse_result.value()) {
        do_read();
        return;
    }

    if (parser_.consumed() < len) {
        pending_.assign(data + parser_.consumed(), len - parser_.consumed());
    }
    HttpRequest request = parser_.get_request();
    parser_.reset();
    dispatch(request);
}

void HttpConnection::dispatch(const HttpRequest& request) {
    spdlog::debug("{} {} HTTP/{} ({} bytes)",
                  HttpMethodUtils::to_string(request.method),
                  request.url,
                  request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
                  request.body.size());

    const std::string connection = request.get_header("Connection");
    bool keep_alive = request.version == HttpVersion::HTTP_1_1
        ? connection != "close"
        : connection == "keep-alive";

    ServerReply reply{HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR)};
    try {
        reply = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        reply = ServerReply{create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                                  "Internal server error")};
    }

    if (reply.response.get_header("Connection") == "close") {
        keep_alive = false;
    }
    if (!reply.response.has_header("Connection")) {
        reply.response.set_header("Connection", keep_alive ? "keep-alive" : "close");
    }

    if (reply.delay.count() <= 0) {
        do_write(std::move(reply.response), keep_alive);
        return;
    }

    auto self = shared_from_this();
    auto response = std::make_shared<HttpResponse>(std::move(reply.response));
    delay_timer_.expires_after(reply.delay);
    delay_timer_.async_wait([this, self, response, keep_alive](boost::system::error_code ec) {
        if (!ec) {
            do_write(std::move(*response), keep_alive);
        }
    });
}

void HttpConnection::do_write(HttpResponse response, bool keep_alive) {
    auto self = shared_from_this();

    // Store data in shared_ptr so it stays alive during async operation
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr, keep_alive](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }

            spdlog::trace("Sent {} bytes", bytes_transferred);
            if (keep_alive) {
                do_read();
                return;
            }

            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        });
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(HttpStatus::BAD_REQUEST, message), false);
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body("{\"error\":{\"message\":\"" + message + "\",\"code\":" +
                      std::to_string(static_cast<int>(status)) + "}}");
    response.set_header("Content-Type", "application/json");
    response.set_header("Connection", "close");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, const std::string& address, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", address, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                spdlog::trace("Accepted new connection (Asio)");
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        });
}

} // namespace network
} // namespace adpush
