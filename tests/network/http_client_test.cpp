#include "adpush/network/http_client.hpp"
#include "adpush/network/http_server_asio.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace adpush::network;
using namespace std::chrono_literals;

class HttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<HttpServerAsio>(io_, "127.0.0.1", 0);
        server_->set_handler([this](const HttpRequest& request) -> ServerReply {
            ++requests_;
            HttpResponse response(HttpStatus::OK);
            response.set_header("Content-Type", "application/json");
            if (request.path() == "/slow") {
                response.set_body("{\"slow\":true}");
                return ServerReply(response, 2000ms);
            }
            if (request.path() == "/echo") {
                response.set_body(request.body_as_string());
                return response;
            }
            response.set_body("{\"method\":\"" + HttpMethodUtils::to_string(request.method) + "\"}");
            return response;
        });
        io_thread_ = std::thread([this]() { io_.run(); });
    }

    void TearDown() override {
        asio::post(io_, [this]() { server_->stop(); });
        io_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    Url url(const std::string& target) const {
        return parse_url("http://127.0.0.1:" + std::to_string(server_->port()) + target).value();
    }

    static HttpRequest request(HttpMethod method) {
        HttpRequest req;
        req.method = method;
        return req;
    }

    asio::io_context io_;
    std::unique_ptr<HttpServerAsio> server_;
    std::thread io_thread_;
    std::atomic<int> requests_{0};
};

TEST_F(HttpClientTest, PerformsRequestAndReusesConnection) {
    HttpClient client;

    auto first = client.send(url("/a"), request(HttpMethod::GET), 5000ms);
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    EXPECT_EQ(first.value().status_code, 200);
    EXPECT_EQ(first.value().body_as_string(), "{\"method\":\"GET\"}");
    EXPECT_EQ(client.idle_connection_count(), 1u);

    auto second = client.send(url("/b"), request(HttpMethod::POST), 5000ms);
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_EQ(second.value().body_as_string(), "{\"method\":\"POST\"}");
    EXPECT_EQ(client.idle_connection_count(), 1u);
    EXPECT_EQ(requests_.load(), 2);
}

TEST_F(HttpClientTest, SendsLargeBodies) {
    HttpClient client;
    auto req = request(HttpMethod::POST);
    req.body.assign(3 * 1024 * 1024, 'z');

    auto res = client.send(url("/echo"), req, 10000ms);
    ASSERT_TRUE(res.is_ok()) << res.error().message;
    EXPECT_EQ(res.value().body.size(), req.body.size());
    EXPECT_EQ(res.value().body, req.body);
}

TEST_F(HttpClientTest, TimesOutAndDropsConnection) {
    HttpClient client;

    const auto started = std::chrono::steady_clock::now();
    auto res = client.send(url("/slow"), request(HttpMethod::GET), 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, TransportError::Kind::Timeout);
    EXPECT_LT(elapsed, 1500ms);
    EXPECT_EQ(client.idle_connection_count(), 0u);

    // The pool recovers with a fresh connection
    auto next = client.send(url("/fast"), request(HttpMethod::GET), 5000ms);
    EXPECT_TRUE(next.is_ok());
}

TEST_F(HttpClientTest, CancellationAbortsExchange) {
    HttpClient client;
    adpush::CancellationToken cancel;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });

    auto res = client.send(url("/slow"), request(HttpMethod::GET), 10000ms, &cancel);
    canceller.join();

    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, TransportError::Kind::Cancelled);
}

TEST_F(HttpClientTest, ConcurrentSendsShareOneClient) {
    HttpClient client;
    std::atomic<int> ok{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
            for (int j = 0; j < 5; ++j) {
                if (client.send(url("/c"), request(HttpMethod::GET), 5000ms).is_ok()) {
                    ++ok;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(ok.load(), 20);
    EXPECT_LE(client.idle_connection_count(), 4u);
}

TEST(HttpClientConnectTest, ReportsRefusedConnection) {
    asio::io_context io;
    tcp::acceptor probe(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = probe.local_endpoint().port();
    probe.close();

    HttpClient client;
    HttpRequest req;
    req.method = HttpMethod::GET;
    auto res = client.send(parse_url("http://127.0.0.1:" + std::to_string(port) + "/").value(),
                           req, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, TransportError::Kind::Connect);
}

TEST(TransportErrorTest, KindNames) {
    EXPECT_STREQ(to_string(TransportError::Kind::Timeout), "timeout");
    EXPECT_STREQ(to_string(TransportError::Kind::Connect), "connect");
}
