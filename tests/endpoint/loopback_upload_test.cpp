#include "adpush/endpoint/loopback_endpoint.hpp"
#include "adpush/events/components.hpp"
#include "adpush/events/event_bus.hpp"
#include "adpush/events/events.hpp"
#include "adpush/network/http_client.hpp"
#include "adpush/upload/coordinator.hpp"
#include "adpush/upload/graph_transfer_client.hpp"
#include "adpush/upload/readiness.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

namespace fs = std::filesystem;
using namespace adpush;
using namespace adpush::upload;
using adpush::endpoint::LoopbackOptions;
using adpush::endpoint::LoopbackUploadEndpoint;
using std::chrono::milliseconds;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("adpush_loopback_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

std::vector<std::uint8_t> write_source(const fs::path& path, std::uint64_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> content(static_cast<std::size_t>(size));
    std::uint32_t state = seed * 2654435761u + 1;
    for (auto& byte : content) {
        state = state * 1664525u + 1013904223u;
        byte = static_cast<std::uint8_t>(state >> 24);
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    return content;
}

} // namespace

class LoopbackUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        http_ = std::make_shared<network::HttpClient>();

        config_.chunk_size = kMiB;
        config_.connect_timeout = milliseconds(5000);
        config_.backoff_base = milliseconds(5);
        config_.backoff_cap = milliseconds(20);
        config_.jitter_ratio = 0.0;
    }

    void TearDown() override {
        graph_.reset();
        if (endpoint_) {
            endpoint_->stop();
        }
        endpoint_.reset();
        http_.reset();
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    void start_endpoint(LoopbackOptions options = {}) {
        options.storage_root = root_ / "endpoint";
        endpoint_ = std::make_unique<LoopbackUploadEndpoint>(options);
        auto started = endpoint_->start();
        ASSERT_TRUE(started.is_ok()) << started.error();

        auto graph = endpoint_->graph_config();
        graph.rate_limit_pause = milliseconds(20);
        connect(graph);
    }

    void connect(const GraphEndpointConfig& graph) {
        auto created = GraphTransferClient::create(http_, graph);
        ASSERT_TRUE(created.is_ok()) << created.error().describe();
        graph_ = std::move(created.value());
    }

    fs::path source(std::uint64_t size, std::uint8_t seed = 1) {
        const auto path = root_ / ("source-" + std::to_string(seed) + ".bin");
        content_ = write_source(path, size, seed);
        return path;
    }

    Result<AssetId, UploadError> upload(const fs::path& path) {
        UploadCoordinator coordinator(*graph_, &bus_);
        return coordinator.upload_file(path, config_, cancel_);
    }

    void expect_asset_matches(const AssetId& asset_id) {
        auto stored = endpoint_->asset_bytes(asset_id);
        ASSERT_TRUE(stored.has_value()) << "no asset " << asset_id;
        EXPECT_EQ(stored->size(), content_.size());
        EXPECT_TRUE(*stored == content_) << "asset " << asset_id << " differs from the source";
    }

    fs::path root_;
    std::shared_ptr<network::HttpClient> http_;
    std::unique_ptr<LoopbackUploadEndpoint> endpoint_;
    std::unique_ptr<GraphTransferClient> graph_;
    UploadConfig config_;
    events::EventBus bus_;
    events::MetricsComponent metrics_{bus_};
    CancellationToken cancel_;
    std::vector<std::uint8_t> content_;
};

TEST_F(LoopbackUploadTest, UploadsFileInChunksAndFinishes) {
    start_endpoint();
    const auto path = source(5 * kMiB + 123);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), "video-1");
    expect_asset_matches(result.value());

    const std::vector<std::uint64_t> expected{0, kMiB, 2 * kMiB, 3 * kMiB, 4 * kMiB, 5 * kMiB};
    EXPECT_EQ(endpoint_->transfer_offsets(), expected);
    EXPECT_EQ(endpoint_->start_count(), 1u);
    EXPECT_EQ(endpoint_->finish_count(), 1u);
    EXPECT_EQ(metrics_.get_stats().bytes_acknowledged.load(), 5 * kMiB + 123);
}

TEST_F(LoopbackUploadTest, AssetIdFromLastTransferSkipsFinish) {
    LoopbackOptions options;
    options.require_finish = false;
    start_endpoint(options);
    const auto path = source(3 * kMiB, 2);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    EXPECT_EQ(endpoint_->transfer_count(), 3u);
    EXPECT_EQ(endpoint_->finish_count(), 0u);
}

TEST_F(LoopbackUploadTest, FinishMayReturnTheVideoId) {
    LoopbackOptions options;
    options.finish_returns_video_id = true;
    start_endpoint(options);

    auto result = upload(source(kMiB / 2, 3));

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), "video-1");
    expect_asset_matches(result.value());
}

TEST_F(LoopbackUploadTest, EmptyFileIsCommittedByFinish) {
    start_endpoint();

    auto result = upload(source(0, 4));

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(endpoint_->transfer_count(), 0u);
    EXPECT_EQ(endpoint_->finish_count(), 1u);
    expect_asset_matches(result.value());
}

TEST_F(LoopbackUploadTest, TransientFailuresAreRetried) {
    start_endpoint();
    endpoint_->fail_next_transfers(2);
    const auto path = source(2 * kMiB, 5);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    const std::vector<std::uint64_t> expected{0, 0, 0, kMiB};
    EXPECT_EQ(endpoint_->transfer_offsets(), expected);
    EXPECT_EQ(metrics_.get_stats().chunk_retries.load(), 2u);
}

TEST_F(LoopbackUploadTest, PersistentFailureExhaustsTheChunk) {
    start_endpoint();
    config_.max_attempts_per_chunk = 3;
    endpoint_->fail_next_transfers(100, network::HttpStatus::BAD_GATEWAY);

    auto result = upload(source(2 * kMiB, 6));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ChunkExhausted);
    EXPECT_EQ(result.error().attempts, 3u);
    EXPECT_EQ(result.error().http_status, 502);
    EXPECT_EQ(result.error().committed_offset, 0u);
    EXPECT_EQ(endpoint_->transfer_count(), 3u);
    EXPECT_EQ(endpoint_->finish_count(), 0u);
}

TEST_F(LoopbackUploadTest, PartialAcceptanceResumesAtRemoteOffset) {
    start_endpoint();
    endpoint_->accept_prefix_of_next_transfer(100000);
    const auto path = source(2 * kMiB, 7);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    const auto offsets = endpoint_->transfer_offsets();
    ASSERT_GE(offsets.size(), 3u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 100000u);
    EXPECT_EQ(offsets[2], 100000u + kMiB);
}

TEST_F(LoopbackUploadTest, RewoundOffsetIsResent) {
    start_endpoint();
    bool rewound = false;
    bus_.subscribe<events::ChunkAcknowledgedEvent>([&](const events::ChunkAcknowledgedEvent&) {
        if (!rewound) {
            rewound = true;
            endpoint_->rewind_next_ack(256 * 1024);
        }
    });
    const auto path = source(3 * kMiB, 8);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    const auto offsets = endpoint_->transfer_offsets();
    ASSERT_GE(offsets.size(), 3u);
    EXPECT_EQ(offsets[1], kMiB);
    EXPECT_EQ(offsets[2], 256u * 1024);
    EXPECT_EQ(metrics_.get_stats().offset_rewinds.load(), 1u);
}

TEST_F(LoopbackUploadTest, ExpiredSessionFailsWithoutRestart) {
    start_endpoint();
    bus_.subscribe<events::ChunkAcknowledgedEvent>([&](const events::ChunkAcknowledgedEvent&) {
        endpoint_->expire_sessions();
    });

    auto result = upload(source(3 * kMiB, 9));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SessionExpired);
    EXPECT_EQ(result.error().committed_offset, kMiB);
    EXPECT_EQ(result.error().attempts, 1u);
    EXPECT_EQ(endpoint_->transfer_count(), 2u);
}

TEST_F(LoopbackUploadTest, ExpiredSessionRestartsWhenAllowed) {
    start_endpoint();
    config_.max_session_restarts = 1;
    bool expired = false;
    bus_.subscribe<events::ChunkAcknowledgedEvent>([&](const events::ChunkAcknowledgedEvent&) {
        if (!expired) {
            expired = true;
            endpoint_->expire_sessions();
        }
    });
    const auto path = source(3 * kMiB, 10);

    auto result = upload(path);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), "video-2");
    expect_asset_matches(result.value());
    EXPECT_EQ(endpoint_->start_count(), 2u);
}

TEST_F(LoopbackUploadTest, StalledTransferTimesOutAndRecovers) {
    start_endpoint();
    config_.chunk_timeout = milliseconds(1000);
    bool stalled = false;
    bus_.subscribe<events::UploadStartedEvent>([&](const events::UploadStartedEvent&) {
        if (!stalled) {
            stalled = true;
            endpoint_->stall_next_responses(1, milliseconds(4000));
        }
    });
    const auto path = source(2 * kMiB, 11);

    const auto started = std::chrono::steady_clock::now();
    auto result = upload(path);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    EXPECT_LT(elapsed, milliseconds(3500));
    EXPECT_EQ(metrics_.get_stats().chunk_retries.load(), 1u);

    // The stalled transfer was applied remotely; the retry learns the new offset
    const auto offsets = endpoint_->transfer_offsets();
    ASSERT_GE(offsets.size(), 3u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 0u);
    EXPECT_EQ(offsets[2], kMiB);
}

TEST_F(LoopbackUploadTest, WrongTokenIsRejectedImmediately) {
    start_endpoint();
    auto graph = endpoint_->graph_config();
    graph.access_token = "stolen";
    connect(graph);

    auto result = upload(source(kMiB, 12));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PermanentRejection);
    EXPECT_EQ(result.error().http_status, 400);
    EXPECT_EQ(result.error().attempts, 1u);
    EXPECT_EQ(endpoint_->start_count(), 0u);
}

TEST_F(LoopbackUploadTest, UsageHeaderPausesTheUpload) {
    start_endpoint();
    endpoint_->set_usage_header(R"({"act_loopback":[{"call_count":95,"total_cputime":10,"total_time":10}]})");

    auto result = upload(source(3 * kMiB, 13));

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    expect_asset_matches(result.value());
    EXPECT_GE(metrics_.get_stats().rate_limit_pauses.load(), 2u);
}

TEST_F(LoopbackUploadTest, CancellationStopsBetweenChunks) {
    start_endpoint();
    std::atomic<int> acknowledged{0};
    bus_.subscribe<events::ChunkAcknowledgedEvent>([&](const events::ChunkAcknowledgedEvent&) {
        if (++acknowledged == 2) {
            cancel_.cancel();
        }
    });

    auto result = upload(source(5 * kMiB, 14));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.error().committed_offset, 2 * kMiB);
    EXPECT_EQ(endpoint_->transfer_count(), 2u);
    EXPECT_EQ(endpoint_->finish_count(), 0u);
    EXPECT_FALSE(endpoint_->asset_bytes("video-1").has_value());
}

TEST_F(LoopbackUploadTest, WaitsUntilAssetIsReady) {
    start_endpoint();
    endpoint_->set_processing_polls(2);

    auto result = upload(source(kMiB, 15));
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    ReadinessOptions options;
    options.timeout = milliseconds(5000);
    options.interval = milliseconds(10);
    options.request_timeout = milliseconds(2000);
    auto status = wait_until_ready(*graph_, result.value(), options, cancel_);

    ASSERT_TRUE(status.is_ok()) << status.error().describe();
    EXPECT_EQ(status.value().state, AssetStatus::State::Ready);
}

TEST_F(LoopbackUploadTest, ReadinessGivesUpWithLastStatus) {
    start_endpoint();
    endpoint_->set_processing_polls(1000);

    auto result = upload(source(1024, 16));
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    ReadinessOptions options;
    options.timeout = milliseconds(100);
    options.interval = milliseconds(20);
    auto status = wait_until_ready(*graph_, result.value(), options, cancel_);

    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, AssetStatus::State::Processing);
}

TEST_F(LoopbackUploadTest, ParallelUploadsShareOneClient) {
    start_endpoint();
    constexpr int kUploads = 3;

    std::vector<fs::path> paths;
    std::vector<std::vector<std::uint8_t>> contents;
    for (int i = 0; i < kUploads; ++i) {
        paths.push_back(source(2 * kMiB + static_cast<std::uint64_t>(i) * 1000, static_cast<std::uint8_t>(20 + i)));
        contents.push_back(content_);
    }

    std::vector<Result<AssetId, UploadError>> results(
        kUploads, Result<AssetId, UploadError>(ErrValue<UploadError>(make_error(ErrorKind::Transient, "not run"))));
    std::vector<std::thread> workers;
    for (int i = 0; i < kUploads; ++i) {
        workers.emplace_back([&, i]() {
            UploadCoordinator coordinator(*graph_, &bus_);
            results[static_cast<std::size_t>(i)] = coordinator.upload_file(paths[static_cast<std::size_t>(i)],
                                                                           config_, cancel_);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<AssetId> assets;
    for (int i = 0; i < kUploads; ++i) {
        const auto& result = results[static_cast<std::size_t>(i)];
        ASSERT_TRUE(result.is_ok()) << result.error().describe();
        assets.insert(result.value());
        auto stored = endpoint_->asset_bytes(result.value());
        ASSERT_TRUE(stored.has_value());
        EXPECT_TRUE(*stored == contents[static_cast<std::size_t>(i)]);
    }
    EXPECT_EQ(assets.size(), static_cast<std::size_t>(kUploads));
    EXPECT_EQ(metrics_.get_stats().uploads_completed.load(), static_cast<std::uint64_t>(kUploads));
}
