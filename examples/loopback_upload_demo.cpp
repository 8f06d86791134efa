/**
 * @file loopback_upload_demo.cpp
 * @brief Resumable upload of a local file, end to end
 *
 * Without --config the demo starts the in-process loopback endpoint and
 * uploads to it, optionally injecting faults so the retry and resume paths
 * are visible in the log. With --config it uploads to the endpoint named in
 * the configuration file instead.
 *
 * Run with:
 *   ./build/loopback_upload_demo --size 24 --chunk 4194304 --fail 2 --prefix 1000
 *   ./build/loopback_upload_demo --file clip.mp4 --config adpush.json --verbose
 *
 * Ctrl+C cancels the upload between (or during) chunks.
 */

#include "adpush/core/cancellation.hpp"
#include "adpush/endpoint/loopback_endpoint.hpp"
#include "adpush/events/components.hpp"
#include "adpush/events/event_bus.hpp"
#include "adpush/network/http_client.hpp"
#include "adpush/upload/config.hpp"
#include "adpush/upload/coordinator.hpp"
#include "adpush/upload/graph_transfer_client.hpp"
#include "adpush/upload/readiness.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace adpush;

namespace {

CancellationToken* g_cancel = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT && g_cancel) {
        g_cancel->cancel();
    }
}

bool write_random_file(const fs::path& path, std::uint64_t size) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return false;
    }
    std::mt19937 engine(42);
    std::vector<char> block(64 * 1024);
    std::uint64_t written = 0;
    while (written < size) {
        for (auto& byte : block) {
            byte = static_cast<char>(engine() & 0xff);
        }
        const auto take = std::min<std::uint64_t>(block.size(), size - written);
        output.write(block.data(), static_cast<std::streamsize>(take));
        written += take;
    }
    return static_cast<bool>(output);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path file;
    fs::path config_path;
    std::uint64_t size_mb = 24;
    std::uint64_t chunk_size = 0;
    uint32_t fail_transfers = 0;
    std::uint64_t prefix = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--size" && i + 1 < argc) {
            size_mb = std::stoull(argv[++i]);
        } else if (arg == "--chunk" && i + 1 < argc) {
            chunk_size = std::stoull(argv[++i]);
        } else if (arg == "--fail" && i + 1 < argc) {
            fail_transfers = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--prefix" && i + 1 < argc) {
            prefix = std::stoull(argv[++i]);
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::error("Unknown argument: {}", arg);
            return 2;
        }
    }

    upload::ClientConfig config;
    if (!config_path.empty()) {
        auto loaded = upload::load_config_file(config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 2;
        }
        config = loaded.value();
    }
    if (chunk_size > 0) {
        config.upload.chunk_size = chunk_size;
    }

    const fs::path work_dir = fs::temp_directory_path() / "adpush_demo";
    fs::create_directories(work_dir);

    if (file.empty()) {
        file = work_dir / "source.bin";
        if (!write_random_file(file, size_mb * 1024 * 1024)) {
            spdlog::error("Failed to create {}", file.string());
            return 1;
        }
        spdlog::info("Generated {} MiB test file at {}", size_mb, file.string());
    }

    std::unique_ptr<endpoint::LoopbackUploadEndpoint> loopback;
    if (config_path.empty()) {
        endpoint::LoopbackOptions options;
        options.storage_root = work_dir / "endpoint";
        loopback = std::make_unique<endpoint::LoopbackUploadEndpoint>(options);
        if (auto started = loopback->start(); started.is_error()) {
            spdlog::error("{}", started.error());
            return 1;
        }
        config.graph = loopback->graph_config();
        if (fail_transfers > 0) {
            loopback->fail_next_transfers(fail_transfers);
        }
        if (prefix > 0) {
            loopback->accept_prefix_of_next_transfer(prefix);
        }
    }

    auto http = std::make_shared<network::HttpClient>();
    auto client = upload::GraphTransferClient::create(http, config.graph);
    if (client.is_error()) {
        spdlog::error("{}", client.error().describe());
        return 2;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    CancellationToken cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, signal_handler);

    upload::UploadCoordinator coordinator(*client.value(), &bus);
    auto asset = coordinator.upload_file(file, config.upload, cancel);

    int exit_code = 0;
    if (asset.is_ok()) {
        spdlog::info("Uploaded {} as asset {}", file.string(), asset.value());

        upload::ReadinessOptions readiness;
        readiness.timeout = std::chrono::seconds(loopback ? 5 : 120);
        readiness.interval = std::chrono::milliseconds(loopback ? 200 : 10000);
        auto status = upload::wait_until_ready(*client.value(), asset.value(), readiness, cancel);
        if (status.is_error()) {
            spdlog::warn("Readiness check ended: {}", status.error().describe());
        }
    } else if (asset.error().kind == ErrorKind::Cancelled) {
        spdlog::warn("Upload cancelled at offset {}", asset.error().committed_offset);
        exit_code = 130;
    } else {
        spdlog::error("Upload failed: {}", asset.error().describe());
        exit_code = 1;
    }

    metrics.print_stats();
    g_cancel = nullptr;
    return exit_code;
}
