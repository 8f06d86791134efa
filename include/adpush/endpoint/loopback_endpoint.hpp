#pragma once

#include "adpush/core/result.hpp"
#include "adpush/network/http_server_asio.hpp"
#include "adpush/network/http_types.hpp"
#include "adpush/upload/config.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace adpush::endpoint {

struct LoopbackOptions {
    std::filesystem::path storage_root;        ///< staging/ and assets/ are created below it
    std::string api_version = "v18.0";
    std::string account_id = "act_loopback";
    std::string access_token = "loopback-token";
    /// true: the last transfer is acknowledged with an offset and finish() issues the asset.
    /// false: the last transfer answers with the video id directly.
    bool require_finish = true;
    /// finish answers {"video_id": ...} instead of {"success": true}
    bool finish_returns_video_id = false;
    std::uint64_t suggested_chunk_size = 4 * 1024 * 1024;
};

/**
 * @brief In-process implementation of the resumable video upload protocol
 *
 * Serves the same multipart start/transfer/finish phases as the remote
 * platform on 127.0.0.1, staging each chunk into a per-session file at its
 * offset and promoting the file to an asset once complete. Used by the demo
 * and by end-to-end tests, which steer it with the fault-injection calls.
 *
 * Usage:
 * ```cpp
 * LoopbackUploadEndpoint endpoint({temp_dir});
 * endpoint.start();
 * auto graph = endpoint.graph_config();   // base_url points at the endpoint
 * endpoint.fail_next_transfers(2);         // two 503s, then normal service
 * ```
 */
class LoopbackUploadEndpoint {
public:
    explicit LoopbackUploadEndpoint(LoopbackOptions options);
    ~LoopbackUploadEndpoint();

    LoopbackUploadEndpoint(const LoopbackUploadEndpoint&) = delete;
    LoopbackUploadEndpoint& operator=(const LoopbackUploadEndpoint&) = delete;

    /// Binds an ephemeral port and starts serving on a background thread
    Result<void> start();
    void stop();

    uint16_t port() const { return port_; }
    std::string base_url() const;

    /// Endpoint configuration a GraphTransferClient needs to talk to this endpoint
    upload::GraphEndpointConfig graph_config() const;

    // ── Fault injection ────────────────────────────────────

    void fail_next_transfers(uint32_t count,
                             network::HttpStatus status = network::HttpStatus::SERVICE_UNAVAILABLE);

    /// The next transfer stores only its first @p bytes and acknowledges accordingly
    void accept_prefix_of_next_transfer(std::uint64_t bytes);

    /// The next successful transfer is acknowledged with @p offset as the next expected offset
    void rewind_next_ack(std::uint64_t offset);

    /// Every existing session answers further requests with "upload session has expired"
    void expire_sessions();

    /// Holds back the next @p count responses (of any phase) by @p delay
    void stall_next_responses(uint32_t count, std::chrono::milliseconds delay);

    /// Attaches an x-business-use-case-usage header to every response; empty removes it
    void set_usage_header(std::string header);

    /// Status polls answer "processing" this many times before "ready"
    void set_processing_polls(uint32_t polls);

    // ── Introspection ──────────────────────────────────────

    std::vector<std::uint64_t> transfer_offsets() const;
    uint32_t start_count() const;
    uint32_t finish_count() const;
    uint32_t transfer_count() const;
    std::optional<std::vector<std::uint8_t>> asset_bytes(const std::string& video_id) const;

private:
    struct StagedSession {
        std::string session_id;
        std::string video_id;
        std::uint64_t total_size = 0;
        std::uint64_t received = 0;
        std::filesystem::path staging_path;
        bool expired = false;
        bool finished = false;
    };

    network::ServerReply handle(const network::HttpRequest& request);

    network::HttpResponse handle_start(const std::map<std::string, std::string>& fields);
    network::HttpResponse handle_transfer(const std::map<std::string, std::string>& fields,
                                          const std::vector<std::uint8_t>& chunk);
    network::HttpResponse handle_finish(const std::map<std::string, std::string>& fields);
    network::HttpResponse handle_status(const std::string& video_id);

    /// Caller holds mutex_
    Result<void> promote(StagedSession& session);
    std::filesystem::path asset_path(const std::string& video_id) const;

    LoopbackOptions options_;
    boost::asio::io_context io_;
    std::unique_ptr<network::HttpServerAsio> server_;
    std::thread io_thread_;
    uint16_t port_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, StagedSession> sessions_;
    std::map<std::string, uint32_t> status_polls_;
    uint64_t next_id_ = 1;
    uint32_t starts_ = 0;
    uint32_t transfers_ = 0;
    uint32_t finishes_ = 0;
    std::vector<std::uint64_t> transfer_offsets_;

    uint32_t fail_transfers_ = 0;
    network::HttpStatus fail_status_ = network::HttpStatus::SERVICE_UNAVAILABLE;
    std::optional<std::uint64_t> accept_prefix_;
    std::optional<std::uint64_t> rewind_to_;
    uint32_t stall_responses_ = 0;
    std::chrono::milliseconds stall_delay_{0};
    std::string usage_header_;
    uint32_t processing_polls_ = 0;
};

} // namespace adpush::endpoint
