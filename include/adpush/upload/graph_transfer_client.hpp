#pragma once

#include "adpush/network/http_client.hpp"
#include "adpush/network/http_types.hpp"
#include "adpush/network/url.hpp"
#include "adpush/upload/config.hpp"
#include "adpush/upload/transfer_client.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace adpush::upload {

/**
 * @brief TransferClient for the Graph-style resumable video endpoint
 *
 * Every phase is a multipart/form-data POST to
 * {base_url}/{api_version}/{account_id}/advideos:
 *
 *   start:    upload_phase=start, file_size
 *             -> {upload_session_id, video_id, start_offset, end_offset}
 *   transfer: upload_phase=transfer, upload_session_id, start_offset, video_file_chunk
 *             -> {start_offset, end_offset} | {video_id}
 *   finish:   upload_phase=finish, upload_session_id
 *             -> {video_id} | {success: true}
 *
 * The HttpClient is shared; one GraphTransferClient may serve concurrent uploads.
 */
class GraphTransferClient : public TransferClient, public AssetStatusProbe {
public:
    /// Fails with InvalidConfig when the endpoint configuration is incomplete
    static Result<std::unique_ptr<GraphTransferClient>, UploadError> create(
        std::shared_ptr<network::HttpClient> http, GraphEndpointConfig config);

    Result<StartResponse, UploadError> start(std::uint64_t total_size,
                                             const CallOptions& options) override;

    Result<ChunkResult, UploadError> push_chunk(const ChunkRequest& request,
                                                const std::vector<std::uint8_t>& bytes,
                                                const CallOptions& options) override;

    Result<FinishResponse, UploadError> finish(const std::string& session_id,
                                               const CallOptions& options) override;

    Result<AssetStatus, UploadError> asset_status(const AssetId& asset_id,
                                                  const CallOptions& options) override;

    /**
     * @brief Pause requested by an x-business-use-case-usage header
     *
     * The header maps account ids to lists of usage objects carrying
     * call_count, total_cputime and total_time percentages. Any figure at or
     * above @p threshold yields @p pause.
     */
    static std::optional<std::chrono::milliseconds> throttle_from_usage(const std::string& header,
                                                                        int threshold,
                                                                        std::chrono::milliseconds pause);

    /// Which ErrorKind an HTTP error response maps to, for the given phase
    static ErrorKind classify_response(const network::HttpResponse& response, bool session_bound);

private:
    GraphTransferClient(std::shared_ptr<network::HttpClient> http, GraphEndpointConfig config,
                        network::Url advideos_url, network::Url api_root);

    Result<network::HttpResponse, UploadError> post_form(const char* phase,
                                                         const std::string& content_type,
                                                         std::vector<std::uint8_t> body,
                                                         const CallOptions& options,
                                                         bool session_bound);

    std::shared_ptr<network::HttpClient> http_;
    GraphEndpointConfig config_;
    network::Url advideos_url_;
    network::Url api_root_;
};

} // namespace adpush::upload
