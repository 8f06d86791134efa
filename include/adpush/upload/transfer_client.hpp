#pragma once

#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"
#include "adpush/upload/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace adpush::upload {

/**
 * @brief One HTTP operation per call against the remote upload protocol
 *
 * Implementations classify every failure into an ErrorKind; they never
 * retry on their own. Retrying is the coordinator's job.
 */
class TransferClient {
public:
    virtual ~TransferClient() = default;

    /// Registers an upload of @p total_size bytes and returns the new session
    virtual Result<StartResponse, UploadError> start(std::uint64_t total_size,
                                                     const CallOptions& options) = 0;

    /// Sends bytes [request.start_offset, request.end_offset)
    virtual Result<ChunkResult, UploadError> push_chunk(const ChunkRequest& request,
                                                        const std::vector<std::uint8_t>& bytes,
                                                        const CallOptions& options) = 0;

    /// Finalizes the session; calling it again returns the same asset
    virtual Result<FinishResponse, UploadError> finish(const std::string& session_id,
                                                       const CallOptions& options) = 0;
};

struct AssetStatus {
    enum class State { Processing, Ready, Error };

    State state = State::Processing;
    std::string detail;
};

/// Reports the remote processing status of a committed asset
class AssetStatusProbe {
public:
    virtual ~AssetStatusProbe() = default;

    virtual Result<AssetStatus, UploadError> asset_status(const AssetId& asset_id,
                                                          const CallOptions& options) = 0;
};

} // namespace adpush::upload
