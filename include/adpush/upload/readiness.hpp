#pragma once

#include "adpush/core/cancellation.hpp"
#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"
#include "adpush/upload/transfer_client.hpp"

#include <chrono>

namespace adpush::upload {

struct ReadinessOptions {
    std::chrono::milliseconds timeout{120000};
    std::chrono::milliseconds interval{10000};
    std::chrono::milliseconds request_timeout{10000};
};

/**
 * @brief Polls the remote until an uploaded asset has been processed
 *
 * Returns the first Ready or Error status. When the timeout passes first,
 * the last observed status (Processing) is returned rather than an error,
 * leaving the caller to decide whether to proceed. Failed polls are logged
 * and retried on the next interval; only cancellation ends the wait early
 * with an error.
 */
Result<AssetStatus, UploadError> wait_until_ready(AssetStatusProbe& probe,
                                                  const AssetId& asset_id,
                                                  const ReadinessOptions& options,
                                                  const CancellationToken& cancel);

} // namespace adpush::upload
