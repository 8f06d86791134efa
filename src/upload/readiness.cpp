#include "adpush/upload/readiness.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace adpush::upload {

Result<AssetStatus, UploadError> wait_until_ready(AssetStatusProbe& probe,
                                                  const AssetId& asset_id,
                                                  const ReadinessOptions& options,
                                                  const CancellationToken& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    AssetStatus last;

    while (true) {
        if (cancel.is_cancelled()) {
            return Err<AssetStatus>(make_error(ErrorKind::Cancelled, "Readiness wait cancelled"));
        }

        auto status = probe.asset_status(asset_id, CallOptions{options.request_timeout, &cancel});
        if (status.is_ok()) {
            last = status.value();
            if (last.state != AssetStatus::State::Processing) {
                spdlog::info("Asset {} is {}", asset_id,
                             last.state == AssetStatus::State::Ready ? std::string("ready") : "in error: " + last.detail);
                return Ok(last);
            }
            spdlog::debug("Asset {} still processing ({})", asset_id, last.detail);
        } else if (status.error().kind == ErrorKind::Cancelled) {
            return status;
        } else {
            spdlog::warn("Status poll for {} failed: {}", asset_id, status.error().describe());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (cancel.wait_for(std::min(options.interval, remaining))) {
            return Err<AssetStatus>(make_error(ErrorKind::Cancelled, "Readiness wait cancelled"));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    spdlog::warn("Asset {} not ready after {}ms; proceeding with last status", asset_id,
                 options.timeout.count());
    return Ok(last);
}

} // namespace adpush::upload
