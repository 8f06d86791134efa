#pragma once

#include "adpush/core/cancellation.hpp"
#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"
#include "adpush/events/event_bus.hpp"
#include "adpush/upload/byte_range_reader.hpp"
#include "adpush/upload/config.hpp"
#include "adpush/upload/transfer_client.hpp"
#include "adpush/upload/types.hpp"

#include <cstdint>
#include <filesystem>

namespace adpush::upload {

/**
 * @brief Public entry point: delivers one local file as a remote asset
 *
 * Drives start, the ordered chunk loop and finish through an UploadSession.
 * Each upload() call owns its session, offsets and retry state, so one
 * coordinator may serve any number of concurrent uploads of different files;
 * the TransferClient (and the HTTP client under it) is the only shared part.
 *
 * On failure the returned UploadError carries the kind, the last committed
 * offset, the attempts spent and the underlying transport detail. A
 * cancelled upload fails with ErrorKind::Cancelled and never calls finish.
 *
 * Usage:
 * ```cpp
 * GraphTransferClient client(http, graph_config);
 * UploadCoordinator coordinator(client, &bus);
 * CancellationToken cancel;
 * auto asset = coordinator.upload_file("creative.mp4", config, cancel);
 * ```
 */
class UploadCoordinator {
public:
    explicit UploadCoordinator(TransferClient& client, events::EventBus* bus = nullptr);

    Result<AssetId, UploadError> upload(ByteRangeReader& reader,
                                        std::uint64_t total_size,
                                        const UploadConfig& config,
                                        const CancellationToken& cancel) const;

    Result<AssetId, UploadError> upload(ByteRangeReader& reader,
                                        std::uint64_t total_size,
                                        const UploadConfig& config) const;

    /// Opens @p path and uploads its full size
    Result<AssetId, UploadError> upload_file(const std::filesystem::path& path,
                                             const UploadConfig& config,
                                             const CancellationToken& cancel) const;

private:
    TransferClient& client_;
    events::EventBus* bus_;
};

} // namespace adpush::upload
