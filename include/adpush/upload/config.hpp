#pragma once

#include "adpush/core/error.hpp"
#include "adpush/core/result.hpp"
#include "adpush/upload/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace adpush::upload {

/**
 * @brief Tunables of one upload
 *
 * chunk_size is a safety parameter, not just a throughput knob: a chunk
 * must be delivered well inside the intermediary's idle-timeout ceiling,
 * so validate() rejects any combination whose timeouts reach it.
 */
struct UploadConfig {
    std::uint64_t chunk_size = 4 * 1024 * 1024;
    std::uint32_t max_attempts_per_chunk = 5;
    std::chrono::milliseconds connect_timeout{10000};      ///< start / finish calls
    std::chrono::milliseconds chunk_timeout{0};            ///< 0: derived from chunk_size
    std::uint64_t min_throughput_bytes_per_sec = 256 * 1024;
    std::chrono::milliseconds idle_timeout_ceiling{60000};
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_cap{30000};
    double jitter_ratio = 0.2;
    std::uint32_t max_session_restarts = 0;
    std::uint32_t max_offset_rewinds = 16;
    std::optional<std::uint64_t> retry_seed;

    /// chunk_timeout, or ceil(chunk_size / min_throughput) + connect_timeout when it is 0
    [[nodiscard]] std::chrono::milliseconds effective_chunk_timeout() const;

    [[nodiscard]] RetryPolicySettings retry_settings() const;

    Result<void, UploadError> validate() const;
};

/// Where and as whom the Graph-style wire adapter talks
struct GraphEndpointConfig {
    std::string base_url = "https://graph-video.facebook.com";
    std::string api_version = "v18.0";
    std::string account_id;
    std::string access_token;
    int rate_limit_threshold = 80;                         ///< Percent of any usage figure
    std::chrono::milliseconds rate_limit_pause{300000};

    Result<void, UploadError> validate() const;
};

struct ClientConfig {
    UploadConfig upload;
    GraphEndpointConfig graph;
};

/**
 * @brief Parses {"upload": {...}, "graph": {...}}
 *
 * Durations use "_ms" suffixed keys; missing keys keep their defaults.
 * Malformed JSON or a value of the wrong type yields InvalidConfig.
 */
Result<ClientConfig, UploadError> parse_config(const std::string& text);

Result<ClientConfig, UploadError> load_config_file(const std::filesystem::path& path);

} // namespace adpush::upload
