#include "adpush/upload/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace adpush::upload {
namespace {

using json = nlohmann::json;
using std::chrono::milliseconds;

// Far beyond any idle ceiling; keeps the derived timeout clear of overflow
constexpr std::uint64_t kMaxTransferMs = std::uint64_t{1} << 52;

UploadError invalid(std::string message) {
    return make_error(ErrorKind::InvalidConfig, std::move(message));
}

template<typename T>
void read_value(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void read_duration(const json& section, const char* key, milliseconds& target) {
    if (section.contains(key)) {
        target = milliseconds(section.at(key).get<std::int64_t>());
    }
}

void read_upload(const json& section, UploadConfig& config) {
    read_value(section, "chunk_size", config.chunk_size);
    read_value(section, "max_attempts_per_chunk", config.max_attempts_per_chunk);
    read_duration(section, "connect_timeout_ms", config.connect_timeout);
    read_duration(section, "chunk_timeout_ms", config.chunk_timeout);
    read_value(section, "min_throughput_bytes_per_sec", config.min_throughput_bytes_per_sec);
    read_duration(section, "idle_timeout_ceiling_ms", config.idle_timeout_ceiling);
    read_duration(section, "backoff_base_ms", config.backoff_base);
    read_duration(section, "backoff_cap_ms", config.backoff_cap);
    read_value(section, "jitter_ratio", config.jitter_ratio);
    read_value(section, "max_session_restarts", config.max_session_restarts);
    read_value(section, "max_offset_rewinds", config.max_offset_rewinds);
    if (section.contains("retry_seed")) {
        config.retry_seed = section.at("retry_seed").get<std::uint64_t>();
    }
}

void read_graph(const json& section, GraphEndpointConfig& config) {
    read_value(section, "base_url", config.base_url);
    read_value(section, "api_version", config.api_version);
    read_value(section, "account_id", config.account_id);
    read_value(section, "access_token", config.access_token);
    read_value(section, "rate_limit_threshold", config.rate_limit_threshold);
    read_duration(section, "rate_limit_pause_ms", config.rate_limit_pause);
}

} // namespace

milliseconds UploadConfig::effective_chunk_timeout() const {
    if (chunk_timeout.count() > 0) {
        return chunk_timeout;
    }
    if (min_throughput_bytes_per_sec == 0) {
        return idle_timeout_ceiling;
    }
    // ceil(chunk_size * 1000 / throughput) in milliseconds, saturating
    const std::uint64_t throughput = min_throughput_bytes_per_sec;
    const std::uint64_t whole_seconds = chunk_size / throughput;
    const std::uint64_t remainder = chunk_size % throughput;
    if (whole_seconds > kMaxTransferMs / 1000) {
        return milliseconds::max();
    }
    const std::uint64_t remainder_ms = remainder <= kMaxTransferMs / 1000
        ? (remainder * 1000 + throughput - 1) / throughput
        : remainder / (throughput / 1000) + 1;
    const std::uint64_t transfer_ms = whole_seconds * 1000 + remainder_ms;
    const auto connect_ms = static_cast<std::uint64_t>(std::max<milliseconds::rep>(connect_timeout.count(), 0));
    if (transfer_ms > kMaxTransferMs || connect_ms > kMaxTransferMs) {
        return milliseconds::max();
    }
    return milliseconds(static_cast<milliseconds::rep>(transfer_ms + connect_ms));
}

RetryPolicySettings UploadConfig::retry_settings() const {
    RetryPolicySettings settings;
    settings.max_attempts = max_attempts_per_chunk;
    settings.base_delay = backoff_base;
    settings.max_delay = backoff_cap;
    settings.jitter_ratio = jitter_ratio;
    return settings;
}

Result<void, UploadError> UploadConfig::validate() const {
    if (chunk_size == 0) {
        return Err<void>(invalid("chunk_size must be > 0"));
    }
    if (max_attempts_per_chunk == 0) {
        return Err<void>(invalid("max_attempts_per_chunk must be > 0"));
    }
    if (min_throughput_bytes_per_sec == 0) {
        return Err<void>(invalid("min_throughput_bytes_per_sec must be > 0"));
    }
    if (connect_timeout.count() <= 0) {
        return Err<void>(invalid("connect_timeout must be > 0"));
    }
    if (chunk_timeout.count() < 0 || backoff_base.count() < 0) {
        return Err<void>(invalid("durations must not be negative"));
    }
    if (backoff_cap < backoff_base) {
        return Err<void>(invalid("backoff_cap must not be below backoff_base"));
    }
    if (jitter_ratio < 0.0 || jitter_ratio > 1.0) {
        return Err<void>(invalid("jitter_ratio must be within [0, 1]"));
    }
    if (connect_timeout >= idle_timeout_ceiling) {
        return Err<void>(invalid("connect_timeout " + std::to_string(connect_timeout.count()) +
                                 "ms must stay below the idle-timeout ceiling of " +
                                 std::to_string(idle_timeout_ceiling.count()) + "ms"));
    }
    const auto chunk_deadline = effective_chunk_timeout();
    if (chunk_deadline >= idle_timeout_ceiling) {
        return Err<void>(invalid("chunk timeout " + std::to_string(chunk_deadline.count()) +
                                 "ms must stay below the idle-timeout ceiling of " +
                                 std::to_string(idle_timeout_ceiling.count()) +
                                 "ms; reduce chunk_size"));
    }
    return Ok();
}

Result<void, UploadError> GraphEndpointConfig::validate() const {
    if (base_url.empty() || api_version.empty()) {
        return Err<void>(invalid("graph.base_url and graph.api_version are required"));
    }
    if (account_id.empty()) {
        return Err<void>(invalid("graph.account_id is required"));
    }
    if (access_token.empty()) {
        return Err<void>(invalid("graph.access_token is required"));
    }
    if (rate_limit_threshold <= 0 || rate_limit_threshold > 100) {
        return Err<void>(invalid("graph.rate_limit_threshold must be within (0, 100]"));
    }
    return Ok();
}

Result<ClientConfig, UploadError> parse_config(const std::string& text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<ClientConfig>(invalid("Configuration is not valid JSON"));
    }
    if (!document.is_object()) {
        return Err<ClientConfig>(invalid("Configuration must be a JSON object"));
    }

    ClientConfig config;
    try {
        if (document.contains("upload")) {
            read_upload(document.at("upload"), config.upload);
        }
        if (document.contains("graph")) {
            read_graph(document.at("graph"), config.graph);
        }
    } catch (const json::exception& e) {
        return Err<ClientConfig>(make_error(ErrorKind::InvalidConfig, "Invalid configuration value", e.what()));
    }
    return Ok(std::move(config));
}

Result<ClientConfig, UploadError> load_config_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(invalid("Failed to open configuration file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace adpush::upload
