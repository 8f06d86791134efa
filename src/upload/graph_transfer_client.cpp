#include "adpush/upload/graph_transfer_client.hpp"

#include "adpush/network/multipart.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>

namespace adpush::upload {
namespace {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::TransportError;

// Graph error codes that go away on their own (unknown, service, rate limits)
constexpr std::array<int, 7> kTransientGraphCodes{1, 2, 4, 17, 32, 341, 613};

// Upper bound on a server-requested Retry-After
constexpr std::chrono::seconds kMaxRetryAfter = std::chrono::hours(1);

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool all_digits(const std::string& text) {
    return !text.empty() && text.size() <= 19 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string trim_path(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

/// Ids arrive as strings, but numeric ids are tolerated
std::optional<std::string> id_field(const json& body, const char* key) {
    if (!body.contains(key)) {
        return std::nullopt;
    }
    const auto& value = body.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<std::string> string_field(const json& body, const char* key) {
    const auto value = body.find(key);
    if (value == body.end() || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

/// Offsets arrive as decimal strings or as numbers
Result<std::optional<std::uint64_t>> offset_field(const json& body, const char* key) {
    if (!body.contains(key) || body.at(key).is_null()) {
        return Ok(std::optional<std::uint64_t>{});
    }
    const auto& value = body.at(key);
    if (value.is_number_unsigned()) {
        return Ok(std::optional<std::uint64_t>(value.get<std::uint64_t>()));
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return Ok(std::optional<std::uint64_t>(static_cast<std::uint64_t>(value.get<std::int64_t>())));
    }
    if (value.is_string() && all_digits(value.get<std::string>())) {
        return Ok(std::optional<std::uint64_t>(std::stoull(value.get<std::string>())));
    }
    return Err<std::optional<std::uint64_t>>(std::string("Field ") + key + " is not an offset: " + value.dump());
}

std::string body_excerpt(const HttpResponse& response) {
    auto text = response.body_as_string();
    if (text.size() > 256) {
        text.resize(256);
        text += "...";
    }
    return text;
}

UploadError malformed(const HttpResponse& response, const std::string& message) {
    const auto kind = response.status_code >= 500 ? ErrorKind::Transient : ErrorKind::PermanentRejection;
    return make_error(kind, message, body_excerpt(response), response.status_code);
}

UploadError from_transport(const TransportError& error, const char* phase) {
    const auto kind = error.kind == TransportError::Kind::Cancelled ? ErrorKind::Cancelled
                                                                    : ErrorKind::Transient;
    return make_error(kind, std::string(phase) + " request failed: " + network::to_string(error.kind),
                      error.message);
}

} // namespace

GraphTransferClient::GraphTransferClient(std::shared_ptr<network::HttpClient> http,
                                         GraphEndpointConfig config,
                                         network::Url advideos_url,
                                         network::Url api_root)
    : http_(std::move(http))
    , config_(std::move(config))
    , advideos_url_(std::move(advideos_url))
    , api_root_(std::move(api_root)) {}

Result<std::unique_ptr<GraphTransferClient>, UploadError> GraphTransferClient::create(
    std::shared_ptr<network::HttpClient> http, GraphEndpointConfig config) {
    using Created = std::unique_ptr<GraphTransferClient>;

    if (!http) {
        return Err<Created>(make_error(ErrorKind::InvalidConfig, "GraphTransferClient needs an HttpClient"));
    }
    if (auto valid = config.validate(); valid.is_error()) {
        return valid.forward_error<Created>();
    }

    auto base = network::parse_url(config.base_url);
    if (base.is_error()) {
        return Err<Created>(make_error(ErrorKind::InvalidConfig, "Invalid graph.base_url", base.error()));
    }

    const auto prefix = trim_path(base.value().target);
    auto api_root = base.value().with_target(prefix + "/" + config.api_version);
    auto advideos = base.value().with_target(api_root.target + "/" + config.account_id + "/advideos");

    return Ok(Created(new GraphTransferClient(std::move(http), std::move(config),
                                              std::move(advideos), std::move(api_root))));
}

Result<StartResponse, UploadError> GraphTransferClient::start(std::uint64_t total_size,
                                                              const CallOptions& options) {
    network::MultipartForm form;
    form.add_field("access_token", config_.access_token);
    form.add_field("upload_phase", "start");
    form.add_field("file_size", std::to_string(total_size));

    auto response = post_form("start", form.content_type(), form.encode(), options, false);
    if (response.is_error()) {
        return response.forward_error<StartResponse>();
    }

    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<StartResponse>(malformed(response.value(), "start response is not a JSON object"));
    }

    StartResponse start;
    auto session_id = id_field(body, "upload_session_id");
    if (!session_id || session_id->empty()) {
        return Err<StartResponse>(malformed(response.value(), "start response has no upload_session_id"));
    }
    start.session_id = *session_id;
    start.asset_hint = id_field(body, "video_id");

    auto offset = offset_field(body, "start_offset");
    if (offset.is_error()) {
        return Err<StartResponse>(malformed(response.value(), offset.error()));
    }
    start.start_offset = offset.value().value_or(0);
    return Ok(std::move(start));
}

Result<ChunkResult, UploadError> GraphTransferClient::push_chunk(const ChunkRequest& request,
                                                                 const std::vector<std::uint8_t>& bytes,
                                                                 const CallOptions& options) {
    network::MultipartForm form;
    form.add_field("access_token", config_.access_token);
    form.add_field("upload_phase", "transfer");
    form.add_field("upload_session_id", request.session_id);
    form.add_field("start_offset", std::to_string(request.start_offset));
    form.add_file("video_file_chunk", "chunk-" + std::to_string(request.start_offset),
                  "application/octet-stream", bytes);

    auto response = post_form("transfer", form.content_type(), form.encode(), options, true);
    if (response.is_error()) {
        return response.forward_error<ChunkResult>();
    }

    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<ChunkResult>(malformed(response.value(), "transfer response is not a JSON object"));
    }

    ChunkResult result;
    result.throttle = throttle_from_usage(response.value().get_header("x-business-use-case-usage"),
                                          config_.rate_limit_threshold, config_.rate_limit_pause);

    if (auto video_id = id_field(body, "video_id"); video_id && !video_id->empty()) {
        result.asset_id = *video_id;
        return Ok(std::move(result));
    }

    auto offset = offset_field(body, "start_offset");
    if (offset.is_error()) {
        return Err<ChunkResult>(malformed(response.value(), offset.error()));
    }
    if (!offset.value()) {
        return Err<ChunkResult>(malformed(response.value(), "transfer response has neither start_offset nor video_id"));
    }
    result.next_offset = offset.value();
    return Ok(std::move(result));
}

Result<FinishResponse, UploadError> GraphTransferClient::finish(const std::string& session_id,
                                                                const CallOptions& options) {
    network::MultipartForm form;
    form.add_field("access_token", config_.access_token);
    form.add_field("upload_phase", "finish");
    form.add_field("upload_session_id", session_id);

    auto response = post_form("finish", form.content_type(), form.encode(), options, true);
    if (response.is_error()) {
        return response.forward_error<FinishResponse>();
    }

    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<FinishResponse>(malformed(response.value(), "finish response is not a JSON object"));
    }

    FinishResponse finish;
    finish.asset_id = id_field(body, "video_id");
    if (!finish.asset_id) {
        const auto success = body.find("success");
        if (success == body.end() || !success->is_boolean() || !success->get<bool>()) {
            return Err<FinishResponse>(malformed(response.value(), "finish response reports no success"));
        }
    }
    return Ok(std::move(finish));
}

Result<AssetStatus, UploadError> GraphTransferClient::asset_status(const AssetId& asset_id,
                                                                   const CallOptions& options) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.set_header("Accept", "application/json");

    const auto url = api_root_.with_target(api_root_.target + "/" + network::url_encode(asset_id) +
                                           "?fields=status&access_token=" +
                                           network::url_encode(config_.access_token));
    auto sent = http_->send(url, std::move(request), options.timeout, options.cancel);
    if (sent.is_error()) {
        return Err<AssetStatus>(from_transport(sent.error(), "status"));
    }

    const auto& response = sent.value();
    if (!response.is_success()) {
        return Err<AssetStatus>(make_error(classify_response(response, false),
            "status request rejected", body_excerpt(response), response.status_code));
    }

    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<AssetStatus>(malformed(response, "status response is not a JSON object"));
    }

    AssetStatus status;
    const auto section = body.find("status");
    if (section == body.end() || !section->is_object()) {
        return Ok(std::move(status));
    }
    const std::string video_status = string_field(*section, "video_status").value_or("");
    if (video_status == "ready") {
        status.state = AssetStatus::State::Ready;
    } else if (video_status == "error") {
        status.state = AssetStatus::State::Error;
        status.detail = string_field(*section, "error_description").value_or("processing failed");
    } else {
        status.detail = video_status;
    }
    return Ok(std::move(status));
}

std::optional<std::chrono::milliseconds> GraphTransferClient::throttle_from_usage(
    const std::string& header, int threshold, std::chrono::milliseconds pause) {
    if (header.empty()) {
        return std::nullopt;
    }

    auto usage = json::parse(header, nullptr, false);
    if (usage.is_discarded() || !usage.is_object()) {
        spdlog::debug("Ignoring unparsable x-business-use-case-usage header: {}", header);
        return std::nullopt;
    }

    for (const auto& [account, entries] : usage.items()) {
        if (!entries.is_array()) {
            continue;
        }
        for (const auto& entry : entries) {
            if (!entry.is_object()) {
                continue;
            }
            for (const char* key : {"call_count", "total_cputime", "total_time"}) {
                const auto figure = entry.find(key);
                if (figure != entry.end() && figure->is_number() &&
                    figure->get<double>() >= static_cast<double>(threshold)) {
                    spdlog::warn("Rate limit usage {}={} for {} reached {}%, pausing {}ms",
                                 key, figure->dump(), account, threshold, pause.count());
                    return pause;
                }
            }
        }
    }
    return std::nullopt;
}

ErrorKind GraphTransferClient::classify_response(const HttpResponse& response, bool session_bound) {
    const int status = response.status_code;
    if (status >= 500 || status == 429) {
        return ErrorKind::Transient;
    }

    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        const auto error = body.find("error");
        if (error != body.end() && error->is_object()) {
            const auto transient = error->find("is_transient");
            if (transient != error->end() && transient->is_boolean() && transient->get<bool>()) {
                return ErrorKind::Transient;
            }
            const auto code = error->find("code");
            if (code != error->end() && code->is_number_integer() &&
                std::find(kTransientGraphCodes.begin(), kTransientGraphCodes.end(),
                          code->get<int>()) != kTransientGraphCodes.end()) {
                return ErrorKind::Transient;
            }
            const auto text = error->find("message");
            const auto message = text != error->end() && text->is_string()
                ? lowercase(text->get<std::string>())
                : std::string();
            if (session_bound && message.find("session") != std::string::npos &&
                (message.find("expired") != std::string::npos ||
                 message.find("invalid") != std::string::npos)) {
                return ErrorKind::SessionExpired;
            }
        }
    }

    if (session_bound && (status == 404 || status == 410)) {
        return ErrorKind::SessionExpired;
    }
    return ErrorKind::PermanentRejection;
}

Result<HttpResponse, UploadError> GraphTransferClient::post_form(const char* phase,
                                                                 const std::string& content_type,
                                                                 std::vector<std::uint8_t> body,
                                                                 const CallOptions& options,
                                                                 bool session_bound) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.set_header("Content-Type", content_type);
    request.set_header("Accept", "application/json");
    request.body = std::move(body);

    auto sent = http_->send(advideos_url_, std::move(request), options.timeout, options.cancel);
    if (sent.is_error()) {
        return Err<HttpResponse>(from_transport(sent.error(), phase));
    }

    auto& response = sent.value();
    if (response.is_success()) {
        return Ok(std::move(response));
    }

    std::string message = std::string(phase) + " rejected with HTTP " + std::to_string(response.status_code);
    auto parsed = json::parse(response.body_as_string(), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") &&
        parsed.at("error").is_object()) {
        const auto& detail = parsed.at("error");
        if (detail.contains("message") && detail.at("message").is_string()) {
            message += ": " + detail.at("message").get<std::string>();
        }
    }

    auto error = make_error(classify_response(response, session_bound), std::move(message),
                            body_excerpt(response), response.status_code);

    const auto retry_after = response.get_header("Retry-After");
    if (all_digits(retry_after)) {
        const auto seconds = std::min<std::uint64_t>(std::stoull(retry_after), kMaxRetryAfter.count());
        error.retry_after = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
    }
    if (auto throttle = throttle_from_usage(response.get_header("x-business-use-case-usage"),
                                            config_.rate_limit_threshold, config_.rate_limit_pause)) {
        if (!error.retry_after || *error.retry_after < *throttle) {
            error.retry_after = *throttle;
        }
    }
    return Err<HttpResponse>(std::move(error));
}

} // namespace adpush::upload
