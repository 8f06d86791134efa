#include "adpush/endpoint/loopback_endpoint.hpp"

#include "adpush/network/multipart.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace adpush::endpoint {

namespace fs = std::filesystem;
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_graph_error(HttpStatus status, const std::string& message, int code,
                              bool transient = false) {
    json error{{"message", message}, {"type", "OAuthException"}, {"code", code}};
    if (transient) {
        error["is_transient"] = true;
    }
    return make_json_response(status, json{{"error", error}});
}

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.size() > 19 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoull(text);
    return true;
}

} // namespace

LoopbackUploadEndpoint::LoopbackUploadEndpoint(LoopbackOptions options)
    : options_(std::move(options)) {}

LoopbackUploadEndpoint::~LoopbackUploadEndpoint() {
    stop();
}

Result<void> LoopbackUploadEndpoint::start() {
    if (server_) {
        return Err<void>(std::string("Loopback endpoint already started"));
    }

    std::error_code ec;
    fs::create_directories(options_.storage_root / "staging", ec);
    if (!ec) {
        fs::create_directories(options_.storage_root / "assets", ec);
    }
    if (ec) {
        return Err<void>("Failed to create storage under " + options_.storage_root.string() + ": " + ec.message());
    }

    try {
        server_ = std::make_unique<network::HttpServerAsio>(io_, "127.0.0.1", 0);
    } catch (const boost::system::system_error& e) {
        return Err<void>(std::string("Failed to bind loopback endpoint: ") + e.what());
    }
    server_->set_handler([this](const HttpRequest& request) { return handle(request); });
    port_ = server_->port();

    io_thread_ = std::thread([this] { io_.run(); });
    spdlog::info("Loopback upload endpoint serving {}", base_url());
    return Ok();
}

void LoopbackUploadEndpoint::stop() {
    if (!server_) {
        return;
    }
    boost::asio::post(io_, [this] { server_->stop(); });
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    server_.reset();
}

std::string LoopbackUploadEndpoint::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

upload::GraphEndpointConfig LoopbackUploadEndpoint::graph_config() const {
    upload::GraphEndpointConfig config;
    config.base_url = base_url();
    config.api_version = options_.api_version;
    config.account_id = options_.account_id;
    config.access_token = options_.access_token;
    return config;
}

void LoopbackUploadEndpoint::fail_next_transfers(uint32_t count, HttpStatus status) {
    std::lock_guard lock(mutex_);
    fail_transfers_ = count;
    fail_status_ = status;
}

void LoopbackUploadEndpoint::accept_prefix_of_next_transfer(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    accept_prefix_ = bytes;
}

void LoopbackUploadEndpoint::rewind_next_ack(std::uint64_t offset) {
    std::lock_guard lock(mutex_);
    rewind_to_ = offset;
}

void LoopbackUploadEndpoint::expire_sessions() {
    std::lock_guard lock(mutex_);
    for (auto& [id, session] : sessions_) {
        session.expired = true;
    }
}

void LoopbackUploadEndpoint::stall_next_responses(uint32_t count, std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    stall_responses_ = count;
    stall_delay_ = delay;
}

void LoopbackUploadEndpoint::set_usage_header(std::string header) {
    std::lock_guard lock(mutex_);
    usage_header_ = std::move(header);
}

void LoopbackUploadEndpoint::set_processing_polls(uint32_t polls) {
    std::lock_guard lock(mutex_);
    processing_polls_ = polls;
}

std::vector<std::uint64_t> LoopbackUploadEndpoint::transfer_offsets() const {
    std::lock_guard lock(mutex_);
    return transfer_offsets_;
}

uint32_t LoopbackUploadEndpoint::start_count() const {
    std::lock_guard lock(mutex_);
    return starts_;
}

uint32_t LoopbackUploadEndpoint::finish_count() const {
    std::lock_guard lock(mutex_);
    return finishes_;
}

uint32_t LoopbackUploadEndpoint::transfer_count() const {
    std::lock_guard lock(mutex_);
    return transfers_;
}

std::optional<std::vector<std::uint8_t>> LoopbackUploadEndpoint::asset_bytes(const std::string& video_id) const {
    std::ifstream input(asset_path(video_id), std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

network::ServerReply LoopbackUploadEndpoint::handle(const HttpRequest& request) {
    const std::string advideos = "/" + options_.api_version + "/" + options_.account_id + "/advideos";
    const std::string api_prefix = "/" + options_.api_version + "/";

    HttpResponse response;
    if (request.method == HttpMethod::POST && request.path() == advideos) {
        auto parts = network::parse_multipart(request.get_header("Content-Type"), request.body);
        if (parts.is_error()) {
            response = make_graph_error(HttpStatus::BAD_REQUEST, "Malformed form: " + parts.error(), 100);
        } else {
            std::map<std::string, std::string> fields;
            std::vector<std::uint8_t> chunk;
            for (auto& part : parts.value()) {
                if (part.name == "video_file_chunk") {
                    chunk = std::move(part.data);
                } else {
                    fields[part.name] = part.text();
                }
            }

            const auto phase = fields["upload_phase"];
            if (fields["access_token"] != options_.access_token) {
                response = make_graph_error(HttpStatus::BAD_REQUEST, "Invalid OAuth access token.", 190);
            } else if (phase == "start") {
                response = handle_start(fields);
            } else if (phase == "transfer") {
                response = handle_transfer(fields, chunk);
            } else if (phase == "finish") {
                response = handle_finish(fields);
            } else {
                response = make_graph_error(HttpStatus::BAD_REQUEST, "Unknown upload_phase: " + phase, 100);
            }
        }
    } else if (request.method == HttpMethod::GET && request.path().rfind(api_prefix, 0) == 0) {
        response = handle_status(request.path().substr(api_prefix.size()));
    } else {
        response = make_graph_error(HttpStatus::NOT_FOUND, "Unknown path " + request.path(), 803);
    }

    std::lock_guard lock(mutex_);
    if (!usage_header_.empty()) {
        response.set_header("x-business-use-case-usage", usage_header_);
    }
    if (stall_responses_ > 0) {
        --stall_responses_;
        return network::ServerReply(std::move(response), stall_delay_);
    }
    return network::ServerReply(std::move(response));
}

HttpResponse LoopbackUploadEndpoint::handle_start(const std::map<std::string, std::string>& fields) {
    std::uint64_t total_size = 0;
    const auto size_field = fields.find("file_size");
    if (size_field == fields.end() || !parse_number(size_field->second, total_size)) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "file_size is required", 100);
    }

    std::lock_guard lock(mutex_);
    ++starts_;
    const auto id = next_id_++;

    StagedSession session;
    session.session_id = "session-" + std::to_string(id);
    session.video_id = "video-" + std::to_string(id);
    session.total_size = total_size;
    session.staging_path = options_.storage_root / "staging" / (session.session_id + ".part");

    std::ofstream create(session.staging_path, std::ios::binary | std::ios::trunc);
    if (!create) {
        return make_graph_error(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to create staging file", 2, true);
    }
    create.close();

    const auto end_offset = std::min(total_size, options_.suggested_chunk_size);
    json body{
        {"upload_session_id", session.session_id},
        {"video_id", session.video_id},
        {"start_offset", "0"},
        {"end_offset", std::to_string(end_offset)},
    };
    sessions_.emplace(session.session_id, session);
    return make_json_response(HttpStatus::OK, body);
}

HttpResponse LoopbackUploadEndpoint::handle_transfer(const std::map<std::string, std::string>& fields,
                                                     const std::vector<std::uint8_t>& chunk) {
    std::lock_guard lock(mutex_);
    ++transfers_;

    const auto id_field = fields.find("upload_session_id");
    auto it = id_field == fields.end() ? sessions_.end() : sessions_.find(id_field->second);
    if (it == sessions_.end()) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "Invalid upload session id", 100);
    }
    auto& session = it->second;
    if (session.expired) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "The upload session has expired", 6001);
    }

    std::uint64_t start_offset = 0;
    const auto offset_field = fields.find("start_offset");
    if (offset_field == fields.end() || !parse_number(offset_field->second, start_offset)) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "start_offset is required", 100);
    }
    transfer_offsets_.push_back(start_offset);

    if (fail_transfers_ > 0) {
        --fail_transfers_;
        return make_graph_error(fail_status_, "Service temporarily unavailable", 2, true);
    }

    auto acknowledge = [&](std::uint64_t next) {
        const auto end = std::min(session.total_size, next + options_.suggested_chunk_size);
        return make_json_response(HttpStatus::OK, json{
            {"start_offset", std::to_string(next)},
            {"end_offset", std::to_string(end)},
        });
    };

    if (start_offset != session.received) {
        // Duplicate or out-of-order chunk: tell the client where to continue
        return acknowledge(session.received);
    }
    if (session.received + chunk.size() > session.total_size) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "Chunk exceeds declared file_size", 100);
    }

    std::uint64_t accepted = chunk.size();
    if (accept_prefix_) {
        accepted = std::min<std::uint64_t>(*accept_prefix_, accepted);
        accept_prefix_.reset();
    }

    if (accepted > 0) {
        std::fstream file(session.staging_path, std::ios::in | std::ios::out | std::ios::binary);
        if (!file) {
            return make_graph_error(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to open staging file", 2, true);
        }
        file.seekp(static_cast<std::streamoff>(start_offset));
        file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(accepted));
        if (!file) {
            return make_graph_error(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to write chunk", 2, true);
        }
        file.flush();
    }
    session.received += accepted;

    if (rewind_to_) {
        session.received = std::min(session.received, *rewind_to_);
        rewind_to_.reset();
        return acknowledge(session.received);
    }

    if (session.received == session.total_size && !options_.require_finish) {
        if (auto promoted = promote(session); promoted.is_error()) {
            return make_graph_error(HttpStatus::INTERNAL_SERVER_ERROR, promoted.error(), 2, true);
        }
        return make_json_response(HttpStatus::OK, json{{"video_id", session.video_id}});
    }
    return acknowledge(session.received);
}

HttpResponse LoopbackUploadEndpoint::handle_finish(const std::map<std::string, std::string>& fields) {
    std::lock_guard lock(mutex_);
    ++finishes_;

    const auto id_field = fields.find("upload_session_id");
    auto it = id_field == fields.end() ? sessions_.end() : sessions_.find(id_field->second);
    if (it == sessions_.end()) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "Invalid upload session id", 100);
    }
    auto& session = it->second;
    if (session.expired) {
        return make_graph_error(HttpStatus::BAD_REQUEST, "The upload session has expired", 6001);
    }
    if (session.received != session.total_size) {
        return make_graph_error(HttpStatus::BAD_REQUEST,
            "File is incomplete: " + std::to_string(session.received) + " of " +
            std::to_string(session.total_size) + " bytes received", 100);
    }

    if (!session.finished) {
        if (auto promoted = promote(session); promoted.is_error()) {
            return make_graph_error(HttpStatus::INTERNAL_SERVER_ERROR, promoted.error(), 2, true);
        }
    }

    if (options_.finish_returns_video_id) {
        return make_json_response(HttpStatus::OK, json{{"video_id", session.video_id}});
    }
    return make_json_response(HttpStatus::OK, json{{"success", true}});
}

HttpResponse LoopbackUploadEndpoint::handle_status(const std::string& video_id) {
    std::lock_guard lock(mutex_);
    const auto known = std::any_of(sessions_.begin(), sessions_.end(), [&](const auto& entry) {
        return entry.second.video_id == video_id && entry.second.finished;
    });
    if (!known) {
        return make_graph_error(HttpStatus::NOT_FOUND, "Unknown video " + video_id, 100);
    }

    auto& polls = status_polls_[video_id];
    ++polls;
    const std::string state = polls > processing_polls_ ? "ready" : "processing";
    return make_json_response(HttpStatus::OK, json{{"id", video_id}, {"status", {{"video_status", state}}}});
}

Result<void> LoopbackUploadEndpoint::promote(StagedSession& session) {
    std::error_code ec;
    fs::rename(session.staging_path, asset_path(session.video_id), ec);
    if (ec) {
        return Err<void>("Failed to promote " + session.staging_path.string() + ": " + ec.message());
    }
    session.finished = true;
    spdlog::debug("Session {} committed as {} ({} bytes)", session.session_id, session.video_id,
                  session.total_size);
    return Ok();
}

fs::path LoopbackUploadEndpoint::asset_path(const std::string& video_id) const {
    return options_.storage_root / "assets" / (video_id + ".bin");
}

} // namespace adpush::endpoint
