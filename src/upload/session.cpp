#include "adpush/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace adpush::upload {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::NotStarted, {SessionState::Started}},
        {SessionState::Started, {SessionState::Transferring, SessionState::Finishing, SessionState::Completed}},
        {SessionState::Transferring, {SessionState::Finishing, SessionState::Completed}},
        {SessionState::Finishing, {SessionState::Completed}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

UploadError protocol_violation(std::string message, std::uint64_t committed) {
    auto error = make_error(ErrorKind::PermanentRejection, std::move(message));
    error.committed_offset = committed;
    return error;
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::NotStarted: return "NotStarted";
        case SessionState::Started: return "Started";
        case SessionState::Transferring: return "Transferring";
        case SessionState::Finishing: return "Finishing";
        case SessionState::Completed: return "Completed";
        case SessionState::Failed: return "Failed";
        case SessionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

UploadSession::UploadSession(std::uint64_t total_size) {
    info_.total_size = total_size;
    info_.state = SessionState::NotStarted;
    info_.created_at = std::chrono::system_clock::now();
    last_transition_ = info_.created_at;
}

Result<void, UploadError> UploadSession::on_started(const StartResponse& response) {
    if (info_.state != SessionState::NotStarted) {
        return Err<void>(protocol_violation("Session already started", info_.committed_offset));
    }
    if (response.session_id.empty()) {
        return Err<void>(protocol_violation("Start response carried no session id", 0));
    }
    if (response.start_offset > info_.total_size) {
        return Err<void>(protocol_violation(
            "Start offset " + std::to_string(response.start_offset) + " beyond file size " +
            std::to_string(info_.total_size), 0));
    }

    info_.session_id = response.session_id;
    info_.committed_offset = response.start_offset;
    if (response.asset_hint) {
        info_.asset_hint = *response.asset_hint;
    }
    return transition_to(SessionState::Started);
}

Result<AckOutcome, UploadError> UploadSession::on_chunk_acknowledged(const ChunkRequest& request,
                                                                     const ChunkResult& result) {
    if (info_.state != SessionState::Started && info_.state != SessionState::Transferring) {
        return Err<AckOutcome>(protocol_violation(
            std::string("Chunk acknowledged in state ") + to_string(info_.state), info_.committed_offset));
    }

    if (result.asset_id && !result.asset_id->empty()) {
        info_.committed_offset = info_.total_size;
        if (auto res = complete_with(*result.asset_id); res.is_error()) {
            return res.forward_error<AckOutcome>();
        }
        return Ok(AckOutcome::Completed);
    }

    if (!result.next_offset) {
        return Err<AckOutcome>(protocol_violation(
            "Chunk response carried neither next offset nor asset id", info_.committed_offset));
    }

    const auto next = *result.next_offset;
    if (next > request.end_offset || next > info_.total_size) {
        return Err<AckOutcome>(protocol_violation(
            "Remote acknowledged offset " + std::to_string(next) + " beyond range [" +
            std::to_string(request.start_offset) + ", " + std::to_string(request.end_offset) + ")",
            info_.committed_offset));
    }

    if (auto res = transition_to(SessionState::Transferring); res.is_error()) {
        return res.forward_error<AckOutcome>();
    }

    if (next == request.start_offset && next == info_.committed_offset) {
        return Ok(AckOutcome::NoProgress);
    }

    if (next < info_.committed_offset) {
        info_.committed_offset = next;
        ++info_.rewinds;
        return Ok(AckOutcome::Rewound);
    }

    info_.committed_offset = next;
    if (next == info_.total_size) {
        return Ok(AckOutcome::ReadyToFinish);
    }
    return Ok(AckOutcome::Advanced);
}

Result<void, UploadError> UploadSession::begin_finishing() {
    if (info_.committed_offset != info_.total_size) {
        return Err<void>(protocol_violation(
            "Cannot finish with " + std::to_string(info_.total_size - info_.committed_offset) +
            " bytes outstanding", info_.committed_offset));
    }
    return transition_to(SessionState::Finishing);
}

Result<void, UploadError> UploadSession::on_finished(const FinishResponse& response) {
    if (info_.state != SessionState::Finishing) {
        return Err<void>(protocol_violation(
            std::string("Finish acknowledged in state ") + to_string(info_.state), info_.committed_offset));
    }

    if (response.asset_id && !response.asset_id->empty()) {
        return complete_with(*response.asset_id);
    }
    if (!info_.asset_hint.empty()) {
        return complete_with(info_.asset_hint);
    }
    return Err<void>(protocol_violation("Finish response carried no asset id", info_.committed_offset));
}

Result<void, UploadError> UploadSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(protocol_violation(
            std::string("Illegal session state transition ") + to_string(info_.state) + " -> " +
            to_string(next_state), info_.committed_offset));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

void UploadSession::mark_failed(UploadError error) {
    if (is_terminal()) {
        return;
    }
    error.committed_offset = info_.committed_offset;
    info_.last_error = std::move(error);
    info_.state = SessionState::Failed;
    last_transition_ = std::chrono::system_clock::now();
}

void UploadSession::mark_cancelled() {
    if (is_terminal()) {
        return;
    }
    info_.state = SessionState::Cancelled;
    last_transition_ = std::chrono::system_clock::now();
}

std::optional<ChunkRequest> UploadSession::next_chunk(std::uint64_t chunk_size) const {
    if (chunk_size == 0 || info_.committed_offset >= info_.total_size) {
        return std::nullopt;
    }

    ChunkRequest request;
    request.session_id = info_.session_id;
    request.start_offset = info_.committed_offset;
    request.end_offset = std::min(info_.committed_offset + chunk_size, info_.total_size);
    return request;
}

bool UploadSession::is_terminal() const noexcept {
    return info_.state == SessionState::Completed ||
           info_.state == SessionState::Failed ||
           info_.state == SessionState::Cancelled;
}

bool UploadSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }
    if (is_terminal()) {
        return false;
    }
    return is_progressive(info_.state, target);
}

Result<void, UploadError> UploadSession::complete_with(AssetId asset_id) {
    if (auto res = transition_to(SessionState::Completed); res.is_error()) {
        return res;
    }
    info_.asset_id = std::move(asset_id);
    return Ok();
}

} // namespace adpush::upload
