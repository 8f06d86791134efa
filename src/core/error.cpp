#include "adpush/core/error.hpp"

#include <sstream>

namespace adpush {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::SessionExpired: return "SessionExpired";
        case ErrorKind::PermanentRejection: return "PermanentRejection";
        case ErrorKind::ChunkExhausted: return "ChunkExhausted";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message
        << " (offset=" << committed_offset
        << ", attempts=" << attempts;
    if (http_status != 0) {
        oss << ", http=" << http_status;
    }
    if (!transport_detail.empty()) {
        oss << ", detail=" << transport_detail;
    }
    if (retry_after) {
        oss << ", retry_after=" << retry_after->count() << "ms";
    }
    oss << ")";
    return oss.str();
}

UploadError make_error(ErrorKind kind, std::string message) {
    UploadError error;
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

UploadError make_error(ErrorKind kind, std::string message, std::string transport_detail,
                       int http_status) {
    UploadError error = make_error(kind, std::move(message));
    error.transport_detail = std::move(transport_detail);
    error.http_status = http_status;
    return error;
}

} // namespace adpush
