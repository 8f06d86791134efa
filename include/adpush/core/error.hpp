#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace adpush {

/**
 * @brief Classification of every failure the upload engine can surface
 *
 * Transient          - retryable at chunk level (reset, timeout, 5xx)
 * SessionExpired     - remote no longer knows the session; only a new session helps
 * PermanentRejection - malformed request, auth failure, size mismatch
 * ChunkExhausted     - a chunk used up its retry budget
 * Cancelled          - caller-initiated abort
 * IOError            - the local byte source could not supply the requested range
 * InvalidConfig      - configuration rejected before any network I/O
 */
enum class ErrorKind {
    Transient,
    SessionExpired,
    PermanentRejection,
    ChunkExhausted,
    Cancelled,
    IOError,
    InvalidConfig
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Structured failure with the diagnostic context a caller needs to
 *        decide whether to retry the entire upload
 */
struct UploadError {
    ErrorKind kind = ErrorKind::PermanentRejection;
    std::string message;
    std::uint64_t committed_offset = 0;   ///< Last offset acknowledged by the remote
    std::uint32_t attempts = 0;           ///< Attempts spent on the failing chunk
    std::string transport_detail;         ///< Underlying transport / server text
    int http_status = 0;                  ///< 0 when no HTTP response was received
    std::optional<std::chrono::milliseconds> retry_after; ///< Server-supplied wait hint

    [[nodiscard]] bool is_retryable() const noexcept { return kind == ErrorKind::Transient; }

    /// Single-line rendering for logs
    [[nodiscard]] std::string describe() const;
};

UploadError make_error(ErrorKind kind, std::string message);

UploadError make_error(ErrorKind kind, std::string message, std::string transport_detail,
                       int http_status = 0);

} // namespace adpush
