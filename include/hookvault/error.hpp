#pragma once

#include <stdexcept>
#include <string>

namespace hookvault {

/// Failure taxonomy shared by every layer. Backend calls classify their
/// failures into one of these kinds; the orchestrator maps them onto archive
/// status and the restore engine hands them back to its caller.
enum class ErrorKind {
    Configuration,         // missing credentials or invalid settings, never retried
    TransientNetwork,      // reset/timeout/DNS, HTTP 429, HTTP 5xx
    FatalBackend,          // other 4xx or a malformed success response
    AuthenticationFailed,  // GCM tag or part hash mismatch
    ResourceExhausted,     // local disk full or unwritable scratch space
    NotFound,              // unknown archive/file, or the remote object is gone
    Cancelled,             // the consumer went away mid-transfer
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, int http_status = 0,
          bool retries_exhausted = false);

    ErrorKind kind() const { return kind_; }

    /// HTTP status of the failing backend response, 0 if none.
    int http_status() const { return http_status_; }

    /// Set when a transient failure outlived the backend retry budget.
    bool retries_exhausted() const { return retries_exhausted_; }

    bool transient() const {
        return kind_ == ErrorKind::TransientNetwork || kind_ == ErrorKind::ResourceExhausted;
    }

    /// Whether an archive that failed with this error may be claimed again.
    bool retryable() const { return transient() || retries_exhausted_; }

private:
    ErrorKind kind_;
    int http_status_;
    bool retries_exhausted_;
};

}  // namespace hookvault
