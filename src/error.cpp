#include "hookvault/error.hpp"

namespace hookvault {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::TransientNetwork: return "transient_network";
        case ErrorKind::FatalBackend: return "fatal_backend";
        case ErrorKind::AuthenticationFailed: return "authentication_failed";
        case ErrorKind::ResourceExhausted: return "resource_exhausted";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message, int http_status,
             bool retries_exhausted)
    : std::runtime_error(message)
    , kind_(kind)
    , http_status_(http_status)
    , retries_exhausted_(retries_exhausted) {}

}  // namespace hookvault
