#include "hookvault/archive.hpp"
#include "hookvault/error.hpp"

#include <chrono>
#include <stdexcept>

namespace hookvault {

const char* status_name(ArchiveStatus status) {
    switch (status) {
        case ArchiveStatus::Queued: return "queued";
        case ArchiveStatus::Processing: return "processing";
        case ArchiveStatus::Ready: return "ready";
        case ArchiveStatus::Error: return "error";
    }
    return "unknown";
}

ArchiveStatus parse_status(const std::string& name) {
    if (name == "queued") return ArchiveStatus::Queued;
    if (name == "processing") return ArchiveStatus::Processing;
    if (name == "ready") return ArchiveStatus::Ready;
    if (name == "error") return ArchiveStatus::Error;
    throw std::invalid_argument("unknown archive status: " + name);
}

EncryptionScheme Archive::scheme() const {
    switch (encryption_version) {
        case kEncryptionWholeArchive:
            return WholeArchiveScheme{iv, auth_tag};
        case kEncryptionPerPart:
            return PerPartScheme{};
        default:
            throw Error(ErrorKind::Configuration,
                        "archive " + std::to_string(id) + " has unknown encryption version " +
                            std::to_string(encryption_version));
    }
}

std::string sanitize_archive_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                    c == '.' || c == '_' || c == '-';
        if (!keep) c = '_';
    }
    return out;
}

std::string sanitize_display_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (c == '/' || c == '\\') c = '_';
    }
    return out;
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace hookvault
