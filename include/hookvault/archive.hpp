#pragma once

#include "hookvault/codec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hookvault {

enum class ArchiveStatus {
    Queued,
    Processing,
    Ready,
    Error,
};

const char* status_name(ArchiveStatus status);

/// Throws std::invalid_argument for an unknown name.
ArchiveStatus parse_status(const std::string& name);

/// Version 1: one IV/tag over the ciphertext of the whole payload.
struct WholeArchiveScheme {
    crypto::Bytes iv;
    crypto::Bytes auth_tag;
};

/// Version 2: every part carries its own IV/tag.
struct PerPartScheme {};

using EncryptionScheme = std::variant<WholeArchiveScheme, PerPartScheme>;

constexpr int kEncryptionWholeArchive = 1;
constexpr int kEncryptionPerPart = 2;

struct ThumbnailInfo {
    std::string content_type;
    uint64_t size = 0;
    std::string local_path;
    std::string url;
    std::string message_id;
    std::string webhook_id;
    int64_t updated_at = 0;
    int64_t failed_at = 0;
    std::string error;
};

struct ArchiveFile {
    uint32_t position = 0;
    std::string path;           // file inside the staging dir
    std::string name;           // entry name inside a bundle
    std::string original_name;
    uint64_t size = 0;
    uint64_t zip_offset = 0;    // data offset inside the bundle zip
    uint64_t download_count = 0;
    uint64_t preview_count = 0;
    int64_t deleted_at = 0;     // 0 while live
    ThumbnailInfo thumbnail;
};

struct ArchivePart {
    uint32_t index = 0;
    uint64_t size = 0;          // stored (encrypted) bytes
    uint64_t plain_size = 0;
    std::string hash;           // SHA-256 hex of the stored bytes
    std::string url;
    std::string message_id;
    std::string webhook_id;
    std::string file_id;
    crypto::Bytes iv;           // per-part mode only
    crypto::Bytes auth_tag;
};

struct Archive {
    int64_t id = 0;
    std::string owner_id;
    std::string name;
    std::string display_name;
    std::string download_name;
    bool is_bundle = false;
    int encryption_version = kEncryptionPerPart;
    std::optional<int64_t> folder_id;
    int priority = 2;

    ArchiveStatus status = ArchiveStatus::Queued;
    uint32_t retry_count = 0;
    std::string error;
    bool error_retryable = false;

    uint64_t original_size = 0;
    uint64_t encrypted_size = 0;
    uint64_t uploaded_bytes = 0;
    uint32_t uploaded_parts = 0;
    uint32_t total_parts = 0;
    uint64_t chunk_size_bytes = 0;

    uint32_t delete_total_parts = 0;
    uint32_t deleted_parts = 0;
    int64_t trashed_at = 0;
    int64_t delete_requested_at = 0;
    int64_t deleted_at = 0;
    bool deleting = false;

    std::string staging_dir;
    crypto::Bytes iv;           // whole-archive mode only
    crypto::Bytes auth_tag;

    int64_t created_at = 0;
    int64_t updated_at = 0;

    std::vector<ArchiveFile> files;
    std::vector<ArchivePart> parts;

    /// Resolve encryption_version into the scheme the codec paths take.
    /// Throws Error{Configuration} for an unknown version.
    EncryptionScheme scheme() const;

    bool ready() const { return status == ArchiveStatus::Ready; }
};

/// Every char outside [A-Za-z0-9._-] becomes '_'.
std::string sanitize_archive_name(const std::string& name);

/// '/' and '\' become '_'; used for the name a download is served under.
std::string sanitize_display_name(const std::string& name);

int64_t now_epoch();

}  // namespace hookvault
