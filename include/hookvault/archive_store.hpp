#pragma once

#include "hookvault/archive.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace hookvault {

/// Which failed archives the upload workers may pick up again.
struct ClaimLimits {
    uint32_t archive_retry_max = 5;
    int64_t retry_delay_secs = 0;  // minimum age of the failure
};

/// SQLite manifest: archives, their files and parts, and per-owner byte
/// counters. The single source of truth for archive state.
///
/// All statements run under one mutex; multi-row writes use BEGIN IMMEDIATE
/// so a second process (hookvault-ctl next to the daemon) serializes on the
/// database lock. Counters only ever move through `col = col + ?`.
///
/// SQL failures other than SQLITE_BUSY throw std::runtime_error.
class ArchiveStore {
public:
    explicit ArchiveStore(const std::filesystem::path& db_path);
    ~ArchiveStore();

    ArchiveStore(const ArchiveStore&) = delete;
    ArchiveStore& operator=(const ArchiveStore&) = delete;

    /// Open the database, switch to WAL and create the schema.
    void open();

    // --- Records ---

    /// Insert `archive` and its files. id, created_at and updated_at are
    /// assigned here; parts are ignored. Returns the new id.
    int64_t insert(const Archive& archive);

    /// Full record including files and parts.
    std::optional<Archive> get(int64_t id);

    /// Live archives of one owner, newest first. Parts are not loaded.
    std::vector<Archive> list(const std::string& owner_id);

    /// Live (not deleted) archive counts keyed by status name.
    std::map<std::string, uint64_t> count_by_status();

    // --- Upload lifecycle ---

    /// Conditionally move one archive to processing. Exactly one of any
    /// number of concurrent callers wins.
    bool claim(int64_t id, const ClaimLimits& limits);

    /// Claim the highest-priority, oldest claimable archive.
    std::optional<int64_t> claim_next(const ClaimLimits& limits);

    /// Startup: every processing archive goes back to queued and every
    /// deletion claim is released. Returns the number of archives requeued.
    size_t recover_processing();

    /// Requeue processing archives not touched since `older_than`.
    size_t reset_stale_processing(int64_t older_than);

    /// Whole-archive mode: persist IV and tag before any part is uploaded.
    void set_whole_archive_key(int64_t id, const crypto::Bytes& iv, const crypto::Bytes& auth_tag);

    /// Bundles: where each file's data starts inside the zip, by position.
    void set_zip_offsets(int64_t id, const std::vector<uint64_t>& offsets);

    void set_layout(int64_t id, uint32_t total_parts, uint64_t encrypted_size);

    /// Insert a part by index. Counters move only when the row is new.
    /// Returns false when the part was already recorded.
    bool record_part(int64_t id, const ArchivePart& part);

    /// processing -> ready, only when every part is recorded.
    bool mark_ready(int64_t id);

    /// processing -> error, retry_count + 1.
    void mark_error(int64_t id, const std::string& message, bool retryable);

    /// Manual retry: error -> queued with a fresh retry budget.
    bool reset_for_retry(int64_t id);

    // --- Trash and deletion ---

    bool trash(int64_t id, int64_t at);
    bool untrash(int64_t id);

    /// Set delete_requested_at and snapshot delete_total_parts.
    bool request_delete(int64_t id);

    /// Trashed before `cutoff` -> delete requested. Returns count.
    size_t promote_expired_trash(int64_t cutoff);

    /// deleting 0 -> 1 on the oldest pending deletion. Archives still
    /// processing are skipped. Refreshes delete_total_parts.
    std::optional<int64_t> claim_deletion();

    void increment_deleted(int64_t id);
    void release_deletion(int64_t id);

    /// deleted_at = now, part rows dropped, claim released.
    void finish_deletion(int64_t id);

    // --- Files ---

    /// Without a position every live file of the archive is counted.
    void increment_download_count(int64_t id, std::optional<uint32_t> position);
    bool increment_preview_count(int64_t id, uint32_t position);
    bool delete_file(int64_t id, uint32_t position);
    bool set_thumbnail(int64_t id, uint32_t position, const ThumbnailInfo& thumbnail);

    // --- Owner byte counters ---

    void adjust_used_bytes(const std::string& owner_id, int64_t delta);
    int64_t used_bytes(const std::string& owner_id);

    const std::filesystem::path& path() const { return db_path_; }

private:
    // Cached prepared statement, reset and unbound. Caller holds db_mutex_.
    sqlite3_stmt* prepare(const char* sql);

    // Step to completion; throws on error
    void step_done(sqlite3_stmt* stmt, const char* what);
    void exec(const char* sql);
    int changes() const;

    Archive read_archive_row(sqlite3_stmt* stmt);
    void load_files(Archive& archive);
    void load_parts(Archive& archive);
    bool claim_locked(int64_t id, const ClaimLimits& limits);

    class Transaction;

    std::filesystem::path db_path_;
    std::mutex db_mutex_;  // Protects prepared statement usage
    sqlite3* db_ = nullptr;
    std::unordered_map<const char*, sqlite3_stmt*> statements_;
};

}  // namespace hookvault
