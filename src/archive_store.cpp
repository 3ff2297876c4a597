#include "hookvault/archive_store.hpp"
#include "hookvault/collaborators.hpp"
#include "hookvault/log.hpp"

#include <chrono>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>

namespace hookvault {

namespace {

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS archives (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id TEXT NOT NULL,
    name TEXT NOT NULL,
    display_name TEXT NOT NULL,
    download_name TEXT NOT NULL,
    is_bundle INTEGER NOT NULL DEFAULT 0,
    encryption_version INTEGER NOT NULL DEFAULT 2,
    folder_id INTEGER,
    priority INTEGER NOT NULL DEFAULT 2,
    status TEXT NOT NULL DEFAULT 'queued',
    retry_count INTEGER NOT NULL DEFAULT 0,
    error TEXT NOT NULL DEFAULT '',
    error_retryable INTEGER NOT NULL DEFAULT 0,
    original_size INTEGER NOT NULL DEFAULT 0,
    encrypted_size INTEGER NOT NULL DEFAULT 0,
    uploaded_bytes INTEGER NOT NULL DEFAULT 0,
    uploaded_parts INTEGER NOT NULL DEFAULT 0,
    total_parts INTEGER NOT NULL DEFAULT 0,
    chunk_size_bytes INTEGER NOT NULL,
    delete_total_parts INTEGER NOT NULL DEFAULT 0,
    deleted_parts INTEGER NOT NULL DEFAULT 0,
    trashed_at INTEGER NOT NULL DEFAULT 0,
    delete_requested_at INTEGER NOT NULL DEFAULT 0,
    deleted_at INTEGER NOT NULL DEFAULT 0,
    deleting INTEGER NOT NULL DEFAULT 0,
    staging_dir TEXT NOT NULL DEFAULT '',
    iv TEXT NOT NULL DEFAULT '',
    auth_tag TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_claim
    ON archives(status, priority DESC, created_at) WHERE deleted_at = 0;

CREATE INDEX IF NOT EXISTS idx_owner
    ON archives(owner_id, created_at) WHERE deleted_at = 0;

CREATE TABLE IF NOT EXISTS archive_files (
    archive_id INTEGER NOT NULL,
    position INTEGER NOT NULL,
    path TEXT NOT NULL,
    name TEXT NOT NULL,
    original_name TEXT NOT NULL,
    size INTEGER NOT NULL,
    zip_offset INTEGER NOT NULL DEFAULT 0,
    download_count INTEGER NOT NULL DEFAULT 0,
    preview_count INTEGER NOT NULL DEFAULT 0,
    deleted_at INTEGER NOT NULL DEFAULT 0,
    thumb_content_type TEXT NOT NULL DEFAULT '',
    thumb_size INTEGER NOT NULL DEFAULT 0,
    thumb_local_path TEXT NOT NULL DEFAULT '',
    thumb_url TEXT NOT NULL DEFAULT '',
    thumb_message_id TEXT NOT NULL DEFAULT '',
    thumb_webhook_id TEXT NOT NULL DEFAULT '',
    thumb_updated_at INTEGER NOT NULL DEFAULT 0,
    thumb_failed_at INTEGER NOT NULL DEFAULT 0,
    thumb_error TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (archive_id, position)
) WITHOUT ROWID;

CREATE TABLE IF NOT EXISTS archive_parts (
    archive_id INTEGER NOT NULL,
    part_index INTEGER NOT NULL,
    size INTEGER NOT NULL,
    plain_size INTEGER NOT NULL,
    hash TEXT NOT NULL,
    url TEXT NOT NULL,
    message_id TEXT NOT NULL,
    webhook_id TEXT NOT NULL,
    file_id TEXT NOT NULL DEFAULT '',
    iv TEXT NOT NULL DEFAULT '',
    auth_tag TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (archive_id, part_index)
) WITHOUT ROWID;

CREATE TABLE IF NOT EXISTS owners (
    owner_id TEXT PRIMARY KEY,
    used_bytes INTEGER NOT NULL DEFAULT 0
) WITHOUT ROWID;
)";

constexpr const char* ARCHIVE_COLUMNS =
    "id, owner_id, name, display_name, download_name, is_bundle, encryption_version, "
    "folder_id, priority, status, retry_count, error, error_retryable, original_size, "
    "encrypted_size, uploaded_bytes, uploaded_parts, total_parts, chunk_size_bytes, "
    "delete_total_parts, deleted_parts, trashed_at, delete_requested_at, deleted_at, "
    "deleting, staging_dir, iv, auth_tag, created_at, updated_at";

// Claimable: queued, or failed retryably with budget left and old enough.
// Never while deletion or trash is pending.
constexpr const char* CLAIM_CONDITION =
    "deleted_at = 0 AND delete_requested_at = 0 AND trashed_at = 0 AND "
    "(status = 'queued' OR (status = 'error' AND error_retryable = 1 AND "
    "retry_count < ?2 AND updated_at <= ?3))";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("store", "SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("store", "SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_bytes_b64(sqlite3_stmt* stmt, int idx, const crypto::Bytes& value) {
    bind_text(stmt, idx, value.empty() ? std::string() : crypto::to_base64(value));
}

crypto::Bytes column_b64(sqlite3_stmt* stmt, int col) {
    auto text = column_text(stmt, col);
    return text.empty() ? crypto::Bytes() : crypto::from_base64(text);
}

}  // namespace

// BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
class ArchiveStore::Transaction {
public:
    explicit Transaction(ArchiveStore& store) : store_(store) { store_.exec("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!committed_) sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    void commit() {
        store_.exec("COMMIT");
        committed_ = true;
    }

private:
    ArchiveStore& store_;
    bool committed_ = false;
};

ArchiveStore::ArchiveStore(const std::filesystem::path& db_path) : db_path_(db_path) {}

ArchiveStore::~ArchiveStore() {
    for (auto& [sql, stmt] : statements_) sqlite3_finalize(stmt);
    statements_.clear();

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

void ArchiveStore::open() {
    std::lock_guard lock(db_mutex_);
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open manifest: " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, MANIFEST_SCHEMA)) {
        throw std::runtime_error("Cannot create manifest schema: " + std::string(sqlite3_errmsg(db_)));
    }
}

sqlite3_stmt* ArchiveStore::prepare(const char* sql) {
    if (!db_) throw std::runtime_error("manifest is not open");

    auto it = statements_.find(sql);
    if (it != statements_.end()) {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQL prepare failed: ") + sqlite3_errmsg(db_) +
                                 " in: " + sql);
    }
    statements_.emplace(sql, stmt);
    return stmt;
}

void ArchiveStore::step_done(sqlite3_stmt* stmt, const char* what) {
    int rc = sql_step_retry(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt);
}

void ArchiveStore::exec(const char* sql) {
    if (!sql_exec(db_, sql)) {
        throw std::runtime_error(std::string("SQL failed: ") + sql);
    }
}

int ArchiveStore::changes() const {
    return sqlite3_changes(db_);
}

// --- Records ---

int64_t ArchiveStore::insert(const Archive& a) {
    std::lock_guard lock(db_mutex_);
    auto now = now_epoch();

    Transaction tx(*this);
    auto* stmt = prepare(
        "INSERT INTO archives (owner_id, name, display_name, download_name, is_bundle, "
        "encryption_version, folder_id, priority, status, original_size, chunk_size_bytes, "
        "total_parts, staging_dir, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, 'queued', ?9, ?10, ?11, ?12, ?13, ?13)");
    bind_text(stmt, 1, a.owner_id);
    bind_text(stmt, 2, a.name);
    bind_text(stmt, 3, a.display_name);
    bind_text(stmt, 4, a.download_name);
    sqlite3_bind_int(stmt, 5, a.is_bundle ? 1 : 0);
    sqlite3_bind_int(stmt, 6, a.encryption_version);
    if (a.folder_id) {
        sqlite3_bind_int64(stmt, 7, *a.folder_id);
    } else {
        sqlite3_bind_null(stmt, 7);
    }
    sqlite3_bind_int(stmt, 8, a.priority);
    sqlite3_bind_int64(stmt, 9, static_cast<int64_t>(a.original_size));
    sqlite3_bind_int64(stmt, 10, static_cast<int64_t>(a.chunk_size_bytes));
    sqlite3_bind_int64(stmt, 11, a.total_parts);
    bind_text(stmt, 12, a.staging_dir);
    sqlite3_bind_int64(stmt, 13, now);
    step_done(stmt, "insert archive");
    int64_t id = sqlite3_last_insert_rowid(db_);

    auto* file_stmt = prepare(
        "INSERT INTO archive_files (archive_id, position, path, name, original_name, size) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    for (size_t i = 0; i < a.files.size(); ++i) {
        const auto& f = a.files[i];
        sqlite3_reset(file_stmt);
        sqlite3_bind_int64(file_stmt, 1, id);
        sqlite3_bind_int(file_stmt, 2, static_cast<int>(i));
        bind_text(file_stmt, 3, f.path);
        bind_text(file_stmt, 4, f.name);
        bind_text(file_stmt, 5, f.original_name);
        sqlite3_bind_int64(file_stmt, 6, static_cast<int64_t>(f.size));
        step_done(file_stmt, "insert archive file");
    }

    tx.commit();
    return id;
}

Archive ArchiveStore::read_archive_row(sqlite3_stmt* stmt) {
    Archive a;
    a.id = sqlite3_column_int64(stmt, 0);
    a.owner_id = column_text(stmt, 1);
    a.name = column_text(stmt, 2);
    a.display_name = column_text(stmt, 3);
    a.download_name = column_text(stmt, 4);
    a.is_bundle = sqlite3_column_int(stmt, 5) != 0;
    a.encryption_version = sqlite3_column_int(stmt, 6);
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) a.folder_id = sqlite3_column_int64(stmt, 7);
    a.priority = sqlite3_column_int(stmt, 8);
    a.status = parse_status(column_text(stmt, 9));
    a.retry_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 10));
    a.error = column_text(stmt, 11);
    a.error_retryable = sqlite3_column_int(stmt, 12) != 0;
    a.original_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 13));
    a.encrypted_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 14));
    a.uploaded_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 15));
    a.uploaded_parts = static_cast<uint32_t>(sqlite3_column_int64(stmt, 16));
    a.total_parts = static_cast<uint32_t>(sqlite3_column_int64(stmt, 17));
    a.chunk_size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 18));
    a.delete_total_parts = static_cast<uint32_t>(sqlite3_column_int64(stmt, 19));
    a.deleted_parts = static_cast<uint32_t>(sqlite3_column_int64(stmt, 20));
    a.trashed_at = sqlite3_column_int64(stmt, 21);
    a.delete_requested_at = sqlite3_column_int64(stmt, 22);
    a.deleted_at = sqlite3_column_int64(stmt, 23);
    a.deleting = sqlite3_column_int(stmt, 24) != 0;
    a.staging_dir = column_text(stmt, 25);
    a.iv = column_b64(stmt, 26);
    a.auth_tag = column_b64(stmt, 27);
    a.created_at = sqlite3_column_int64(stmt, 28);
    a.updated_at = sqlite3_column_int64(stmt, 29);
    return a;
}

void ArchiveStore::load_files(Archive& archive) {
    auto* stmt = prepare(
        "SELECT position, path, name, original_name, size, download_count, preview_count, "
        "deleted_at, thumb_content_type, thumb_size, thumb_local_path, thumb_url, "
        "thumb_message_id, thumb_webhook_id, thumb_updated_at, thumb_failed_at, thumb_error, "
        "zip_offset FROM archive_files WHERE archive_id = ?1 ORDER BY position");
    sqlite3_bind_int64(stmt, 1, archive.id);
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        ArchiveFile f;
        f.position = static_cast<uint32_t>(sqlite3_column_int(stmt, 0));
        f.path = column_text(stmt, 1);
        f.name = column_text(stmt, 2);
        f.original_name = column_text(stmt, 3);
        f.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        f.download_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        f.preview_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        f.deleted_at = sqlite3_column_int64(stmt, 7);
        f.thumbnail.content_type = column_text(stmt, 8);
        f.thumbnail.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
        f.thumbnail.local_path = column_text(stmt, 10);
        f.thumbnail.url = column_text(stmt, 11);
        f.thumbnail.message_id = column_text(stmt, 12);
        f.thumbnail.webhook_id = column_text(stmt, 13);
        f.thumbnail.updated_at = sqlite3_column_int64(stmt, 14);
        f.thumbnail.failed_at = sqlite3_column_int64(stmt, 15);
        f.thumbnail.error = column_text(stmt, 16);
        f.zip_offset = static_cast<uint64_t>(sqlite3_column_int64(stmt, 17));
        archive.files.push_back(std::move(f));
    }
    sqlite3_reset(stmt);
}

void ArchiveStore::load_parts(Archive& archive) {
    auto* stmt = prepare(
        "SELECT part_index, size, plain_size, hash, url, message_id, webhook_id, file_id, iv, auth_tag "
        "FROM archive_parts WHERE archive_id = ?1 ORDER BY part_index");
    sqlite3_bind_int64(stmt, 1, archive.id);
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        ArchivePart p;
        p.index = static_cast<uint32_t>(sqlite3_column_int64(stmt, 0));
        p.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        p.plain_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        p.hash = column_text(stmt, 3);
        p.url = column_text(stmt, 4);
        p.message_id = column_text(stmt, 5);
        p.webhook_id = column_text(stmt, 6);
        p.file_id = column_text(stmt, 7);
        p.iv = column_b64(stmt, 8);
        p.auth_tag = column_b64(stmt, 9);
        archive.parts.push_back(std::move(p));
    }
    sqlite3_reset(stmt);
}

std::optional<Archive> ArchiveStore::get(int64_t id) {
    static const std::string sql =
        std::string("SELECT ") + ARCHIVE_COLUMNS + " FROM archives WHERE id = ?1";

    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(sql.c_str());
    sqlite3_bind_int64(stmt, 1, id);
    if (sql_step_retry(stmt) != SQLITE_ROW) {
        sqlite3_reset(stmt);
        return std::nullopt;
    }
    auto archive = read_archive_row(stmt);
    sqlite3_reset(stmt);

    load_files(archive);
    load_parts(archive);
    return archive;
}

std::vector<Archive> ArchiveStore::list(const std::string& owner_id) {
    static const std::string sql = std::string("SELECT ") + ARCHIVE_COLUMNS +
        " FROM archives WHERE owner_id = ?1 AND deleted_at = 0 ORDER BY created_at DESC, id DESC";

    std::lock_guard lock(db_mutex_);
    std::vector<Archive> result;
    auto* stmt = prepare(sql.c_str());
    bind_text(stmt, 1, owner_id);
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        result.push_back(read_archive_row(stmt));
    }
    sqlite3_reset(stmt);

    for (auto& a : result) load_files(a);
    return result;
}

std::map<std::string, uint64_t> ArchiveStore::count_by_status() {
    std::lock_guard lock(db_mutex_);
    std::map<std::string, uint64_t> counts;
    auto* stmt = prepare(
        "SELECT status, COUNT(*) FROM archives WHERE deleted_at = 0 GROUP BY status");
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        counts[column_text(stmt, 0)] = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    }
    sqlite3_reset(stmt);
    return counts;
}

// --- Upload lifecycle ---

bool ArchiveStore::claim_locked(int64_t id, const ClaimLimits& limits) {
    static const std::string sql = std::string(
        "UPDATE archives SET status = 'processing', error = '', updated_at = ?4 "
        "WHERE id = ?1 AND ") + CLAIM_CONDITION;

    auto now = now_epoch();
    auto* stmt = prepare(sql.c_str());
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, limits.archive_retry_max);
    sqlite3_bind_int64(stmt, 3, now - limits.retry_delay_secs);
    sqlite3_bind_int64(stmt, 4, now);
    step_done(stmt, "claim archive");
    return changes() == 1;
}

bool ArchiveStore::claim(int64_t id, const ClaimLimits& limits) {
    std::lock_guard lock(db_mutex_);
    return claim_locked(id, limits);
}

std::optional<int64_t> ArchiveStore::claim_next(const ClaimLimits& limits) {
    static const std::string sql = std::string(
        "SELECT id FROM archives WHERE ") + CLAIM_CONDITION +
        " ORDER BY priority DESC, created_at ASC, id ASC LIMIT 1";

    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);

    auto* stmt = prepare(sql.c_str());
    sqlite3_bind_int64(stmt, 2, limits.archive_retry_max);
    sqlite3_bind_int64(stmt, 3, now_epoch() - limits.retry_delay_secs);
    if (sql_step_retry(stmt) != SQLITE_ROW) {
        sqlite3_reset(stmt);
        tx.commit();
        return std::nullopt;
    }
    int64_t id = sqlite3_column_int64(stmt, 0);
    sqlite3_reset(stmt);

    bool won = claim_locked(id, limits);
    tx.commit();
    if (!won) return std::nullopt;
    return id;
}

size_t ArchiveStore::recover_processing() {
    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);
    step_done(prepare("UPDATE archives SET status = 'queued' WHERE status = 'processing'"),
              "recover processing");
    size_t requeued = static_cast<size_t>(changes());
    step_done(prepare("UPDATE archives SET deleting = 0 WHERE deleting = 1"), "release deletions");
    tx.commit();
    return requeued;
}

size_t ArchiveStore::reset_stale_processing(int64_t older_than) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET status = 'queued', updated_at = ?2 "
        "WHERE status = 'processing' AND updated_at < ?1");
    sqlite3_bind_int64(stmt, 1, older_than);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "reset stale processing");
    return static_cast<size_t>(changes());
}

void ArchiveStore::set_whole_archive_key(int64_t id, const crypto::Bytes& iv,
                                         const crypto::Bytes& auth_tag) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare("UPDATE archives SET iv = ?2, auth_tag = ?3, updated_at = ?4 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    bind_bytes_b64(stmt, 2, iv);
    bind_bytes_b64(stmt, 3, auth_tag);
    sqlite3_bind_int64(stmt, 4, now_epoch());
    step_done(stmt, "set archive key");
}

void ArchiveStore::set_zip_offsets(int64_t id, const std::vector<uint64_t>& offsets) {
    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);
    auto* stmt = prepare(
        "UPDATE archive_files SET zip_offset = ?3 WHERE archive_id = ?1 AND position = ?2");
    for (size_t position = 0; position < offsets.size(); ++position) {
        sqlite3_bind_int64(stmt, 1, id);
        sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(position));
        sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(offsets[position]));
        step_done(stmt, "set zip offset");
    }
    tx.commit();
}

void ArchiveStore::set_layout(int64_t id, uint32_t total_parts, uint64_t encrypted_size) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET total_parts = ?2, encrypted_size = ?3, updated_at = ?4 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, total_parts);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(encrypted_size));
    sqlite3_bind_int64(stmt, 4, now_epoch());
    step_done(stmt, "set archive layout");
}

bool ArchiveStore::record_part(int64_t id, const ArchivePart& part) {
    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);

    auto* stmt = prepare(
        "INSERT OR IGNORE INTO archive_parts "
        "(archive_id, part_index, size, plain_size, hash, url, message_id, webhook_id, file_id, iv, auth_tag) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, part.index);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(part.size));
    sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(part.plain_size));
    bind_text(stmt, 5, part.hash);
    bind_text(stmt, 6, part.url);
    bind_text(stmt, 7, part.message_id);
    bind_text(stmt, 8, part.webhook_id);
    bind_text(stmt, 9, part.file_id);
    bind_bytes_b64(stmt, 10, part.iv);
    bind_bytes_b64(stmt, 11, part.auth_tag);
    step_done(stmt, "insert part");
    bool inserted = changes() == 1;

    if (inserted) {
        auto* counters = prepare(
            "UPDATE archives SET uploaded_parts = uploaded_parts + 1, "
            "uploaded_bytes = uploaded_bytes + ?2, updated_at = ?3 WHERE id = ?1");
        sqlite3_bind_int64(counters, 1, id);
        sqlite3_bind_int64(counters, 2, static_cast<int64_t>(part.size));
        sqlite3_bind_int64(counters, 3, now_epoch());
        step_done(counters, "increment part counters");
    }

    tx.commit();
    return inserted;
}

bool ArchiveStore::mark_ready(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET status = 'ready', error = '', error_retryable = 0, updated_at = ?2 "
        "WHERE id = ?1 AND status = 'processing' AND total_parts > 0 AND uploaded_parts = total_parts");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "mark ready");
    return changes() == 1;
}

void ArchiveStore::mark_error(int64_t id, const std::string& message, bool retryable) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET status = 'error', error = ?2, error_retryable = ?3, "
        "retry_count = retry_count + 1, updated_at = ?4 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    bind_text(stmt, 2, message);
    sqlite3_bind_int(stmt, 3, retryable ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, now_epoch());
    step_done(stmt, "mark error");
}

bool ArchiveStore::reset_for_retry(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET status = 'queued', error = '', error_retryable = 0, retry_count = 0, "
        "updated_at = ?2 WHERE id = ?1 AND status = 'error' AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "reset for retry");
    return changes() == 1;
}

// --- Trash and deletion ---

bool ArchiveStore::trash(int64_t id, int64_t at) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET trashed_at = ?2, updated_at = ?3 "
        "WHERE id = ?1 AND trashed_at = 0 AND delete_requested_at = 0 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, at);
    sqlite3_bind_int64(stmt, 3, now_epoch());
    step_done(stmt, "trash archive");
    return changes() == 1;
}

bool ArchiveStore::untrash(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET trashed_at = 0, updated_at = ?2 "
        "WHERE id = ?1 AND trashed_at > 0 AND delete_requested_at = 0 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "restore archive from trash");
    return changes() == 1;
}

bool ArchiveStore::request_delete(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET delete_requested_at = ?2, "
        "delete_total_parts = (SELECT COUNT(*) FROM archive_parts WHERE archive_id = ?1) "
        "WHERE id = ?1 AND delete_requested_at = 0 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "request delete");
    return changes() == 1;
}

size_t ArchiveStore::promote_expired_trash(int64_t cutoff) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archives SET delete_requested_at = ?2, "
        "delete_total_parts = (SELECT COUNT(*) FROM archive_parts WHERE archive_parts.archive_id = archives.id) "
        "WHERE trashed_at > 0 AND trashed_at <= ?1 AND delete_requested_at = 0 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, cutoff);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "promote expired trash");
    return static_cast<size_t>(changes());
}

std::optional<int64_t> ArchiveStore::claim_deletion() {
    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);

    auto* select = prepare(
        "SELECT id FROM archives WHERE delete_requested_at > 0 AND deleted_at = 0 AND deleting = 0 "
        "AND status != 'processing' ORDER BY delete_requested_at ASC, id ASC LIMIT 1");
    if (sql_step_retry(select) != SQLITE_ROW) {
        sqlite3_reset(select);
        tx.commit();
        return std::nullopt;
    }
    int64_t id = sqlite3_column_int64(select, 0);
    sqlite3_reset(select);

    // Parts recorded after the request was made still need deleting
    auto* stmt = prepare(
        "UPDATE archives SET deleting = 1, delete_total_parts = MAX(delete_total_parts, "
        "(SELECT COUNT(*) FROM archive_parts WHERE archive_id = ?1)) "
        "WHERE id = ?1 AND deleting = 0");
    sqlite3_bind_int64(stmt, 1, id);
    step_done(stmt, "claim deletion");
    bool won = changes() == 1;
    tx.commit();

    if (!won) return std::nullopt;
    return id;
}

void ArchiveStore::increment_deleted(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare("UPDATE archives SET deleted_parts = deleted_parts + 1 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    step_done(stmt, "increment deleted parts");
}

void ArchiveStore::release_deletion(int64_t id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare("UPDATE archives SET deleting = 0 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    step_done(stmt, "release deletion");
}

void ArchiveStore::finish_deletion(int64_t id) {
    std::lock_guard lock(db_mutex_);
    Transaction tx(*this);

    auto* parts = prepare("DELETE FROM archive_parts WHERE archive_id = ?1");
    sqlite3_bind_int64(parts, 1, id);
    step_done(parts, "drop parts");

    auto* stmt = prepare(
        "UPDATE archives SET deleted_at = ?2, deleting = 0, updated_at = ?2 WHERE id = ?1");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, now_epoch());
    step_done(stmt, "finish deletion");

    tx.commit();
}

// --- Files ---

void ArchiveStore::increment_download_count(int64_t id, std::optional<uint32_t> position) {
    std::lock_guard lock(db_mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (position) {
        stmt = prepare(
            "UPDATE archive_files SET download_count = download_count + 1 "
            "WHERE archive_id = ?1 AND position = ?2 AND deleted_at = 0");
        sqlite3_bind_int64(stmt, 2, *position);
    } else {
        stmt = prepare(
            "UPDATE archive_files SET download_count = download_count + 1 "
            "WHERE archive_id = ?1 AND deleted_at = 0");
    }
    sqlite3_bind_int64(stmt, 1, id);
    step_done(stmt, "increment download count");
}

bool ArchiveStore::increment_preview_count(int64_t id, uint32_t position) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archive_files SET preview_count = preview_count + 1 "
        "WHERE archive_id = ?1 AND position = ?2 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, position);
    step_done(stmt, "increment preview count");
    return changes() == 1;
}

bool ArchiveStore::delete_file(int64_t id, uint32_t position) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archive_files SET deleted_at = ?3 "
        "WHERE archive_id = ?1 AND position = ?2 AND deleted_at = 0");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, position);
    sqlite3_bind_int64(stmt, 3, now_epoch());
    step_done(stmt, "delete file");
    return changes() == 1;
}

bool ArchiveStore::set_thumbnail(int64_t id, uint32_t position, const ThumbnailInfo& t) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "UPDATE archive_files SET thumb_content_type = ?3, thumb_size = ?4, thumb_local_path = ?5, "
        "thumb_url = ?6, thumb_message_id = ?7, thumb_webhook_id = ?8, thumb_updated_at = ?9, "
        "thumb_failed_at = ?10, thumb_error = ?11 WHERE archive_id = ?1 AND position = ?2");
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_int64(stmt, 2, position);
    bind_text(stmt, 3, t.content_type);
    sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(t.size));
    bind_text(stmt, 5, t.local_path);
    bind_text(stmt, 6, t.url);
    bind_text(stmt, 7, t.message_id);
    bind_text(stmt, 8, t.webhook_id);
    sqlite3_bind_int64(stmt, 9, t.updated_at);
    sqlite3_bind_int64(stmt, 10, t.failed_at);
    bind_text(stmt, 11, t.error);
    step_done(stmt, "set thumbnail");
    return changes() == 1;
}

// --- Owner byte counters ---

void ArchiveStore::adjust_used_bytes(const std::string& owner_id, int64_t delta) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare(
        "INSERT INTO owners (owner_id, used_bytes) VALUES (?1, ?2) "
        "ON CONFLICT(owner_id) DO UPDATE SET used_bytes = used_bytes + excluded.used_bytes");
    bind_text(stmt, 1, owner_id);
    sqlite3_bind_int64(stmt, 2, delta);
    step_done(stmt, "adjust used bytes");
}

int64_t ArchiveStore::used_bytes(const std::string& owner_id) {
    std::lock_guard lock(db_mutex_);
    auto* stmt = prepare("SELECT used_bytes FROM owners WHERE owner_id = ?1");
    bind_text(stmt, 1, owner_id);
    int64_t used = 0;
    if (sql_step_retry(stmt) == SQLITE_ROW) used = sqlite3_column_int64(stmt, 0);
    sqlite3_reset(stmt);
    return used;
}

void SqliteQuotaService::adjust_used_bytes(const std::string& owner_id, int64_t delta) {
    store_.adjust_used_bytes(owner_id, delta);
}

}  // namespace hookvault
