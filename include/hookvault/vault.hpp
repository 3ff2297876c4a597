#pragma once

#include "hookvault/archive.hpp"
#include "hookvault/codec.hpp"
#include "hookvault/restore_engine.hpp"
#include "hookvault/vault_config.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hookvault {

class ArchiveObserver;
class ArchiveStore;
class BackendPool;
class DeletionSweeper;
class MetricsExporter;
class QuotaService;
class ShareLookup;
class UploadOrchestrator;

/// One file going into a bundle.
struct BundleSource {
    std::filesystem::path path;
    std::string original_name;
};

/// The storage engine.
///
/// Owns the manifest, the backend pool and the three workers built on them:
/// upload orchestration (worker_concurrency threads polling for claimable
/// archives), deletion sweeping, and restore. hookvault-ctl uses the same
/// object without starting the threads.
class Vault {
public:
    explicit Vault(const VaultConfig& config);

    /// Use a ready-made backend pool instead of building one from config.
    Vault(const VaultConfig& config, std::unique_ptr<BackendPool> backends);

    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    /// Open the manifest and build the components. No threads are started.
    /// Returns error message on failure, empty string on success.
    std::string open();

    /// open(), crash recovery, then the worker and sweeper threads.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop the threads. In-flight uploads are abandoned and picked up again
    /// by the next start().
    void stop();

    /// Block until stop() is called (for daemon mode).
    void wait();

    void set_metrics(MetricsExporter* metrics);
    void set_quota_service(QuotaService* quota);  // null restores the manifest counter
    void set_share_lookup(ShareLookup* shares) { shares_ = shares; }
    void add_observer(ArchiveObserver* observer);

    // --- Creation ---

    /// Move `source` into a fresh staging directory and queue the archive.
    Archive create_from_local_file(const std::string& owner_id, const std::filesystem::path& source,
                                   const std::string& original_name,
                                   std::optional<int64_t> folder_id = std::nullopt);

    /// Queue several files as one zip bundle. Throws Error{Configuration}
    /// when their total size exceeds bundle_max_mib.
    Archive create_bundle(const std::string& owner_id, const std::vector<BundleSource>& sources,
                          const std::string& bundle_name,
                          std::optional<int64_t> folder_id = std::nullopt);

    // --- Restore ---

    /// Stream the archive, or one file of it, into `sink`. download_count of
    /// the served file(s) goes up only when the restore completes.
    RestoreOutcome get_download_stream(int64_t archive_id, std::optional<uint32_t> file_position,
                                       ByteSink& sink);

    /// Plaintext bytes [first, last] of a per-part single-file archive.
    RestoreOutcome get_range_stream(int64_t archive_id, uint64_t first, uint64_t last,
                                    ByteSink& sink);

    // --- State changes ---
    // Each throws Error{NotFound} for an unknown archive and returns false
    // when the archive is not in a state that allows the change.

    bool request_delete(int64_t archive_id);
    bool request_trash(int64_t archive_id);
    bool restore_from_trash(int64_t archive_id);
    bool retry_archive(int64_t archive_id);
    bool delete_file(int64_t archive_id, uint32_t position);
    bool record_preview(int64_t archive_id, uint32_t position);

    /// Thumbnail services report back here, usually from an ArchiveObserver.
    /// updated_at is stamped when neither timestamp is set.
    bool record_thumbnail(int64_t archive_id, uint32_t position, const ThumbnailInfo& thumbnail);

    // --- Queries ---

    std::optional<Archive> get_archive(int64_t archive_id);
    std::vector<Archive> list_archives(const std::string& owner_id);

    /// Ready archives reachable through a share token. Empty when the token
    /// is unknown or expired, or no ShareLookup is set.
    std::vector<Archive> archives_for_share(const std::string& token);

    // --- Foreground work (hookvault-ctl and tests) ---

    /// Claim and process archives until none is claimable. Returns how many
    /// were processed.
    size_t process_pending();

    /// One deletion sweep. Returns archives fully deleted.
    size_t sweep_deletions();

    // --- Statistics ---

    struct Stats {
        uint64_t archives_completed = 0;
        uint64_t archives_failed = 0;
        uint64_t parts_uploaded = 0;
        uint64_t bytes_uploaded = 0;
        uint64_t upload_retries = 0;
        uint64_t restores_completed = 0;
        uint64_t restores_failed = 0;
        uint64_t restores_cancelled = 0;
        uint64_t bytes_restored = 0;
        uint64_t parts_deleted = 0;
        uint64_t archives_deleted = 0;
        std::map<std::string, uint64_t> archives_by_status;
    };
    Stats get_stats();

    const VaultConfig& config() const { return config_; }
    ArchiveStore& store() { return *store_; }

private:
    void build_backends();
    Archive require_archive(int64_t archive_id);
    std::filesystem::path make_staging_dir();
    Archive finish_create(Archive archive);
    void clear_work_dirs();

    void upload_worker_loop(size_t worker);
    void sweeper_loop();
    void wake_workers();

    VaultConfig config_;
    crypto::Key key_{};

    std::unique_ptr<ArchiveStore> store_;
    std::unique_ptr<BackendPool> backends_;
    std::unique_ptr<QuotaService> default_quota_;
    QuotaService* quota_ = nullptr;
    std::unique_ptr<UploadOrchestrator> orchestrator_;
    std::unique_ptr<RestoreEngine> restore_;
    std::unique_ptr<DeletionSweeper> sweeper_;

    MetricsExporter* metrics_ = nullptr;
    ShareLookup* shares_ = nullptr;
    std::vector<ArchiveObserver*> observers_;

    // Incremented by every backend retry
    std::atomic<uint64_t> upload_retries_{0};

    // Threads
    std::vector<std::thread> upload_threads_;
    std::thread sweeper_thread_;

    // Synchronization
    bool opened_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::mutex upload_cv_mutex_;
    std::condition_variable upload_cv_;
    std::mutex sweep_cv_mutex_;
    std::condition_variable sweep_cv_;
    bool sweep_requested_ = false;  // guarded by sweep_cv_mutex_
    std::condition_variable wait_cv_;
    std::mutex wait_mutex_;
};

}  // namespace hookvault
