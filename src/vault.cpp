#include "hookvault/vault.hpp"
#include "hookvault/archive_store.hpp"
#include "hookvault/backend.hpp"
#include "hookvault/collaborators.hpp"
#include "hookvault/deletion_sweeper.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"
#include "hookvault/metrics.hpp"
#include "hookvault/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <set>

namespace hookvault {

namespace fs = std::filesystem;

namespace {

// Move a file, copying when source and destination are on different devices
void move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw Error(ErrorKind::ResourceExhausted,
                    "cannot stage " + from.string() + ": " + ec.message());
    }
    fs::remove(from, ec);
    if (ec) {
        log_warn("vault", "staged a copy of %s but could not remove it: %s", from.c_str(),
                 ec.message().c_str());
    }
}

uint64_t regular_file_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw Error(ErrorKind::NotFound, "no such file: " + path.string());
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw Error(ErrorKind::NotFound, "cannot stat " + path.string() + ": " + ec.message());
    }
    return size;
}

// "a.txt", "a.txt" -> "a.txt", "a_1.txt"
std::string unique_entry_name(const std::string& wanted, std::set<std::string>& taken) {
    std::string name = wanted.empty() ? "file" : wanted;
    if (taken.insert(name).second) return name;

    auto dot = name.rfind('.');
    std::string stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
    std::string ext = (dot == std::string::npos || dot == 0) ? "" : name.substr(dot);
    for (size_t n = 1;; ++n) {
        std::string candidate = stem + "_" + std::to_string(n) + ext;
        if (taken.insert(candidate).second) return candidate;
    }
}

bool ends_with_zip(const std::string& name) {
    if (name.size() < 4) return false;
    std::string tail = name.substr(name.size() - 4);
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == ".zip";
}

}  // namespace

Vault::Vault(const VaultConfig& config) : config_(config) {}

Vault::Vault(const VaultConfig& config, std::unique_ptr<BackendPool> backends)
    : config_(config), backends_(std::move(backends)) {}

Vault::~Vault() {
    stop();
}

void Vault::build_backends() {
    BackendOptions options;
    options.retry.policy.max_retries = config_.upload_retry_max;
    options.retry.policy.base_delay = config_.upload_retry_base;
    options.retry.policy.max_delay = config_.upload_retry_max_delay;
    options.retry.sleeper = default_sleeper();
    options.retry.retry_counter = &upload_retries_;
    options.connect_timeout = config_.connect_timeout;
    options.request_timeout = config_.request_timeout;

    backends_ = std::make_unique<BackendPool>();
    for (const auto& bc : config_.backends) {
        auto backend = BlobBackendFactory::create(bc, options);
        log_info("vault", "backend %s (%s)%s", backend->id().c_str(), backend->type_name().c_str(),
                 backend->ready() ? "" : " missing credentials");
        backends_->add(std::move(backend));
    }
}

std::string Vault::open() {
    if (opened_) return {};

    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    for (const auto& dir : {config_.data_dir, config_.uploads_dir(), config_.work_dir()}) {
        fs::create_directories(dir, ec);
        if (ec) return "Failed to create " + dir.string() + ": " + ec.message();
    }

    store_ = std::make_unique<ArchiveStore>(config_.db_path());
    try {
        store_->open();
    } catch (const std::exception& e) {
        return std::string("Failed to open manifest: ") + e.what();
    }

    if (!backends_) {
        try {
            build_backends();
        } catch (const std::exception& e) {
            return std::string("Failed to create backend: ") + e.what();
        }
    }

    key_ = crypto::derive_key(config_.master_key);

    default_quota_ = std::make_unique<SqliteQuotaService>(*store_);
    if (!quota_) quota_ = default_quota_.get();

    UploadSettings upload;
    upload.parts_concurrency = config_.upload_parts_concurrency;
    upload.archive_retry_max = config_.archive_retry_max;
    upload.delete_staging_after_upload = config_.delete_staging_after_upload;
    upload.work_root = config_.work_dir();
    orchestrator_ = std::make_unique<UploadOrchestrator>(*store_, *backends_, key_, upload);
    orchestrator_->set_shutdown_flag(&stopping_);

    restore_ = std::make_unique<RestoreEngine>(*backends_, key_, RestoreSettings{config_.restore_prefetch});

    SweeperSettings sweep;
    sweep.trash_retention_days = static_cast<uint32_t>(config_.trash_retention_days);
    sweeper_ = std::make_unique<DeletionSweeper>(*store_, *backends_, *quota_, sweep);

    if (metrics_) set_metrics(metrics_);

    opened_ = true;
    return {};
}

std::string Vault::start() {
    auto err = open();
    if (!err.empty()) return err;
    if (running_) return {};

    if (backends_->empty()) {
        log_warn("vault", "no storage backend configured, uploads will fail");
    }

    // Crash recovery: nothing can be processing or deleting before we start
    try {
        size_t requeued = store_->recover_processing();
        if (requeued > 0) {
            log_info("vault", "recovered %zu interrupted archive(s)", requeued);
        }
    } catch (const std::exception& e) {
        return std::string("Crash recovery failed: ") + e.what();
    }
    clear_work_dirs();

    auto counts = store_->count_by_status();
    log_info("vault", "manifest %s: %llu queued, %llu ready, %llu error",
             store_->path().c_str(), static_cast<unsigned long long>(counts["queued"]),
             static_cast<unsigned long long>(counts["ready"]),
             static_cast<unsigned long long>(counts["error"]));

    stopping_ = false;
    running_ = true;

    size_t workers = std::max<size_t>(1, config_.worker_concurrency);
    for (size_t i = 0; i < workers; ++i) {
        upload_threads_.emplace_back(&Vault::upload_worker_loop, this, i);
    }
    sweeper_thread_ = std::thread(&Vault::sweeper_loop, this);

    return {};
}

void Vault::stop() {
    if (!running_.exchange(false)) return;

    log_info("vault", "shutting down...");
    stopping_ = true;

    // Wake up all waiting threads
    {
        std::lock_guard lock(upload_cv_mutex_);
    }
    upload_cv_.notify_all();
    {
        std::lock_guard lock(sweep_cv_mutex_);
    }
    sweep_cv_.notify_all();

    for (auto& t : upload_threads_) {
        if (t.joinable()) t.join();
    }
    upload_threads_.clear();
    if (sweeper_thread_.joinable()) sweeper_thread_.join();

    // Signal waiters
    {
        std::lock_guard lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    log_info("vault", "stopped");
}

void Vault::wait() {
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return !running_.load(); });
}

void Vault::set_metrics(MetricsExporter* metrics) {
    metrics_ = metrics;
    if (orchestrator_) orchestrator_->set_metrics(metrics);
    if (restore_) restore_->set_metrics(metrics);
    if (sweeper_) sweeper_->set_metrics(metrics);
}

void Vault::set_quota_service(QuotaService* quota) {
    quota_ = quota ? quota : default_quota_.get();
    if (sweeper_ && quota_) sweeper_->set_quota_service(*quota_);
}

void Vault::add_observer(ArchiveObserver* observer) {
    if (observer) observers_.push_back(observer);
}

// --- Creation ---

fs::path Vault::make_staging_dir() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char day[16];
    std::strftime(day, sizeof(day), "%Y-%m-%d", &tm);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto dir = config_.uploads_dir() / day / (std::to_string(ms) + "_" + crypto::random_hex(4));

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw Error(ErrorKind::ResourceExhausted,
                    "cannot create staging dir " + dir.string() + ": " + ec.message());
    }
    return dir;
}

Archive Vault::create_from_local_file(const std::string& owner_id, const fs::path& source,
                                      const std::string& original_name,
                                      std::optional<int64_t> folder_id) {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");

    uint64_t size = regular_file_size(source);
    std::string display = original_name.empty() ? source.filename().string() : original_name;

    auto staging = make_staging_dir();
    auto staged = staging / ("0_" + sanitize_archive_name(display));
    move_file(source, staged);

    Archive a;
    a.owner_id = owner_id;
    a.name = sanitize_archive_name(display);
    a.display_name = display;
    a.download_name = sanitize_display_name(display);
    a.is_bundle = false;
    a.encryption_version = config_.encryption_version;
    a.folder_id = folder_id;
    a.original_size = size;
    a.chunk_size_bytes = config_.chunk_size_bytes();
    a.staging_dir = staging.string();

    ArchiveFile f;
    f.position = 0;
    f.path = staged.string();
    f.name = sanitize_display_name(display);
    f.original_name = display;
    f.size = size;
    a.files.push_back(std::move(f));

    return finish_create(std::move(a));
}

Archive Vault::create_bundle(const std::string& owner_id, const std::vector<BundleSource>& sources,
                             const std::string& bundle_name, std::optional<int64_t> folder_id) {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");
    if (sources.empty()) {
        throw Error(ErrorKind::Configuration, "a bundle needs at least one file");
    }

    // Entry names are settled before anything is moved
    std::set<std::string> taken;
    std::vector<std::pair<std::string, uint64_t>> entries;
    uint64_t total = 0;
    for (const auto& s : sources) {
        uint64_t size = regular_file_size(s.path);
        std::string wanted = s.original_name.empty() ? s.path.filename().string() : s.original_name;
        entries.emplace_back(unique_entry_name(sanitize_display_name(wanted), taken), size);
        total += size;
    }
    if (total > config_.bundle_max_bytes()) {
        throw Error(ErrorKind::Configuration,
                    "bundle of " + std::to_string(total) + " bytes exceeds the " +
                        std::to_string(config_.bundle_max_bytes()) + " byte limit");
    }

    auto staging = make_staging_dir();

    std::string display = bundle_name.empty() ? "bundle" : bundle_name;
    Archive a;
    a.owner_id = owner_id;
    a.name = sanitize_archive_name(display);
    a.display_name = display;
    a.download_name = sanitize_display_name(display);
    if (!ends_with_zip(a.download_name)) a.download_name += ".zip";
    a.is_bundle = true;
    a.encryption_version = config_.encryption_version;
    a.folder_id = folder_id;
    a.original_size = total;
    a.chunk_size_bytes = config_.chunk_size_bytes();
    a.staging_dir = staging.string();

    for (size_t i = 0; i < sources.size(); ++i) {
        auto staged = staging / (std::to_string(i) + "_" + sanitize_archive_name(entries[i].first));
        move_file(sources[i].path, staged);

        ArchiveFile f;
        f.position = static_cast<uint32_t>(i);
        f.path = staged.string();
        f.name = entries[i].first;
        f.original_name = sources[i].original_name.empty() ? sources[i].path.filename().string()
                                                           : sources[i].original_name;
        f.size = entries[i].second;
        a.files.push_back(std::move(f));
    }

    return finish_create(std::move(a));
}

Archive Vault::finish_create(Archive archive) {
    int64_t id = store_->insert(archive);
    quota_->adjust_used_bytes(archive.owner_id, static_cast<int64_t>(archive.original_size));

    log_info("vault", "queued %lld %s (%llu bytes, %zu file(s), v%d)", static_cast<long long>(id),
             archive.name.c_str(), static_cast<unsigned long long>(archive.original_size),
             archive.files.size(), archive.encryption_version);

    for (auto* observer : observers_) {
        try {
            observer->on_archive_created(id);
        } catch (const std::exception& e) {
            log_warn("vault", "observer failed for archive %lld: %s", static_cast<long long>(id),
                     e.what());
        }
    }

    wake_workers();

    auto stored = store_->get(id);
    if (!stored) {
        throw Error(ErrorKind::NotFound, "archive " + std::to_string(id) + " vanished after insert");
    }
    return std::move(*stored);
}

// --- Restore ---

RestoreOutcome Vault::get_download_stream(int64_t archive_id, std::optional<uint32_t> file_position,
                                          ByteSink& sink) {
    auto archive = require_archive(archive_id);
    auto outcome = restore_->stream(archive, file_position, sink);
    if (outcome == RestoreOutcome::Completed) {
        store_->increment_download_count(archive_id, file_position);
    }
    return outcome;
}

RestoreOutcome Vault::get_range_stream(int64_t archive_id, uint64_t first, uint64_t last,
                                       ByteSink& sink) {
    auto archive = require_archive(archive_id);
    return restore_->stream_range(archive, first, last, sink);
}

// --- State changes ---

Archive Vault::require_archive(int64_t archive_id) {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");
    auto archive = store_->get(archive_id);
    if (!archive || archive->deleted_at != 0) {
        throw Error(ErrorKind::NotFound, "archive " + std::to_string(archive_id) + " not found");
    }
    return std::move(*archive);
}

bool Vault::request_delete(int64_t archive_id) {
    require_archive(archive_id);
    bool ok = store_->request_delete(archive_id);
    if (ok) {
        log_info("vault", "delete requested for %lld", static_cast<long long>(archive_id));
        {
            std::lock_guard lock(sweep_cv_mutex_);
            sweep_requested_ = true;
        }
        sweep_cv_.notify_one();
    }
    return ok;
}

bool Vault::request_trash(int64_t archive_id) {
    require_archive(archive_id);
    return store_->trash(archive_id, now_epoch());
}

bool Vault::restore_from_trash(int64_t archive_id) {
    require_archive(archive_id);
    return store_->untrash(archive_id);
}

bool Vault::retry_archive(int64_t archive_id) {
    require_archive(archive_id);
    bool ok = store_->reset_for_retry(archive_id);
    if (ok) wake_workers();
    return ok;
}

bool Vault::delete_file(int64_t archive_id, uint32_t position) {
    require_archive(archive_id);
    return store_->delete_file(archive_id, position);
}

bool Vault::record_preview(int64_t archive_id, uint32_t position) {
    require_archive(archive_id);
    return store_->increment_preview_count(archive_id, position);
}

bool Vault::record_thumbnail(int64_t archive_id, uint32_t position, const ThumbnailInfo& thumbnail) {
    require_archive(archive_id);
    ThumbnailInfo stamped = thumbnail;
    if (stamped.updated_at == 0 && stamped.failed_at == 0) stamped.updated_at = now_epoch();
    return store_->set_thumbnail(archive_id, position, stamped);
}

// --- Queries ---

std::optional<Archive> Vault::get_archive(int64_t archive_id) {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");
    return store_->get(archive_id);
}

std::vector<Archive> Vault::list_archives(const std::string& owner_id) {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");
    return store_->list(owner_id);
}

std::vector<Archive> Vault::archives_for_share(const std::string& token) {
    std::vector<Archive> result;
    if (!shares_ || !opened_) return result;

    auto grant = shares_->resolve(token);
    if (!grant) return result;
    if (grant->expires_at != 0 && grant->expires_at <= now_epoch()) return result;

    for (int64_t id : grant->archive_ids) {
        auto archive = store_->get(id);
        if (!archive || !archive->ready()) continue;
        if (archive->deleted_at != 0 || archive->delete_requested_at != 0 || archive->trashed_at != 0) {
            continue;
        }
        result.push_back(std::move(*archive));
    }
    return result;
}

// --- Foreground work ---

size_t Vault::process_pending() {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");

    ClaimLimits limits{config_.archive_retry_max, config_.archive_retry_delay_secs};
    size_t processed = 0;
    while (!stopping_.load()) {
        auto id = store_->claim_next(limits);
        if (!id) break;
        orchestrator_->process(*id);
        ++processed;
    }
    return processed;
}

size_t Vault::sweep_deletions() {
    if (!opened_) throw Error(ErrorKind::Configuration, "vault is not open");
    return sweeper_->sweep();
}

Vault::Stats Vault::get_stats() {
    Stats s;
    if (orchestrator_) {
        const auto& c = orchestrator_->counters();
        s.archives_completed = c.archives_completed.load();
        s.archives_failed = c.archives_failed.load();
        s.parts_uploaded = c.parts_uploaded.load();
        s.bytes_uploaded = c.bytes_uploaded.load();
    }
    if (restore_) {
        const auto& c = restore_->counters();
        s.restores_completed = c.completed.load();
        s.restores_failed = c.failed.load();
        s.restores_cancelled = c.cancelled.load();
        s.bytes_restored = c.bytes.load();
    }
    if (sweeper_) {
        const auto& c = sweeper_->counters();
        s.parts_deleted = c.parts_deleted.load();
        s.archives_deleted = c.archives_deleted.load();
    }
    s.upload_retries = upload_retries_.load();
    if (store_) {
        try {
            s.archives_by_status = store_->count_by_status();
        } catch (const std::exception& e) {
            log_warn("vault", "status counts unavailable: %s", e.what());
        }
    }
    return s;
}

// --- Workers ---

void Vault::clear_work_dirs() {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(config_.work_dir(), ec)) {
        std::error_code rm_ec;
        fs::remove_all(entry.path(), rm_ec);
        if (rm_ec) {
            log_warn("vault", "cannot remove orphaned %s: %s", entry.path().c_str(),
                     rm_ec.message().c_str());
        }
    }
}

void Vault::wake_workers() {
    {
        std::lock_guard lock(upload_cv_mutex_);
    }
    upload_cv_.notify_all();
}

void Vault::upload_worker_loop(size_t worker) {
    ClaimLimits limits{config_.archive_retry_max, config_.archive_retry_delay_secs};
    bool first = true;

    while (running_.load(std::memory_order_relaxed)) {
        // Wait for work
        if (!first) {
            std::unique_lock lock(upload_cv_mutex_);
            upload_cv_.wait_for(lock, config_.worker_poll_interval);
        }
        first = false;
        if (!running_.load(std::memory_order_relaxed)) break;

        try {
            // Another process may have died holding a claim
            if (worker == 0 && config_.processing_stale_minutes > 0) {
                auto cutoff = now_epoch() - static_cast<int64_t>(config_.processing_stale_minutes) * 60;
                size_t reset = store_->reset_stale_processing(cutoff);
                if (reset > 0) {
                    log_warn("worker", "requeued %zu stale processing archive(s)", reset);
                }
            }

            while (running_.load(std::memory_order_relaxed)) {
                auto id = store_->claim_next(limits);
                if (!id) break;
                orchestrator_->process(*id);
            }
        } catch (const std::exception& e) {
            log_error("worker", "worker %zu: %s", worker, e.what());
        }
    }
}

void Vault::sweeper_loop() {
    auto interval = std::chrono::seconds(std::max<size_t>(1, config_.delete_sweep_interval_secs));

    while (running_.load(std::memory_order_relaxed)) {
        try {
            sweeper_->sweep();
        } catch (const std::exception& e) {
            log_error("sweeper", "%s", e.what());
        }

        std::unique_lock lock(sweep_cv_mutex_);
        sweep_cv_.wait_for(lock, interval, [this] { return !running_.load() || sweep_requested_; });
        sweep_requested_ = false;
    }
}

}  // namespace hookvault
