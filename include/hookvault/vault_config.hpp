#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hookvault {

/// One remote attachment host (Discord webhook, Telegram chat, or a local
/// directory for development).
struct BackendConfig {
    std::string id;    // webhook_id recorded on every part stored here
    std::string type;  // "discord", "telegram", "local"
    std::map<std::string, std::string> params;  // Passed to BlobBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the hookvault daemon and hookvault-ctl.
struct VaultConfig {
    // Manifest, staging and scratch space live under here
    std::filesystem::path data_dir;

    // AES key material; the actual key is SHA-256 of this string
    std::string master_key;

    std::vector<BackendConfig> backends;

    // Chunking
    double chunk_size_mib = 9.8;
    double webhook_max_mib = 9.8;    // host attachment limit, caps the chunk size
    double bundle_max_mib = 32;
    int encryption_version = 2;      // for new archives only

    // Workers
    size_t worker_concurrency = 1;
    std::chrono::milliseconds worker_poll_interval{2000};
    size_t upload_parts_concurrency = 2;
    size_t processing_stale_minutes = 30;
    size_t restore_prefetch = 2;

    // Backend retry
    uint32_t upload_retry_max = 5;
    std::chrono::milliseconds upload_retry_base{1500};
    std::chrono::milliseconds upload_retry_max_delay{15000};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{120};

    // Archive retry: how often a failed archive is re-claimed
    uint32_t archive_retry_max = 5;
    int64_t archive_retry_delay_secs = 0;

    // Deletion
    size_t trash_retention_days = 30;
    size_t delete_sweep_interval_secs = 10;
    bool delete_staging_after_upload = true;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr). When
    /// `positional` is given, non-option arguments are collected there
    /// instead of being rejected.
    static std::optional<VaultConfig> from_args(int argc, char* argv[],
                                                std::vector<std::string>* positional = nullptr);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Environment fallbacks and derived backend ids.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// min(chunk_size_mib, webhook_max_mib) in bytes.
    uint64_t chunk_size_bytes() const;
    uint64_t bundle_max_bytes() const;

    std::filesystem::path db_path() const { return data_dir / "vault.db"; }
    std::filesystem::path uploads_dir() const { return data_dir / "uploads"; }
    std::filesystem::path work_dir() const { return data_dir / "work"; }
};

/// Discord webhook ids come from the URL: .../webhooks/<id>/<token>.
/// Returns an empty string when the URL has no such segment.
std::string webhook_id_from_url(const std::string& url);

/// Replace all but the last four characters with '*'.
std::string mask_secret(const std::string& secret);

}  // namespace hookvault
