#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

namespace hookvault {

class ArchiveStore;
class BackendPool;
class MetricsExporter;
class QuotaService;

struct SweeperSettings {
    uint32_t trash_retention_days = 30;
};

/// Removes the remote parts of delete-requested archives.
///
/// One archive at a time is claimed (deleting 0 -> 1). Parts go in index
/// order starting at deleted_parts, and every removal bumps the counter, so
/// a failed pass resumes where it stopped. A part the host no longer has
/// counts as removed. Once every part is gone the record is finalized and
/// the owner's byte counter drops by original_size.
class DeletionSweeper {
public:
    DeletionSweeper(ArchiveStore& store, BackendPool& backends, QuotaService& quota,
                    SweeperSettings settings);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }
    void set_quota_service(QuotaService& quota) { quota_ = &quota; }

    /// Trashed longer than the retention period -> delete requested.
    size_t promote_expired_trash(int64_t now);

    /// Work on one pending deletion. Returns the archive id it handled
    /// (finished or not), or nullopt when nothing was pending.
    std::optional<int64_t> sweep_one();

    /// Promote expired trash, then sweep until nothing is pending or a pass
    /// fails. Returns the number of archives fully deleted.
    size_t sweep();

    struct Counters {
        std::atomic<uint64_t> parts_deleted{0};
        std::atomic<uint64_t> archives_deleted{0};
        std::atomic<uint64_t> failures{0};
    };
    const Counters& counters() const { return counters_; }

private:
    // True when the archive reached deleted_at
    bool delete_parts(int64_t archive_id);

    ArchiveStore& store_;
    BackendPool& backends_;
    QuotaService* quota_;
    SweeperSettings settings_;
    MetricsExporter* metrics_ = nullptr;
    Counters counters_;
};

}  // namespace hookvault
