#include "hookvault/deletion_sweeper.hpp"
#include "hookvault/archive_store.hpp"
#include "hookvault/backend.hpp"
#include "hookvault/collaborators.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"
#include "hookvault/metrics.hpp"

#include <filesystem>

namespace hookvault {

DeletionSweeper::DeletionSweeper(ArchiveStore& store, BackendPool& backends, QuotaService& quota,
                                 SweeperSettings settings)
    : store_(store), backends_(backends), quota_(&quota), settings_(settings) {}

size_t DeletionSweeper::promote_expired_trash(int64_t now) {
    int64_t cutoff = now - static_cast<int64_t>(settings_.trash_retention_days) * 86400;
    size_t n = store_.promote_expired_trash(cutoff);
    if (n > 0) {
        log_info("sweeper", "%zu trashed archive(s) past retention queued for deletion", n);
    }
    return n;
}

std::optional<int64_t> DeletionSweeper::sweep_one() {
    auto claimed = store_.claim_deletion();
    if (!claimed) return std::nullopt;

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->deletion_duration());

    int64_t id = *claimed;
    try {
        delete_parts(id);
    } catch (const std::exception& e) {
        counters_.failures++;
        log_error("sweeper", "archive %lld: %s", static_cast<long long>(id), e.what());
        store_.release_deletion(id);
    }
    return id;
}

size_t DeletionSweeper::sweep() {
    promote_expired_trash(now_epoch());

    uint64_t failures_before = counters_.failures.load();
    uint64_t deleted_before = counters_.archives_deleted.load();
    while (sweep_one()) {
        // A failed pass stays pending until the next sweep interval
        if (counters_.failures.load() != failures_before) break;
    }
    return static_cast<size_t>(counters_.archives_deleted.load() - deleted_before);
}

bool DeletionSweeper::delete_parts(int64_t archive_id) {
    auto archive = store_.get(archive_id);
    if (!archive) {
        store_.release_deletion(archive_id);
        return false;
    }

    log_info("sweeper", "delete %lld parts=%u/%u", static_cast<long long>(archive_id),
             archive->deleted_parts, archive->delete_total_parts);

    uint32_t skip = archive->deleted_parts;
    uint32_t seen = 0;
    for (const auto& part : archive->parts) {
        if (seen++ < skip) continue;

        BlobBackend* backend = backends_.find(part.webhook_id);
        if (!backend) {
            log_warn("sweeper", "archive %lld part %u: backend '%s' not configured, dropping record",
                     static_cast<long long>(archive_id), part.index, part.webhook_id.c_str());
        } else {
            try {
                backend->remove(BlobRef{part.url, part.message_id, part.webhook_id, part.file_id});
            } catch (const Error& e) {
                if (e.kind() != ErrorKind::NotFound) {
                    log_warn("sweeper", "archive %lld part %u: %s, stopping at %u/%u",
                             static_cast<long long>(archive_id), part.index, e.what(),
                             seen - 1, archive->delete_total_parts);
                    counters_.failures++;
                    store_.release_deletion(archive_id);
                    return false;
                }
            }
        }

        store_.increment_deleted(archive_id);
        counters_.parts_deleted++;
    }

    store_.finish_deletion(archive_id);
    quota_->adjust_used_bytes(archive->owner_id, -static_cast<int64_t>(archive->original_size));

    if (!archive->staging_dir.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(archive->staging_dir, ec);
    }

    counters_.archives_deleted++;
    log_info("sweeper", "deleted %lld (%zu parts, %llu bytes released)",
             static_cast<long long>(archive_id), archive->parts.size(),
             static_cast<unsigned long long>(archive->original_size));
    return true;
}

}  // namespace hookvault
