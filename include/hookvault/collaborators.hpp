#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hookvault {

class ArchiveStore;

/// Per-owner byte accounting. Incremented once when an archive is created
/// and decremented once when its deletion completes.
class QuotaService {
public:
    virtual ~QuotaService() = default;
    virtual void adjust_used_bytes(const std::string& owner_id, int64_t delta) = 0;
};

/// Keeps the counter in the manifest's owners table.
class SqliteQuotaService : public QuotaService {
public:
    explicit SqliteQuotaService(ArchiveStore& store) : store_(store) {}
    void adjust_used_bytes(const std::string& owner_id, int64_t delta) override;

private:
    ArchiveStore& store_;
};

struct ShareGrant {
    std::vector<int64_t> archive_ids;
    int64_t expires_at = 0;  // epoch seconds, 0 = never
};

/// Resolves public share tokens. Owned by whatever serves shares.
class ShareLookup {
public:
    virtual ~ShareLookup() = default;
    virtual std::optional<ShareGrant> resolve(const std::string& token) = 0;
};

/// Notified after an archive record is created (file-type detection,
/// thumbnails). Exceptions thrown here are logged and otherwise ignored.
/// Results go back through Vault::record_thumbnail().
class ArchiveObserver {
public:
    virtual ~ArchiveObserver() = default;
    virtual void on_archive_created(int64_t archive_id) = 0;
};

}  // namespace hookvault
