#pragma once

#include "hookvault/archive.hpp"
#include "hookvault/chunker.hpp"
#include "hookvault/codec.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>

namespace hookvault {

class ArchiveStore;
class BackendPool;
class MetricsExporter;

struct UploadSettings {
    size_t parts_concurrency = 2;
    uint32_t archive_retry_max = 5;
    bool delete_staging_after_upload = true;
    std::filesystem::path work_root;  // per-archive scratch: <work_root>/<id>
};

enum class UploadOutcome {
    Ready,
    Failed,
    Interrupted,  // shutdown mid-upload; the archive stays processing until recovery
    Skipped,      // record vanished
};

/// Drives one claimed archive from processing to ready or error.
///
/// Payload: the single staged file, or a stored zip of the staged files for
/// bundles. Whole-archive mode (v1) encrypts the payload once and splits the
/// ciphertext; the IV and tag are persisted before the first part upload so
/// a retried archive reproduces byte-identical parts. Per-part mode (v2)
/// splits the plaintext and seals every part with its own IV inside its
/// upload task.
///
/// Parts already recorded are skipped; new parts are recorded by index as
/// they complete, in any order. Failures become status error with
/// retry_count + 1; the staging directory survives until the error is
/// permanent.
class UploadOrchestrator {
public:
    UploadOrchestrator(ArchiveStore& store, BackendPool& backends, const crypto::Key& key,
                       UploadSettings settings);

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Raised by the owner on shutdown; pending part uploads are abandoned.
    void set_shutdown_flag(const std::atomic<bool>* flag) { shutdown_ = flag; }

    /// Process an archive the caller has already claimed.
    UploadOutcome process(int64_t archive_id);

    struct Counters {
        std::atomic<uint64_t> archives_completed{0};
        std::atomic<uint64_t> archives_failed{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };
    const Counters& counters() const { return counters_; }

private:
    std::filesystem::path build_payload(const Archive& archive, const std::filesystem::path& work_dir);
    std::vector<PartFile> stage_parts(const Archive& archive, const std::filesystem::path& payload,
                                      const std::filesystem::path& work_dir);
    void upload_parts(const Archive& archive, const std::vector<PartFile>& parts);
    ArchivePart upload_one(const Archive& archive, const PartFile& part);
    void release_dir(const std::string& dir);
    bool shutting_down() const { return shutdown_ && shutdown_->load(); }

    ArchiveStore& store_;
    BackendPool& backends_;
    crypto::Key key_;
    UploadSettings settings_;
    MetricsExporter* metrics_ = nullptr;
    const std::atomic<bool>* shutdown_ = nullptr;
    Counters counters_;
};

}  // namespace hookvault
