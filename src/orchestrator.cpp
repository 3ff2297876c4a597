#include "hookvault/orchestrator.hpp"
#include "hookvault/archive_store.hpp"
#include "hookvault/backend.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"
#include "hookvault/metrics.hpp"
#include "hookvault/worker_pool.hpp"
#include "hookvault/zip.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <optional>
#include <set>

namespace hookvault {

namespace fs = std::filesystem;

namespace {

crypto::Bytes read_part(const fs::path& path, uint64_t expected_size) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw Error(ErrorKind::ResourceExhausted, "cannot read part file " + path.string());
    }
    crypto::Bytes data(static_cast<size_t>(expected_size));
    if (expected_size > 0) {
        ifs.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (static_cast<uint64_t>(ifs.gcount()) != expected_size) {
            throw Error(ErrorKind::ResourceExhausted, "short read on part file " + path.string());
        }
    }
    return data;
}

}  // namespace

UploadOrchestrator::UploadOrchestrator(ArchiveStore& store, BackendPool& backends,
                                       const crypto::Key& key, UploadSettings settings)
    : store_(store), backends_(backends), key_(key), settings_(std::move(settings)) {}

UploadOutcome UploadOrchestrator::process(int64_t archive_id) {
    auto loaded = store_.get(archive_id);
    if (!loaded) {
        log_warn("upload", "archive %lld vanished before processing", static_cast<long long>(archive_id));
        return UploadOutcome::Skipped;
    }
    const Archive& archive = *loaded;

    auto work_dir = settings_.work_root / std::to_string(archive.id);
    log_info("upload", "start %lld name=%s parts_done=%u priority=%d",
             static_cast<long long>(archive.id), archive.name.c_str(), archive.uploaded_parts,
             archive.priority);

    try {
        fs::create_directories(work_dir);

        auto payload = build_payload(archive, work_dir);
        auto parts = stage_parts(archive, payload, work_dir);

        uint64_t encrypted_size = 0;
        for (const auto& p : parts) encrypted_size += p.size;
        auto total = static_cast<uint32_t>(parts.size());
        store_.set_layout(archive.id, total, encrypted_size);

        // Resume: recorded parts must still line up with this split
        bool whole = std::holds_alternative<WholeArchiveScheme>(archive.scheme());
        for (const auto& recorded : archive.parts) {
            if (recorded.index >= total) {
                throw Error(ErrorKind::FatalBackend,
                            "recorded part " + std::to_string(recorded.index) +
                                " is beyond the payload's " + std::to_string(total) + " parts");
            }
            if (whole && recorded.hash != parts[recorded.index].hash) {
                throw Error(ErrorKind::AuthenticationFailed,
                            "recorded part " + std::to_string(recorded.index) +
                                " does not match the re-encrypted payload");
            }
        }

        upload_parts(archive, parts);

        if (!store_.mark_ready(archive.id)) {
            if (shutting_down()) {
                log_info("upload", "interrupted %lld", static_cast<long long>(archive.id));
                return UploadOutcome::Interrupted;
            }
            throw Error(ErrorKind::FatalBackend, "not every part was recorded");
        }

        log_info("upload", "ready %lld parts=%u bytes=%llu", static_cast<long long>(archive.id),
                 total, static_cast<unsigned long long>(encrypted_size));
        counters_.archives_completed++;

        release_dir(work_dir.string());
        if (settings_.delete_staging_after_upload) {
            release_dir(archive.staging_dir);
        }
        return UploadOutcome::Ready;
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled && shutting_down()) {
            log_info("upload", "interrupted %lld", static_cast<long long>(archive.id));
            return UploadOutcome::Interrupted;
        }

        bool retryable = e.retryable();
        store_.mark_error(archive.id, e.what(), retryable);
        bool permanent = !retryable || archive.retry_count + 1 >= settings_.archive_retry_max;
        log_error("upload", "error %lld (%s, attempt %u/%u%s): %s",
                  static_cast<long long>(archive.id), error_kind_name(e.kind()),
                  archive.retry_count + 1, settings_.archive_retry_max,
                  permanent ? ", permanent" : "", e.what());

        counters_.archives_failed++;
        release_dir(work_dir.string());
        if (permanent) release_dir(archive.staging_dir);
        return UploadOutcome::Failed;
    } catch (const std::exception& e) {
        store_.mark_error(archive.id, e.what(), false);
        log_error("upload", "error %lld (permanent): %s", static_cast<long long>(archive.id), e.what());

        counters_.archives_failed++;
        release_dir(work_dir.string());
        release_dir(archive.staging_dir);
        return UploadOutcome::Failed;
    }
}

fs::path UploadOrchestrator::build_payload(const Archive& archive, const fs::path& work_dir) {
    if (archive.files.empty()) {
        throw Error(ErrorKind::NotFound, "missing_file: archive has no files");
    }

    if (!archive.is_bundle) {
        fs::path source = archive.files[0].path;
        if (!fs::is_regular_file(source)) {
            throw Error(ErrorKind::NotFound, "missing_file: " + source.string());
        }
        return source;
    }

    std::vector<ZipSource> sources;
    for (const auto& f : archive.files) {
        if (!fs::is_regular_file(f.path)) {
            throw Error(ErrorKind::NotFound, "missing_file: " + f.path);
        }
        sources.push_back({f.path, f.name});
    }

    auto zip_path = work_dir / "archive.zip";
    auto layout = write_stored_zip(sources, zip_path);

    // Range restores of a single entry read these back
    std::vector<uint64_t> offsets;
    offsets.reserve(layout.size());
    for (const auto& entry : layout) offsets.push_back(entry.data_offset);
    store_.set_zip_offsets(archive.id, offsets);
    return zip_path;
}

std::vector<PartFile> UploadOrchestrator::stage_parts(const Archive& archive, const fs::path& payload,
                                                      const fs::path& work_dir) {
    auto scheme = archive.scheme();
    auto parts_dir = work_dir / "parts";

    if (std::holds_alternative<PerPartScheme>(scheme)) {
        return split_into_parts(payload, archive.chunk_size_bytes, parts_dir);
    }

    const auto& whole = std::get<WholeArchiveScheme>(scheme);
    auto cipher_path = work_dir / "archive.enc";
    std::optional<crypto::Bytes> iv;
    if (!whole.iv.empty()) iv = whole.iv;

    auto sealed = crypto::encrypt_file(payload, cipher_path, key_, iv);
    if (whole.iv.empty()) {
        store_.set_whole_archive_key(archive.id, sealed.iv, sealed.tag);
    } else if (!whole.auth_tag.empty() && whole.auth_tag != sealed.tag) {
        throw Error(ErrorKind::AuthenticationFailed,
                    "payload changed since the first attempt (tag mismatch)");
    }

    auto parts = split_into_parts(cipher_path, archive.chunk_size_bytes, parts_dir);
    std::error_code ec;
    fs::remove(cipher_path, ec);
    return parts;
}

void UploadOrchestrator::upload_parts(const Archive& archive, const std::vector<PartFile>& parts) {
    std::set<uint32_t> recorded;
    for (const auto& p : archive.parts) recorded.insert(p.index);

    std::vector<const PartFile*> pending;
    for (const auto& p : parts) {
        if (!recorded.count(p.index)) pending.push_back(&p);
    }
    if (pending.empty()) return;

    size_t concurrency = std::max<size_t>(1, std::min(settings_.parts_concurrency, backends_.size()));
    log_info("upload", "upload %lld parts=%zu/%zu concurrency=%zu", static_cast<long long>(archive.id),
             pending.size(), parts.size(), concurrency);

    std::atomic<bool> failed{false};
    std::atomic<uint32_t> done{static_cast<uint32_t>(recorded.size())};
    WorkerPool pool(concurrency);

    std::vector<std::future<void>> futures;
    futures.reserve(pending.size());
    for (const PartFile* part : pending) {
        futures.push_back(pool.submit([this, &archive, part, &failed, &done, &parts] {
            // A failed sibling or shutdown makes the remaining parts pointless
            if (failed.load() || shutting_down()) return;
            try {
                auto record = upload_one(archive, *part);
                store_.record_part(archive.id, record);
            } catch (...) {
                failed = true;
                throw;
            }
            counters_.parts_uploaded++;
            counters_.bytes_uploaded += part->size;

            auto n = ++done;
            if (verbose_logging() || n % 10 == 0 || n == parts.size()) {
                log_info("upload", "progress %lld %u/%zu", static_cast<long long>(archive.id), n,
                         parts.size());
            }
        }));
    }

    // Wait for everything before surfacing the first failure
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

ArchivePart UploadOrchestrator::upload_one(const Archive& archive, const PartFile& part) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->part_upload_duration());

    auto data = read_part(part.path, part.size);

    ArchivePart record;
    record.index = part.index;
    record.plain_size = part.size;

    if (std::holds_alternative<PerPartScheme>(archive.scheme())) {
        record.iv = crypto::random_iv();
        crypto::GcmEncryptor enc(key_, record.iv);
        crypto::Bytes sealed;
        enc.update(data.data(), data.size(), sealed);
        record.auth_tag = enc.finish();
        data = std::move(sealed);
        record.hash = crypto::sha256_hex(data);
    } else {
        record.hash = part.hash;
    }
    record.size = data.size();

    auto& backend = backends_.for_part(part.index);
    auto ref = backend.upload(data, "part_" + std::to_string(part.index),
                              "archive:" + std::to_string(archive.id) + " part:" +
                                  std::to_string(part.index));
    record.url = ref.url;
    record.message_id = ref.message_id;
    record.webhook_id = ref.webhook_id;
    record.file_id = ref.file_id;
    return record;
}

void UploadOrchestrator::release_dir(const std::string& dir) {
    if (dir.empty()) return;
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        log_warn("upload", "cannot remove %s: %s", dir.c_str(), ec.message().c_str());
    }
}

}  // namespace hookvault
