#include "hookvault/restore_engine.hpp"
#include "hookvault/backend.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"
#include "hookvault/metrics.hpp"
#include "hookvault/zip.hpp"

#include <algorithm>
#include <deque>
#include <future>

namespace hookvault {

namespace fs = std::filesystem;

// --- FileSink ---

FileSink::FileSink(fs::path path) : path_(std::move(path)) {
    tmp_path_ = path_;
    tmp_path_ += ".partial";
    out_.open(tmp_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw Error(ErrorKind::ResourceExhausted, "cannot create " + tmp_path_.string());
    }
}

FileSink::~FileSink() {
    if (!done_) {
        out_.close();
        std::error_code ec;
        fs::remove(tmp_path_, ec);
    }
}

bool FileSink::write(const uint8_t* data, size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out_) {
        throw Error(ErrorKind::ResourceExhausted, "write failed on " + tmp_path_.string());
    }
    bytes_ += len;
    return true;
}

void FileSink::finish() {
    out_.close();
    if (!out_) {
        throw Error(ErrorKind::ResourceExhausted, "close failed on " + tmp_path_.string());
    }
    std::error_code ec;
    fs::rename(tmp_path_, path_, ec);
    if (ec) {
        throw Error(ErrorKind::ResourceExhausted,
                    "rename " + tmp_path_.string() + " failed: " + ec.message());
    }
    done_ = true;
}

void FileSink::abort(const std::string& reason) {
    log_warn("restore", "discarding %s: %s", tmp_path_.c_str(), reason.c_str());
    out_.close();
    std::error_code ec;
    fs::remove(tmp_path_, ec);
    done_ = true;
}

// --- Ordered prefetching fetcher ---

namespace {

/// Keeps up to `window` part fetches in flight while the caller consumes
/// them strictly in order. Leaving scope raises the cancel flag and waits
/// for whatever is still running.
class OrderedFetch {
public:
    using FetchFn = std::function<crypto::Bytes(const ArchivePart&, const std::atomic<bool>*)>;

    OrderedFetch(std::vector<const ArchivePart*> parts, size_t window, FetchFn fetch)
        : parts_(std::move(parts)), window_(std::max<size_t>(1, window)), fetch_(std::move(fetch)) {}

    ~OrderedFetch() {
        cancel_ = true;
        for (auto& f : in_flight_) {
            if (f.valid()) f.wait();
        }
    }

    OrderedFetch(const OrderedFetch&) = delete;
    OrderedFetch& operator=(const OrderedFetch&) = delete;

    bool done() const { return next_out_ >= parts_.size(); }

    /// Next part in order, blocking until it has arrived.
    crypto::Bytes next() {
        fill();
        auto future = std::move(in_flight_.front());
        in_flight_.pop_front();
        ++next_out_;
        auto bytes = future.get();
        fill();
        return bytes;
    }

private:
    void fill() {
        while (next_in_ < parts_.size() && in_flight_.size() < window_) {
            const ArchivePart* part = parts_[next_in_++];
            in_flight_.push_back(std::async(std::launch::async,
                                            [this, part] { return fetch_(*part, &cancel_); }));
        }
    }

    std::vector<const ArchivePart*> parts_;
    size_t window_;
    FetchFn fetch_;
    std::deque<std::future<crypto::Bytes>> in_flight_;
    std::atomic<bool> cancel_{false};
    size_t next_in_ = 0;
    size_t next_out_ = 0;
};

/// Decrypted payload of a whole-archive archive, handed out block by block.
/// One GCM stream covers every part, so parts are fetched strictly one at a
/// time.
class WholePlaintext {
public:
    WholePlaintext(std::vector<const ArchivePart*> parts, OrderedFetch::FetchFn fetch,
                   const crypto::Key& key, const WholeArchiveScheme& scheme)
        : fetch_(std::move(parts), 1, std::move(fetch)),
          decryptor_(key, scheme.iv, scheme.auth_tag) {}

    /// Next non-empty block, or 0 once every part is consumed. The block
    /// stays valid until the following call.
    size_t next(const uint8_t** data) {
        while (!fetch_.done()) {
            auto cipher = fetch_.next();
            block_.clear();
            decryptor_.update(cipher.data(), cipher.size(), block_);
            if (!block_.empty()) {
                *data = block_.data();
                return block_.size();
            }
        }
        *data = nullptr;
        return 0;
    }

    /// Consume whatever is left and verify the tag.
    void finish() {
        const uint8_t* rest = nullptr;
        while (next(&rest) > 0) {
        }
        decryptor_.finish();
    }

private:
    OrderedFetch fetch_;
    crypto::GcmDecryptor decryptor_;
    crypto::Bytes block_;
};

void check_contiguous(const Archive& archive) {
    if (archive.total_parts == 0 || archive.parts.size() != archive.total_parts) {
        throw Error(ErrorKind::FatalBackend,
                    "archive " + std::to_string(archive.id) + " has " +
                        std::to_string(archive.parts.size()) + " of " +
                        std::to_string(archive.total_parts) + " parts");
    }
    for (uint32_t i = 0; i < archive.parts.size(); ++i) {
        if (archive.parts[i].index != i) {
            throw Error(ErrorKind::FatalBackend,
                        "archive " + std::to_string(archive.id) + " is missing part " +
                            std::to_string(i));
        }
    }
}

}  // namespace

// --- RestoreEngine ---

RestoreEngine::RestoreEngine(BackendPool& backends, const crypto::Key& key, RestoreSettings settings)
    : backends_(backends), key_(key), settings_(settings) {}

RestoreOutcome RestoreEngine::stream(const Archive& archive, std::optional<uint32_t> file_position,
                                     ByteSink& sink) {
    return run(archive, sink, [&](ByteSink& out) {
        auto scheme = archive.scheme();
        const auto* whole = std::get_if<WholeArchiveScheme>(&scheme);

        auto whole_payload = [&]() {
            if (whole) return stream_whole(archive, *whole, std::nullopt, out);
            uint64_t total = 0;
            for (const auto& p : archive.parts) total += p.plain_size;
            Window w{0, total == 0 ? 0 : total - 1, total == 0};
            return stream_per_part(archive, w, out);
        };

        if (!file_position) return whole_payload();

        size_t entry = archive.files.size();
        for (size_t i = 0; i < archive.files.size(); ++i) {
            if (archive.files[i].position == *file_position) {
                entry = i;
                break;
            }
        }
        if (entry == archive.files.size() || archive.files[entry].deleted_at != 0) {
            throw Error(ErrorKind::NotFound, "file " + std::to_string(*file_position) +
                                                 " not found in archive " +
                                                 std::to_string(archive.id));
        }

        if (!archive.is_bundle) return whole_payload();
        if (whole) return stream_whole(archive, *whole, entry, out);

        // Offsets were recorded from the written zip when it was uploaded
        const auto& target = archive.files[entry];
        if (target.zip_offset == 0) {
            throw Error(ErrorKind::FatalBackend,
                        "bundle " + std::to_string(archive.id) + " has no recorded offset for entry " +
                            std::to_string(entry));
        }
        Window w{target.zip_offset, target.zip_offset + target.size - 1, target.size == 0};
        if (target.size == 0) w.last = target.zip_offset;
        return stream_per_part(archive, w, out);
    });
}

RestoreOutcome RestoreEngine::stream_range(const Archive& archive, uint64_t first, uint64_t last,
                                           ByteSink& sink) {
    return run(archive, sink, [&](ByteSink& out) {
        if (archive.is_bundle || !std::holds_alternative<PerPartScheme>(archive.scheme())) {
            throw Error(ErrorKind::Configuration,
                        "range reads need a per-part encrypted single-file archive");
        }
        uint64_t total = 0;
        for (const auto& p : archive.parts) total += p.plain_size;
        if (first > last || last >= total) {
            throw Error(ErrorKind::NotFound, "range " + std::to_string(first) + "-" +
                                                 std::to_string(last) + " outside " +
                                                 std::to_string(total) + " bytes");
        }
        return stream_per_part(archive, Window{first, last, false}, out);
    });
}

RestoreOutcome RestoreEngine::run(const Archive& archive, ByteSink& sink,
                                  const std::function<RestoreOutcome(ByteSink&)>& body) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->restore_duration());

    try {
        if (!archive.ready()) {
            throw Error(ErrorKind::NotFound, "archive " + std::to_string(archive.id) +
                                                 " is " + status_name(archive.status));
        }
        if (archive.deleted_at != 0 || archive.delete_requested_at != 0) {
            throw Error(ErrorKind::NotFound, "archive " + std::to_string(archive.id) + " is deleted");
        }
        check_contiguous(archive);

        auto outcome = body(sink);
        if (outcome == RestoreOutcome::Cancelled) {
            counters_.cancelled++;
            log_info("restore", "cancelled %lld", static_cast<long long>(archive.id));
            return outcome;
        }
        sink.finish();
        counters_.completed++;
        return outcome;
    } catch (const Error& e) {
        counters_.failed++;
        log_warn("restore", "archive %lld failed (%s): %s", static_cast<long long>(archive.id),
                 error_kind_name(e.kind()), e.what());
        sink.abort(e.what());
        throw;
    } catch (const std::exception& e) {
        counters_.failed++;
        log_warn("restore", "archive %lld failed: %s", static_cast<long long>(archive.id), e.what());
        sink.abort(e.what());
        throw Error(ErrorKind::FatalBackend, e.what());
    }
}

RestoreOutcome RestoreEngine::stream_per_part(const Archive& archive, const Window& window,
                                              ByteSink& sink) {
    if (window.empty) return RestoreOutcome::Completed;

    struct Slice {
        const ArchivePart* part;
        uint64_t begin;  // offset inside the part's plaintext
        uint64_t end;    // exclusive
    };
    std::vector<Slice> slices;
    uint64_t offset = 0;
    for (const auto& p : archive.parts) {
        uint64_t start = offset;
        offset += p.plain_size;
        if (p.plain_size == 0 || offset <= window.first || start > window.last) continue;
        uint64_t begin = std::max(window.first, start) - start;
        uint64_t end = std::min(window.last + 1, offset) - start;
        slices.push_back({&p, begin, end});
    }

    std::vector<const ArchivePart*> wanted;
    for (const auto& s : slices) wanted.push_back(s.part);

    OrderedFetch fetch(std::move(wanted), settings_.prefetch,
                       [this, &archive](const ArchivePart& part, const std::atomic<bool>* cancel) {
                           auto stored = fetch_part(archive, part, cancel);
                           return crypto::decrypt_buffer(stored, key_, part.iv, part.auth_tag);
                       });

    for (const auto& s : slices) {
        auto plain = fetch.next();
        if (plain.size() != s.part->plain_size) {
            throw Error(ErrorKind::FatalBackend,
                        "part " + std::to_string(s.part->index) + " decrypted to " +
                            std::to_string(plain.size()) + " bytes, expected " +
                            std::to_string(s.part->plain_size));
        }
        size_t len = static_cast<size_t>(s.end - s.begin);
        if (!sink.write(plain.data() + s.begin, len)) return RestoreOutcome::Cancelled;
        counters_.bytes += len;
    }
    return RestoreOutcome::Completed;
}

RestoreOutcome RestoreEngine::stream_whole(const Archive& archive, const WholeArchiveScheme& scheme,
                                           std::optional<size_t> zip_entry, ByteSink& sink) {
    std::vector<const ArchivePart*> wanted;
    for (const auto& p : archive.parts) wanted.push_back(&p);
    WholePlaintext plaintext(
        std::move(wanted),
        [this, &archive](const ArchivePart& part, const std::atomic<bool>* cancel) {
            return fetch_part(archive, part, cancel);
        },
        key_, scheme);

    if (!zip_entry) {
        const uint8_t* block = nullptr;
        while (size_t len = plaintext.next(&block)) {
            if (!sink.write(block, len)) return RestoreOutcome::Cancelled;
            counters_.bytes += len;
        }
        plaintext.finish();
        return RestoreOutcome::Completed;
    }

    ZipStreamReader reader([&plaintext](const uint8_t** data) { return plaintext.next(data); });
    if (!reader.seek_entry(*zip_entry)) {
        throw Error(ErrorKind::FatalBackend,
                    "entry " + std::to_string(*zip_entry) + " missing from bundle " +
                        std::to_string(archive.id));
    }
    bool delivered = reader.read_entry([&](const uint8_t* data, size_t len) {
        if (!sink.write(data, len)) return false;
        counters_.bytes += len;
        return true;
    });
    if (!delivered) return RestoreOutcome::Cancelled;

    plaintext.finish();
    return RestoreOutcome::Completed;
}

crypto::Bytes RestoreEngine::fetch_part(const Archive& archive, const ArchivePart& part,
                                        const std::atomic<bool>* cancel) {
    BlobBackend* backend = backends_.find(part.webhook_id);
    if (!backend) {
        throw Error(ErrorKind::NotFound, "no backend configured for '" + part.webhook_id + "'");
    }

    BlobRef ref{part.url, part.message_id, part.webhook_id, part.file_id};
    auto stored = backend->fetch(ref, cancel);

    if (crypto::sha256_hex(stored) != part.hash) {
        throw Error(ErrorKind::AuthenticationFailed,
                    "hash mismatch on part " + std::to_string(part.index) + " of archive " +
                        std::to_string(archive.id));
    }
    return stored;
}

}  // namespace hookvault
