#pragma once

#include "hookvault/archive.hpp"
#include "hookvault/codec.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

namespace hookvault {

class BackendPool;
class MetricsExporter;

/// Consumer of restored plaintext.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Returns false when the consumer has gone away; the restore stops.
    virtual bool write(const uint8_t* data, size_t len) = 0;

    /// Every byte was delivered and verified.
    virtual void finish() {}

    /// The restore failed after `write` may already have been called.
    virtual void abort(const std::string& reason) { (void)reason; }
};

/// Writes to `<path>.partial` and renames on finish; removes it on abort.
class FileSink : public ByteSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    bool write(const uint8_t* data, size_t len) override;
    void finish() override;
    void abort(const std::string& reason) override;

    uint64_t bytes_written() const { return bytes_; }

private:
    std::filesystem::path path_;
    std::filesystem::path tmp_path_;
    std::ofstream out_;
    uint64_t bytes_ = 0;
    bool done_ = false;
};

enum class RestoreOutcome {
    Completed,
    Cancelled,  // the sink declined a write
};

struct RestoreSettings {
    size_t prefetch = 2;  // per-part parts fetched ahead of the one being emitted
};

/// Reassembles archive plaintext from the backends, strictly in part order.
///
/// Every fetched part is checked against its recorded SHA-256 before it is
/// decrypted. Per-part archives fetch up to `prefetch` parts ahead;
/// whole-archive archives fetch one part at a time through a single GCM
/// decryptor whose tag is verified before finish(). Any failure aborts the sink and throws
/// hookvault::Error. Archive records are never modified.
class RestoreEngine {
public:
    RestoreEngine(BackendPool& backends, const crypto::Key& key, RestoreSettings settings);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Whole payload, or one file of a bundle when `file_position` is set.
    RestoreOutcome stream(const Archive& archive, std::optional<uint32_t> file_position,
                          ByteSink& sink);

    /// Plaintext bytes [first, last] of a per-part, single-file archive.
    RestoreOutcome stream_range(const Archive& archive, uint64_t first, uint64_t last,
                                ByteSink& sink);

    struct Counters {
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> cancelled{0};
        std::atomic<uint64_t> bytes{0};
    };
    const Counters& counters() const { return counters_; }

private:
    // Plaintext range of the payload to emit, inclusive
    struct Window {
        uint64_t first = 0;
        uint64_t last = 0;
        bool empty = false;
    };

    RestoreOutcome run(const Archive& archive, ByteSink& sink,
                       const std::function<RestoreOutcome(ByteSink&)>& body);
    RestoreOutcome stream_per_part(const Archive& archive, const Window& window, ByteSink& sink);
    RestoreOutcome stream_whole(const Archive& archive, const WholeArchiveScheme& scheme,
                                std::optional<size_t> zip_entry, ByteSink& sink);
    /// Stored bytes of one part, checked against its recorded hash.
    crypto::Bytes fetch_part(const Archive& archive, const ArchivePart& part,
                             const std::atomic<bool>* cancel);

    BackendPool& backends_;
    crypto::Key key_;
    RestoreSettings settings_;
    MetricsExporter* metrics_ = nullptr;
    Counters counters_;
};

}  // namespace hookvault
