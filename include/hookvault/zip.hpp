#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct archive;

namespace hookvault {

/// Bundles are zip files whose entries are all stored uncompressed, so each
/// entry's bytes sit contiguously in the payload. Entry metadata is fixed
/// (timestamp, mode, owner) and the same inputs always produce the same
/// bytes, which a resumed upload depends on.

struct ZipSource {
    std::filesystem::path path;
    std::string entry_name;
};

/// Where an entry's data landed in the written bundle.
struct ZipEntryLayout {
    std::string name;
    uint64_t data_offset = 0;
    uint64_t size = 0;
};

/// Write `sources` as a stored zip to `output` with libarchive. Returns one
/// layout per source, in order. Throws Error{ResourceExhausted} when the
/// bundle cannot be written and Error{NotFound} when a source is unreadable
/// or changes size while it is being copied.
std::vector<ZipEntryLayout> write_stored_zip(const std::vector<ZipSource>& sources,
                                             const std::filesystem::path& output);

/// Forward-only zip reader over bytes that only exist as a stream, such as
/// the decrypted payload of a whole-archive bundle. Each call to `pull`
/// hands out the next block, which must stay valid until the next call; a
/// return of 0 ends the stream. Exceptions thrown by `pull` come back out of
/// seek_entry() and read_entry() unchanged.
class ZipStreamReader {
public:
    using Pull = std::function<size_t(const uint8_t** data)>;
    using Emit = std::function<bool(const uint8_t* data, size_t len)>;

    explicit ZipStreamReader(Pull pull);
    ~ZipStreamReader();

    ZipStreamReader(const ZipStreamReader&) = delete;
    ZipStreamReader& operator=(const ZipStreamReader&) = delete;

    /// Advance to entry `index` in archive order. Returns false when the
    /// archive ends first. Entries can only be visited front to back.
    bool seek_entry(size_t index);

    /// Hand the current entry's data to `emit`. Returns false as soon as
    /// `emit` does.
    bool read_entry(const Emit& emit);

    /// Name of the entry seek_entry() stopped on.
    const std::string& entry_name() const { return entry_name_; }

private:
    friend struct ZipReadCallbacks;

    [[noreturn]] void fail(const char* what);

    struct archive* ar_ = nullptr;
    Pull pull_;
    std::exception_ptr pull_error_;
    size_t next_entry_ = 0;
    bool positioned_ = false;
    std::string entry_name_;
};

}  // namespace hookvault
