#include "hookvault/zip.hpp"
#include "hookvault/error.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <new>
#include <stdexcept>

namespace hookvault {

namespace fs = std::filesystem;

namespace {

// 1980-01-02 00:00 UTC keeps the DOS date valid in every time zone
constexpr time_t kEntryMtime = 315619200;
constexpr size_t kCopyBufferSize = 64 * 1024;

struct WriterFree {
    void operator()(struct archive* ar) const { archive_write_free(ar); }
};
struct EntryFree {
    void operator()(struct archive_entry* entry) const { archive_entry_free(entry); }
};
using WriterPtr = std::unique_ptr<struct archive, WriterFree>;
using EntryPtr = std::unique_ptr<struct archive_entry, EntryFree>;

// Output of the zip writer. Blocking is off, so `written` is exact after
// every libarchive call and marks where the next entry's data begins.
struct CountingOutput {
    std::ofstream out;
    uint64_t written = 0;
};

la_ssize_t write_counted(struct archive* ar, void* client, const void* buffer, size_t length) {
    auto* output = static_cast<CountingOutput*>(client);
    output->out.write(static_cast<const char*>(buffer), static_cast<std::streamsize>(length));
    if (!output->out) {
        archive_set_error(ar, EIO, "write to bundle failed");
        return -1;
    }
    output->written += length;
    return static_cast<la_ssize_t>(length);
}

[[noreturn]] void writer_failed(struct archive* ar, const std::string& what) {
    const char* reason = archive_error_string(ar);
    throw Error(ErrorKind::ResourceExhausted,
                what + ": " + (reason ? reason : "libarchive error"));
}

}  // namespace

std::vector<ZipEntryLayout> write_stored_zip(const std::vector<ZipSource>& sources,
                                             const fs::path& output) {
    CountingOutput sink;
    sink.out.open(output, std::ios::binary | std::ios::trunc);
    if (!sink.out) {
        throw Error(ErrorKind::ResourceExhausted, "cannot create " + output.string());
    }

    WriterPtr ar(archive_write_new());
    if (!ar) throw std::bad_alloc();
    if (archive_write_set_format_zip(ar.get()) != ARCHIVE_OK ||
        archive_write_set_options(ar.get(), "zip:compression=store,zip:hdrcharset=UTF-8") != ARCHIVE_OK ||
        archive_write_set_bytes_per_block(ar.get(), 0) != ARCHIVE_OK) {
        writer_failed(ar.get(), "zip writer setup");
    }
    if (archive_write_open(ar.get(), &sink, nullptr, write_counted, nullptr) != ARCHIVE_OK) {
        writer_failed(ar.get(), "open " + output.string());
    }

    std::vector<ZipEntryLayout> layout;
    layout.reserve(sources.size());
    std::vector<char> buffer(kCopyBufferSize);

    for (const auto& source : sources) {
        std::error_code ec;
        uint64_t expected = fs::file_size(source.path, ec);
        std::ifstream in(source.path, std::ios::binary);
        if (ec || !in) {
            throw Error(ErrorKind::NotFound, "missing_file: " + source.path.string());
        }

        EntryPtr entry(archive_entry_new());
        if (!entry) throw std::bad_alloc();
        archive_entry_set_pathname_utf8(entry.get(), source.entry_name.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(expected));
        archive_entry_set_mtime(entry.get(), kEntryMtime, 0);
        if (archive_write_header(ar.get(), entry.get()) < ARCHIVE_WARN) {
            writer_failed(ar.get(), "zip header for " + source.entry_name);
        }

        ZipEntryLayout placed;
        placed.name = source.entry_name;
        placed.data_offset = sink.written;

        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got <= 0) break;
            if (archive_write_data(ar.get(), buffer.data(), static_cast<size_t>(got)) < 0) {
                writer_failed(ar.get(), "zip data for " + source.entry_name);
            }
            placed.size += static_cast<uint64_t>(got);
        }
        if (in.bad() || placed.size != expected) {
            throw Error(ErrorKind::NotFound,
                        source.path.string() + " changed while it was being bundled");
        }
        if (archive_write_finish_entry(ar.get()) < ARCHIVE_WARN) {
            writer_failed(ar.get(), "zip entry " + source.entry_name);
        }
        layout.push_back(std::move(placed));
    }

    if (archive_write_close(ar.get()) != ARCHIVE_OK) {
        writer_failed(ar.get(), "zip central directory");
    }
    sink.out.close();
    if (!sink.out) {
        throw Error(ErrorKind::ResourceExhausted, "flush failed on " + output.string());
    }
    return layout;
}

// --- ZipStreamReader ---

struct ZipReadCallbacks {
    static la_ssize_t read(struct archive* ar, void* client, const void** buffer) {
        auto* reader = static_cast<ZipStreamReader*>(client);
        try {
            const uint8_t* data = nullptr;
            size_t len = reader->pull_(&data);
            *buffer = data;
            return static_cast<la_ssize_t>(len);
        } catch (...) {
            // Must not unwind through libarchive; fail() rethrows it
            reader->pull_error_ = std::current_exception();
            archive_set_error(ar, EIO, "payload stream failed");
            return -1;
        }
    }
};

ZipStreamReader::ZipStreamReader(Pull pull) : ar_(archive_read_new()), pull_(std::move(pull)) {
    if (!ar_) throw std::bad_alloc();
    try {
        if (archive_read_support_format_zip_streamable(ar_) != ARCHIVE_OK) fail("zip reader setup");
        if (archive_read_open(ar_, this, nullptr, ZipReadCallbacks::read, nullptr) != ARCHIVE_OK) {
            fail("bundle is not a zip");
        }
    } catch (...) {
        archive_read_free(ar_);
        throw;
    }
}

ZipStreamReader::~ZipStreamReader() {
    archive_read_free(ar_);
}

void ZipStreamReader::fail(const char* what) {
    if (pull_error_) {
        auto error = pull_error_;
        pull_error_ = nullptr;
        std::rethrow_exception(error);
    }
    const char* reason = archive_error_string(ar_);
    throw Error(ErrorKind::FatalBackend,
                std::string(what) + ": " + (reason ? reason : "libarchive error"));
}

bool ZipStreamReader::seek_entry(size_t index) {
    if (index < next_entry_) {
        throw std::logic_error("zip entries can only be read front to back");
    }
    while (true) {
        struct archive_entry* entry = nullptr;
        int rc = archive_read_next_header(ar_, &entry);
        if (rc == ARCHIVE_EOF) return false;
        if (rc < ARCHIVE_WARN) fail("zip header");

        if (next_entry_++ == index) {
            const char* name = archive_entry_pathname(entry);
            entry_name_ = name ? name : "";
            positioned_ = true;
            return true;
        }
    }
}

bool ZipStreamReader::read_entry(const Emit& emit) {
    if (!positioned_) throw std::logic_error("read_entry without seek_entry");
    positioned_ = false;

    while (true) {
        const void* block = nullptr;
        size_t len = 0;
        la_int64_t offset = 0;
        int rc = archive_read_data_block(ar_, &block, &len, &offset);
        if (rc == ARCHIVE_EOF) return true;
        if (rc < ARCHIVE_WARN) fail("zip entry data");
        if (len > 0 && !emit(static_cast<const uint8_t*>(block), len)) return false;
    }
}

}  // namespace hookvault
