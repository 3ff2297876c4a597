#include "hookvault/chunker.hpp"
#include "hookvault/codec.hpp"
#include "hookvault/error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace hookvault {

namespace fs = std::filesystem;

namespace {

// Removes the part file we were writing, or the link standing in its
// place. A link is unlinked, never its target.
void discard_partial(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (fs::is_regular_file(status) || fs::is_symlink(status)) {
        fs::remove(path, ec);
    }
}

}  // namespace

fs::path part_file_path(const fs::path& dir, uint32_t index) {
    return dir / ("part_" + std::to_string(index));
}

uint32_t expected_part_count(uint64_t payload_size, uint64_t chunk_size) {
    if (chunk_size == 0 || payload_size == 0) return 1;
    return static_cast<uint32_t>((payload_size + chunk_size - 1) / chunk_size);
}

std::vector<PartFile> split_into_parts(const fs::path& source, uint64_t chunk_size,
                                       const fs::path& out_dir) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + source.string() + ": " + strerror(errno));
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        throw Error(ErrorKind::ResourceExhausted,
                    "cannot create " + out_dir.string() + ": " + ec.message());
    }

    std::vector<PartFile> parts;
    std::vector<char> buffer(crypto::kStreamBufferSize);
    bool eof = false;

    while (!eof) {
        PartFile part;
        part.index = static_cast<uint32_t>(parts.size());
        part.path = part_file_path(out_dir, part.index);

        std::ofstream out(part.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            int err = errno;
            discard_partial(part.path);
            throw Error(ErrorKind::ResourceExhausted,
                        "cannot create " + part.path.string() + ": " + strerror(err));
        }

        crypto::Sha256 hasher;
        while (part.size < chunk_size) {
            auto want = static_cast<std::streamsize>(
                std::min<uint64_t>(buffer.size(), chunk_size - part.size));
            in.read(buffer.data(), want);
            auto got = in.gcount();
            if (got > 0) {
                out.write(buffer.data(), got);
                if (!out) {
                    int err = errno;
                    out.close();
                    discard_partial(part.path);
                    throw Error(ErrorKind::ResourceExhausted,
                                "write failed on " + part.path.string() + ": " + strerror(err));
                }
                hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()),
                              static_cast<size_t>(got));
                part.size += static_cast<uint64_t>(got);
            }
            if (got < want) {
                if (in.bad()) {
                    out.close();
                    discard_partial(part.path);
                    throw std::runtime_error("read failed on " + source.string());
                }
                eof = true;
                break;
            }
        }

        out.close();
        if (!out.good()) {
            discard_partial(part.path);
            throw Error(ErrorKind::ResourceExhausted, "flush failed on " + part.path.string());
        }

        // A source that is an exact multiple of chunk_size leaves an empty
        // trailing slice; keep it only when it is the sole part
        if (part.size == 0 && !parts.empty()) {
            discard_partial(part.path);
            break;
        }

        part.hash = hasher.hex_digest();
        parts.push_back(std::move(part));

        if (!eof && in.peek() == std::char_traits<char>::eof()) {
            eof = true;
        }
    }

    return parts;
}

}  // namespace hookvault
