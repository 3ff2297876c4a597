#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hookvault {

/// One slice of a payload written to scratch space by the splitter.
struct PartFile {
    uint32_t index = 0;
    std::filesystem::path path;
    uint64_t size = 0;
    std::string hash;  // SHA-256 hex of the bytes on disk
};

/// `<dir>/part_<index>`
std::filesystem::path part_file_path(const std::filesystem::path& dir, uint32_t index);

/// Number of parts a payload of `payload_size` bytes splits into. Never 0.
uint32_t expected_part_count(uint64_t payload_size, uint64_t chunk_size);

/// Stream `source` into consecutive part files of `chunk_size` bytes (the last
/// one may be shorter) under `out_dir`, hashing each as it is written. Reads
/// never run ahead of an accepted write. An empty source yields a single
/// empty part.
///
/// On a failed write the in-progress part file is removed and
/// Error{ResourceExhausted} propagates; completed parts stay on disk.
std::vector<PartFile> split_into_parts(const std::filesystem::path& source, uint64_t chunk_size,
                                       const std::filesystem::path& out_dir);

}  // namespace hookvault
