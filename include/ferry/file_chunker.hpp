#pragma once

#include "ferry/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry {

inline constexpr const char* kChunkPrefix = "chunk_";
inline constexpr int kChunkSuffixDigits = 4;
inline constexpr std::size_t kMaxChunks = 10000;
inline constexpr std::size_t kCopyBufferSize = 1024 * 1024; // 1 MiB

// One artifact split across N parts; chunks are in ascending suffix order.
struct ChunkSet {
    std::filesystem::path dir;
    std::vector<std::filesystem::path> chunks;
    std::uint64_t total_bytes{0};
};

class FileChunker {
public:
    explicit FileChunker(std::uint64_t chunk_size_bytes);

    // Writes chunk_0000, chunk_0001, ... into dest_dir (created if missing).
    // A file smaller than one chunk, or empty, yields exactly one chunk.
    Result Split(const std::filesystem::path &file, const std::filesystem::path &dest_dir,
                 ChunkSet &out) const;

    // Concatenates every `<prefix>*` file in chunk_dir, in ascending filename
    // order, into out_file. Refuses to overwrite an existing out_file.
    static Result Join(const std::filesystem::path &chunk_dir, const std::string &prefix,
                       const std::filesystem::path &out_file);

    static std::vector<std::filesystem::path> ListChunks(const std::filesystem::path &chunk_dir,
                                                         const std::string &prefix);

    static std::string ChunkName(std::size_t index);

private:
    std::uint64_t chunk_size_bytes_;
};

} // namespace ferry
