#include "ferry/file_chunker.hpp"

#include "ferry/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ferry {

FileChunker::FileChunker(std::uint64_t chunk_size_bytes) : chunk_size_bytes_(chunk_size_bytes) {
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

std::string FileChunker::ChunkName(std::size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%0*zu", kChunkPrefix, kChunkSuffixDigits, index);
    return buf;
}

Result FileChunker::Split(const fs::path &file, const fs::path &dest_dir, ChunkSet &out) const {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Result::Fail(ENOENT, "split: not a regular file: " + file.string());
    }
    const auto file_size = fs::file_size(file, ec);
    if (ec) {
        return Result::Fail(ec.value(), "split: cannot stat " + file.string() + ": " + ec.message());
    }

    const std::uint64_t count =
        file_size == 0 ? 1 : (file_size + chunk_size_bytes_ - 1) / chunk_size_bytes_;
    if (count > kMaxChunks) {
        return Result::Fail(EFBIG, "split: " + std::to_string(count) + " chunks exceed the " +
                                       std::to_string(kMaxChunks) + "-chunk suffix space");
    }

    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "split: create_directories failed: " + dest_dir.string() +
                                            ": " + ec.message());
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Result::Fail(errno, "split: cannot open " + file.string());
    }

    ChunkSet set;
    set.dir = dest_dir;
    set.chunks.reserve(static_cast<std::size_t>(count));

    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size_bytes_, kCopyBufferSize)));

    for (std::uint64_t i = 0; i < count; ++i) {
        const fs::path chunk_path = dest_dir / ChunkName(static_cast<std::size_t>(i));
        std::ofstream chunk(chunk_path, std::ios::binary | std::ios::trunc);
        if (!chunk) {
            return Result::Fail(errno, "split: cannot create " + chunk_path.string());
        }

        std::uint64_t remaining = std::min<std::uint64_t>(chunk_size_bytes_, file_size - set.total_bytes);
        while (remaining > 0) {
            const auto want = static_cast<std::streamsize>(
                std::min<std::uint64_t>(remaining, buffer.size()));
            in.read(buffer.data(), want);
            const auto got = in.gcount();
            if (got <= 0) {
                return Result::Fail(EIO, "split: short read from " + file.string());
            }
            chunk.write(buffer.data(), got);
            if (!chunk) {
                return Result::Fail(EIO, "split: write failed: " + chunk_path.string());
            }
            remaining -= static_cast<std::uint64_t>(got);
            set.total_bytes += static_cast<std::uint64_t>(got);
        }

        set.chunks.push_back(chunk_path);
    }

    LogDebug("split %s into %zu chunk(s) of at most %llu bytes", file.string().c_str(),
             set.chunks.size(), (unsigned long long)chunk_size_bytes_);
    out = std::move(set);
    return Result::Ok();
}

std::vector<fs::path> FileChunker::ListChunks(const fs::path &chunk_dir, const std::string &prefix) {
    std::vector<fs::path> chunks;
    std::error_code ec;
    for (fs::directory_iterator it(chunk_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0) {
            chunks.push_back(it->path());
        }
    }
    std::sort(chunks.begin(), chunks.end(),
              [](const fs::path &a, const fs::path &b) { return a.filename() < b.filename(); });
    return chunks;
}

Result FileChunker::Join(const fs::path &chunk_dir, const std::string &prefix, const fs::path &out_file) {
    std::error_code ec;
    if (!fs::is_directory(chunk_dir, ec)) {
        return Result::Fail(ENOTDIR, "join: not a directory: " + chunk_dir.string());
    }
    if (fs::exists(out_file, ec)) {
        return Result::Fail(EEXIST, "join: output already exists: " + out_file.string());
    }

    const auto chunks = ListChunks(chunk_dir, prefix);
    if (chunks.empty()) {
        return Result::Fail(ENOENT, "join: no " + prefix + "* files in " + chunk_dir.string());
    }

    std::ofstream out(out_file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result::Fail(errno, "join: cannot create " + out_file.string());
    }

    std::vector<char> buffer(kCopyBufferSize);
    for (const auto &chunk_path : chunks) {
        std::ifstream in(chunk_path, std::ios::binary);
        if (!in) {
            return Result::Fail(errno, "join: cannot open " + chunk_path.string());
        }
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = in.gcount();
            if (got <= 0) break;
            out.write(buffer.data(), got);
            if (!out) {
                return Result::Fail(EIO, "join: write failed: " + out_file.string());
            }
        }
    }

    out.flush();
    if (!out) {
        return Result::Fail(EIO, "join: flush failed: " + out_file.string());
    }
    LogDebug("joined %zu chunk(s) into %s", chunks.size(), out_file.string().c_str());
    return Result::Ok();
}

} // namespace ferry
