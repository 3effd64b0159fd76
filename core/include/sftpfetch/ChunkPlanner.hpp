// Splits a remote file into contiguous byte ranges fetched in parallel.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sftpfetch {

constexpr int kDefaultConcurrency = 8;
// Each chunk holds its own SSH session and thread.
constexpr int kMaxConcurrency = 64;
constexpr std::uint64_t kDefaultSmallFileThreshold = 10ull * 1024 * 1024;

struct ChunkRange {
    int index = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0; // exclusive

    std::uint64_t length() const { return end - start; }
};

// Files below smallFileThreshold get a single range spanning the whole file.
// Otherwise `degree` ranges of totalSize/degree bytes are produced and the
// last one absorbs the remainder. Fails (InvalidConfiguration) if degree is
// outside [1, kMaxConcurrency].
bool planChunks(std::uint64_t totalSize,
                int degree,
                std::uint64_t smallFileThreshold,
                std::vector<ChunkRange>& out,
                std::string& err);

// Temporary sink for one chunk: "<localPath>.part<index>".
std::string chunkPartPath(const std::string& localPath, int index);

} // namespace sftpfetch
