#include "sftpfetch/ChunkPlanner.hpp"

namespace sftpfetch {

bool planChunks(std::uint64_t totalSize,
                int degree,
                std::uint64_t smallFileThreshold,
                std::vector<ChunkRange>& out,
                std::string& err) {
    out.clear();
    if (degree < 1) {
        err = "Concurrency degree must be at least 1 (got " + std::to_string(degree) + ")";
        return false;
    }
    if (degree > kMaxConcurrency) {
        err = "Concurrency degree must be at most " + std::to_string(kMaxConcurrency) + " (got " +
              std::to_string(degree) + ")";
        return false;
    }

    if (totalSize < smallFileThreshold) {
        out.push_back(ChunkRange{0, 0, totalSize});
        return true;
    }

    const std::uint64_t chunkSize = totalSize / (std::uint64_t)degree;
    out.reserve((std::size_t)degree);
    for (int i = 0; i < degree; ++i) {
        ChunkRange r;
        r.index = i;
        r.start = (std::uint64_t)i * chunkSize;
        r.end = (i == degree - 1) ? totalSize : (std::uint64_t)(i + 1) * chunkSize;
        out.push_back(r);
    }
    return true;
}

std::string chunkPartPath(const std::string& localPath, int index) {
    return localPath + ".part" + std::to_string(index);
}

} // namespace sftpfetch
