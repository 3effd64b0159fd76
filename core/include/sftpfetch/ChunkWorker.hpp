#pragma once
#include "ChunkPlanner.hpp"
#include "SftpClient.hpp"
#include <cstddef>
#include <functional>
#include <optional>

namespace sftpfetch {

constexpr std::size_t kReadBlockSize = 64 * 1024;

struct ChunkResult {
    int index = 0;
    std::uint64_t bytesWritten = 0;
    std::optional<ErrorKind> error;
    std::string message;

    bool ok() const { return !error.has_value(); }
};

using ProgressDeltaCB = std::function<void(std::uint64_t /*bytesDelta*/)>;

// Reads exactly range.length() bytes of remotePath starting at range.start
// into sinkPath (created/truncated), in blocks of at most kReadBlockSize.
// onProgress runs after every successful read. A short read is reported as
// TransferTruncated; nothing is retried.
ChunkResult fetchChunk(SftpClient& session,
                       const std::string& remotePath,
                       const ChunkRange& range,
                       const std::string& sinkPath,
                       const ProgressDeltaCB& onProgress,
                       const SftpClient::CancelCB& shouldCancel = {});

} // namespace sftpfetch
