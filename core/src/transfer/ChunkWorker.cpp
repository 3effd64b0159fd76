#include "sftpfetch/ChunkWorker.hpp"
#include <algorithm>
#include <cstdio>
#include <vector>

namespace sftpfetch {

namespace {

ChunkResult failed(ChunkResult r, ErrorKind kind, std::string msg) {
    r.error = kind;
    r.message = std::move(msg);
    return r;
}

} // namespace

ChunkResult fetchChunk(SftpClient& session,
                       const std::string& remotePath,
                       const ChunkRange& range,
                       const std::string& sinkPath,
                       const ProgressDeltaCB& onProgress,
                       const SftpClient::CancelCB& shouldCancel) {
    ChunkResult r;
    r.index = range.index;

    std::string err;
    auto rf = session.openRead(remotePath, err);
    if (!rf) {
        const ErrorKind k = session.lastErrorKind();
        return failed(r, k == ErrorKind::None ? ErrorKind::RemoteIOFailed : k, err);
    }
    if (!rf->seek(range.start, err))
        return failed(r, ErrorKind::RemoteIOFailed, err);

    FILE* sink = std::fopen(sinkPath.c_str(), "wb");
    if (!sink)
        return failed(r, ErrorKind::LocalIOFailed, "Could not open chunk file for writing: " + sinkPath);

    const std::uint64_t expected = range.length();
    std::vector<char> buf(kReadBlockSize);

    while (r.bytesWritten < expected) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(sink);
            return failed(r, ErrorKind::Canceled, "Canceled by user");
        }
        const std::size_t want =
            (std::size_t)std::min<std::uint64_t>(buf.size(), expected - r.bytesWritten);
        const long long n = rf->read(buf.data(), want, err);
        if (n < 0) {
            std::fclose(sink);
            return failed(r, ErrorKind::ConnectionFailed, err);
        }
        if (n == 0) {
            std::fclose(sink);
            return failed(r, ErrorKind::TransferTruncated,
                          "Remote data ended after " + std::to_string(r.bytesWritten) + " of " +
                              std::to_string(expected) + " bytes");
        }
        if (std::fwrite(buf.data(), 1, (std::size_t)n, sink) != (std::size_t)n) {
            std::fclose(sink);
            return failed(r, ErrorKind::LocalIOFailed, "Write to chunk file failed: " + sinkPath);
        }
        r.bytesWritten += (std::uint64_t)n;
        if (onProgress) onProgress((std::uint64_t)n);
    }

    if (std::fclose(sink) != 0)
        return failed(r, ErrorKind::LocalIOFailed, "Could not flush chunk file: " + sinkPath);
    return r;
}

} // namespace sftpfetch
