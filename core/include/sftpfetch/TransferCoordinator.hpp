// Parallel chunked download of a single remote file.
//
// Flow: stat -> plan -> one worker thread per range, each with its own
// session -> wait for all -> reassemble in index order -> verify size.
// Files below the small-file threshold skip chunking and use one whole-file
// get() on the base session.
#pragma once
#include "ChunkWorker.hpp"
#include "SftpClient.hpp"
#include <atomic>
#include <mutex>

namespace sftpfetch {

struct TransferOptions {
    int concurrency = kDefaultConcurrency;
    std::uint64_t smallFileThreshold = kDefaultSmallFileThreshold;
};

struct TransferRequest {
    std::string remotePath;
    std::string localPath;
    std::uint64_t totalSize = 0;
    int concurrencyDegree = kDefaultConcurrency;
};

struct ProgressEvent {
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0;
};

enum class TransferState { Idle, Planning, InFlight, Reassembling, Succeeded, Failed };

// Step a failed transfer stopped at.
enum class FailedStep { None, Session, Planning, Chunk, Reassembly, Verification };

const char* transferStateName(TransferState st);
const char* failedStepName(FailedStep st);

struct ChunkFailure {
    int index = 0;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

struct TransferOutcome {
    bool succeeded = false;
    FailedStep step = FailedStep::None;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<ChunkFailure> failedChunks; // ascending index
    std::uint64_t totalBytes = 0;
    std::uint64_t bytesTransferred = 0;
    int chunkCount = 0;

    // One line naming the failed step and every failed chunk.
    std::string summary() const;
};

class TransferCoordinator {
public:
    using ProgressCB = std::function<void(const ProgressEvent&)>;

    // `base` must stay connected for the coordinator's lifetime; it is used
    // for stat and small files. Chunk workers open their own sessions with
    // base.newConnectionLike(options).
    TransferCoordinator(SftpClient& base, SessionOptions options, TransferOptions topt = {});

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Stats remotePath, then runs the transfer. onProgress may be invoked
    // from worker threads; invocations are serialized.
    TransferOutcome startTransfer(const std::string& remotePath,
                                  const std::string& localPath,
                                  const ProgressCB& onProgress = {},
                                  const SftpClient::CancelCB& shouldCancel = {});

    // Runs a transfer whose size is already known.
    TransferOutcome run(const TransferRequest& req,
                        const ProgressCB& onProgress = {},
                        const SftpClient::CancelCB& shouldCancel = {});

    TransferState state() const { return state_.load(); }
    std::uint64_t bytesTransferred() const { return transferred_.load(); }
    std::uint64_t totalBytes() const { return total_.load(); }

private:
    SftpClient& base_;
    SessionOptions options_;
    TransferOptions topt_;

    std::atomic<TransferState> state_{TransferState::Idle};
    std::atomic<std::uint64_t> transferred_{0};
    std::atomic<std::uint64_t> total_{0};
    std::mutex progressMutex_;    // serializes onProgress callbacks
    std::mutex connFactoryMutex_; // serializes session creation

    TransferOutcome runWholeFile(const TransferRequest& req,
                                 const ProgressCB& onProgress,
                                 const SftpClient::CancelCB& shouldCancel);
    TransferOutcome runChunked(const TransferRequest& req,
                               const std::vector<ChunkRange>& plan,
                               const ProgressCB& onProgress,
                               const SftpClient::CancelCB& shouldCancel);
    ChunkResult runWorker(const TransferRequest& req,
                          const ChunkRange& range,
                          const ProgressCB& onProgress,
                          const SftpClient::CancelCB& shouldCancel);
    void addProgress(std::uint64_t delta, const ProgressCB& onProgress);
    TransferOutcome verifyAndFinish(const TransferRequest& req, TransferOutcome out);
    TransferOutcome fail(TransferOutcome out, FailedStep step, ErrorKind kind, std::string msg);
};

} // namespace sftpfetch
