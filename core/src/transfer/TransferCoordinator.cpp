// Coordinator: per-chunk worker threads with isolated SFTP sessions, a
// single atomic progress counter and ordered reassembly.
#include "sftpfetch/TransferCoordinator.hpp"
#include "sftpfetch/Reassembler.hpp"
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace sftpfetch {

const char* transferStateName(TransferState st) {
    switch (st) {
    case TransferState::Idle:
        return "Idle";
    case TransferState::Planning:
        return "Planning";
    case TransferState::InFlight:
        return "InFlight";
    case TransferState::Reassembling:
        return "Reassembling";
    case TransferState::Succeeded:
        return "Succeeded";
    case TransferState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* failedStepName(FailedStep st) {
    switch (st) {
    case FailedStep::None:
        return "none";
    case FailedStep::Session:
        return "session";
    case FailedStep::Planning:
        return "planning";
    case FailedStep::Chunk:
        return "chunk";
    case FailedStep::Reassembly:
        return "reassembly";
    case FailedStep::Verification:
        return "verification";
    }
    return "unknown";
}

std::string TransferOutcome::summary() const {
    if (succeeded)
        return "OK " + std::to_string(bytesTransferred) + "/" + std::to_string(totalBytes) + " bytes";
    std::string s = std::string(failedStepName(step)) + " failed: " + errorKindName(error);
    if (!message.empty()) s += " (" + message + ")";
    for (const ChunkFailure& f : failedChunks) {
        s += "; chunk " + std::to_string(f.index) + ": " + errorKindName(f.kind);
        if (!f.message.empty()) s += " (" + f.message + ")";
    }
    return s;
}

TransferCoordinator::TransferCoordinator(SftpClient& base, SessionOptions options, TransferOptions topt)
    : base_(base), options_(std::move(options)), topt_(topt) {}

TransferOutcome TransferCoordinator::fail(TransferOutcome out, FailedStep step, ErrorKind kind,
                                          std::string msg) {
    out.succeeded = false;
    out.step = step;
    out.error = kind;
    out.message = std::move(msg);
    out.bytesTransferred = transferred_.load();
    state_ = TransferState::Failed;
    return out;
}

void TransferCoordinator::addProgress(std::uint64_t delta, const ProgressCB& onProgress) {
    transferred_.fetch_add(delta);
    if (!onProgress) return;
    std::lock_guard<std::mutex> lk(progressMutex_);
    onProgress(ProgressEvent{transferred_.load(), total_.load()});
}

TransferOutcome TransferCoordinator::startTransfer(const std::string& remotePath,
                                                   const std::string& localPath,
                                                   const ProgressCB& onProgress,
                                                   const SftpClient::CancelCB& shouldCancel) {
    state_ = TransferState::Planning;
    transferred_ = 0;
    total_ = 0;
    TransferOutcome out;

    if (shouldCancel && shouldCancel())
        return fail(out, FailedStep::Session, ErrorKind::Canceled, "Canceled before start");
    if (!base_.isConnected())
        return fail(out, FailedStep::Session, ErrorKind::ConnectionFailed, "Session is not connected");

    FileInfo info{};
    std::string err;
    if (!base_.stat(remotePath, info, err)) {
        const ErrorKind k = base_.lastErrorKind();
        return fail(out, FailedStep::Session, k == ErrorKind::None ? ErrorKind::RemoteIOFailed : k, err);
    }
    if (info.is_dir)
        return fail(out, FailedStep::Session, ErrorKind::RemoteIOFailed, remotePath + " is a directory");

    TransferRequest req;
    req.remotePath = remotePath;
    req.localPath = localPath;
    req.totalSize = info.size;
    req.concurrencyDegree = topt_.concurrency;
    return run(req, onProgress, shouldCancel);
}

TransferOutcome TransferCoordinator::run(const TransferRequest& req,
                                         const ProgressCB& onProgress,
                                         const SftpClient::CancelCB& shouldCancel) {
    state_ = TransferState::Planning;
    transferred_ = 0;
    total_ = req.totalSize;
    TransferOutcome out;
    out.totalBytes = req.totalSize;

    if (req.remotePath.empty() || req.localPath.empty())
        return fail(out, FailedStep::Planning, ErrorKind::InvalidConfiguration,
                    "Remote and local paths are required");
    if (shouldCancel && shouldCancel())
        return fail(out, FailedStep::Session, ErrorKind::Canceled, "Canceled before start");

    std::vector<ChunkRange> plan;
    std::string err;
    if (!planChunks(req.totalSize, req.concurrencyDegree, topt_.smallFileThreshold, plan, err))
        return fail(out, FailedStep::Planning, ErrorKind::InvalidConfiguration, err);

    state_ = TransferState::InFlight;
    if (req.totalSize < topt_.smallFileThreshold)
        return runWholeFile(req, onProgress, shouldCancel);
    return runChunked(req, plan, onProgress, shouldCancel);
}

TransferOutcome TransferCoordinator::runWholeFile(const TransferRequest& req,
                                                  const ProgressCB& onProgress,
                                                  const SftpClient::CancelCB& shouldCancel) {
    TransferOutcome out;
    out.totalBytes = req.totalSize;
    out.chunkCount = 1;

    std::uint64_t lastDone = 0;
    auto progress = [this, &lastDone, &onProgress](std::size_t done, std::size_t /*total*/) {
        if (done > lastDone) {
            addProgress(done - lastDone, onProgress);
            lastDone = done;
        }
    };

    // Downloaded into the single chunk's temporary; the destination is only
    // replaced once the size checks out.
    const std::string part = chunkPartPath(req.localPath, 0);
    std::string err;
    if (!base_.get(req.remotePath, part, err, progress, shouldCancel)) {
        ErrorKind k = base_.lastErrorKind();
        if (k == ErrorKind::None) k = ErrorKind::ConnectionFailed;
        out.failedChunks.push_back(ChunkFailure{0, k, err});
        return fail(out, FailedStep::Chunk, k, "whole-file transfer failed");
    }

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(part, ec);
    if (ec || (std::uint64_t)size != req.totalSize) {
        const std::string msg = ec ? "Could not read size of " + part
                                   : "Downloaded " + std::to_string(size) + " bytes, expected " +
                                         std::to_string(req.totalSize);
        fs::remove(part, ec);
        return fail(out, FailedStep::Verification, ErrorKind::SizeMismatch, msg);
    }
    state_ = TransferState::Reassembling;
    fs::rename(part, req.localPath, ec);
    if (ec)
        return fail(out, FailedStep::Reassembly, ErrorKind::ReassemblyFailed,
                    "Could not move " + part + " to " + req.localPath + ": " + ec.message());
    out.bytesTransferred = transferred_.load();
    return verifyAndFinish(req, out);
}

ChunkResult TransferCoordinator::runWorker(const TransferRequest& req,
                                           const ChunkRange& range,
                                           const ProgressCB& onProgress,
                                           const SftpClient::CancelCB& shouldCancel) {
    ChunkResult r;
    r.index = range.index;
    if (shouldCancel && shouldCancel()) {
        r.error = ErrorKind::Canceled;
        r.message = "Canceled before start";
        return r;
    }

    std::unique_ptr<SftpClient> session;
    std::string err;
    ErrorKind kind = ErrorKind::None;
    {
        // Creating sessions from a single entry point avoids cross-thread
        // initialisation hazards in the SSH backend.
        std::lock_guard<std::mutex> lk(connFactoryMutex_);
        session = base_.newConnectionLike(options_, err);
        kind = base_.lastErrorKind();
    }
    if (!session) {
        r.error = (kind == ErrorKind::None) ? ErrorKind::ConnectionFailed : kind;
        r.message = "Could not open session: " + err;
        return r;
    }

    try {
        r = fetchChunk(*session, req.remotePath, range, chunkPartPath(req.localPath, range.index),
                       [this, &onProgress](std::uint64_t delta) { addProgress(delta, onProgress); },
                       shouldCancel);
    } catch (const std::exception& e) {
        r.error = ErrorKind::LocalIOFailed;
        r.message = std::string("Chunk worker aborted: ") + e.what();
    }
    session->disconnect();
    return r;
}

TransferOutcome TransferCoordinator::runChunked(const TransferRequest& req,
                                                const std::vector<ChunkRange>& plan,
                                                const ProgressCB& onProgress,
                                                const SftpClient::CancelCB& shouldCancel) {
    TransferOutcome out;
    out.totalBytes = req.totalSize;
    out.chunkCount = (int)plan.size();

    std::vector<ChunkResult> results(plan.size());
    std::vector<std::thread> workers;
    workers.reserve(plan.size());
    for (const ChunkRange& range : plan) {
        workers.emplace_back([this, &req, &results, range, &onProgress, &shouldCancel]() {
            results[(std::size_t)range.index] = runWorker(req, range, onProgress, shouldCancel);
        });
    }
    // Wait for every worker, failed or not: chunk files of the survivors stay
    // available for inspection.
    for (auto& w : workers) w.join();

    for (const ChunkResult& r : results) {
        out.bytesTransferred += r.bytesWritten;
        if (!r.ok()) out.failedChunks.push_back(ChunkFailure{r.index, *r.error, r.message});
    }
    if (!out.failedChunks.empty()) {
        return fail(out, FailedStep::Chunk, out.failedChunks.front().kind,
                    std::to_string(out.failedChunks.size()) + " of " + std::to_string(plan.size()) +
                        " chunks failed");
    }

    state_ = TransferState::Reassembling;
    std::vector<std::string> parts;
    parts.reserve(plan.size());
    for (const ChunkRange& range : plan) parts.push_back(chunkPartPath(req.localPath, range.index));

    std::uint64_t written = 0;
    std::string err;
    if (!reassembleChunks(parts, req.localPath, written, err)) {
        std::error_code ec;
        fs::remove(req.localPath, ec);
        return fail(out, FailedStep::Reassembly, ErrorKind::ReassemblyFailed, err);
    }
    return verifyAndFinish(req, out);
}

TransferOutcome TransferCoordinator::verifyAndFinish(const TransferRequest& req, TransferOutcome out) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(req.localPath, ec);
    if (ec) {
        fs::remove(req.localPath, ec);
        return fail(out, FailedStep::Verification, ErrorKind::SizeMismatch,
                    "Could not read destination size: " + req.localPath);
    }
    if ((std::uint64_t)size != req.totalSize) {
        fs::remove(req.localPath, ec);
        return fail(out, FailedStep::Verification, ErrorKind::SizeMismatch,
                    "Destination has " + std::to_string(size) + " bytes, expected " +
                        std::to_string(req.totalSize));
    }
    out.succeeded = true;
    out.step = FailedStep::None;
    out.error = ErrorKind::None;
    out.bytesTransferred = transferred_.load();
    state_ = TransferState::Succeeded;
    return out;
}

} // namespace sftpfetch
