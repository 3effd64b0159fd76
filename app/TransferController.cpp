#include "TransferController.hpp"
#include "LogUtils.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <utility>
Q_LOGGING_CATEGORY(ocXfer, "sftpfetch.transfer")

TransferController::TransferController(sftpfetch::SftpClient& base,
                                       sftpfetch::SessionOptions options,
                                       sftpfetch::TransferOptions topt,
                                       QObject* parent)
    : QObject(parent), base_(base), options_(std::move(options)), topt_(topt) {}

TransferController::~TransferController() {
    cancelAll();
    wait();
}

void TransferController::enqueue(const QString& remote, const QString& localDir) {
    if (running_.load()) {
        qCWarning(ocXfer) << "enqueue ignored while the queue is running";
        return;
    }
    DownloadJob job;
    job.remote = remote;
    job.local = QDir(localDir).filePath(QFileInfo(remote).fileName());
    std::lock_guard<std::mutex> lk(mtx_);
    jobs_.push_back(std::move(job));
}

bool TransferController::start() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (jobs_.isEmpty()) return false;
    }
    if (running_.exchange(true)) return false;
    if (worker_.joinable()) worker_.join();
    canceled_ = false;
    worker_ = std::thread([this] { runQueue(); });
    return true;
}

void TransferController::wait() {
    if (worker_.joinable()) worker_.join();
}

void TransferController::cancelAll() {
    if (!canceled_.exchange(true) && running_.load())
        qCInfo(ocXfer) << "cancelAll requested";
}

QVector<DownloadJob> TransferController::jobs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return jobs_;
}

void TransferController::runQueue() {
    int count = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        count = jobs_.size();
    }
    int succeeded = 0, failed = 0;
    for (int i = 0; i < count; ++i) {
        DownloadJob job;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            job = jobs_[i];
        }

        sftpfetch::TransferOutcome outcome;
        if (canceled_.load()) {
            outcome.step = sftpfetch::FailedStep::Session;
            outcome.error = sftpfetch::ErrorKind::Canceled;
            outcome.message = "Skipped after cancellation";
        } else {
            emit fileStarted(i, job.remote);
            outcome = runOne(i, job);
        }

        if (outcome.succeeded) {
            ++succeeded;
            qCInfo(ocXfer).noquote() << "SUCCESS:" << sftpfetchapp::sensitive(job.remote)
                                     << "->" << sftpfetchapp::sensitive(job.local)
                                     << outcome.totalBytes << "bytes";
        } else {
            ++failed;
            qCWarning(ocXfer).noquote() << "FAILED:" << sftpfetchapp::sensitive(job.remote)
                                        << QString::fromStdString(outcome.summary());
        }
        const bool ok = outcome.succeeded;
        const QString message = QString::fromStdString(outcome.summary());
        {
            std::lock_guard<std::mutex> lk(mtx_);
            jobs_[i].outcome = std::move(outcome);
            jobs_[i].finished = true;
        }
        emit fileFinished(i, ok, message);
    }
    running_ = false;
    emit queueFinished(succeeded, failed);
}

sftpfetch::TransferOutcome TransferController::runOne(int index, const DownloadJob& job) {
    const QString dir = QFileInfo(job.local).absolutePath();
    if (!QDir().mkpath(dir)) {
        sftpfetch::TransferOutcome out;
        out.step = sftpfetch::FailedStep::Session;
        out.error = sftpfetch::ErrorKind::LocalIOFailed;
        out.message = "Cannot create destination directory: " + dir.toStdString();
        return out;
    }

    int lastPermille = -1;
    auto onProgress = [this, index, &lastPermille](const sftpfetch::ProgressEvent& ev) {
        const int permille = ev.totalBytes
                                 ? (int)((ev.bytesTransferred * 1000) / ev.totalBytes)
                                 : 1000;
        if (permille == lastPermille && ev.bytesTransferred != ev.totalBytes) return;
        lastPermille = permille;
        emit progress(index, (quint64)ev.bytesTransferred, (quint64)ev.totalBytes);
    };
    auto shouldCancel = [this] { return canceled_.load(); };

    sftpfetch::TransferCoordinator coord(base_, options_, topt_);
    return coord.startTransfer(job.remote.toStdString(), job.local.toStdString(),
                               onProgress, shouldCancel);
}
