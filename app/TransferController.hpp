// Sequential download queue. Each file goes through a TransferCoordinator on
// a single worker thread, one file at a time.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <mutex>
#include <thread>
#include "sftpfetch/TransferCoordinator.hpp"

struct DownloadJob {
    QString remote;    // absolute remote path
    QString local;     // destination file path
    sftpfetch::TransferOutcome outcome; // filled when the job finishes
    bool finished = false;
};

class TransferController : public QObject {
    Q_OBJECT
public:
    // `base` is not owned and must stay connected until the queue finishes.
    // While the queue runs it is used only from the worker thread.
    TransferController(sftpfetch::SftpClient& base,
                       sftpfetch::SessionOptions options,
                       sftpfetch::TransferOptions topt,
                       QObject* parent = nullptr);
    ~TransferController() override;

    // Queues remote for download into localDir/<basename>. Ignored while running.
    void enqueue(const QString& remote, const QString& localDir);

    // Starts the worker thread. Returns false if already running or the queue is empty.
    bool start();
    // Blocks until the worker thread exits.
    void wait();
    // Stops the current file at the next block boundary and skips the rest.
    void cancelAll();

    bool isRunning() const { return running_.load(); }
    bool isCanceled() const { return canceled_.load(); }
    QVector<DownloadJob> jobs() const;

signals:
    void fileStarted(int index, const QString& remote);
    void progress(int index, quint64 done, quint64 total);
    void fileFinished(int index, bool ok, const QString& message);
    void queueFinished(int succeeded, int failed);

private:
    sftpfetch::SftpClient& base_;
    sftpfetch::SessionOptions options_;
    sftpfetch::TransferOptions topt_;

    QVector<DownloadJob> jobs_;
    mutable std::mutex mtx_; // protects jobs_
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> canceled_{false};

    void runQueue();
    sftpfetch::TransferOutcome runOne(int index, const DownloadJob& job);
};
