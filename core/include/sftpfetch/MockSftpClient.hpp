#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>

namespace sftpfetch {

// In-memory remote shared by a mock client and every connection created
// from it with newConnectionLike(). Fault knobs let tests break specific
// sessions, files or byte offsets.
class MockRemote {
public:
  void addDir(const std::string& path, std::uint64_t mtime = 0);
  void addFile(const std::string& path, const std::string& content,
               std::uint64_t mtime = 0);

  // stat() reports this size instead of the real content length.
  void setReportedSize(const std::string& path, std::uint64_t size);
  // Reads covering this absolute offset fail as a dropped connection.
  void failReadsAt(const std::string& path, std::uint64_t offset);
  // list() on this directory fails (permission denied).
  void denyList(const std::string& path);
  // connect() fails with the given kind; None restores normal behaviour.
  void setConnectFailure(ErrorKind kind);

  int listCalls() const { return listCalls_.load(); }
  int connectCalls() const { return connectCalls_.load(); }
  int liveSessions() const { return liveSessions_.load(); }

private:
  friend class MockSftpClient;
  friend class MockRemoteFile;

  struct Node {
    bool is_dir = false;
    std::string content;
    std::uint64_t mtime = 0;
    std::optional<std::uint64_t> reportedSize;
    std::optional<std::uint64_t> failAt;
  };

  mutable std::mutex mtx_;
  std::map<std::string, Node> nodes_ = {{"/", Node{true, {}, 0, {}, {}}}};
  std::set<std::string> denied_;
  ErrorKind connectFailure_ = ErrorKind::None;

  std::atomic<int> listCalls_{0};
  std::atomic<int> connectCalls_{0};
  std::atomic<int> liveSessions_{0};
};

class MockSftpClient : public SftpClient {
public:
  MockSftpClient();
  explicit MockSftpClient(std::shared_ptr<MockRemote> remote);
  ~MockSftpClient() override;

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }
  ErrorKind lastErrorKind() const override { return lastKind_; }

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

  bool get(const std::string& remote,
           const std::string& local,
           std::string& err,
           ProgressCB progress = {},
           CancelCB shouldCancel = {}) override;

  std::unique_ptr<RemoteFile> openRead(const std::string& remote,
                                       std::string& err) override;

  std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                std::string& err) override;

  MockRemote& remote() { return *remote_; }

private:
  std::shared_ptr<MockRemote> remote_;
  bool connected_ = false;
  ErrorKind lastKind_ = ErrorKind::None;

  bool requireConnected(std::string& err);
};

} // namespace sftpfetch
