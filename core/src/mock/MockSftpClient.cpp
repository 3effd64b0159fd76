#include "sftpfetch/MockSftpClient.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace sftpfetch {

namespace {

std::string normalizedPath(const std::string& p) {
  if (p.empty()) return "/";
  std::string out = p;
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

std::string parentOf(const std::string& p) {
  const auto pos = p.find_last_of('/');
  if (pos == std::string::npos || pos == 0) return "/";
  return p.substr(0, pos);
}

std::string baseName(const std::string& p) {
  const auto pos = p.find_last_of('/');
  return pos == std::string::npos ? p : p.substr(pos + 1);
}

} // namespace

void MockRemote::addDir(const std::string& path, std::uint64_t mtime) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::string cur = normalizedPath(path);
  // Create missing parents as well
  while (cur != "/" && nodes_.find(cur) == nodes_.end()) {
    Node n;
    n.is_dir = true;
    n.mtime = mtime;
    nodes_[cur] = n;
    cur = parentOf(cur);
  }
}

void MockRemote::addFile(const std::string& path, const std::string& content,
                         std::uint64_t mtime) {
  const std::string p = normalizedPath(path);
  addDir(parentOf(p), mtime);
  std::lock_guard<std::mutex> lk(mtx_);
  Node n;
  n.content = content;
  n.mtime = mtime;
  nodes_[p] = n;
}

void MockRemote::setReportedSize(const std::string& path, std::uint64_t size) {
  std::lock_guard<std::mutex> lk(mtx_);
  nodes_[normalizedPath(path)].reportedSize = size;
}

void MockRemote::failReadsAt(const std::string& path, std::uint64_t offset) {
  std::lock_guard<std::mutex> lk(mtx_);
  nodes_[normalizedPath(path)].failAt = offset;
}

void MockRemote::denyList(const std::string& path) {
  std::lock_guard<std::mutex> lk(mtx_);
  denied_.insert(normalizedPath(path));
}

void MockRemote::setConnectFailure(ErrorKind kind) {
  std::lock_guard<std::mutex> lk(mtx_);
  connectFailure_ = kind;
}

class MockRemoteFile : public RemoteFile {
public:
  MockRemoteFile(std::shared_ptr<MockRemote> remote, std::string path)
    : remote_(std::move(remote)), path_(std::move(path)) {}

  bool seek(std::uint64_t offset, std::string& err) override {
    (void)err;
    pos_ = offset;
    return true;
  }

  long long read(char* buf, std::size_t len, std::string& err) override {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    auto it = remote_->nodes_.find(path_);
    if (it == remote_->nodes_.end()) {
      err = "Remote file vanished: " + path_;
      return -1;
    }
    const MockRemote::Node& n = it->second;
    if (n.failAt && *n.failAt >= pos_ && *n.failAt < pos_ + len) {
      err = "Connection reset by peer";
      return -1;
    }
    if (pos_ >= n.content.size()) return 0;
    const std::size_t avail = n.content.size() - (std::size_t)pos_;
    const std::size_t take = std::min(avail, len);
    std::memcpy(buf, n.content.data() + pos_, take);
    pos_ += take;
    return (long long)take;
  }

private:
  std::shared_ptr<MockRemote> remote_;
  std::string path_;
  std::uint64_t pos_ = 0;
};

MockSftpClient::MockSftpClient() : remote_(std::make_shared<MockRemote>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemote> remote)
  : remote_(std::move(remote)) {}

MockSftpClient::~MockSftpClient() {
  disconnect();
}

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
  remote_->connectCalls_.fetch_add(1);
  if (connected_) {
    err = "Already connected";
    lastKind_ = ErrorKind::ConnectionFailed;
    return false;
  }
  if (opt.host.empty() || opt.username.empty()) {
    err = "Host and user are required";
    lastKind_ = ErrorKind::InvalidConfiguration;
    return false;
  }
  ErrorKind failure = ErrorKind::None;
  {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    failure = remote_->connectFailure_;
  }
  if (failure != ErrorKind::None) {
    err = std::string("Mock connect refused: ") + errorKindName(failure);
    lastKind_ = failure;
    return false;
  }
  connected_ = true;
  lastKind_ = ErrorKind::None;
  remote_->liveSessions_.fetch_add(1);
  return true;
}

void MockSftpClient::disconnect() {
  if (connected_) remote_->liveSessions_.fetch_sub(1);
  connected_ = false;
}

bool MockSftpClient::requireConnected(std::string& err) {
  if (connected_) return true;
  err = "Not connected";
  lastKind_ = ErrorKind::ConnectionFailed;
  return false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
  if (!requireConnected(err)) return false;
  remote_->listCalls_.fetch_add(1);
  const std::string path = normalizedPath(remote_path);

  std::lock_guard<std::mutex> lk(remote_->mtx_);
  auto dir = remote_->nodes_.find(path);
  if (dir == remote_->nodes_.end() || !dir->second.is_dir) {
    err = "Remote path not found in mock: " + path;
    lastKind_ = ErrorKind::RemoteIOFailed;
    return false;
  }
  if (remote_->denied_.count(path) > 0) {
    err = "Permission denied: " + path;
    lastKind_ = ErrorKind::RemoteIOFailed;
    return false;
  }
  out.clear();
  for (const auto& kv : remote_->nodes_) {
    if (kv.first == "/" || parentOf(kv.first) != path) continue;
    FileInfo fi;
    fi.name = baseName(kv.first);
    fi.is_dir = kv.second.is_dir;
    fi.size = kv.second.is_dir ? 0 : kv.second.content.size();
    fi.mtime = kv.second.mtime;
    fi.mode = kv.second.is_dir ? 0040755 : 0100644;
    out.push_back(std::move(fi));
  }
  return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
  if (!requireConnected(err)) return false;
  const std::string path = normalizedPath(remote_path);
  std::lock_guard<std::mutex> lk(remote_->mtx_);
  auto it = remote_->nodes_.find(path);
  if (it == remote_->nodes_.end()) {
    err = "No such file: " + path;
    lastKind_ = ErrorKind::RemoteIOFailed;
    return false;
  }
  const MockRemote::Node& n = it->second;
  info.name = baseName(path);
  info.is_dir = n.is_dir;
  info.size = n.reportedSize ? *n.reportedSize : n.content.size();
  info.mtime = n.mtime;
  info.mode = n.is_dir ? 0040755 : 0100644;
  return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err,
                         ProgressCB progress,
                         CancelCB shouldCancel) {
  if (!requireConnected(err)) return false;
  auto rf = openRead(remote, err);
  if (!rf) return false;

  FileInfo info;
  if (!stat(remote, info, err)) return false;
  const std::size_t total = (std::size_t)info.size;

  FILE* lf = std::fopen(local.c_str(), "wb");
  if (!lf) {
    err = "Could not open local file for writing";
    lastKind_ = ErrorKind::LocalIOFailed;
    return false;
  }
  std::vector<char> buf(64 * 1024);
  std::size_t done = 0;
  while (true) {
    if (shouldCancel && shouldCancel()) {
      err = "Canceled by user";
      lastKind_ = ErrorKind::Canceled;
      std::fclose(lf);
      return false;
    }
    const long long n = rf->read(buf.data(), buf.size(), err);
    if (n < 0) {
      lastKind_ = ErrorKind::ConnectionFailed;
      std::fclose(lf);
      return false;
    }
    if (n == 0) break;
    if (std::fwrite(buf.data(), 1, (std::size_t)n, lf) != (std::size_t)n) {
      err = "Local write failed";
      lastKind_ = ErrorKind::LocalIOFailed;
      std::fclose(lf);
      return false;
    }
    done += (std::size_t)n;
    if (progress) progress(done, total);
  }
  if (std::fclose(lf) != 0) {
    err = "Local write failed";
    lastKind_ = ErrorKind::LocalIOFailed;
    return false;
  }
  return true;
}

std::unique_ptr<RemoteFile> MockSftpClient::openRead(const std::string& remote,
                                                     std::string& err) {
  if (!requireConnected(err)) return nullptr;
  const std::string path = normalizedPath(remote);
  {
    std::lock_guard<std::mutex> lk(remote_->mtx_);
    auto it = remote_->nodes_.find(path);
    if (it == remote_->nodes_.end() || it->second.is_dir) {
      err = "Could not open remote file for reading: " + path;
      lastKind_ = ErrorKind::RemoteIOFailed;
      return nullptr;
    }
  }
  return std::make_unique<MockRemoteFile>(remote_, path);
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              std::string& err) {
  auto ptr = std::make_unique<MockSftpClient>(remote_);
  if (!ptr->connect(opt, err)) {
    lastKind_ = ptr->lastErrorKind();
    return nullptr;
  }
  return ptr;
}

} // namespace sftpfetch
