#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace sftpfetch {

class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  Libssh2SftpClient(const Libssh2SftpClient&) = delete;
  Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

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

private:
  bool connected_ = false;
  ErrorKind lastKind_ = ErrorKind::None;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool sshHandshakeAuth(const SessionOptions& opt, std::string& err);
  bool verifyHostKey(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  std::string lastSessionError() const;
  bool fail(ErrorKind kind, const std::string& msg, std::string& err);
};

} // namespace sftpfetch
