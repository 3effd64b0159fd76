// Abstract transport session. Concrete backends (libssh2, mock) implement this
// API so the transfer engine stays decoupled from the wire protocol.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>

namespace sftpfetch {

// Open remote file positioned for sequential reads.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    virtual bool seek(std::uint64_t offset, std::string& err) = 0;

    // Returns bytes read, 0 at EOF, -1 on error (err is filled).
    virtual long long read(char* buf, std::size_t len, std::string& err) = 0;
};

class SftpClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Classification of the last failed call on this session.
    virtual ErrorKind lastErrorKind() const = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Detailed metadata (stat). Returns true if the path exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Whole-file download to a local path.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Open a remote file for ranged reads. The handle must not outlive
    // this session.
    virtual std::unique_ptr<RemoteFile> openRead(const std::string& remote,
                                                 std::string& err) = 0;

    // Create a new, independent connection of the same kind.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          std::string& err) = 0;
};

} // namespace sftpfetch
