#include "sftpfetch/DirectorySize.hpp"
#include <vector>

namespace sftpfetch {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::uint64_t directorySize(SftpClient& client, const std::string& remoteDir) {
    std::vector<FileInfo> entries;
    std::string err;
    if (!client.list(remoteDir, entries, err))
        return 0;

    std::uint64_t total = 0;
    for (const FileInfo& e : entries) {
        if (e.is_dir)
            total += directorySize(client, joinRemotePath(remoteDir, e.name));
        else
            total += e.size;
    }
    return total;
}

} // namespace sftpfetch
