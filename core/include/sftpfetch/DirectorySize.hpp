#pragma once
#include "SftpClient.hpp"
#include <cstdint>
#include <string>

namespace sftpfetch {

std::string joinRemotePath(const std::string& base, const std::string& name);

// Recursive sum of file sizes below remoteDir. Subdirectories that cannot be
// listed contribute zero.
std::uint64_t directorySize(SftpClient& client, const std::string& remoteDir);

} // namespace sftpfetch
