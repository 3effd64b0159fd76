#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sftpfetch {

// Concatenates `parts` in order into destPath (created/truncated) and deletes
// each part once it has been appended. On failure the destination may hold a
// prefix of the data and must not be trusted.
bool reassembleChunks(const std::vector<std::string>& parts,
                      const std::string& destPath,
                      std::uint64_t& bytesWritten,
                      std::string& err);

} // namespace sftpfetch
