#include "sftpfetch/Reassembler.hpp"
#include "sftpfetch/ChunkWorker.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace sftpfetch {

namespace {

bool appendFile(FILE* out, const std::string& part, std::vector<char>& buf,
                std::uint64_t& bytesWritten, std::string& err) {
    FILE* in = std::fopen(part.c_str(), "rb");
    if (!in) {
        err = "Could not open chunk file " + part + ": " + std::strerror(errno);
        return false;
    }
    while (true) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, n, out) != n) {
                err = std::string("Write to destination failed: ") + std::strerror(errno);
                std::fclose(in);
                return false;
            }
            bytesWritten += n;
        }
        if (n < buf.size()) {
            if (std::ferror(in)) {
                err = "Read from chunk file failed: " + part;
                std::fclose(in);
                return false;
            }
            break; // EOF
        }
    }
    std::fclose(in);
    return true;
}

} // namespace

bool reassembleChunks(const std::vector<std::string>& parts,
                      const std::string& destPath,
                      std::uint64_t& bytesWritten,
                      std::string& err) {
    bytesWritten = 0;
    FILE* out = std::fopen(destPath.c_str(), "wb");
    if (!out) {
        err = "Could not open destination " + destPath + ": " + std::strerror(errno);
        return false;
    }

    std::vector<char> buf(kReadBlockSize);
    for (const std::string& part : parts) {
        if (!appendFile(out, part, buf, bytesWritten, err)) {
            std::fclose(out);
            return false;
        }
        if (std::remove(part.c_str()) != 0) {
            err = "Could not delete chunk file " + part + ": " + std::strerror(errno);
            std::fclose(out);
            return false;
        }
    }

    if (std::fclose(out) != 0) {
        err = std::string("Could not flush destination: ") + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace sftpfetch
