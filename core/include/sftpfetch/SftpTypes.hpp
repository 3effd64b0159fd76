// Basic types shared between the transfer core and the Qt layer.
// Keep these structures plain so they can cross thread boundaries by value.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace sftpfetch {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accept and store new hosts; reject changed keys.
    Off         // No verification (not recommended).
};

// Failure taxonomy used by sessions, chunk workers and the coordinator.
enum class ErrorKind {
    None,
    InvalidConfiguration,
    ConnectionFailed,
    AuthenticationFailed,
    UnsupportedCredentialFormat,
    RemoteIOFailed,
    TransferTruncated,
    SizeMismatch,
    ReassemblyFailed,
    LocalIOFailed,
    Canceled
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorKind::ConnectionFailed:
        return "ConnectionFailed";
    case ErrorKind::AuthenticationFailed:
        return "AuthenticationFailed";
    case ErrorKind::UnsupportedCredentialFormat:
        return "UnsupportedCredentialFormat";
    case ErrorKind::RemoteIOFailed:
        return "RemoteIOFailed";
    case ErrorKind::TransferTruncated:
        return "TransferTruncated";
    case ErrorKind::SizeMismatch:
        return "SizeMismatch";
    case ErrorKind::ReassemblyFailed:
        return "ReassemblyFailed";
    case ErrorKind::LocalIOFailed:
        return "LocalIOFailed";
    case ErrorKind::Canceled:
        return "Canceled";
    }
    return "Unknown";
}

// One directory entry as reported by the server.
struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Return true to accept and store, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

} // namespace sftpfetch
