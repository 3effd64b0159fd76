// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and ranged reads.
#include "sftpfetch/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdlib>
#include <cstdio>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace sftpfetch {

// Global libssh2 initialisation (once per process)
static std::once_flag g_libssh2_init;

// Context for keyboard-interactive: answer user or password depending on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text),
                                               (size_t)prompts[i].length)
                                 : std::string();
        for (char& c : prompt) {
            if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        }
        // Simple heuristic: prompts mentioning "user" or "name" get the user name
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0) continue;
        // libssh2 frees the response with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(alen + 1));
        if (!buf) continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)alen;
    }
}

namespace {

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(LIBSSH2_SESSION* session, LIBSSH2_SFTP_HANDLE* handle)
        : session_(session), handle_(handle) {}

    ~Libssh2RemoteFile() override {
        if (handle_) libssh2_sftp_close(handle_);
    }

    bool seek(std::uint64_t offset, std::string& err) override {
        (void)err;
        libssh2_sftp_seek64(handle_, (libssh2_uint64_t)offset);
        return true;
    }

    long long read(char* buf, std::size_t len, std::string& err) override {
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            char* emsg = nullptr;
            int emlen = 0;
            (void)libssh2_session_last_error(session_, &emsg, &emlen, 0);
            err = "Remote read failed";
            if (emsg && emlen > 0) err += ": " + std::string(emsg, (size_t)emlen);
            return -1;
        }
        return (long long)n;
    }

private:
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP_HANDLE* handle_ = nullptr;
};

const char* hostKeyAlgName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
        default: return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default:
            return 0;
    }
}

FileInfo fromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo fi{};
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = (std::uint32_t)attrs.permissions;
    return fi;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::fail(ErrorKind kind, const std::string& msg, std::string& err) {
    lastKind_ = kind;
    err = msg;
    return false;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0)
        return fail(ErrorKind::ConnectionFailed, std::string("getaddrinfo: ") + gai_strerror(gai), err);

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Avoid SO_RCVTIMEO/SO_SNDTIMEO during auth; libssh2_session_set_timeout
        // handles timeouts. Enable TCP keepalive.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    return fail(ErrorKind::ConnectionFailed, "Could not connect to host/port", err);
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) return fail(ErrorKind::ConnectionFailed, "Could not initialise known_hosts", err);

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::ConnectionFailed, "known_hosts missing or unreadable (strict policy)", err);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        return fail(ErrorKind::ConnectionFailed, "Could not obtain host key", err);
    }

    const int alg = knownHostKeyMask(keytype);
    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        // Without a callback new hosts are accepted (non-interactive TOFU)
        bool confirmed = true;
        if (opt.hostkey_confirm_cb) {
            confirmed = opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype), fpStr);
        }
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            return fail(ErrorKind::ConnectionFailed, "Unknown host: fingerprint not confirmed", err);
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            return fail(ErrorKind::ConnectionFailed, "known_hosts path not defined", err);
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            return fail(ErrorKind::ConnectionFailed, "Could not add host to known_hosts", err);
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    // Only Strict fails on mismatch/notfound; AcceptNew handled NOTFOUND above
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        return fail(ErrorKind::ConnectionFailed,
                    (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                        ? "Host key does not match known_hosts"
                        : "Host unknown in known_hosts",
                    err);
    }
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    // 1) Explicit private key first.
    // 2) Password, then keyboard-interactive if the server offers it.
    // 3) ssh-agent as a last resort.
    if (opt.private_key_path.has_value()) {
        if (::access(opt.private_key_path->c_str(), R_OK) != 0)
            return fail(ErrorKind::AuthenticationFailed, "SSH key not found: " + *opt.private_key_path, err);
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr, // public key derived from the private one
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc == LIBSSH2_ERROR_FILE)
            return fail(ErrorKind::UnsupportedCredentialFormat,
                        "Could not load SSH key (unsupported format): " + lastSessionError(), err);
        if (rc != 0)
            return fail(ErrorKind::AuthenticationFailed, "Key authentication failed: " + lastSessionError(), err);
        return true;
    }

    std::string authlist;
    auto hasMethod = [&](const char* m) { return !authlist.empty() && authlist.find(m) != std::string::npos; };
    auto loadAuthList = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0) return true;
        // The server closed after the password attempt: everything else would cascade
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            return fail(ErrorKind::ConnectionFailed, "Server closed the connection after password attempt", err);
        }
        loadAuthList();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            int rc_kbd = -1;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rc_kbd == 0) return true;
        }
    }

    loadAuthList();
    if (hasMethod("publickey")) {
        LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
        bool authed = false;
        if (agent && libssh2_agent_connect(agent) == 0) {
            if (libssh2_agent_list_identities(agent) == 0) {
                struct libssh2_agent_publickey* identity = nullptr;
                struct libssh2_agent_publickey* prev = nullptr;
                int tries = 0;
                const int kMaxAgentTries = 3;
                while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                    prev = identity;
                    ++tries;
                    int arc = -1;
                    for (;;) {
                        arc = libssh2_agent_userauth(agent, opt.username.c_str(), identity);
                        if (arc != LIBSSH2_ERROR_EAGAIN) break;
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                    if (arc == 0) {
                        authed = true;
                        break;
                    }
                }
            }
        }
        if (agent) {
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
        if (authed) return true;
    }

    std::string msg = opt.password.has_value() ? "Password/keyboard-interactive authentication failed"
                                               : "No credentials: key/agent/password unavailable";
    if (!authlist.empty()) msg += " (methods: " + authlist + ")";
    const std::string last = lastSessionError();
    if (!last.empty()) msg += " - " + last;
    return fail(ErrorKind::AuthenticationFailed, msg, err);
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) return fail(ErrorKind::ConnectionFailed, "libssh2_session_init failed", err);

    if (libssh2_session_handshake(session_, sock_) != 0)
        return fail(ErrorKind::ConnectionFailed, "SSH handshake failed: " + lastSessionError(), err);

    // Blocking mode with a reasonable timeout to avoid EAGAIN during auth
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000); // 20s

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) return fail(ErrorKind::ConnectionFailed, "Could not initialise SFTP", err);
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) return fail(ErrorKind::ConnectionFailed, "Already connected", err);
    if (opt.host.empty() || opt.username.empty())
        return fail(ErrorKind::InvalidConfiguration, "Host and user are required", err);
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    lastKind_ = ErrorKind::None;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!connected_ || !sftp_) return fail(ErrorKind::ConnectionFailed, "Not connected", err);

    std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) return fail(ErrorKind::RemoteIOFailed, "sftp_opendir failed for: " + path, err);

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            // rc = name length
            FileInfo fi = fromAttrs(attrs);
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            libssh2_sftp_closedir(dir);
            return fail(ErrorKind::ConnectionFailed, "sftp_readdir_ex failed", err);
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    if (!connected_ || !sftp_) return fail(ErrorKind::ConnectionFailed, "Not connected", err);

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE)
            return fail(ErrorKind::RemoteIOFailed, "No such remote file: " + remote_path, err);
        return fail(ErrorKind::ConnectionFailed, "Remote stat failed: " + lastSessionError(), err);
    }
    info = fromAttrs(st);
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    return true;
}

// Download a remote file to a local path, reporting progress and honouring
// cooperative cancellation.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::string& err,
                            ProgressCB progress,
                            CancelCB shouldCancel) {
    FileInfo st{};
    if (!stat(remote, st, err)) return false;
    const std::size_t total = (std::size_t)st.size;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) return fail(ErrorKind::RemoteIOFailed, "Could not open remote file for reading", err);

    FILE* lf = ::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        return fail(ErrorKind::LocalIOFailed, "Could not open local file for writing", err);
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return fail(ErrorKind::Canceled, "Canceled by user", err);
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return fail(ErrorKind::LocalIOFailed, "Local write failed", err);
            }
            done += (std::size_t)n;
            if (progress && total) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return fail(ErrorKind::ConnectionFailed, "Remote read failed: " + lastSessionError(), err);
        }
    }

    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) return fail(ErrorKind::LocalIOFailed, "Local write failed", err);
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::openRead(const std::string& remote,
                                                        std::string& err) {
    if (!connected_ || !sftp_) {
        fail(ErrorKind::ConnectionFailed, "Not connected", err);
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        fail(ErrorKind::RemoteIOFailed, "Could not open remote file for reading: " + remote, err);
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(session_, rh);
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 std::string& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) {
        lastKind_ = ptr->lastErrorKind();
        return nullptr;
    }
    return ptr;
}

} // namespace sftpfetch
