// Core unit tests without external framework (run via CTest).
#include "sftpfetch/DirectorySize.hpp"
#include "sftpfetch/MockSftpClient.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

sftpfetch::SessionOptions validOptions() {
    sftpfetch::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

std::shared_ptr<sftpfetch::MockRemote> sampleRemote() {
    auto remote = std::make_shared<sftpfetch::MockRemote>();
    remote->addFile("/srv/media/a.mkv", std::string(1000, 'a'), 100);
    remote->addFile("/srv/media/b.mkv", std::string(250, 'b'), 300);
    remote->addFile("/srv/media/show/s01e01.mkv", std::string(40, 'x'), 200);
    remote->addFile("/srv/media/show/extras/trailer.mp4", std::string(60, 't'), 150);
    remote->addDir("/srv/media/empty", 50);
    return remote;
}

void test_session_defaults(TestContext &t) {
    sftpfetch::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == sftpfetch::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(!o.hostkey_confirm_cb, "hostkey_confirm_cb should be unset");
}

void test_connect_validation(TestContext &t) {
    sftpfetch::MockSftpClient c;
    std::string err;
    sftpfetch::SessionOptions opt;
    opt.host = "";
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::InvalidConfiguration,
            "empty host should be InvalidConfiguration");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::None,
            "successful connect should clear the error kind");
}

void test_connect_failure_injection(TestContext &t) {
    auto remote = sampleRemote();
    remote->setConnectFailure(sftpfetch::ErrorKind::AuthenticationFailed);
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(!c.connect(validOptions(), err),
            "connect should fail when a failure is injected");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::AuthenticationFailed,
            "injected kind should be reported");
    t.checkContains(err, "AuthenticationFailed", "error should name the kind");

    remote->setConnectFailure(sftpfetch::ErrorKind::None);
    err.clear();
    t.check(c.connect(validOptions(), err),
            "connect should succeed after clearing the failure");
}

void test_disconnect_changes_state(TestContext &t) {
    auto remote = sampleRemote();
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(c.connect(validOptions(), err),
            "connect should succeed before disconnect test");
    t.check(remote->liveSessions() == 1, "one live session after connect");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");
    t.check(remote->liveSessions() == 0, "no live session after disconnect");

    std::vector<sftpfetch::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err), "list should fail after disconnect");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::ConnectionFailed,
            "operations on a closed session should be ConnectionFailed");
}

void test_list_known_path(TestContext &t) {
    sftpfetch::MockSftpClient c(sampleRemote());
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed before list");

    std::vector<sftpfetch::FileInfo> out;
    t.check(c.list("/srv/media/", out, err),
            "list should accept a trailing slash");
    t.check(out.size() == 4, "list('/srv/media') should return 4 entries");
    if (out.size() == 4) {
        t.check(!out[0].is_dir && out[0].name == "a.mkv" && out[0].size == 1000,
                "a.mkv should be listed with its size");
        t.check(out[2].is_dir && out[2].name == "empty",
                "empty should be a directory");
        t.check(out[3].is_dir && out[3].name == "show",
                "show should be a directory");
    }
}

void test_list_errors(TestContext &t) {
    auto remote = sampleRemote();
    remote->denyList("/srv/media/show");
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    std::vector<sftpfetch::FileInfo> out;
    t.check(!c.list("/", out, err), "list should fail when disconnected");
    t.check(!err.empty(), "list should provide error when disconnected");

    t.check(c.connect(validOptions(), err), "connect should succeed");
    err.clear();
    t.check(!c.list("/does-not-exist", out, err),
            "list on missing path should fail");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::RemoteIOFailed,
            "missing path should be RemoteIOFailed");

    err.clear();
    t.check(!c.list("/srv/media/show", out, err), "denied list should fail");
    t.checkContains(err, "Permission denied", "denied list should say so");

    err.clear();
    t.check(!c.list("/srv/media/a.mkv", out, err),
            "list on a regular file should fail");
}

void test_stat_and_reported_size(TestContext &t) {
    auto remote = sampleRemote();
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    sftpfetch::FileInfo info;
    t.check(c.stat("/srv/media/b.mkv", info, err), "stat should succeed");
    t.check(info.size == 250 && !info.is_dir && info.mtime == 300,
            "stat should report size and mtime");

    remote->setReportedSize("/srv/media/b.mkv", 999);
    t.check(c.stat("/srv/media/b.mkv", info, err), "stat should still succeed");
    t.check(info.size == 999, "stat should honour the reported size override");

    t.check(!c.stat("/nope", info, err), "stat on missing path should fail");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::RemoteIOFailed,
            "missing stat should be RemoteIOFailed");
}

void test_ranged_reads(TestContext &t) {
    auto remote = std::make_shared<sftpfetch::MockRemote>();
    remote->addFile("/f.bin", "0123456789");
    remote->failReadsAt("/f.bin", 8);
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    auto rf = c.openRead("/f.bin", err);
    t.check(static_cast<bool>(rf), "openRead should return a handle");
    if (!rf)
        return;
    char buf[4];
    t.check(rf->seek(3, err), "seek should succeed");
    t.check(rf->read(buf, 4, err) == 4 && std::string(buf, 4) == "3456",
            "read should start at the seek offset");
    t.check(rf->read(buf, 4, err) < 0, "read covering offset 8 should fail");
    t.checkContains(err, "Connection reset", "injected read failure message");

    t.check(rf->seek(10, err), "seek to end should succeed");
    t.check(rf->read(buf, 4, err) == 0, "read at end should report EOF");

    t.check(!c.openRead("/srv", err), "openRead on a directory should fail");
}

void test_new_connection_like(TestContext &t) {
    auto remote = sampleRemote();
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(c.connect(validOptions(), err), "base connect should succeed");
    {
        auto conn = c.newConnectionLike(validOptions(), err);
        t.check(static_cast<bool>(conn),
                "newConnectionLike should return a client");
        t.check(conn && conn->isConnected(),
                "newConnectionLike client should be connected");
        t.check(remote->liveSessions() == 2, "clone should count as a session");
        std::vector<sftpfetch::FileInfo> out;
        t.check(conn && conn->list("/srv/media", out, err),
                "clone should see the same remote tree");
    }
    t.check(remote->liveSessions() == 1,
            "destroying the clone should close its session");
}

void test_new_connection_like_validation(TestContext &t) {
    sftpfetch::MockSftpClient c;
    sftpfetch::SessionOptions bad;
    bad.host = "";
    bad.username = "alice";
    std::string err;
    auto conn = c.newConnectionLike(bad, err);
    t.check(!conn, "newConnectionLike should fail with invalid options");
    t.check(!err.empty(), "newConnectionLike should report validation errors");
    t.check(c.lastErrorKind() == sftpfetch::ErrorKind::InvalidConfiguration,
            "failed clone should propagate its error kind");
}

void test_directory_size(TestContext &t) {
    auto remote = sampleRemote();
    sftpfetch::MockSftpClient c(remote);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    t.check(sftpfetch::directorySize(c, "/srv/media/show") == 100,
            "directorySize should sum nested files");
    t.check(sftpfetch::directorySize(c, "/srv/media/empty") == 0,
            "empty directory should be zero");
    t.check(sftpfetch::directorySize(c, "/srv/media") == 1350,
            "directorySize should recurse through every level");

    remote->denyList("/srv/media/show/extras");
    t.check(sftpfetch::directorySize(c, "/srv/media/show") == 40,
            "unlistable subdirectories should count as zero");
    t.check(sftpfetch::directorySize(c, "/missing") == 0,
            "missing directory should be zero");
}

void test_join_remote_path(TestContext &t) {
    t.check(sftpfetch::joinRemotePath("", "a") == "/a", "empty base joins at root");
    t.check(sftpfetch::joinRemotePath("/", "a") == "/a", "root base");
    t.check(sftpfetch::joinRemotePath("/x/", "a") == "/x/a", "trailing slash");
    t.check(sftpfetch::joinRemotePath("/x", "a") == "/x/a", "plain base");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_connect_failure_injection(t);
    test_disconnect_changes_state(t);
    test_list_known_path(t);
    test_list_errors(t);
    test_stat_and_reported_size(t);
    test_ranged_reads(t);
    test_new_connection_like(t);
    test_new_connection_like_validation(t);
    test_directory_size(t);
    test_join_remote_path(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpfetch_core_tests\n";
    return EXIT_SUCCESS;
}
