// Application layer tests: settings, remote browser and the download queue
// (run via CTest, no external framework).
#include "AppSettings.hpp"
#include "RemoteBrowser.hpp"
#include "SecretStore.hpp"
#include "TransferController.hpp"
#include "sftpfetch/MockSftpClient.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>
#include <QTextStream>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

bool writeText(const QString &path, const QString &text) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    QTextStream(&f) << text;
    return true;
}

QByteArray readAll(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

sftpfetch::SessionOptions mockOptions() {
    sftpfetch::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

// Settings

const char *kSampleConf =
    "# sftpfetch test configuration\n"
    "REMOTE_HOST=\"seedbox.example.net\"\n"
    "REMOTE_PORT=2222\n"
    "export REMOTE_USER='media'\n"
    "SSH_KEY_PATH=~/.ssh/id_ed25519\n"
    "\n"
    "KNOWN_HOSTS_POLICY=accept-new\n"
    "REMOTE_BASE_PATH=/home/media/downloads\n"
    "DOWNLOAD_CHUNKS=4\n"
    "SMALL_FILE_THRESHOLD_BYTES=not-a-number\n"
    "CACHE_MAX_AGE_SECONDS=60\n"
    "SHOW_FOLDER_SIZES=yes\n"
    "DOWNLOAD_PATH_1=/srv/movies\n"
    "PATH_1_NAME=Movies\n"
    "DOWNLOAD_PATH_3=~/tv\n";

void test_settings_load(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = QDir(tmp.path()).filePath(QStringLiteral("sftpfetch.conf"));
    t.check(writeText(path, QString::fromLatin1(kSampleConf)), "config should be writable");

    AppSettings s;
    QString err;
    t.check(AppSettings::load(path, s, &err), "load should succeed: " + err.toStdString());
    t.check(s.host == QStringLiteral("seedbox.example.net"), "quotes should be stripped");
    t.check(s.port == 2222, "port should be parsed");
    t.check(s.user == QStringLiteral("media"), "export prefix and single quotes handled");
    t.check(s.keyPath == QDir::homePath() + QStringLiteral("/.ssh/id_ed25519"),
            "~ should expand to the home directory");
    t.check(s.knownHostsPolicy == sftpfetch::KnownHostsPolicy::AcceptNew,
            "accept-new policy should be recognised");
    t.check(s.basePath == QStringLiteral("/home/media/downloads"), "base path");
    t.check(s.chunks == 4, "chunk count should be parsed");
    t.check(s.smallFileThreshold == (qint64)sftpfetch::kDefaultSmallFileThreshold,
            "invalid numbers should fall back to the default");
    t.check(s.cacheMaxAgeSeconds == 60, "cache max age should be parsed");
    t.check(s.showFolderSizes, "yes should enable folder sizes");
    t.check(s.cacheDir == QDir(tmp.path()).absolutePath() + QStringLiteral("/.cache"),
            "cache dir should default next to the config file");
    t.check(s.downloadPaths.size() == 2, "two download targets configured");
    if (s.downloadPaths.size() == 2) {
        t.check(s.downloadPaths[0].name == QStringLiteral("Movies") &&
                    s.downloadPaths[0].path == QStringLiteral("/srv/movies"),
                "named download target");
        t.check(s.downloadPaths[1].name == QStringLiteral("Path 3") &&
                    s.downloadPaths[1].path == QDir::homePath() + QStringLiteral("/tv"),
                "unnamed target gets a default name");
    }
    t.check(s.validate(&err), "sample config should validate");

    const auto opt = s.sessionOptions();
    t.check(opt.host == "seedbox.example.net" && opt.port == 2222 && opt.username == "media",
            "session options should mirror the settings");
    t.check(!opt.password.has_value(), "unset password should stay empty");
    t.check(opt.private_key_path.has_value(), "key path should be passed on");
    t.check(s.transferOptions().concurrency == 4, "transfer options carry chunks");
}

void test_settings_defaults_and_errors(TestContext &t) {
    QTemporaryDir tmp;
    AppSettings s;
    QString err;
    t.check(!AppSettings::load(QDir(tmp.path()).filePath(QStringLiteral("none.conf")), s, &err),
            "missing config should fail");
    t.check(err.contains(QStringLiteral("not found")), "error should say the file is missing");

    const QString path = QDir(tmp.path()).filePath(QStringLiteral("min.conf"));
    t.check(writeText(path, QStringLiteral("REMOTE_HOST=h\n")), "config should be writable");
    t.check(AppSettings::load(path, s, &err), "minimal config should load");
    t.check(s.port == 22 && s.chunks == 8 && s.cacheMaxAgeSeconds == 300 &&
                !s.showFolderSizes && s.basePath == QStringLiteral("/") &&
                s.knownHostsPolicy == sftpfetch::KnownHostsPolicy::Strict,
            "unset keys should keep their defaults");
    t.check(!s.validate(&err) && err.contains(QStringLiteral("REMOTE_USER")),
            "missing user should fail validation");

    s.user = QStringLiteral("u");
    s.chunks = 0;
    t.check(!s.validate(&err) && err.contains(QStringLiteral("DOWNLOAD_CHUNKS")),
            "zero chunks should fail validation");
    s.chunks = sftpfetch::kMaxConcurrency + 1;
    t.check(!s.validate(&err) && err.contains(QStringLiteral("DOWNLOAD_CHUNKS")),
            "chunk count above the maximum should fail validation");
    s.chunks = 8;
    s.port = 70000;
    t.check(!s.validate(&err) && err.contains(QStringLiteral("REMOTE_PORT")),
            "out-of-range port should fail validation");
    s.port = 22;
    s.cacheMaxAgeSeconds = -1;
    t.check(!s.validate(&err), "negative cache age should fail validation");

    // 4294967297 would wrap to 1 if narrowed to int.
    const QString big = QDir(tmp.path()).filePath(QStringLiteral("big.conf"));
    t.check(writeText(big, QStringLiteral("REMOTE_HOST=h\nREMOTE_USER=u\nDOWNLOAD_CHUNKS=4294967297\n"
                                          "REMOTE_PORT=4294967318\n")),
            "config should be writable");
    AppSettings huge;
    t.check(AppSettings::load(big, huge, &err), "oversized numbers should still load");
    t.check(huge.chunks > sftpfetch::kMaxConcurrency, "oversized chunk count must not wrap");
    t.check(huge.port > 65535, "oversized port must not wrap");
    t.check(!huge.validate(&err) && err.contains(QStringLiteral("REMOTE_PORT")),
            "oversized values should fail validation");
    huge.port = 22;
    t.check(!huge.validate(&err) && err.contains(QStringLiteral("DOWNLOAD_CHUNKS")),
            "oversized chunk count should fail validation");
}

void test_settings_persist_folder_sizes(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = QDir(tmp.path()).filePath(QStringLiteral("sftpfetch.conf"));
    t.check(writeText(path, QStringLiteral("REMOTE_HOST=h\nREMOTE_USER=u\nDOWNLOAD_CHUNKS=3\n")),
            "config should be writable");
    AppSettings s;
    QString err;
    t.check(AppSettings::load(path, s, &err), "config should load");
    t.check(s.setShowFolderSizes(true, &err), "toggle should persist: " + err.toStdString());
    t.check(s.showFolderSizes, "in-memory flag should follow");

    AppSettings again;
    t.check(AppSettings::load(path, again, &err), "rewritten config should load");
    t.check(again.showFolderSizes, "persisted toggle should be read back");
    t.check(again.host == QStringLiteral("h") && again.user == QStringLiteral("u") &&
                again.chunks == 3,
            "other keys should survive the rewrite");
    t.check(readAll(path).contains("SHOW_FOLDER_SIZES=\"true\""),
            "file should hold the new value");
}

// Secret store (plain-settings backend only; the Secret Service needs a session bus)

void test_secret_store_fallback(TestContext &t) {
    if (QString::fromLatin1(SecretStore::backendName()) != QLatin1String("settings-fallback"))
        return;
    QTemporaryDir tmp;
    QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, tmp.path());
    const QString key = SecretStore::passwordKey(QStringLiteral("media"),
                                                 QStringLiteral("seedbox.example.net"), 2222);
    t.check(key == QStringLiteral("password:media@seedbox.example.net:2222"),
            "password key should name user, host and port");

    SecretStore store;
    qunsetenv("SFTPFETCH_ENABLE_INSECURE_FALLBACK");
    const auto refused = store.setSecret(key, QStringLiteral("pw"));
    t.check(refused.status == SecretStore::PersistStatus::Unavailable,
            "fallback should be off unless enabled");
    t.check(!store.getSecret(key).has_value(), "nothing should be readable when disabled");

    qputenv("SFTPFETCH_ENABLE_INSECURE_FALLBACK", "1");
    t.check(SecretStore::insecureFallbackActive(), "fallback should report itself active");
    t.check(store.setSecret(key, QStringLiteral("s3cret")).ok(), "enabled fallback should store");
    t.check(store.getSecret(key).value_or(QString()) == QStringLiteral("s3cret"),
            "stored secret should be read back");
    t.check(!store.setSecret(QString(), QStringLiteral("x")).ok(), "empty key should be refused");

    AppSettings s;
    s.host = QStringLiteral("seedbox.example.net");
    s.port = 2222;
    s.user = QStringLiteral("media");
    s.keyPath = QStringLiteral("/keys/id_ed25519");
    t.check(store.setSecret(SecretStore::passphraseKey(s.keyPath), QStringLiteral("pp")).ok(),
            "passphrase should store");
    t.check(s.applySecrets(store) == 2, "both credentials should come from the store");
    t.check(s.password == QStringLiteral("s3cret") && s.keyPassphrase == QStringLiteral("pp"),
            "credentials should be filled in");

    AppSettings explicitPw = s;
    explicitPw.password = QStringLiteral("from-file");
    explicitPw.keyPassphrase.clear();
    t.check(explicitPw.applySecrets(store) == 1 &&
                explicitPw.password == QStringLiteral("from-file"),
            "a password from the config file should win");

    t.check(store.removeSecret(key), "remove should succeed");
    t.check(!store.getSecret(key).has_value(), "removed secret should be gone");
    qunsetenv("SFTPFETCH_ENABLE_INSECURE_FALLBACK");
}

// Remote browser

std::shared_ptr<sftpfetch::MockRemote> browseRemote() {
    auto remote = std::make_shared<sftpfetch::MockRemote>();
    remote->addFile("/dl/old.mkv", std::string(100, 'o'), 1000);
    remote->addFile("/dl/new.mkv", std::string(200, 'n'), 3000);
    remote->addFile("/dl/Show/e1.mkv", std::string(30, 'e'), 2000);
    remote->addFile("/dl/Show/Extras/x.mkv", std::string(12, 'x'), 2000);
    remote->addDir("/dl/Empty", 1500);
    remote->addDir("/void", 10);
    return remote;
}

void test_browser_sorts_and_caches(TestContext &t) {
    QTemporaryDir tmp;
    auto remote = browseRemote();
    sftpfetch::MockSftpClient client(remote);
    std::string e;
    t.check(client.connect(mockOptions(), e), "mock connect should succeed");
    ListingCache cache(tmp.path(), 300);
    RemoteBrowser browser(client, cache);

    DirectoryListing l;
    QString err;
    t.check(browser.listDirectory(QStringLiteral("/dl"), false, false, l, &err),
            "first listing should succeed");
    t.check(!l.fromCache, "first listing should come from the remote");
    t.check(l.entries.size() == 4, "four entries expected");
    bool newestFirst = true;
    for (std::size_t i = 1; i < l.entries.size(); ++i)
        newestFirst = newestFirst && l.entries[i - 1].mtime >= l.entries[i].mtime;
    t.check(newestFirst, "entries should be sorted newest first");
    t.check(!l.entries.empty() && l.entries.front().name == "new.mkv",
            "newest file should come first");
    t.check(l.folderSizes.empty(), "no folder sizes unless requested");
    t.check(remote->listCalls() == 1, "one remote listing so far");

    t.check(browser.listDirectory(QStringLiteral("/dl"), false, false, l, &err),
            "second listing should succeed");
    t.check(l.fromCache, "second listing should be served from cache");
    t.check(remote->listCalls() == 1, "cache hit should not touch the remote");
    t.check(l.entries.size() == 4 && l.entries.front().name == "new.mkv",
            "cached listing should keep the order");

    t.check(browser.listDirectory(QStringLiteral("/dl"), true, false, l, &err),
            "forced refresh should succeed");
    t.check(!l.fromCache && remote->listCalls() == 2, "refresh should bypass the cache");
}

void test_browser_folder_sizes(TestContext &t) {
    QTemporaryDir tmp;
    auto remote = browseRemote();
    sftpfetch::MockSftpClient client(remote);
    std::string e;
    t.check(client.connect(mockOptions(), e), "mock connect should succeed");
    ListingCache cache(tmp.path(), 300);
    RemoteBrowser browser(client, cache);

    DirectoryListing l;
    t.check(browser.listDirectory(QStringLiteral("/dl"), false, false, l),
            "listing without sizes should succeed");
    const int before = remote->listCalls();

    t.check(browser.listDirectory(QStringLiteral("/dl"), false, true, l),
            "listing with sizes should succeed");
    t.check(l.fromCache, "entries should still come from cache");
    t.check(l.folderSizes.size() == 2 && l.folderSizes["Show"] == 42 &&
                l.folderSizes["Empty"] == 0,
            "missing folder sizes should be computed recursively");
    t.check(remote->listCalls() > before, "sizes need remote listings");

    const int afterSizes = remote->listCalls();
    t.check(browser.listDirectory(QStringLiteral("/dl"), false, true, l),
            "listing with cached sizes should succeed");
    t.check(remote->listCalls() == afterSizes, "stored sizes should be reused");
    t.check(l.folderSizes.size() == 2, "cached sizes should be complete");

    auto stored = cache.get(QStringLiteral("/dl"));
    t.check(stored.has_value() && stored->folderSizes.size() == 2,
            "the completed size set should be stored");
}

void test_browser_errors_and_empty(TestContext &t) {
    QTemporaryDir tmp;
    auto remote = browseRemote();
    remote->denyList("/dl/Show");
    sftpfetch::MockSftpClient client(remote);
    std::string e;
    t.check(client.connect(mockOptions(), e), "mock connect should succeed");
    ListingCache cache(tmp.path(), 300);
    RemoteBrowser browser(client, cache);

    DirectoryListing l;
    QString err;
    t.check(!browser.listDirectory(QStringLiteral("/dl/Show"), false, false, l, &err),
            "denied listing should fail");
    t.check(err.contains(QStringLiteral("Permission denied")), "error should be passed on");

    t.check(browser.listDirectory(QStringLiteral("/void"), false, false, l, &err),
            "empty directory should list");
    t.check(l.entries.empty(), "empty directory has no entries");
    t.check(!cache.get(QStringLiteral("/void")).has_value(),
            "empty listings should not be cached");

    t.check(browser.listDirectory(QStringLiteral("/dl"), false, true, l, &err),
            "listing with an unreadable subfolder should succeed");
    t.check(l.folderSizes["Show"] == 0, "unreadable folder should count as zero");
}

void test_parent_path(TestContext &t) {
    t.check(RemoteBrowser::parentPath(QStringLiteral("/a/b/c")) == QStringLiteral("/a/b"),
            "parent of nested path");
    t.check(RemoteBrowser::parentPath(QStringLiteral("/a/")) == QStringLiteral("/"),
            "parent of top-level dir");
    t.check(RemoteBrowser::parentPath(QStringLiteral("/")) == QStringLiteral("/"),
            "root is its own parent");
    t.check(RemoteBrowser::parentPath(QStringLiteral("/base/x"), QStringLiteral("/base")) ==
                QStringLiteral("/base"),
            "parent within root");
    t.check(RemoteBrowser::parentPath(QStringLiteral("/base"), QStringLiteral("/base/")) ==
                QStringLiteral("/base"),
            "never above root");
}

// Download queue

struct QueueRecorder {
    int started = 0;
    int finishedOk = 0;
    int finishedFailed = 0;
    int queueSucceeded = -1;
    int queueFailed = -1;
    quint64 lastDone = 0;
    quint64 lastTotal = 0;

    void attach(TransferController &ctl) {
        QObject::connect(&ctl, &TransferController::fileStarted, &ctl,
                         [this](int, const QString &) { ++started; }, Qt::DirectConnection);
        QObject::connect(&ctl, &TransferController::progress, &ctl,
                         [this](int, quint64 done, quint64 total) {
                             lastDone = done;
                             lastTotal = total;
                         },
                         Qt::DirectConnection);
        QObject::connect(&ctl, &TransferController::fileFinished, &ctl,
                         [this](int, bool ok, const QString &) {
                             ok ? ++finishedOk : ++finishedFailed;
                         },
                         Qt::DirectConnection);
        QObject::connect(&ctl, &TransferController::queueFinished, &ctl,
                         [this](int s, int f) {
                             queueSucceeded = s;
                             queueFailed = f;
                         },
                         Qt::DirectConnection);
    }
};

void test_queue_downloads(TestContext &t) {
    QTemporaryDir tmp;
    auto remote = std::make_shared<sftpfetch::MockRemote>();
    remote->addFile("/dl/a.bin", std::string(3000, 'a'));
    remote->addFile("/dl/b.bin", std::string(700, 'b'));
    sftpfetch::MockSftpClient client(remote);
    std::string e;
    t.check(client.connect(mockOptions(), e), "mock connect should succeed");

    sftpfetch::TransferOptions topt;
    topt.concurrency = 3;
    topt.smallFileThreshold = 1000;
    TransferController ctl(client, mockOptions(), topt);
    QueueRecorder rec;
    rec.attach(ctl);
    const QString dest = QDir(tmp.path()).filePath(QStringLiteral("out"));
    ctl.enqueue(QStringLiteral("/dl/a.bin"), dest);
    ctl.enqueue(QStringLiteral("/dl/missing.bin"), dest);
    ctl.enqueue(QStringLiteral("/dl/b.bin"), dest);

    t.check(ctl.start(), "queue should start");
    ctl.wait();
    t.check(!ctl.isRunning(), "queue should be idle after wait");
    t.check(rec.started == 3, "every file should start");
    t.check(rec.finishedOk == 2 && rec.finishedFailed == 1, "one file should fail");
    t.check(rec.queueSucceeded == 2 && rec.queueFailed == 1, "queue totals");
    t.check(rec.lastDone == 700 && rec.lastTotal == 700,
            "last progress should report the last file complete");
    t.check(readAll(QDir(dest).filePath(QStringLiteral("a.bin"))) == QByteArray(3000, 'a'),
            "chunked file should be downloaded into the destination directory");
    t.check(readAll(QDir(dest).filePath(QStringLiteral("b.bin"))) == QByteArray(700, 'b'),
            "small file should be downloaded");

    const auto jobs = ctl.jobs();
    t.check(jobs.size() == 3 && jobs[1].finished && !jobs[1].outcome.succeeded &&
                jobs[1].outcome.error == sftpfetch::ErrorKind::RemoteIOFailed,
            "missing file outcome should be recorded");
    t.check(remote->liveSessions() == 1, "queue should not leak sessions");
}

void test_queue_cancel(TestContext &t) {
    QTemporaryDir tmp;
    auto remote = std::make_shared<sftpfetch::MockRemote>();
    remote->addFile("/dl/a.bin", std::string(100, 'a'));
    remote->addFile("/dl/b.bin", std::string(100, 'b'));
    sftpfetch::MockSftpClient client(remote);
    std::string e;
    t.check(client.connect(mockOptions(), e), "mock connect should succeed");

    TransferController ctl(client, mockOptions(), sftpfetch::TransferOptions{});
    QueueRecorder rec;
    rec.attach(ctl);
    QObject::connect(&ctl, &TransferController::fileStarted, &ctl,
                     [&ctl](int index, const QString &) {
                         if (index == 0)
                             ctl.cancelAll();
                     },
                     Qt::DirectConnection);
    ctl.enqueue(QStringLiteral("/dl/a.bin"), tmp.path());
    ctl.enqueue(QStringLiteral("/dl/b.bin"), tmp.path());
    t.check(ctl.start(), "queue should start");
    ctl.wait();

    t.check(rec.started == 1, "files after the cancellation should not start");
    t.check(rec.queueSucceeded == 0 && rec.queueFailed == 2, "both files count as failed");
    const auto jobs = ctl.jobs();
    t.check(jobs.size() == 2 && jobs[0].outcome.error == sftpfetch::ErrorKind::Canceled &&
                jobs[1].outcome.error == sftpfetch::ErrorKind::Canceled,
            "both outcomes should be Canceled");
    t.check(!QFile::exists(QDir(tmp.path()).filePath(QStringLiteral("a.bin"))),
            "canceled file should not be written");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_settings_load(t);
    test_settings_defaults_and_errors(t);
    test_settings_persist_folder_sizes(t);
    test_secret_store_fallback(t);
    test_browser_sorts_and_caches(t);
    test_browser_folder_sizes(t);
    test_browser_errors_and_empty(t);
    test_parent_path(t);
    test_queue_downloads(t);
    test_queue_cancel(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpfetch_app_tests\n";
    return EXIT_SUCCESS;
}
