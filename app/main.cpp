// sftpfetch command-line entry point.
#include "AppSettings.hpp"
#include "FormatUtils.hpp"
#include "ListingCache.hpp"
#include "LogUtils.hpp"
#include "RemoteBrowser.hpp"
#include "SecretStore.hpp"
#include "TransferController.hpp"
#include "sftpfetch/Libssh2SftpClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <unistd.h>
Q_LOGGING_CATEGORY(ocCli, "sftpfetch.cli")

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2 };

std::atomic<bool> g_interrupted{false};

void onSigint(int) { g_interrupted = true; }

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

QString defaultConfigPath() {
    const QByteArray env = qgetenv("SFTPFETCH_CONFIG");
    if (!env.isEmpty()) return QString::fromLocal8Bit(env);
    return QDir::homePath() + QStringLiteral("/.config/sftpfetch/sftpfetch.conf");
}

// Relative remote paths are resolved against REMOTE_BASE_PATH.
QString resolveRemote(const AppSettings& s, const QString& path) {
    if (path.isEmpty()) return s.basePath;
    if (path.startsWith('/')) return path;
    return QString::fromStdString(
        sftpfetch::joinRemotePath(s.basePath.toStdString(), path.toStdString()));
}

bool confirmHostKey(const std::string& host, std::uint16_t port,
                    const std::string& algorithm, const std::string& fingerprint) {
    if (!isatty(fileno(stdin))) return false;
    err() << "The authenticity of host " << QString::fromStdString(host) << ':' << port
          << " can't be established.\n"
          << QString::fromStdString(algorithm) << " key fingerprint is "
          << QString::fromStdString(fingerprint) << "\n"
          << "Accept and store it? [y/N] " << Qt::flush;
    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

bool connectClient(const AppSettings& s, sftpfetch::SftpClient& client) {
    auto opt = s.sessionOptions();
    opt.hostkey_confirm_cb = confirmHostKey;
    qCInfo(ocCli) << "connecting to" << sftpfetchapp::sensitive(s.host) << "port" << s.port
                  << "as" << sftpfetchapp::sensitive(s.user);
    std::string e;
    if (!client.connect(opt, e)) {
        err() << "Connection failed (" << sftpfetch::errorKindName(client.lastErrorKind())
              << "): " << QString::fromStdString(e) << "\n";
        return false;
    }
    return true;
}

int cmdTest(const AppSettings& s) {
    sftpfetch::Libssh2SftpClient client;
    if (!connectClient(s, client)) return ExitFailed;
    sftpfetch::FileInfo info{};
    std::string e;
    if (!client.stat(s.basePath.toStdString(), info, e)) {
        err() << "Connected, but " << s.basePath << " is not accessible: "
              << QString::fromStdString(e) << "\n";
        return ExitFailed;
    }
    out() << "Connection OK: " << s.user << '@' << s.host << ':' << s.port << ' '
          << s.basePath << "\n";
    return ExitOk;
}

int cmdList(const AppSettings& s, const QString& pathArg, bool refresh, bool folderSizes) {
    sftpfetch::Libssh2SftpClient client;
    if (!connectClient(s, client)) return ExitFailed;
    ListingCache cache(s.cacheDir, s.cacheMaxAgeSeconds);
    RemoteBrowser browser(client, cache);

    const QString path = resolveRemote(s, pathArg);
    DirectoryListing listing;
    QString e;
    if (!browser.listDirectory(path, refresh, folderSizes, listing, &e)) {
        err() << "Failed to list " << path << ": " << e << "\n";
        return ExitFailed;
    }

    out() << "Current path: " << path << "\n";
    if (listing.fromCache)
        out() << "Using cached data (" << sftpfetchapp::formatAge(listing.ageSeconds) << " old)\n";
    if (listing.entries.empty()) {
        out() << "No files found\n";
        return ExitOk;
    }
    int idx = 0;
    for (const auto& fi : listing.entries) {
        QString name = QString::fromStdString(fi.name);
        QString size;
        if (fi.is_dir) {
            name += '/';
            auto it = listing.folderSizes.find(fi.name);
            if (folderSizes && it != listing.folderSizes.end() && it->second > 0)
                size = sftpfetchapp::formatSize(it->second);
        } else {
            size = sftpfetchapp::formatSize(fi.size);
        }
        out() << QStringLiteral("%1  %2  %3  %4\n")
                     .arg(++idx, 4)
                     .arg(name, -48)
                     .arg(size, 10)
                     .arg(sftpfetchapp::localShortTime(fi.mtime));
    }
    return ExitOk;
}

int cmdGet(QCoreApplication& app, AppSettings s, const QStringList& remotes,
           QString dest, int chunksOverride) {
    if (chunksOverride > 0) s.chunks = chunksOverride;
    if (dest.isEmpty())
        dest = s.downloadPaths.isEmpty() ? QDir::currentPath() : s.downloadPaths.first().path;

    sftpfetch::Libssh2SftpClient client;
    if (!connectClient(s, client)) return ExitFailed;

    auto opt = s.sessionOptions();
    opt.hostkey_confirm_cb = confirmHostKey;
    TransferController ctl(client, opt, s.transferOptions());
    for (const QString& r : remotes) ctl.enqueue(resolveRemote(s, r), dest);
    const int total = remotes.size();

    QObject::connect(&ctl, &TransferController::fileStarted, &app,
                     [total](int index, const QString& remote) {
                         err() << "[" << index + 1 << "/" << total << "] "
                               << QFileInfo(remote).fileName() << "\n";
                     });
    QObject::connect(&ctl, &TransferController::progress, &app,
                     [](int, quint64 done, quint64 size) {
                         const int pct = size ? (int)((done * 100) / size) : 100;
                         err() << "\r  " << pct << "%  " << sftpfetchapp::formatSize(done)
                               << " / " << sftpfetchapp::formatSize(size) << "   " << Qt::flush;
                     });
    QObject::connect(&ctl, &TransferController::fileFinished, &app,
                     [](int, bool ok, const QString& message) {
                         err() << "\n  " << (ok ? "done: " : "FAILED: ") << message << "\n";
                     });
    QObject::connect(&ctl, &TransferController::queueFinished, &app,
                     [&app](int succeeded, int failed) {
                         out() << succeeded << " succeeded, " << failed << " failed\n" << Qt::flush;
                         app.exit(failed ? ExitFailed : ExitOk);
                     });

    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&ctl] {
        if (g_interrupted.load() && !ctl.isCanceled()) {
            err() << "\nInterrupted, canceling...\n";
            ctl.cancelAll();
        }
    });
    interruptPoll.start(200);
    std::signal(SIGINT, onSigint);

    if (!ctl.start()) {
        err() << "Nothing to download\n";
        return ExitUsage;
    }
    const int rc = app.exec();
    ctl.wait();
    return rc;
}

int cmdCacheStats(const AppSettings& s) {
    const CacheStats st = ListingCache(s.cacheDir, s.cacheMaxAgeSeconds).stats();
    out() << "Cache directory: " << s.cacheDir << "\n"
          << "Entries: " << st.count << "\n"
          << "Size: " << sftpfetchapp::formatSize((quint64)st.totalBytes) << "\n";
    return ExitOk;
}

int cmdCacheClear(const AppSettings& s) {
    const int n = ListingCache(s.cacheDir, s.cacheMaxAgeSeconds).clear();
    out() << "Removed " << n << " cache entries\n";
    return ExitOk;
}

int cmdFolderSizes(AppSettings& s, const QString& arg) {
    const QString v = arg.toLower();
    if (v.isEmpty()) {
        out() << "Folder sizes: " << (s.showFolderSizes ? "on" : "off") << "\n";
        return ExitOk;
    }
    if (v != QLatin1String("on") && v != QLatin1String("off")) {
        err() << "folder-sizes expects 'on' or 'off'\n";
        return ExitUsage;
    }
    QString e;
    if (!s.setShowFolderSizes(v == QLatin1String("on"), &e)) {
        err() << e << "\n";
        return ExitFailed;
    }
    out() << "Folder sizes: " << v << "\n";
    return ExitOk;
}

// secret set|clear password|passphrase; the value for "set" is read from stdin.
int cmdSecret(const AppSettings& s, const QStringList& args) {
    const QString action = args.value(0);
    const QString what = args.value(1);
    QString key;
    if (what == QLatin1String("password")) {
        if (s.user.isEmpty() || s.host.isEmpty()) {
            err() << "REMOTE_USER and REMOTE_HOST must be set to store a password\n";
            return ExitUsage;
        }
        key = SecretStore::passwordKey(s.user, s.host, s.port);
    } else if (what == QLatin1String("passphrase")) {
        if (s.keyPath.isEmpty()) {
            err() << "SSH_KEY_PATH must be set to store a passphrase\n";
            return ExitUsage;
        }
        key = SecretStore::passphraseKey(s.keyPath);
    } else {
        err() << "secret expects 'set' or 'clear' followed by 'password' or 'passphrase'\n";
        return ExitUsage;
    }

    SecretStore store;
    if (action == QLatin1String("clear")) {
        if (!store.removeSecret(key)) {
            err() << "Could not remove the " << what << " (" << SecretStore::backendName() << ")\n";
            return ExitFailed;
        }
        out() << "Removed stored " << what << "\n";
        return ExitOk;
    }
    if (action != QLatin1String("set")) {
        err() << "Unknown secret action: " << action << "\n";
        return ExitUsage;
    }

    if (isatty(fileno(stdin))) err() << "Enter " << what << ": " << Qt::flush;
    QTextStream in(stdin);
    const QString value = in.readLine();
    if (value.isEmpty()) {
        err() << "Empty " << what << ", nothing stored\n";
        return ExitUsage;
    }
    const SecretStore::PersistResult r = store.setSecret(key, value);
    if (!r.ok()) {
        err() << "Could not store the " << what << ": " << r.detail << "\n";
        return r.status == SecretStore::PersistStatus::Unavailable ? ExitUsage : ExitFailed;
    }
    if (SecretStore::insecureFallbackActive())
        err() << "Warning: stored in plain text (" << SecretStore::backendName() << ")\n";
    out() << "Stored " << what << " in " << SecretStore::backendName() << "\n";
    return ExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sftpfetch"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    sftpfetchapp::applyLoggingRules();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Parallel chunked SFTP downloader with a cached remote browser.\n\n"
        "Commands:\n"
        "  ls [PATH]               list a remote directory\n"
        "  get REMOTE...           download files\n"
        "  test                    test the connection\n"
        "  cache-stats             show listing cache usage\n"
        "  cache-clear             delete cached listings\n"
        "  folder-sizes [on|off]   show or persist the folder size setting\n"
        "  secret set|clear password|passphrase\n"
        "                          manage credentials kept outside the config file"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                       QStringLiteral("Configuration file."),
                                       QStringLiteral("file"), defaultConfigPath());
    const QCommandLineOption refreshOpt(QStringLiteral("refresh"),
                                        QStringLiteral("Ignore cached listings."));
    const QCommandLineOption sizesOpt(QStringLiteral("folder-sizes"),
                                      QStringLiteral("Compute folder sizes."));
    const QCommandLineOption destOpt({QStringLiteral("d"), QStringLiteral("dest")},
                                     QStringLiteral("Download directory."),
                                     QStringLiteral("dir"));
    const QCommandLineOption chunksOpt({QStringLiteral("n"), QStringLiteral("chunks")},
                                       QStringLiteral("Parallel chunks per file."),
                                       QStringLiteral("count"));
    parser.addOptions({configOpt, refreshOpt, sizesOpt, destOpt, chunksOpt});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        err() << parser.helpText();
        return ExitUsage;
    }
    const QString command = args.takeFirst();

    AppSettings settings;
    QString e;
    if (!AppSettings::load(parser.value(configOpt), settings, &e)) {
        err() << e << "\n";
        return ExitUsage;
    }

    if (command == QLatin1String("cache-stats")) return cmdCacheStats(settings);
    if (command == QLatin1String("cache-clear")) return cmdCacheClear(settings);
    if (command == QLatin1String("folder-sizes"))
        return cmdFolderSizes(settings, args.value(0));
    if (command == QLatin1String("secret")) return cmdSecret(settings, args);

    SecretStore secrets;
    settings.applySecrets(secrets);

    int chunks = 0;
    if (parser.isSet(chunksOpt)) {
        bool ok = false;
        chunks = parser.value(chunksOpt).toInt(&ok);
        if (!ok || chunks < 1 || chunks > sftpfetch::kMaxConcurrency) {
            err() << "--chunks must be between 1 and " << sftpfetch::kMaxConcurrency << "\n";
            return ExitUsage;
        }
    }
    if (!settings.validate(&e)) {
        err() << sftpfetch::errorKindName(sftpfetch::ErrorKind::InvalidConfiguration) << ": "
              << e << "\n";
        return ExitUsage;
    }

    if (command == QLatin1String("test")) return cmdTest(settings);
    if (command == QLatin1String("ls"))
        return cmdList(settings, args.value(0), parser.isSet(refreshOpt),
                       parser.isSet(sizesOpt) || settings.showFolderSizes);
    if (command == QLatin1String("get")) {
        if (args.isEmpty()) {
            err() << "get needs at least one remote file\n";
            return ExitUsage;
        }
        return cmdGet(app, settings, args, parser.value(destOpt), chunks);
    }

    err() << "Unknown command: " << command << "\n";
    return ExitUsage;
}
