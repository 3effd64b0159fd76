#include "AppSettings.hpp"
#include "SecretStore.hpp"
#include <QDir>
#include <QFileInfo>
#include <QIODevice>
#include <QLoggingCategory>
#include <QTextStream>
#include <QtGlobal>
#include <limits>
Q_LOGGING_CATEGORY(ocConf, "sftpfetch.config")

namespace {

QString unquote(QString v) {
    v = v.trimmed();
    while (v.size() >= 1 && (v.startsWith('"') || v.startsWith('\''))) v.remove(0, 1);
    while (v.size() >= 1 && (v.endsWith('"') || v.endsWith('\''))) v.chop(1);
    return v;
}

bool readBashConf(QIODevice& device, QSettings::SettingsMap& map) {
    QTextStream in(&device);
    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;
        if (line.startsWith(QLatin1String("export "))) line = line.mid(7).trimmed();
        const int eq = line.indexOf('=');
        if (eq <= 0) continue;
        map.insert(line.left(eq).trimmed(), unquote(line.mid(eq + 1)));
    }
    return in.status() == QTextStream::Ok;
}

bool writeBashConf(QIODevice& device, const QSettings::SettingsMap& map) {
    QTextStream out(&device);
    out << "# sftpfetch configuration\n";
    for (auto it = map.constBegin(); it != map.constEnd(); ++it)
        out << it.key() << "=\"" << it.value().toString() << "\"\n";
    out.flush();
    return out.status() == QTextStream::Ok;
}

QString expandHome(const QString& v) {
    if (v == QLatin1String("~")) return QDir::homePath();
    if (v.startsWith(QLatin1String("~/"))) return QDir::homePath() + v.mid(1);
    return v;
}

QString readString(const QSettings& s, const QString& key) {
    return s.value(key).toString().trimmed();
}

qint64 readInt(const QSettings& s, const QString& key, qint64 def) {
    const QString raw = readString(s, key);
    if (raw.isEmpty()) return def;
    bool ok = false;
    const qint64 v = raw.toLongLong(&ok);
    if (!ok) {
        qCWarning(ocConf) << key << "is not a number:" << raw << "- using" << def;
        return def;
    }
    return v;
}

// Out-of-range values saturate so validate() still rejects them instead of
// seeing a wrapped number.
int readIntField(const QSettings& s, const QString& key, int def) {
    const qint64 v = readInt(s, key, def);
    return (int)qBound<qint64>(std::numeric_limits<int>::min(), v, std::numeric_limits<int>::max());
}

bool readBool(const QSettings& s, const QString& key, bool def) {
    const QString raw = readString(s, key).toLower();
    if (raw.isEmpty()) return def;
    return raw == QLatin1String("true") || raw == QLatin1String("yes") || raw == QLatin1String("1");
}

sftpfetch::KnownHostsPolicy parsePolicy(const QString& raw) {
    const QString v = raw.toLower();
    if (v.isEmpty() || v == QLatin1String("strict")) return sftpfetch::KnownHostsPolicy::Strict;
    if (v == QLatin1String("accept-new") || v == QLatin1String("acceptnew") || v == QLatin1String("tofu"))
        return sftpfetch::KnownHostsPolicy::AcceptNew;
    if (v == QLatin1String("off") || v == QLatin1String("no")) return sftpfetch::KnownHostsPolicy::Off;
    qCWarning(ocConf) << "Unknown KNOWN_HOSTS_POLICY" << raw << "- using strict";
    return sftpfetch::KnownHostsPolicy::Strict;
}

} // namespace

QSettings::Format AppSettings::bashConfFormat() {
    static const QSettings::Format fmt =
        QSettings::registerFormat(QStringLiteral("conf"), readBashConf, writeBashConf);
    return fmt;
}

bool AppSettings::load(const QString& path, AppSettings& out, QString* errorOut) {
    const QFileInfo fi(path);
    if (!fi.exists()) {
        if (errorOut) *errorOut = QStringLiteral("Configuration file not found: %1").arg(path);
        return false;
    }
    QSettings s(path, bashConfFormat());
    if (s.status() != QSettings::NoError) {
        if (errorOut) *errorOut = QStringLiteral("Could not read configuration file: %1").arg(path);
        return false;
    }

    AppSettings a;
    a.configPath = fi.absoluteFilePath();
    a.host = readString(s, QStringLiteral("REMOTE_HOST"));
    a.port = readIntField(s, QStringLiteral("REMOTE_PORT"), 22);
    a.user = readString(s, QStringLiteral("REMOTE_USER"));
    a.keyPath = expandHome(readString(s, QStringLiteral("SSH_KEY_PATH")));
    a.keyPassphrase = readString(s, QStringLiteral("SSH_KEY_PASSPHRASE"));
    a.password = readString(s, QStringLiteral("SSH_PASSWORD"));
    a.knownHostsPath = expandHome(readString(s, QStringLiteral("KNOWN_HOSTS_PATH")));
    a.knownHostsPolicy = parsePolicy(readString(s, QStringLiteral("KNOWN_HOSTS_POLICY")));
    const QString base = readString(s, QStringLiteral("REMOTE_BASE_PATH"));
    if (!base.isEmpty()) a.basePath = base;
    a.chunks = readIntField(s, QStringLiteral("DOWNLOAD_CHUNKS"), sftpfetch::kDefaultConcurrency);
    a.smallFileThreshold = readInt(s, QStringLiteral("SMALL_FILE_THRESHOLD_BYTES"),
                                   (qint64)sftpfetch::kDefaultSmallFileThreshold);
    a.cacheMaxAgeSeconds = readInt(s, QStringLiteral("CACHE_MAX_AGE_SECONDS"), 300);
    a.cacheDir = expandHome(readString(s, QStringLiteral("CACHE_DIR")));
    if (a.cacheDir.isEmpty()) a.cacheDir = fi.absolutePath() + QStringLiteral("/.cache");
    a.showFolderSizes = readBool(s, QStringLiteral("SHOW_FOLDER_SIZES"), false);

    for (int i = 1; i <= 5; ++i) {
        const QString p = expandHome(readString(s, QStringLiteral("DOWNLOAD_PATH_%1").arg(i)));
        if (p.isEmpty()) continue;
        QString name = readString(s, QStringLiteral("PATH_%1_NAME").arg(i));
        if (name.isEmpty()) name = QStringLiteral("Path %1").arg(i);
        a.downloadPaths.push_back(DownloadTarget{name, p});
    }

    out = a;
    return true;
}

bool AppSettings::validate(QString* errorOut) const {
    QString err;
    if (host.isEmpty())
        err = QStringLiteral("REMOTE_HOST is not set");
    else if (user.isEmpty())
        err = QStringLiteral("REMOTE_USER is not set");
    else if (port < 1 || port > 65535)
        err = QStringLiteral("REMOTE_PORT must be between 1 and 65535 (got %1)").arg(port);
    else if (chunks < 1 || chunks > sftpfetch::kMaxConcurrency)
        err = QStringLiteral("DOWNLOAD_CHUNKS must be between 1 and %1 (got %2)")
                  .arg(sftpfetch::kMaxConcurrency)
                  .arg(chunks);
    else if (smallFileThreshold < 0)
        err = QStringLiteral("SMALL_FILE_THRESHOLD_BYTES must not be negative");
    else if (cacheMaxAgeSeconds < 0)
        err = QStringLiteral("CACHE_MAX_AGE_SECONDS must not be negative");
    if (err.isEmpty()) return true;
    if (errorOut) *errorOut = err;
    return false;
}

int AppSettings::applySecrets(const SecretStore& store) {
    int applied = 0;
    if (password.isEmpty()) {
        if (auto pw = store.getSecret(SecretStore::passwordKey(user, host, port))) {
            password = *pw;
            ++applied;
        }
    }
    if (!keyPath.isEmpty() && keyPassphrase.isEmpty()) {
        if (auto pp = store.getSecret(SecretStore::passphraseKey(keyPath))) {
            keyPassphrase = *pp;
            ++applied;
        }
    }
    if (applied)
        qCDebug(ocConf) << "credentials taken from" << SecretStore::backendName() << applied;
    return applied;
}

sftpfetch::SessionOptions AppSettings::sessionOptions() const {
    sftpfetch::SessionOptions opt;
    opt.host = host.toStdString();
    opt.port = (std::uint16_t)port;
    opt.username = user.toStdString();
    if (!password.isEmpty()) opt.password = password.toStdString();
    if (!keyPath.isEmpty()) opt.private_key_path = keyPath.toStdString();
    if (!keyPassphrase.isEmpty()) opt.private_key_passphrase = keyPassphrase.toStdString();
    if (!knownHostsPath.isEmpty()) opt.known_hosts_path = knownHostsPath.toStdString();
    opt.known_hosts_policy = knownHostsPolicy;
    return opt;
}

sftpfetch::TransferOptions AppSettings::transferOptions() const {
    sftpfetch::TransferOptions t;
    t.concurrency = chunks;
    t.smallFileThreshold = (std::uint64_t)smallFileThreshold;
    return t;
}

bool AppSettings::setShowFolderSizes(bool on, QString* errorOut) {
    QSettings s(configPath, bashConfFormat());
    s.setValue(QStringLiteral("SHOW_FOLDER_SIZES"), on ? QStringLiteral("true") : QStringLiteral("false"));
    s.sync();
    if (s.status() != QSettings::NoError) {
        if (errorOut) *errorOut = QStringLiteral("Could not update configuration file: %1").arg(configPath);
        return false;
    }
    showFolderSizes = on;
    return true;
}
