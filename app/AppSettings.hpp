// Application configuration loaded from a bash-style KEY=value file.
#pragma once
#include <QSettings>
#include <QString>
#include <QVector>
#include "sftpfetch/SftpTypes.hpp"
#include "sftpfetch/TransferCoordinator.hpp"

class SecretStore;

struct DownloadTarget {
    QString name;
    QString path;
};

class AppSettings {
public:
    // QSettings format for shell-style files: '#' comments, optional quotes,
    // no sections.
    static QSettings::Format bashConfFormat();

    // Reads `path`. Missing keys keep their defaults. Fails only when the
    // file cannot be read or parsed.
    static bool load(const QString& path, AppSettings& out, QString* errorOut = nullptr);

    // Checks the values the transfer engine depends on (InvalidConfiguration).
    bool validate(QString* errorOut = nullptr) const;

    // Fills SSH_PASSWORD / SSH_KEY_PASSPHRASE from the secret store when the
    // file leaves them empty. Returns how many values were taken from it.
    int applySecrets(const SecretStore& store);

    sftpfetch::SessionOptions sessionOptions() const;
    sftpfetch::TransferOptions transferOptions() const;

    // Persists SHOW_FOLDER_SIZES back to the configuration file.
    bool setShowFolderSizes(bool on, QString* errorOut = nullptr);

    QString configPath;
    QString host;
    int port = 22;
    QString user;
    QString keyPath;
    QString keyPassphrase;
    QString password;
    QString knownHostsPath;
    sftpfetch::KnownHostsPolicy knownHostsPolicy = sftpfetch::KnownHostsPolicy::Strict;
    QString basePath = QStringLiteral("/");
    int chunks = sftpfetch::kDefaultConcurrency;
    qint64 smallFileThreshold = (qint64)sftpfetch::kDefaultSmallFileThreshold;
    qint64 cacheMaxAgeSeconds = 300;
    QString cacheDir;
    bool showFolderSizes = false;
    QVector<DownloadTarget> downloadPaths;
};
