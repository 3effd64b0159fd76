#pragma once
#include <QString>
#include <optional>

// Credential store for SSH passwords and key passphrases that are kept out
// of the configuration file. Uses the Secret Service (libsecret) when built
// with it; otherwise an opt-in plain QSettings fallback.
class SecretStore {
public:
    enum class PersistStatus { Stored, Unavailable, BackendError };

    struct PersistResult {
        PersistStatus status = PersistStatus::BackendError;
        QString detail;

        bool ok() const { return status == PersistStatus::Stored; }
    };

    PersistResult setSecret(const QString& key, const QString& value);
    std::optional<QString> getSecret(const QString& key) const;
    // False when the backend reported an error or is unavailable.
    bool removeSecret(const QString& key);

    // "libsecret" or "settings-fallback".
    static const char* backendName();
    // True when secrets would be written in clear text (fallback enabled).
    static bool insecureFallbackActive();

    // Logical keys: one password per user@host:port, one passphrase per key file.
    static QString passwordKey(const QString& user, const QString& host, int port);
    static QString passphraseKey(const QString& keyPath);
};
