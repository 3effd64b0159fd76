// SecretStore implementation: Libsecret (Linux) or optional fallback with QSettings.
#include "SecretStore.hpp"
#include <QByteArray>
#include <QSettings>
#include <QVariant>
#include <cstdlib>

QString SecretStore::passwordKey(const QString& user, const QString& host, int port) {
    return QStringLiteral("password:%1@%2:%3").arg(user, host).arg(port);
}

QString SecretStore::passphraseKey(const QString& keyPath) {
    return QStringLiteral("passphrase:%1").arg(keyPath);
}

#if defined(HAVE_LIBSECRET) // Secret Service

#include <libsecret/secret.h>

static const SecretSchema* sftpfetch_schema() {
    static const SecretSchema schema = {
        "sftpfetch.secret", SECRET_SCHEMA_NONE,
        {
            { "key", SECRET_SCHEMA_ATTRIBUTE_STRING },
            { NULL, SECRET_SCHEMA_ATTRIBUTE_STRING }
        }
    };
    return &schema;
}

SecretStore::PersistResult SecretStore::setSecret(const QString& key, const QString& value) {
    if (key.isEmpty()) {
        return { PersistStatus::BackendError, QStringLiteral("Empty secret key") };
    }
    QByteArray k = key.toUtf8();
    QByteArray v = value.toUtf8();
    GError* gerr = nullptr;
    const gboolean ok = secret_password_store_sync(sftpfetch_schema(), SECRET_COLLECTION_DEFAULT,
                                                   "sftpfetch secret", v.constData(), nullptr,
                                                   &gerr,
                                                   "key", k.constData(), nullptr);
    if (ok) return { PersistStatus::Stored, QString() };
    QString detail = gerr ? QString::fromUtf8(gerr->message) : QStringLiteral("libsecret store failed");
    if (gerr) g_error_free(gerr);
    return { PersistStatus::BackendError, detail };
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    QByteArray k = key.toUtf8();
    GError* gerr = nullptr;
    gchar* pw = secret_password_lookup_sync(sftpfetch_schema(), nullptr, &gerr,
                                            "key", k.constData(), nullptr);
    if (gerr) g_error_free(gerr);
    if (!pw) return std::nullopt;
    QString out = QString::fromUtf8(pw);
    secret_password_free(pw);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

bool SecretStore::removeSecret(const QString& key) {
    QByteArray k = key.toUtf8();
    GError* gerr = nullptr;
    // The return value only says whether an item matched; errors come in gerr.
    secret_password_clear_sync(sftpfetch_schema(), nullptr, &gerr,
                               "key", k.constData(), nullptr);
    if (!gerr) return true;
    g_error_free(gerr);
    return false;
}

const char* SecretStore::backendName() {
    return "libsecret";
}

bool SecretStore::insecureFallbackActive() {
    return false;
}

#else // without Libsecret: optional insecure fallback controlled by env var

static bool fallbackEnabled() {
    const char* v = std::getenv("SFTPFETCH_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

SecretStore::PersistResult SecretStore::setSecret(const QString& key, const QString& value) {
    if (key.isEmpty()) return { PersistStatus::BackendError, QStringLiteral("Empty secret key") };
    if (!fallbackEnabled()) {
        return { PersistStatus::Unavailable,
                 QStringLiteral("No secret service in this build; set SFTPFETCH_ENABLE_INSECURE_FALLBACK=1 "
                                "to store secrets in plain text") };
    }
    QSettings s(QStringLiteral("sftpfetch"), QStringLiteral("secrets"));
    s.setValue(key, value);
    s.sync();
    if (s.status() != QSettings::NoError) {
        return { PersistStatus::BackendError, QStringLiteral("QSettings could not persist the secret") };
    }
    return { PersistStatus::Stored, QString() };
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    if (!fallbackEnabled()) return std::nullopt;
    QSettings s(QStringLiteral("sftpfetch"), QStringLiteral("secrets"));
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    return v.toString();
}

bool SecretStore::removeSecret(const QString& key) {
    if (!fallbackEnabled()) return false;
    QSettings s(QStringLiteral("sftpfetch"), QStringLiteral("secrets"));
    s.remove(key);
    s.sync();
    return s.status() == QSettings::NoError;
}

const char* SecretStore::backendName() {
    return "settings-fallback";
}

bool SecretStore::insecureFallbackActive() {
    return fallbackEnabled();
}

#endif
