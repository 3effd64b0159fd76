#include "ListingCache.hpp"
#include <QCryptographicHash>
#include <QDataStream>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <algorithm>
#include <utility>
Q_LOGGING_CATEGORY(ocCache, "sftpfetch.cache")

namespace {
constexpr quint32 kMagic = 0x53464C43; // "SFLC"
constexpr quint32 kVersion = 1;
// Empty name (length prefix), is_dir, size, mtime, mode.
constexpr qint64 kMinEntryBytes = 4 + 1 + 8 + 8 + 4;
const QString kSuffix = QStringLiteral(".cache");
} // namespace

ListingCache::ListingCache(QString dir, qint64 maxAgeSeconds, Clock clock)
    : dir_(std::move(dir)), maxAge_(maxAgeSeconds), clock_(std::move(clock)) {}

QString ListingCache::keyFor(const QString& remotePath) {
    return QString::fromLatin1(
        QCryptographicHash::hash(remotePath.toUtf8(), QCryptographicHash::Md5).toHex());
}

QString ListingCache::fileFor(const QString& remotePath) const {
    return QDir(dir_).filePath(keyFor(remotePath) + kSuffix);
}

qint64 ListingCache::now() const {
    if (clock_) return clock_();
    return QDateTime::currentSecsSinceEpoch();
}

std::optional<CachedListing> ListingCache::get(const QString& remotePath) const {
    QFile f(fileFor(remotePath));
    if (!f.exists()) return std::nullopt;
    if (!f.open(QIODevice::ReadOnly)) {
        qCDebug(ocCache) << "Cannot open cache file" << f.fileName() << f.errorString();
        return std::nullopt;
    }

    QDataStream in(&f);
    in.setVersion(QDataStream::Qt_6_0);
    quint32 magic = 0, version = 0;
    in >> magic >> version;
    if (magic != kMagic || version != kVersion) {
        qCDebug(ocCache) << "Ignoring cache file with unknown header" << f.fileName();
        return std::nullopt;
    }

    qint64 capturedAt = 0;
    quint32 entryCount = 0;
    in >> capturedAt >> entryCount;
    // An entry takes at least kMinEntryBytes on disk; a larger count is corrupt.
    const qint64 remaining = f.size() - f.pos();
    if (in.status() != QDataStream::Ok || (qint64)entryCount > remaining / kMinEntryBytes) {
        qCDebug(ocCache) << "Corrupt entry count" << entryCount << "in" << f.fileName();
        return std::nullopt;
    }
    CachedListing out;
    out.entries.reserve(entryCount);
    for (quint32 i = 0; i < entryCount && in.status() == QDataStream::Ok; ++i) {
        QString name;
        bool isDir = false;
        quint64 size = 0, mtime = 0;
        quint32 mode = 0;
        in >> name >> isDir >> size >> mtime >> mode;
        sftpfetch::FileInfo fi;
        fi.name = name.toStdString();
        fi.is_dir = isDir;
        fi.size = size;
        fi.mtime = mtime;
        fi.mode = mode;
        out.entries.push_back(std::move(fi));
    }
    quint32 sizeCount = 0;
    in >> sizeCount;
    for (quint32 i = 0; i < sizeCount && in.status() == QDataStream::Ok; ++i) {
        QString name;
        quint64 bytes = 0;
        in >> name >> bytes;
        out.folderSizes[name.toStdString()] = bytes;
    }
    if (in.status() != QDataStream::Ok) {
        qCDebug(ocCache) << "Truncated cache file" << f.fileName();
        return std::nullopt;
    }

    const qint64 age = std::max<qint64>(0, now() - capturedAt);
    if (age > maxAge_) return std::nullopt;
    out.ageSeconds = age;
    return out;
}

void ListingCache::set(const QString& remotePath,
                       const std::vector<sftpfetch::FileInfo>& entries,
                       const FolderSizes& folderSizes) {
    if (!QDir().mkpath(dir_)) {
        qCDebug(ocCache) << "Cannot create cache directory" << dir_;
        return;
    }
    QSaveFile f(fileFor(remotePath));
    if (!f.open(QIODevice::WriteOnly)) {
        qCDebug(ocCache) << "Cannot write cache file" << f.fileName() << f.errorString();
        return;
    }

    QDataStream out(&f);
    out.setVersion(QDataStream::Qt_6_0);
    out << kMagic << kVersion << now() << (quint32)entries.size();
    for (const auto& e : entries) {
        out << QString::fromStdString(e.name) << e.is_dir << (quint64)e.size
            << (quint64)e.mtime << (quint32)e.mode;
    }
    out << (quint32)folderSizes.size();
    for (const auto& kv : folderSizes)
        out << QString::fromStdString(kv.first) << (quint64)kv.second;

    if (out.status() != QDataStream::Ok || !f.commit())
        qCDebug(ocCache) << "Failed to store listing for" << keyFor(remotePath) << f.errorString();
}

int ListingCache::clear() {
    QDir d(dir_);
    if (!d.exists()) return 0;
    int removed = 0;
    const QStringList files = d.entryList({QStringLiteral("*") + kSuffix}, QDir::Files);
    for (const QString& name : files) {
        if (d.remove(name))
            ++removed;
        else
            qCWarning(ocCache) << "Could not remove cache file" << d.filePath(name);
    }
    return removed;
}

CacheStats ListingCache::stats() const {
    CacheStats st;
    QDir d(dir_);
    if (!d.exists()) return st;
    const QFileInfoList files = d.entryInfoList({QStringLiteral("*") + kSuffix}, QDir::Files);
    for (const QFileInfo& fi : files) {
        ++st.count;
        st.totalBytes += fi.size();
    }
    return st;
}
