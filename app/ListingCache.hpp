// On-disk cache of remote directory listings, one file per remote path.
#pragma once
#include <QString>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "sftpfetch/SftpTypes.hpp"

using FolderSizes = std::map<std::string, std::uint64_t>;

struct CachedListing {
    std::vector<sftpfetch::FileInfo> entries;
    qint64 ageSeconds = 0;
    FolderSizes folderSizes;
};

struct CacheStats {
    int count = 0;
    qint64 totalBytes = 0;
};

class ListingCache {
public:
    // Returns the current time in epoch seconds.
    using Clock = std::function<qint64()>;

    explicit ListingCache(QString dir, qint64 maxAgeSeconds = 300, Clock clock = {});

    // Miss when the entry is absent, unreadable or older than maxAgeSeconds.
    std::optional<CachedListing> get(const QString& remotePath) const;

    // Replaces any previous entry for remotePath. Failures are logged only.
    void set(const QString& remotePath,
             const std::vector<sftpfetch::FileInfo>& entries,
             const FolderSizes& folderSizes = {});

    // Deletes every cache file; returns how many were removed.
    int clear();
    CacheStats stats() const;

    // File name stem for remotePath (MD5 hex of the UTF-8 path).
    static QString keyFor(const QString& remotePath);

    const QString& directory() const { return dir_; }
    qint64 maxAgeSeconds() const { return maxAge_; }

private:
    QString dir_;
    qint64 maxAge_;
    Clock clock_;

    QString fileFor(const QString& remotePath) const;
    qint64 now() const;
};
