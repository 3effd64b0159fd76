// Directory listings served from the listing cache or the remote session.
#pragma once
#include "ListingCache.hpp"
#include "sftpfetch/SftpClient.hpp"
#include <QString>

struct DirectoryListing {
    std::vector<sftpfetch::FileInfo> entries; // newest first
    FolderSizes folderSizes;                  // by entry name, directories only
    bool fromCache = false;
    qint64 ageSeconds = 0;                    // meaningful when fromCache
};

class RemoteBrowser {
public:
    // Neither the client nor the cache is owned.
    RemoteBrowser(sftpfetch::SftpClient& client, ListingCache& cache)
        : client_(client), cache_(cache) {}

    // Cache first unless forceRefresh. A remote listing is sorted by mtime,
    // newest first, and stored unless it is empty. With withFolderSizes,
    // directories without a known size are measured recursively and the
    // completed set is stored again.
    bool listDirectory(const QString& path, bool forceRefresh, bool withFolderSizes,
                       DirectoryListing& out, QString* errorOut = nullptr);

    // Parent of `path`, never above `root`.
    static QString parentPath(const QString& path, const QString& root = QStringLiteral("/"));

private:
    sftpfetch::SftpClient& client_;
    ListingCache& cache_;
};
