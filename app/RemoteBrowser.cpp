#include "RemoteBrowser.hpp"
#include "LogUtils.hpp"
#include "sftpfetch/DirectorySize.hpp"
#include <QLoggingCategory>
#include <algorithm>
Q_LOGGING_CATEGORY(ocBrowse, "sftpfetch.browse")

bool RemoteBrowser::listDirectory(const QString& path, bool forceRefresh, bool withFolderSizes,
                                  DirectoryListing& out, QString* errorOut) {
    out = DirectoryListing{};
    if (!forceRefresh) {
        if (auto hit = cache_.get(path)) {
            out.entries = std::move(hit->entries);
            out.folderSizes = std::move(hit->folderSizes);
            out.fromCache = true;
            out.ageSeconds = hit->ageSeconds;
            qCDebug(ocBrowse) << "cache hit" << sftpfetchapp::sensitive(path)
                              << "age" << out.ageSeconds;
        }
    }

    bool dirty = false;
    if (!out.fromCache) {
        std::string err;
        if (!client_.list(path.toStdString(), out.entries, err)) {
            qCWarning(ocBrowse) << "list failed" << sftpfetchapp::sensitive(path)
                                << sftpfetch::errorKindName(client_.lastErrorKind());
            if (errorOut) *errorOut = QString::fromStdString(err);
            return false;
        }
        std::stable_sort(out.entries.begin(), out.entries.end(),
                         [](const sftpfetch::FileInfo& a, const sftpfetch::FileInfo& b) {
                             return a.mtime > b.mtime;
                         });
        dirty = true;
    }

    if (withFolderSizes) {
        const std::string base = path.toStdString();
        for (const auto& e : out.entries) {
            if (!e.is_dir || out.folderSizes.count(e.name)) continue;
            out.folderSizes[e.name] =
                sftpfetch::directorySize(client_, sftpfetch::joinRemotePath(base, e.name));
            dirty = true;
        }
    }

    if (dirty && !out.entries.empty()) cache_.set(path, out.entries, out.folderSizes);
    return true;
}

QString RemoteBrowser::parentPath(const QString& path, const QString& root) {
    QString p = path;
    while (p.size() > 1 && p.endsWith('/')) p.chop(1);
    QString r = root;
    while (r.size() > 1 && r.endsWith('/')) r.chop(1);
    if (p == r || p == QLatin1String("/")) return r;
    const int slash = p.lastIndexOf('/');
    QString parent = slash <= 0 ? QStringLiteral("/") : p.left(slash);
    if (r != QLatin1String("/") && !parent.startsWith(r)) return r;
    return parent;
}
