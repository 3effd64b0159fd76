// Small formatting helpers shared by the command-line views.
#pragma once
#include <QString>
#include <QDateTime>
#include <QLocale>

namespace sftpfetchapp {

// Human-readable size with one decimal: 512.0B, 1.5KB, 27.0MB, ...
inline QString formatSize(quint64 bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double v = (double)bytes;
    for (const char* u : units) {
        if (v < 1024.0) return QString::number(v, 'f', 1) + QLatin1String(u);
        v /= 1024.0;
    }
    return QString::number(v, 'f', 1) + QStringLiteral("PB");
}

// 42s, 3m 5s, 2h 10m
inline QString formatAge(qint64 seconds) {
    if (seconds < 60) return QStringLiteral("%1s").arg(seconds);
    const qint64 minutes = seconds / 60;
    if (minutes < 60) return QStringLiteral("%1m %2s").arg(minutes).arg(seconds % 60);
    return QStringLiteral("%1h %2m").arg(minutes / 60).arg(minutes % 60);
}

// Epoch seconds in LOCAL time, short system-locale format.
inline QString localShortTime(quint64 secs) {
    if (secs == 0) return QStringLiteral("-");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch((qint64)secs);
    if (!dt.isValid()) return QStringLiteral("-");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

} // namespace sftpfetchapp
