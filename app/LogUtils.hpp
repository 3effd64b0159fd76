// Logging policy glue between the runtime env flags and Qt logging categories.
#pragma once
#include "sftpfetch/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QString>

namespace sftpfetchapp {

// Enables debug output for every sftpfetch.* category when SFTPFETCH_DEBUG is set.
inline void applyLoggingRules() {
    if (sftpfetch::debugLoggingEnabled())
        QLoggingCategory::setFilterRules(QStringLiteral("sftpfetch.*.debug=true"));
}

// Hosts, users and paths are masked unless sensitive logging is enabled.
inline QString sensitive(const QString& value) {
    if (sftpfetch::sensitiveLoggingEnabled()) return value;
    return value.isEmpty() ? value : QStringLiteral("<redacted>");
}

inline QString sensitive(const std::string& value) {
    return sensitive(QString::fromStdString(value));
}

} // namespace sftpfetchapp
