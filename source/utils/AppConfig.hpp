#ifndef TASKTRACK_UTILS_APPCONFIG_HPP
#define TASKTRACK_UTILS_APPCONFIG_HPP

#include <QProcessEnvironment>
#include <QString>

#include "Result.hpp"

struct AppConfig {
    QString storePath = QStringLiteral("tasks.json");
    QString logFile;
    int lockTimeoutMs = 5000;
    bool verbose = false;
    bool jsonOutput = false;

    // TASKTRACK_FILE, TASKTRACK_LOG_FILE, TASKTRACK_LOCK_TIMEOUT_MS
    static Result<AppConfig> fromEnvironment(const QProcessEnvironment &env);
};

Result<int> parseLockTimeout(const QString &text);

#endif // TASKTRACK_UTILS_APPCONFIG_HPP
