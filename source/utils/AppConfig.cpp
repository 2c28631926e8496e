#include "AppConfig.hpp"

Result<int> parseLockTimeout(const QString &text) {
    bool ok = false;
    const int value = text.toInt(&ok, 10);
    if (!ok || value < 0) {
        return TaskError::validation(
            QString("Invalid lock timeout '%1' (expected milliseconds >= 0)")
                .arg(text),
            QJsonObject{{"field", "lockTimeoutMs"}, {"value", text}});
    }
    return value;
}

Result<AppConfig> AppConfig::fromEnvironment(const QProcessEnvironment &env) {
    AppConfig config;

    const QString storePath = env.value(QStringLiteral("TASKTRACK_FILE"));
    if (!storePath.isEmpty()) {
        config.storePath = storePath;
    }

    config.logFile = env.value(QStringLiteral("TASKTRACK_LOG_FILE"));

    if (env.contains(QStringLiteral("TASKTRACK_LOCK_TIMEOUT_MS"))) {
        auto timeout =
            parseLockTimeout(env.value(QStringLiteral("TASKTRACK_LOCK_TIMEOUT_MS")));
        if (!timeout) {
            return timeout.error();
        }
        config.lockTimeoutMs = timeout.value();
    }

    return config;
}
