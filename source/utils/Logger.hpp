#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appStore)
Q_DECLARE_LOGGING_CATEGORY(appCli)

void initLogging(const QString &filePath = QString(), bool verbose = false);

void shutdownLogging();

#endif // LOGGER_HPP
