#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdio>

#include "Logger.hpp"

// warning+ until initLogging() installs the filter rules
Q_LOGGING_CATEGORY(appCore, "tasktrack.core", QtWarningMsg)
Q_LOGGING_CATEGORY(appStore, "tasktrack.store", QtWarningMsg)
Q_LOGGING_CATEGORY(appCli, "tasktrack.cli", QtWarningMsg)

static QFile *g_logFile = nullptr;
static QMutex g_logMutex;

static void messageHandler(QtMsgType type, const QMessageLogContext &ctx,
                           const QString &msg) {
    const QString line = qFormatLogMessage(type, ctx, msg) + '\n';

    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << line;
        ts.flush();
    }
}

void initLogging(const QString &filePath, bool verbose) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    // stdout занят выводом команд, поэтому по умолчанию только warning+
    if (verbose) {
        QLoggingCategory::setFilterRules("tasktrack.*=true\n");
    } else {
        QLoggingCategory::setFilterRules("tasktrack.*.debug=false\n"
                                         "tasktrack.*.info=false\n");
    }

    if (!filePath.isEmpty()) {
        QMutexLocker lock(&g_logMutex);
        g_logFile = new QFile(filePath);
        if (!g_logFile->open(QIODevice::WriteOnly | QIODevice::Append |
                             QIODevice::Text)) {
            delete g_logFile;
            g_logFile = nullptr;
        }
    }

    qInstallMessageHandler(messageHandler);

    if (!filePath.isEmpty() && !g_logFile) {
        qWarning(appCore) << "Failed to open log file:" << filePath;
    }

    qInfo(appCore) << "Logging initialized"
                   << (g_logFile ? QString("-> %1").arg(filePath)
                                 : QString("(stderr only)"));
}

void shutdownLogging() {
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_logMutex);
    if (g_logFile) {
        g_logFile->close();
        delete g_logFile;
        g_logFile = nullptr;
    }
}
