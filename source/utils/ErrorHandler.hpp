#ifndef ERRORHANDLER_HPP
#define ERRORHANDLER_HPP

#include <QElapsedTimer>
#include <QString>
#include <QTextStream>
#include <exception>
#include <utility>

#include "Logger.hpp"
#include "Result.hpp"

enum ExitCode : int {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
};

inline QString formatCliError(const TaskError &error) {
    return QStringLiteral("Error: ") + error.message();
}

inline int reportCliError(QTextStream &err, const TaskError &error) {
    qInfo(appCli) << "[ERR]" << error.type() << "|" << error.message()
                  << "| details=" << error.details();
    err << formatCliError(error) << Qt::endl;
    return ExitFailure;
}

// Обёртка над командой: время выполнения в лог, исключения в код выхода.
template <typename Fn>
int runSafe(const char *commandName, QTextStream &err, Fn &&fn) {
    QElapsedTimer timer;
    timer.start();
    try {
        const int code = std::forward<Fn>(fn)();
        qInfo(appCli) << "[DONE]" << commandName << "| exit=" << code
                      << "| ms=" << timer.elapsed();
        return code;
    } catch (const std::exception &e) {
        qCritical(appCli) << "[EXC]" << commandName << "| ms=" << timer.elapsed()
                          << "| what=" << e.what();
        err << QStringLiteral("Error: Internal error: ")
            << QString::fromLocal8Bit(e.what()) << Qt::endl;
        return ExitFailure;
    }
}

#endif // ERRORHANDLER_HPP
