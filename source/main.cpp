#include <QCoreApplication>
#include <QProcessEnvironment>
#include <QTextStream>

#include <cstdio>

#include "CommandLine.hpp"
#include "ErrorHandler.hpp"
#include "Invocation.hpp"
#include "Logger.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tasktrack");
    QCoreApplication::setApplicationVersion(TASKTRACK_VERSION);

    QTextStream out(stdout);
    QTextStream err(stderr);

    // ──────────────────────────────
    // 1. Конфигурация: окружение, затем аргументы
    // ──────────────────────────────
    auto envConfig =
        AppConfig::fromEnvironment(QProcessEnvironment::systemEnvironment());
    if (!envConfig) {
        return reportCliError(err, envConfig.error());
    }

    CommandLine commandLine;
    switch (commandLine.parse(app.arguments(), envConfig.value())) {
    case CommandLine::Outcome::Help:
        out << commandLine.helpText();
        return ExitSuccess;
    case CommandLine::Outcome::Version:
        out << QCoreApplication::applicationName() << " "
            << QCoreApplication::applicationVersion() << Qt::endl;
        return ExitSuccess;
    case CommandLine::Outcome::UsageError:
        err << "Error: " << commandLine.errorText() << "\n\n"
            << commandLine.helpText();
        return ExitUsage;
    case CommandLine::Outcome::Run:
        break;
    }

    const AppConfig &config = commandLine.config();
    const CommandRequest &request = commandLine.request();

    initLogging(config.logFile, config.verbose);

    const int code = runSafe(commandName(request.kind), err, [&]() -> int {
        return runInvocation(config, request, out, err);
    });

    shutdownLogging();
    return code;
}
