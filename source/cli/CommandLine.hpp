#ifndef TASKTRACK_CLI_COMMANDLINE_HPP
#define TASKTRACK_CLI_COMMANDLINE_HPP

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include "AppConfig.hpp"
#include "CommandRequest.hpp"

// Turns argv into an AppConfig plus a CommandRequest.
//
//   tasktrack [global options] <command> [arguments] [command options]
//
// Global options override the configuration passed to parse(); command
// options are only accepted by the commands that use them.
class CommandLine {
public:
    enum class Outcome { Run, Help, Version, UsageError };

    CommandLine();

    Outcome parse(const QStringList &arguments, const AppConfig &defaults);

    const AppConfig &config() const { return m_config; }
    const CommandRequest &request() const { return m_request; }
    const QString &errorText() const { return m_error; }

    QString helpText() const;

private:
    Outcome fail(const QString &message);
    void setUsageError(const QString &message);
    bool buildRequest(const QString &command, const QStringList &args);
    bool checkPositionals(const QString &command, const QStringList &args,
                          int expected, const QString &usage);
    bool checkOptions(const QString &command, const QStringList &allowed);

    QCommandLineParser m_parser;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_fileOption;
    QCommandLineOption m_logFileOption;
    QCommandLineOption m_lockTimeoutOption;
    QCommandLineOption m_verboseOption;
    QCommandLineOption m_jsonOption;
    QCommandLineOption m_descriptionOption;
    QCommandLineOption m_priorityOption;
    QCommandLineOption m_statusOption;
    QCommandLineOption m_projectOption;

    AppConfig m_config;
    CommandRequest m_request;
    QString m_error;
};

#endif // TASKTRACK_CLI_COMMANDLINE_HPP
