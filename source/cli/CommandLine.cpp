#include "CommandLine.hpp"

#include "Logger.hpp"

namespace {

const char *const kDescription =
    "A console-based task management application.\n"
    "\n"
    "Commands:\n"
    "  add <title> <description> <priority> <status> <project>\n"
    "                                Add a new task\n"
    "  remove <title>                Remove every task with this title\n"
    "  list                          List all tasks\n"
    "  list-by-project --project <p> List tasks of a project\n"
    "  list-by-status --status <s>   List tasks with a status\n"
    "  list-by-priority --priority <n>\n"
    "                                List tasks with a priority (0-255)\n"
    "  search <query>                Search titles and descriptions\n"
    "  update <title> [--description d] [--priority n] [--status s] "
    "[--project p]\n"
    "                                Update the first task with this title";

} // END NAMESPACE

const char *commandName(CommandKind kind) {
    switch (kind) {
    case CommandKind::Add: return "add";
    case CommandKind::Remove: return "remove";
    case CommandKind::List: return "list";
    case CommandKind::ListByProject: return "list-by-project";
    case CommandKind::ListByStatus: return "list-by-status";
    case CommandKind::ListByPriority: return "list-by-priority";
    case CommandKind::Search: return "search";
    case CommandKind::Update: return "update";
    }
    return "unknown";
}

bool isMutating(CommandKind kind) {
    switch (kind) {
    case CommandKind::Add:
    case CommandKind::Remove:
    case CommandKind::Update:
        return true;
    case CommandKind::List:
    case CommandKind::ListByProject:
    case CommandKind::ListByStatus:
    case CommandKind::ListByPriority:
    case CommandKind::Search:
        return false;
    }
    return true;
}

CommandLine::CommandLine()
    : m_helpOption(QStringList{"h", "help"}, "Displays help on commands."),
      m_versionOption(QStringList{"version"}, "Displays version information."),
      m_fileOption(QStringList{"f", "file"}, "Task store file.", "path"),
      m_logFileOption(QStringList{"log-file"}, "Append log lines to this file.",
                      "path"),
      m_lockTimeoutOption(QStringList{"lock-timeout"},
                          "Milliseconds to wait for the store lock.", "ms"),
      m_verboseOption(QStringList{"verbose"}, "Log info messages to stderr."),
      m_jsonOption(QStringList{"json"}, "Print listings as JSON."),
      m_descriptionOption(QStringList{"description"}, "New description.",
                          "text"),
      m_priorityOption(QStringList{"priority"}, "Priority (0-255).", "n"),
      m_statusOption(QStringList{"status"}, "Status label.", "status"),
      m_projectOption(QStringList{"project"}, "Project name.", "project") {
    m_parser.setApplicationDescription(QString::fromLatin1(kDescription));

    m_parser.addOption(m_helpOption);
    m_parser.addOption(m_versionOption);
    m_parser.addOption(m_fileOption);
    m_parser.addOption(m_logFileOption);
    m_parser.addOption(m_lockTimeoutOption);
    m_parser.addOption(m_verboseOption);
    m_parser.addOption(m_jsonOption);
    m_parser.addOption(m_descriptionOption);
    m_parser.addOption(m_priorityOption);
    m_parser.addOption(m_statusOption);
    m_parser.addOption(m_projectOption);

    m_parser.addPositionalArgument("command", "Command to run.");
    m_parser.addPositionalArgument("arguments", "Command arguments.",
                                   "[arguments...]");
}

QString CommandLine::helpText() const { return m_parser.helpText(); }

void CommandLine::setUsageError(const QString &message) {
    m_error = message;
    qInfo(appCli) << "Usage error:" << message;
}

CommandLine::Outcome CommandLine::fail(const QString &message) {
    setUsageError(message);
    return Outcome::UsageError;
}

CommandLine::Outcome CommandLine::parse(const QStringList &arguments,
                                        const AppConfig &defaults) {
    m_config = defaults;
    m_request = CommandRequest{};
    m_error.clear();

    if (!m_parser.parse(arguments)) {
        return fail(m_parser.errorText());
    }

    if (m_parser.isSet(m_helpOption)) {
        return Outcome::Help;
    }
    if (m_parser.isSet(m_versionOption)) {
        return Outcome::Version;
    }

    if (m_parser.isSet(m_fileOption)) {
        const QString path = m_parser.value(m_fileOption);
        if (path.isEmpty()) {
            return fail("Option --file needs a non-empty path");
        }
        m_config.storePath = path;
    }
    if (m_parser.isSet(m_logFileOption)) {
        m_config.logFile = m_parser.value(m_logFileOption);
    }
    if (m_parser.isSet(m_lockTimeoutOption)) {
        auto timeout = parseLockTimeout(m_parser.value(m_lockTimeoutOption));
        if (!timeout) {
            return fail(timeout.error().message());
        }
        m_config.lockTimeoutMs = timeout.value();
    }
    m_config.verbose = m_config.verbose || m_parser.isSet(m_verboseOption);
    m_config.jsonOutput = m_config.jsonOutput || m_parser.isSet(m_jsonOption);

    QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return fail("Missing command");
    }

    const QString command = positional.takeFirst();
    if (!buildRequest(command, positional)) {
        return Outcome::UsageError;
    }

    return Outcome::Run;
}

bool CommandLine::checkPositionals(const QString &command,
                                   const QStringList &args, int expected,
                                   const QString &usage) {
    if (args.size() != expected) {
        setUsageError(
            QString("'%1' expects %2 argument(s), got %3. Usage: %1 %4")
                .arg(command)
                .arg(expected)
                .arg(args.size())
                .arg(usage));
        return false;
    }
    return true;
}

bool CommandLine::checkOptions(const QString &command,
                               const QStringList &allowed) {
    const QList<const QCommandLineOption *> commandOptions{
        &m_descriptionOption, &m_priorityOption, &m_statusOption,
        &m_projectOption};

    for (const QCommandLineOption *option : commandOptions) {
        const QString name = option->names().constFirst();
        if (m_parser.isSet(*option) && !allowed.contains(name)) {
            setUsageError(QString("Option --%1 is not valid for '%2'")
                              .arg(name, command));
            return false;
        }
    }
    return true;
}

bool CommandLine::buildRequest(const QString &command, const QStringList &args) {
    if (command == "add") {
        if (!checkOptions(command, {}) ||
            !checkPositionals(command, args, 5,
                              "<title> <description> <priority> <status> "
                              "<project>")) {
            return false;
        }
        m_request.kind = CommandKind::Add;
        m_request.title = args.at(0);
        m_request.description = args.at(1);
        m_request.priority = args.at(2);
        m_request.status = args.at(3);
        m_request.project = args.at(4);
        return true;
    }

    if (command == "remove") {
        if (!checkOptions(command, {}) ||
            !checkPositionals(command, args, 1, "<title>")) {
            return false;
        }
        m_request.kind = CommandKind::Remove;
        m_request.title = args.at(0);
        return true;
    }

    if (command == "list") {
        if (!checkOptions(command, {}) ||
            !checkPositionals(command, args, 0, QString())) {
            return false;
        }
        m_request.kind = CommandKind::List;
        return true;
    }

    if (command == "list-by-project") {
        if (!checkOptions(command, {"project"}) ||
            !checkPositionals(command, args, 0, "--project <project>")) {
            return false;
        }
        if (!m_parser.isSet(m_projectOption)) {
            setUsageError(
                "Please provide a project name with the --project option");
            return false;
        }
        m_request.kind = CommandKind::ListByProject;
        m_request.project = m_parser.value(m_projectOption);
        return true;
    }

    if (command == "list-by-status") {
        if (!checkOptions(command, {"status"}) ||
            !checkPositionals(command, args, 0, "--status <status>")) {
            return false;
        }
        if (!m_parser.isSet(m_statusOption)) {
            setUsageError("Please provide a status with the --status option");
            return false;
        }
        m_request.kind = CommandKind::ListByStatus;
        m_request.status = m_parser.value(m_statusOption);
        return true;
    }

    if (command == "list-by-priority") {
        if (!checkOptions(command, {"priority"}) ||
            !checkPositionals(command, args, 0, "--priority <n>")) {
            return false;
        }
        if (!m_parser.isSet(m_priorityOption)) {
            setUsageError("Please provide a priority with the --priority option");
            return false;
        }
        m_request.kind = CommandKind::ListByPriority;
        m_request.priority = m_parser.value(m_priorityOption);
        return true;
    }

    if (command == "search") {
        if (!checkOptions(command, {}) ||
            !checkPositionals(command, args, 1, "<query>")) {
            return false;
        }
        m_request.kind = CommandKind::Search;
        m_request.query = args.at(0);
        return true;
    }

    if (command == "update") {
        if (!checkOptions(command,
                          {"description", "priority", "status", "project"}) ||
            !checkPositionals(command, args, 1,
                              "<title> [--description d] [--priority n] "
                              "[--status s] [--project p]")) {
            return false;
        }
        m_request.kind = CommandKind::Update;
        m_request.title = args.at(0);
        if (m_parser.isSet(m_descriptionOption)) {
            m_request.patch.description = m_parser.value(m_descriptionOption);
        }
        if (m_parser.isSet(m_priorityOption)) {
            m_request.patch.priority = m_parser.value(m_priorityOption);
        }
        if (m_parser.isSet(m_statusOption)) {
            m_request.patch.status = m_parser.value(m_statusOption);
        }
        if (m_parser.isSet(m_projectOption)) {
            m_request.patch.project = m_parser.value(m_projectOption);
        }
        return true;
    }

    setUsageError(QString("Invalid command '%1'").arg(command));
    return false;
}
