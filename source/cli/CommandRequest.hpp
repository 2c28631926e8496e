#ifndef TASKTRACK_CLI_COMMANDREQUEST_HPP
#define TASKTRACK_CLI_COMMANDREQUEST_HPP

#include <QString>

#include "TaskPatch.hpp"

enum class CommandKind {
    Add,
    Remove,
    List,
    ListByProject,
    ListByStatus,
    ListByPriority,
    Search,
    Update,
};

// Decoded arguments of one invocation. Only the fields of `kind` are filled.
struct CommandRequest {
    CommandKind kind = CommandKind::List;

    QString title;
    QString description;
    QString priority;
    QString status;
    QString project;
    QString query;

    TaskPatch patch;
};

const char *commandName(CommandKind kind);

// Add, Remove and Update rewrite the store; the rest only read it.
bool isMutating(CommandKind kind);

#endif // TASKTRACK_CLI_COMMANDREQUEST_HPP
