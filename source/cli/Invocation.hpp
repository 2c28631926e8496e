#ifndef TASKTRACK_CLI_INVOCATION_HPP
#define TASKTRACK_CLI_INVOCATION_HPP

#include <QTextStream>

#include "AppConfig.hpp"
#include "CommandRequest.hpp"

// One parsed command against the configured store: lock (mutating commands
// only), load, execute. Returns the process exit code.
int runInvocation(const AppConfig &config, const CommandRequest &request,
                  QTextStream &out, QTextStream &err);

#endif // TASKTRACK_CLI_INVOCATION_HPP
