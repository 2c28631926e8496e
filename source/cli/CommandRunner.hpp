#ifndef TASKTRACK_CLI_COMMANDRUNNER_HPP
#define TASKTRACK_CLI_COMMANDRUNNER_HPP

#include <QTextStream>
#include <memory>

#include "CommandRequest.hpp"
#include "ITaskService.hpp"
#include "TaskPrinter.hpp"

// Dispatches one decoded command to the service and prints the outcome.
// The service must already be loaded.
class CommandRunner {
public:
    CommandRunner(std::shared_ptr<ITaskService> service, OutputFormat format);

    Status execute(const CommandRequest &request, QTextStream &out);

private:
    Status addTask(const CommandRequest &request, QTextStream &out);
    Status removeTasks(const CommandRequest &request, QTextStream &out);
    Status listByPriority(const CommandRequest &request, QTextStream &out);
    Status updateTask(const CommandRequest &request, QTextStream &out);

    std::shared_ptr<ITaskService> m_service;
    OutputFormat m_format;
};

#endif // TASKTRACK_CLI_COMMANDRUNNER_HPP
