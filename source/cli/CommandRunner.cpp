#include "CommandRunner.hpp"

#include "Logger.hpp"
#include "Validation.hpp"

CommandRunner::CommandRunner(std::shared_ptr<ITaskService> service,
                             OutputFormat format)
    : m_service(std::move(service)), m_format(format) {}

Status CommandRunner::execute(const CommandRequest &request, QTextStream &out) {
    qInfo(appCli) << "Run command" << commandName(request.kind);

    switch (request.kind) {
    case CommandKind::Add:
        return addTask(request, out);
    case CommandKind::Remove:
        return removeTasks(request, out);
    case CommandKind::List:
        printTasks(out, m_service->getAllTasks(), m_format);
        return Status::ok();
    case CommandKind::ListByProject:
        printTasks(out, m_service->getTasksByProject(request.project), m_format);
        return Status::ok();
    case CommandKind::ListByStatus:
        printTasks(out, m_service->getTasksByStatus(request.status), m_format);
        return Status::ok();
    case CommandKind::ListByPriority:
        return listByPriority(request, out);
    case CommandKind::Search:
        printTasks(out, m_service->search(request.query), m_format);
        return Status::ok();
    case CommandKind::Update:
        return updateTask(request, out);
    }

    return TaskError::validation(QStringLiteral("Invalid command"));
}

Status CommandRunner::addTask(const CommandRequest &request, QTextStream &out) {
    auto priority = parsePriority(request.priority);
    if (!priority) {
        return priority.error();
    }

    Task task;
    task.title = request.title;
    task.description = request.description;
    task.priority = priority.value();
    task.status = request.status;
    task.project = request.project;

    const Status added = m_service->addTask(task);
    if (!added) {
        return added;
    }

    out << "Task added successfully!" << Qt::endl;
    return Status::ok();
}

Status CommandRunner::removeTasks(const CommandRequest &request,
                                  QTextStream &out) {
    auto removed = m_service->removeTasks(request.title);
    if (!removed) {
        return removed.error();
    }

    if (removed.value() == 0) {
        out << QString("No task titled '%1' found.").arg(request.title)
            << Qt::endl;
    } else {
        out << "Task removed successfully!" << Qt::endl;
    }
    return Status::ok();
}

Status CommandRunner::listByPriority(const CommandRequest &request,
                                     QTextStream &out) {
    auto priority = parsePriority(request.priority);
    if (!priority) {
        return priority.error();
    }

    printTasks(out, m_service->getTasksByPriority(priority.value()), m_format);
    return Status::ok();
}

Status CommandRunner::updateTask(const CommandRequest &request,
                                 QTextStream &out) {
    const Status updated = m_service->updateTask(request.title, request.patch);
    if (!updated) {
        return updated;
    }

    out << "Task updated successfully!" << Qt::endl;
    return Status::ok();
}
