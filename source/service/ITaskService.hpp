#ifndef TASKTRACK_SERVICE_ITASKSERVICE_HPP
#define TASKTRACK_SERVICE_ITASKSERVICE_HPP

#include <QString>
#include <QtGlobal>
#include <cstddef>
#include <vector>

#include "Result.hpp"
#include "Task.hpp"
#include "TaskPatch.hpp"

class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual Status load() = 0;

    virtual std::vector<Task> getAllTasks() const = 0;
    virtual std::vector<Task> getTasksByProject(const QString &project) const = 0;
    virtual std::vector<Task> getTasksByStatus(const QString &status) const = 0;
    virtual std::vector<Task> getTasksByPriority(quint8 priority) const = 0;
    virtual std::vector<Task> search(const QString &query) const = 0;

    virtual Status addTask(const Task &task) = 0;
    virtual Result<std::size_t> removeTasks(const QString &title) = 0;
    virtual Status updateTask(const QString &title, const TaskPatch &patch) = 0;
};

#endif // TASKTRACK_SERVICE_ITASKSERVICE_HPP
