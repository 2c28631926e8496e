#ifndef TASKTRACK_SERVICE_TASKSERVICEIMPL_HPP
#define TASKTRACK_SERVICE_TASKSERVICEIMPL_HPP

#include <memory>
#include <vector>

#include "IStorage.hpp"
#include "ITaskService.hpp"

class TaskServiceImpl : public ITaskService {
public:
    explicit TaskServiceImpl(std::shared_ptr<IStorage> storage);

    Status load() override;

    std::vector<Task> getAllTasks() const override;
    std::vector<Task> getTasksByProject(const QString &project) const override;
    std::vector<Task> getTasksByStatus(const QString &status) const override;
    std::vector<Task> getTasksByPriority(quint8 priority) const override;
    std::vector<Task> search(const QString &query) const override;

    Status addTask(const Task &task) override;
    Result<std::size_t> removeTasks(const QString &title) override;
    Status updateTask(const QString &title, const TaskPatch &patch) override;

private:
    Status persist();

    std::shared_ptr<IStorage> m_storage;
    std::vector<Task> m_tasks;
};

#endif // TASKTRACK_SERVICE_TASKSERVICEIMPL_HPP
