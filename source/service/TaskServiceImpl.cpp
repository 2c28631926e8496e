#include "Logger.hpp"
#include "TaskQueries.hpp"
#include "TaskServiceImpl.hpp"
#include "Validation.hpp"

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<IStorage> storage)
    : m_storage(std::move(storage)) {}

Status TaskServiceImpl::load() {
    auto loaded = m_storage->loadTasks();
    if (!loaded) {
        qCritical(appCore) << "Failed to load tasks:" << loaded.error().message();
        return loaded.error();
    }

    m_tasks = std::move(loaded).value();
    qInfo(appCore) << "Loaded" << m_tasks.size() << "tasks";
    return Status::ok();
}

// ───────────────────────────────────────────────
// Queries
// ───────────────────────────────────────────────

std::vector<Task> TaskServiceImpl::getAllTasks() const {
    qInfo(appCore) << "Retrieved" << m_tasks.size() << "tasks";
    return m_tasks;
}

std::vector<Task> TaskServiceImpl::getTasksByProject(
    const QString &project) const {
    auto out = filterByProject(m_tasks, project);
    qInfo(appCore) << "Project" << project << "->" << out.size() << "tasks";
    return out;
}

std::vector<Task> TaskServiceImpl::getTasksByStatus(const QString &status) const {
    auto out = filterByStatus(m_tasks, status);
    qInfo(appCore) << "Status" << status << "->" << out.size() << "tasks";
    return out;
}

std::vector<Task> TaskServiceImpl::getTasksByPriority(quint8 priority) const {
    auto out = filterByPriority(m_tasks, priority);
    qInfo(appCore) << "Priority" << static_cast<int>(priority) << "->"
                   << out.size() << "tasks";
    return out;
}

std::vector<Task> TaskServiceImpl::search(const QString &query) const {
    auto out = searchTasks(m_tasks, query);
    qInfo(appCore) << "Search" << query << "->" << out.size() << "tasks";
    return out;
}

// ───────────────────────────────────────────────
// Mutations
// ───────────────────────────────────────────────

Status TaskServiceImpl::addTask(const Task &task) {
    const Status valid = validateTitle(task.title);
    if (!valid) {
        qWarning(appCore) << "Attempt to add task with empty title";
        return valid;
    }

    if (findFirstByTitle(m_tasks, task.title)) {
        qWarning(appCore) << "Adding duplicate title" << task.title
                          << "- update will only reach the first one";
    }

    m_tasks.push_back(task);

    Status saved = persist();
    if (saved) {
        qInfo(appCore) << "Task added:" << task.title;
    } else {
        qCritical(appCore) << "Failed to add task:" << task.title;
    }

    return saved;
}

Result<std::size_t> TaskServiceImpl::removeTasks(const QString &title) {
    const std::size_t removed = removeByTitle(m_tasks, title);
    if (removed == 0) {
        qInfo(appCore) << "No task titled" << title << "- nothing removed";
    }

    const Status saved = persist();
    if (!saved) {
        qCritical(appCore) << "Failed to remove task:" << title;
        return saved.error();
    }

    qInfo(appCore) << "Removed" << removed << "task(s) titled" << title;
    return removed;
}

Status TaskServiceImpl::updateTask(const QString &title, const TaskPatch &patch) {
    Task *task = findFirstByTitle(m_tasks, title);
    if (!task) {
        qWarning(appCore) << "Task" << title << "not found";
        return TaskError::notFound(QStringLiteral("Task not found"),
                                   QJsonObject{{"title", title}});
    }

    if (countByTitle(m_tasks, title) > 1) {
        qWarning(appCore) << "Title" << title
                          << "is ambiguous, updating the first match";
    }

    const Status applied = applyTaskPatch(*task, patch);
    if (!applied) {
        qWarning(appCore) << "Update rejected:" << applied.error().message();
        return applied;
    }

    Status saved = persist();
    if (saved) {
        qInfo(appCore) << "Task updated:" << title;
    } else {
        qCritical(appCore) << "Failed to update task:" << title;
    }

    return saved;
}

Status TaskServiceImpl::persist() { return m_storage->saveTasks(m_tasks); }
