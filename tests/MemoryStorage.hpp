#ifndef TASKTRACK_TESTS_MEMORYSTORAGE_HPP
#define TASKTRACK_TESTS_MEMORYSTORAGE_HPP

#include <optional>
#include <vector>

#include "IStorage.hpp"

// In-memory IStorage that records how often it was written.
class MemoryStorage : public IStorage {
public:
    explicit MemoryStorage(std::vector<Task> initial = {})
        : stored(std::move(initial)) {}

    Result<std::vector<Task>> loadTasks() const override {
        if (loadError) {
            return *loadError;
        }
        return stored;
    }

    Status saveTasks(const std::vector<Task> &tasks) override {
        ++saveCount;
        if (saveError) {
            return *saveError;
        }
        stored = tasks;
        return Status::ok();
    }

    std::vector<Task> stored;
    int saveCount = 0;
    std::optional<TaskError> loadError;
    std::optional<TaskError> saveError;
};

inline Task makeTask(const QString &title, const QString &description,
                     quint8 priority, const QString &status,
                     const QString &project) {
    Task task;
    task.title = title;
    task.description = description;
    task.priority = priority;
    task.status = status;
    task.project = project;
    return task;
}

inline std::vector<Task> sampleTasks() {
    return {makeTask("Task 1", "Description 1", 1, "Todo", "Project"),
            makeTask("Task 2", "Description 2", 2, "In Progress", "Project")};
}

#endif // TASKTRACK_TESTS_MEMORYSTORAGE_HPP
