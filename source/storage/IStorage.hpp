#ifndef TASKTRACK_STORAGE_ISTORAGE_HPP
#define TASKTRACK_STORAGE_ISTORAGE_HPP

#include <vector>

#include "Result.hpp"
#include "Task.hpp"

class IStorage {
public:
    virtual ~IStorage() = default;

    virtual Result<std::vector<Task>> loadTasks() const = 0;
    virtual Status saveTasks(const std::vector<Task> &tasks) = 0;
};

#endif // TASKTRACK_STORAGE_ISTORAGE_HPP
