#include "TaskQueries.hpp"

#include <algorithm>
#include <iterator>

namespace {

template <typename Pred>
std::vector<Task> filterTasks(const std::vector<Task> &tasks, Pred pred) {
    std::vector<Task> out;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(out), pred);
    return out;
}

} // END NAMESPACE

std::vector<Task> filterByProject(const std::vector<Task> &tasks,
                                  const QString &project) {
    return filterTasks(tasks, [&project](const Task &task) {
        return task.project == project;
    });
}

std::vector<Task> filterByStatus(const std::vector<Task> &tasks,
                                 const QString &status) {
    return filterTasks(tasks, [&status](const Task &task) {
        return task.status == status;
    });
}

std::vector<Task> filterByPriority(const std::vector<Task> &tasks,
                                   quint8 priority) {
    return filterTasks(tasks, [priority](const Task &task) {
        return task.priority == priority;
    });
}

std::vector<Task> searchTasks(const std::vector<Task> &tasks,
                              const QString &query) {
    const QString needle = query.toLower();
    return filterTasks(tasks, [&needle](const Task &task) {
        return task.title.toLower().contains(needle) ||
               task.description.toLower().contains(needle);
    });
}

Task *findFirstByTitle(std::vector<Task> &tasks, const QString &title) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&title](const Task &task) {
                               return task.title == title;
                           });
    return it != tasks.end() ? &*it : nullptr;
}

std::size_t countByTitle(const std::vector<Task> &tasks, const QString &title) {
    return static_cast<std::size_t>(
        std::count_if(tasks.begin(), tasks.end(), [&title](const Task &task) {
            return task.title == title;
        }));
}

std::size_t removeByTitle(std::vector<Task> &tasks, const QString &title) {
    const auto before = tasks.size();
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                               [&title](const Task &task) {
                                   return task.title == title;
                               }),
                tasks.end());
    return before - tasks.size();
}
