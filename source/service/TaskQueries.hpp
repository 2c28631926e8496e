#ifndef TASKTRACK_SERVICE_TASKQUERIES_HPP
#define TASKTRACK_SERVICE_TASKQUERIES_HPP

#include <QString>
#include <QtGlobal>
#include <cstddef>
#include <vector>

#include "Task.hpp"

// Linear-scan queries over the in-memory collection.
// All filters keep the original order.

std::vector<Task> filterByProject(const std::vector<Task> &tasks,
                                  const QString &project);

std::vector<Task> filterByStatus(const std::vector<Task> &tasks,
                                 const QString &status);

std::vector<Task> filterByPriority(const std::vector<Task> &tasks,
                                   quint8 priority);

// Case-insensitive substring match on title or description.
std::vector<Task> searchTasks(const std::vector<Task> &tasks,
                              const QString &query);

// First task with exactly this title, or nullptr.
Task *findFirstByTitle(std::vector<Task> &tasks, const QString &title);

std::size_t countByTitle(const std::vector<Task> &tasks, const QString &title);

// Removes every task with exactly this title; returns how many were removed.
std::size_t removeByTitle(std::vector<Task> &tasks, const QString &title);

#endif // TASKTRACK_SERVICE_TASKQUERIES_HPP
