#ifndef TASKTRACK_CLI_TASKPRINTER_HPP
#define TASKTRACK_CLI_TASKPRINTER_HPP

#include <QString>
#include <QTextStream>
#include <vector>

#include "Task.hpp"

enum class OutputFormat { Text, Json };

QString formatTask(const Task &task, int number);

void printTasks(QTextStream &out, const std::vector<Task> &tasks,
                OutputFormat format);

#endif // TASKTRACK_CLI_TASKPRINTER_HPP
