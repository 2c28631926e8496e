#include "TaskPrinter.hpp"

#include "JsonUtils.hpp"

QString formatTask(const Task &task, int number) {
    return QString("Task %1:\n"
                   "  title: %2\n"
                   "  description: %3\n"
                   "  priority: %4\n"
                   "  status: %5\n"
                   "  project: %6\n")
        .arg(QString::number(number), task.title, task.description,
             QString::number(task.priority), task.status, task.project);
}

void printTasks(QTextStream &out, const std::vector<Task> &tasks,
                OutputFormat format) {
    if (format == OutputFormat::Json) {
        out << QString::fromUtf8(toJsonTaskList(tasks));
        out.flush();
        return;
    }

    if (tasks.empty()) {
        out << "No tasks found." << Qt::endl;
        return;
    }

    int number = 1;
    for (const Task &task : tasks) {
        out << formatTask(task, number++);
    }
    out.flush();
}
