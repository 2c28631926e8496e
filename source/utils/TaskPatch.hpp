#ifndef TASKPATCH_HPP
#define TASKPATCH_HPP

#include <QString>
#include <optional>

#include "Result.hpp"
#include "Task.hpp"
#include "Validation.hpp"

// Частичное обновление задачи. Отсутствующее поле не меняется.
// priority приходит строкой из командной строки и проверяется здесь.
struct TaskPatch {
    std::optional<QString> description;
    std::optional<QString> priority;
    std::optional<QString> status;
    std::optional<QString> project;

    bool isEmpty() const {
        return !description && !priority && !status && !project;
    }
};

// Сначала валидируем все поля, потом применяем: при ошибке task не тронут.
inline Status applyTaskPatch(Task &task, const TaskPatch &patch) {
    std::optional<quint8> newPriority;
    if (patch.priority) {
        auto parsed = parsePriority(*patch.priority);
        if (!parsed) {
            return parsed.error();
        }
        newPriority = parsed.value();
    }

    if (patch.description) {
        task.description = *patch.description;
    }

    if (newPriority) {
        task.priority = *newPriority;
    }

    if (patch.status) {
        task.status = *patch.status;
    }

    if (patch.project) {
        task.project = *patch.project;
    }

    return Status::ok();
}

#endif // TASKPATCH_HPP
