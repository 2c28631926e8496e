#ifndef JSONUTILS_H
#define JSONUTILS_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>
#include <initializer_list>
#include <vector>

#include "Result.hpp"
#include "Task.hpp"

inline bool requireFields(const QJsonObject &obj,
                          std::initializer_list<const char *> keys,
                          QString *missing = nullptr) {
    for (const char *key : keys) {
        if (!obj.contains(key)) {
            if (missing) {
                *missing = key;
            }
            return false;
        }
    }
    return true;
}

inline Result<QString> requireString(const QJsonObject &obj, const char *key,
                                     int index) {
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        return TaskError::decode(
            QString("Field '%1' of task #%2 must be a string")
                .arg(QString::fromLatin1(key))
                .arg(index),
            QJsonObject{{"field", key}, {"index", index}});
    }
    return value.toString();
}

inline Result<Task> fromJsonTaskStrict(const QJsonValue &value, int index) {
    if (!value.isObject()) {
        return TaskError::decode(
            QString("Task #%1 is not an object").arg(index),
            QJsonObject{{"index", index}});
    }

    const QJsonObject obj = value.toObject();

    QString missingKey;
    if (!requireFields(obj,
                       {"title", "description", "priority", "status", "project"},
                       &missingKey)) {
        return TaskError::decode(
            QString("Missing field '%1' in task #%2").arg(missingKey).arg(index),
            QJsonObject{{"field", missingKey}, {"index", index}});
    }

    Task task;

    auto title = requireString(obj, "title", index);
    if (!title) {
        return title.error();
    }
    task.title = std::move(title).value();

    auto description = requireString(obj, "description", index);
    if (!description) {
        return description.error();
    }
    task.description = std::move(description).value();

    auto status = requireString(obj, "status", index);
    if (!status) {
        return status.error();
    }
    task.status = std::move(status).value();

    auto project = requireString(obj, "project", index);
    if (!project) {
        return project.error();
    }
    task.project = std::move(project).value();

    const QJsonValue priority = obj.value("priority");
    const double number = priority.toDouble(-1.0);
    if (!priority.isDouble() || number < 0.0 || number > 255.0 ||
        std::floor(number) != number) {
        return TaskError::decode(
            QString("Field 'priority' of task #%1 must be an integer 0-255")
                .arg(index),
            QJsonObject{{"field", "priority"}, {"index", index}});
    }
    task.priority = static_cast<quint8>(number);

    return task;
}

inline Result<std::vector<Task>> fromJsonTaskList(const QByteArray &bytes) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        return TaskError::decode(
            "Invalid JSON: " + parseError.errorString(),
            QJsonObject{{"offset", parseError.offset}});
    }

    if (!doc.isArray()) {
        return TaskError::decode(
            QStringLiteral("Expected a JSON array of tasks"));
    }

    const QJsonArray items = doc.array();
    std::vector<Task> out;
    out.reserve(static_cast<size_t>(items.size()));

    for (int i = 0; i < items.size(); ++i) {
        auto task = fromJsonTaskStrict(items.at(i), i);
        if (!task) {
            return task.error();
        }
        out.push_back(std::move(task).value());
    }

    return out;
}

inline QByteArray toJsonTaskList(const std::vector<Task> &tasks) {
    QJsonArray items;
    for (const Task &task : tasks) {
        items.append(task.toJson());
    }
    return QJsonDocument(items).toJson(QJsonDocument::Indented);
}

#endif // JSONUTILS_H
