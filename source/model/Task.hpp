#ifndef TASK_HPP
#define TASK_HPP

#include <QJsonObject>
#include <QString>
#include <QtGlobal>

struct Task {
    QString title;
    QString description;
    quint8 priority = 0;
    QString status;
    QString project;

    // QJsonObject хранит ключи отсортированными, порядок в файле стабилен
    QJsonObject toJson() const {
        return QJsonObject{{"title", title},
                           {"description", description},
                           {"priority", static_cast<int>(priority)},
                           {"status", status},
                           {"project", project}};
    }

    bool operator==(const Task &other) const {
        return title == other.title && description == other.description &&
               priority == other.priority && status == other.status &&
               project == other.project;
    }

    bool operator!=(const Task &other) const { return !(*this == other); }
};

#endif // TASK_HPP
