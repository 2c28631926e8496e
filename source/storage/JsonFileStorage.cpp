#include "JsonFileStorage.hpp"

#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "JsonUtils.hpp"
#include "Logger.hpp"

JsonFileStorage::JsonFileStorage(const QString &filePath)
    : m_filePath(filePath) {
    qInfo(appStore) << "JsonFileStorage ready, path:" << m_filePath;
}

Result<std::vector<Task>> JsonFileStorage::loadTasks() const {
    qInfo(appStore) << "Load tasks from" << m_filePath;

    const QFileInfo info(m_filePath);
    if (!info.exists()) {
        qInfo(appStore) << "Store file absent, starting empty";
        return std::vector<Task>{};
    }
    if (info.isDir()) {
        qCritical(appStore) << "store path is a directory";
        return TaskError::io(
            QString("Failed to read %1: is a directory").arg(m_filePath),
            QJsonObject{{"path", m_filePath}});
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical(appStore) << "open for read:" << file.errorString();
        return TaskError::io(
            QString("Failed to read %1: %2").arg(m_filePath, file.errorString()),
            QJsonObject{{"path", m_filePath}});
    }

    const QByteArray contents = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        qCritical(appStore) << "read:" << file.errorString();
        return TaskError::io(
            QString("Failed to read %1: %2").arg(m_filePath, file.errorString()),
            QJsonObject{{"path", m_filePath}});
    }

    if (contents.trimmed().isEmpty()) {
        qInfo(appStore) << "Store file empty, starting empty";
        return std::vector<Task>{};
    }

    auto tasks = fromJsonTaskList(contents);
    if (!tasks) {
        qCritical(appStore) << "decode" << m_filePath << ":"
                            << tasks.error().message();
        return tasks.error();
    }

    qInfo(appStore) << "→" << tasks.value().size() << "tasks loaded";
    return tasks;
}

Status JsonFileStorage::saveTasks(const std::vector<Task> &tasks) {
    qInfo(appStore) << "Save" << tasks.size() << "tasks to" << m_filePath;

    // QSaveFile пишет во временный файл и переименовывает при commit()
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCritical(appStore) << "open for write:" << file.errorString();
        return TaskError::io(
            QString("Failed to write %1: %2").arg(m_filePath, file.errorString()),
            QJsonObject{{"path", m_filePath}});
    }

    const QByteArray payload = toJsonTaskList(tasks);
    if (file.write(payload) != payload.size()) {
        qCritical(appStore) << "write:" << file.errorString();
        file.cancelWriting();
        return TaskError::io(
            QString("Failed to write %1: %2").arg(m_filePath, file.errorString()),
            QJsonObject{{"path", m_filePath}});
    }

    if (!file.commit()) {
        qCritical(appStore) << "commit:" << file.errorString();
        return TaskError::io(
            QString("Failed to write %1: %2").arg(m_filePath, file.errorString()),
            QJsonObject{{"path", m_filePath}});
    }

    qInfo(appStore) << "Tasks saved to" << m_filePath;
    return Status::ok();
}
