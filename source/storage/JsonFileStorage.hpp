#ifndef TASKTRACK_STORAGE_JSONFILESTORAGE_HPP
#define TASKTRACK_STORAGE_JSONFILESTORAGE_HPP

#include <QString>

#include "IStorage.hpp"

// Whole collection in one pretty-printed JSON array.
// A missing or blank file reads as an empty collection.
class JsonFileStorage : public IStorage {
public:
    explicit JsonFileStorage(const QString &filePath);

    Result<std::vector<Task>> loadTasks() const override;
    Status saveTasks(const std::vector<Task> &tasks) override;

    const QString &filePath() const { return m_filePath; }

private:
    QString m_filePath;
};

#endif // TASKTRACK_STORAGE_JSONFILESTORAGE_HPP
