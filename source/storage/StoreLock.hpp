#ifndef TASKTRACK_STORAGE_STORELOCK_HPP
#define TASKTRACK_STORAGE_STORELOCK_HPP

#include <QLockFile>
#include <QString>

#include "Result.hpp"

// Exclusive "<store>.lock" held for one load/mutate/save sequence.
// Released on destruction.
class StoreLock {
public:
    explicit StoreLock(const QString &storePath);
    ~StoreLock();

    StoreLock(const StoreLock &) = delete;
    StoreLock &operator=(const StoreLock &) = delete;

    Status acquire(int timeoutMs);
    void release();

    bool isLocked() const { return m_lock.isLocked(); }
    const QString &lockPath() const { return m_lockPath; }

private:
    QString m_lockPath;
    QLockFile m_lock;
};

#endif // TASKTRACK_STORAGE_STORELOCK_HPP
