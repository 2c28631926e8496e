#include "StoreLock.hpp"

#include "Logger.hpp"

StoreLock::StoreLock(const QString &storePath)
    : m_lockPath(storePath + QStringLiteral(".lock")), m_lock(m_lockPath) {
    // 0 = не считать lock-файл устаревшим по времени, только по мёртвому PID
    m_lock.setStaleLockTime(0);
}

StoreLock::~StoreLock() { release(); }

Status StoreLock::acquire(int timeoutMs) {
    qInfo(appStore) << "Acquire lock" << m_lockPath << "timeout ms=" << timeoutMs;

    if (m_lock.tryLock(timeoutMs)) {
        qInfo(appStore) << "Lock acquired" << m_lockPath;
        return Status::ok();
    }

    switch (m_lock.error()) {
    case QLockFile::LockFailedError:
        qWarning(appStore) << "Store is locked by another process:"
                           << m_lockPath;
        return TaskError::io(
            QString("Task store is busy (lock held: %1)").arg(m_lockPath),
            QJsonObject{{"path", m_lockPath}});
    case QLockFile::PermissionError:
        qCritical(appStore) << "No permission to create lock" << m_lockPath;
        return TaskError::io(
            QString("Cannot create lock file %1: permission denied")
                .arg(m_lockPath),
            QJsonObject{{"path", m_lockPath}});
    default:
        qCritical(appStore) << "Lock error for" << m_lockPath;
        return TaskError::io(
            QString("Cannot create lock file %1").arg(m_lockPath),
            QJsonObject{{"path", m_lockPath}});
    }
}

void StoreLock::release() {
    if (m_lock.isLocked()) {
        m_lock.unlock();
        qInfo(appStore) << "Lock released" << m_lockPath;
    }
}
