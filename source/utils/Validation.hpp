#ifndef TASKTRACK_UTILS_VALIDATION_HPP
#define TASKTRACK_UTILS_VALIDATION_HPP

#include <QString>
#include <QtGlobal>
#include <limits>

#include "Result.hpp"

inline Result<quint8> parsePriority(const QString &text) {
    bool ok = false;
    const int value = text.toInt(&ok, 10);
    if (!ok || text.trimmed() != text || value < 0 ||
        value > std::numeric_limits<quint8>::max()) {
        return TaskError::validation(
            QStringLiteral("Invalid priority"),
            QJsonObject{{"field", "priority"}, {"value", text}});
    }

    return static_cast<quint8>(value);
}

inline Status validateTitle(const QString &title) {
    if (title.isEmpty()) {
        return TaskError::validation(
            QStringLiteral("Field 'title' is required and must be non-empty"),
            QJsonObject{{"field", "title"}});
    }

    return Status::ok();
}

#endif // TASKTRACK_UTILS_VALIDATION_HPP
