#ifndef TASKTRACK_UTILS_RESULT_HPP
#define TASKTRACK_UTILS_RESULT_HPP

#include <QJsonObject>
#include <QString>
#include <optional>
#include <utility>
#include <variant>

class TaskError {
public:
    enum class Kind { Io, Decode, Validation, NotFound };

    TaskError(Kind kind, QString message, QJsonObject details = {})
        : m_kind(kind), m_message(std::move(message)),
          m_details(std::move(details)) {}

    static TaskError io(const QString &message, QJsonObject details = {}) {
        return TaskError(Kind::Io, message, std::move(details));
    }
    static TaskError decode(const QString &message, QJsonObject details = {}) {
        return TaskError(Kind::Decode, message, std::move(details));
    }
    static TaskError validation(const QString &message,
                                QJsonObject details = {}) {
        return TaskError(Kind::Validation, message, std::move(details));
    }
    static TaskError notFound(const QString &message,
                              QJsonObject details = {}) {
        return TaskError(Kind::NotFound, message, std::move(details));
    }

    Kind kind() const { return m_kind; }
    const QString &message() const { return m_message; }
    const QJsonObject &details() const { return m_details; }

    // машинное имя ошибки, как в API-ответах
    QString type() const {
        switch (m_kind) {
        case Kind::Io: return QStringLiteral("io_error");
        case Kind::Decode: return QStringLiteral("decode_error");
        case Kind::Validation: return QStringLiteral("validation_error");
        case Kind::NotFound: return QStringLiteral("not_found");
        }
        return QStringLiteral("error");
    }

private:
    Kind m_kind;
    QString m_message;
    QJsonObject m_details;
};

// Value-or-error holder returned by every store and engine operation.
template <typename T> class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(TaskError error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool isOk() const { return m_data.index() == 0; }
    explicit operator bool() const { return isOk(); }

    const T &value() const & { return std::get<0>(m_data); }
    T &value() & { return std::get<0>(m_data); }
    T &&value() && { return std::get<0>(std::move(m_data)); }

    const TaskError &error() const { return std::get<1>(m_data); }

private:
    std::variant<T, TaskError> m_data;
};

class Status {
public:
    Status() = default;
    Status(TaskError error) : m_error(std::move(error)) {}

    static Status ok() { return Status(); }

    bool isOk() const { return !m_error.has_value(); }
    explicit operator bool() const { return isOk(); }

    const TaskError &error() const { return *m_error; }

private:
    std::optional<TaskError> m_error;
};

#endif // TASKTRACK_UTILS_RESULT_HPP
