#ifndef TODOKEEP_UTILS_TODOERROR_HPP
#define TODOKEEP_UTILS_TODOERROR_HPP

#include <QString>
#include <stdexcept>

enum class TodoErrorKind {
    Validation,
    NotFound,
    IndexOutOfRange,
    CorruptStorage,
    Persistence
};

inline const char *toString(TodoErrorKind kind) {
    switch (kind) {
    case TodoErrorKind::Validation: return "validation_error";
    case TodoErrorKind::NotFound: return "not_found";
    case TodoErrorKind::IndexOutOfRange: return "index_out_of_range";
    case TodoErrorKind::CorruptStorage: return "corrupt_storage";
    case TodoErrorKind::Persistence: return "persistence_error";
    }
    return "error";
}

class TodoError : public std::runtime_error {
public:
    TodoError(TodoErrorKind kind, const QString &message)
        : std::runtime_error(message.toUtf8().toStdString()), m_kind(kind) {}

    TodoErrorKind kind() const noexcept { return m_kind; }
    QString message() const { return QString::fromUtf8(what()); }

private:
    TodoErrorKind m_kind;
};

class ValidationError : public TodoError {
public:
    explicit ValidationError(const QString &message)
        : TodoError(TodoErrorKind::Validation, message) {}
};

class NotFoundError : public TodoError {
public:
    explicit NotFoundError(const QString &id)
        : TodoError(TodoErrorKind::NotFound,
                    QStringLiteral("Todo with id=%1 not found").arg(id)),
          m_id(id) {}

    const QString &id() const noexcept { return m_id; }

private:
    QString m_id;
};

class IndexOutOfRangeError : public TodoError {
public:
    IndexOutOfRangeError(qsizetype index, qsizetype size)
        : TodoError(TodoErrorKind::IndexOutOfRange,
                    QStringLiteral("Index %1 is outside [0, %2)").arg(index).arg(size)),
          m_index(index), m_size(size) {}

    qsizetype index() const noexcept { return m_index; }
    qsizetype size() const noexcept { return m_size; }

private:
    qsizetype m_index;
    qsizetype m_size;
};

class CorruptStorageError : public TodoError {
public:
    explicit CorruptStorageError(const QString &message)
        : TodoError(TodoErrorKind::CorruptStorage, message) {}
};

class PersistenceError : public TodoError {
public:
    explicit PersistenceError(const QString &message)
        : TodoError(TodoErrorKind::Persistence, message) {}
};

#endif // TODOKEEP_UTILS_TODOERROR_HPP
