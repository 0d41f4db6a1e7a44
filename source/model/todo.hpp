#ifndef TODOKEEP_MODEL_TODO_HPP
#define TODOKEEP_MODEL_TODO_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QUuid>
#include <optional>
#include <utility>

inline QString normalizeTitle(const QString &title) {
    return title.trimmed();
}

// Blank descriptions are stored as absent, never as "".
inline std::optional<QString> normalizeDescription(const std::optional<QString> &description) {
    if (!description) {
        return std::nullopt;
    }
    const QString trimmed = description->trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    return trimmed;
}

class Todo {
public:
    static Todo create(const QString &title,
                       const std::optional<QString> &description = std::nullopt) {
        return Todo(QUuid::createUuid().toString(QUuid::WithoutBraces),
                    normalizeTitle(title), normalizeDescription(description),
                    false, QDateTime::currentDateTimeUtc());
    }

    // Copy with overrides. id and createdAt always carry over.
    Todo withChanges(const std::optional<QString> &title = std::nullopt,
                     const std::optional<std::optional<QString>> &description = std::nullopt,
                     std::optional<bool> completed = std::nullopt) const {
        Todo updated = *this;
        if (title) {
            updated.m_title = normalizeTitle(*title);
        }
        if (description) {
            updated.m_description = normalizeDescription(*description);
        }
        if (completed) {
            updated.m_completed = *completed;
        }
        return updated;
    }

    const QString &id() const { return m_id; }
    const QString &title() const { return m_title; }
    const std::optional<QString> &description() const { return m_description; }
    bool isCompleted() const { return m_completed; }
    const QDateTime &createdAt() const { return m_createdAt; }

    bool operator==(const Todo &other) const {
        return m_id == other.m_id && m_title == other.m_title &&
               m_description == other.m_description &&
               m_completed == other.m_completed && m_createdAt == other.m_createdAt;
    }
    bool operator!=(const Todo &other) const { return !(*this == other); }

    QJsonObject toJson() const {
        return QJsonObject{
            {"id", m_id},
            {"title", m_title},
            {"description", m_description ? QJsonValue(*m_description) : QJsonValue(QJsonValue::Null)},
            {"completed", m_completed},
            {"createdAt", m_createdAt.toUTC().toString(Qt::ISODateWithMs)}};
    }

    static std::optional<Todo> fromJson(const QJsonObject &jsonObject,
                                        QString *outError = nullptr) {
        const auto fail = [outError](const QString &message) -> std::optional<Todo> {
            if (outError) {
                *outError = message;
            }
            return std::nullopt;
        };

        const QJsonValue id = jsonObject.value("id");
        if (!id.isString() || id.toString().isEmpty()) {
            return fail(QStringLiteral("Missing or invalid field: id"));
        }

        const QJsonValue title = jsonObject.value("title");
        if (!title.isString()) {
            return fail(QStringLiteral("Missing or invalid field: title"));
        }
        if (normalizeTitle(title.toString()).isEmpty()) {
            return fail(QStringLiteral("Blank title"));
        }

        const QJsonValue completed = jsonObject.value("completed");
        if (!completed.isBool()) {
            return fail(QStringLiteral("Missing or invalid field: completed"));
        }

        const QJsonValue createdAtValue = jsonObject.value("createdAt");
        if (!createdAtValue.isString()) {
            return fail(QStringLiteral("Missing or invalid field: createdAt"));
        }
        const QDateTime createdAt =
            QDateTime::fromString(createdAtValue.toString(), Qt::ISODateWithMs);
        if (!createdAt.isValid()) {
            return fail(QStringLiteral("Malformed createdAt: %1").arg(createdAtValue.toString()));
        }

        std::optional<QString> description;
        const QJsonValue descriptionValue = jsonObject.value("description");
        if (descriptionValue.isString()) {
            description = normalizeDescription(descriptionValue.toString());
        } else if (!descriptionValue.isNull() && !descriptionValue.isUndefined()) {
            return fail(QStringLiteral("Invalid field: description"));
        }

        return Todo(id.toString(), normalizeTitle(title.toString()), std::move(description),
                    completed.toBool(), createdAt.toUTC());
    }

private:
    Todo(QString id, QString title, std::optional<QString> description,
         bool completed, QDateTime createdAt)
        : m_id(std::move(id)), m_title(std::move(title)),
          m_description(std::move(description)), m_completed(completed),
          m_createdAt(std::move(createdAt)) {}

    QString m_id;
    QString m_title;
    std::optional<QString> m_description;
    bool m_completed = false;
    QDateTime m_createdAt;
};

#endif // TODOKEEP_MODEL_TODO_HPP
