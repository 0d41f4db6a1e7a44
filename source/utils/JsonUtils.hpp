#ifndef TODOKEEP_UTILS_JSONUTILS_HPP
#define TODOKEEP_UTILS_JSONUTILS_HPP

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QtHttpServer/QHttpServerRequest>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>

#include "todo.hpp"

inline std::optional<QJsonObject>
parseBodyObject(const QHttpServerRequest &request,
                QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc =
        QJsonDocument::fromJson(request.body(), &parseError);

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (outError) {
            *outError = parseError.error != QJsonParseError::NoError
                            ? parseError.errorString()
                            : QStringLiteral("body must be a JSON object");
        }

        return std::nullopt;
    }

    return doc.object();
}

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

inline QJsonArray toJsonArray(const std::vector<Todo> &todos) {
    QJsonArray items;
    for (const Todo &todo : todos) {
        items.append(todo.toJson());
    }
    return items;
}

// Whole numbers that fit in qint64 only; 1.5, "1" or 1e300 are rejected.
inline std::optional<qint64> readIndex(const QJsonValue &value) {
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    if (!std::isfinite(number) || std::trunc(number) != number) {
        return std::nullopt;
    }
    // 2^63 is exactly representable, qint64 max is not.
    if (number < static_cast<double>(std::numeric_limits<qint64>::min()) ||
        number >= 9223372036854775808.0) {
        return std::nullopt;
    }
    return static_cast<qint64>(number);
}

// Partial update of a todo as accepted by PATCH.
//  - "title": string
//  - "description": string | null   (null or blank clears it)
//  - "completed": bool
struct TodoPatch {
    std::optional<QString> title;
    std::optional<std::optional<QString>> description;
    std::optional<bool> completed;
};

inline std::optional<TodoPatch> parseTodoPatch(const QJsonObject &obj,
                                               QString *outError = nullptr) {
    const auto fail = [outError](const QString &message) -> std::optional<TodoPatch> {
        if (outError) {
            *outError = message;
        }
        return std::nullopt;
    };

    TodoPatch patch;

    if (obj.contains("title")) {
        const QJsonValue title = obj.value("title");
        if (!title.isString()) {
            return fail(QStringLiteral("Field 'title' must be a string"));
        }
        patch.title = title.toString();
    }

    if (obj.contains("description")) {
        const QJsonValue description = obj.value("description");
        if (description.isNull()) {
            patch.description = std::optional<QString>();
        } else if (description.isString()) {
            patch.description = std::optional<QString>(description.toString());
        } else {
            return fail(QStringLiteral("Field 'description' must be a string or null"));
        }
    }

    if (obj.contains("completed")) {
        const QJsonValue completed = obj.value("completed");
        if (!completed.isBool()) {
            return fail(QStringLiteral("Field 'completed' must be a boolean"));
        }
        patch.completed = completed.toBool();
    }

    return patch;
}

#endif // TODOKEEP_UTILS_JSONUTILS_HPP
