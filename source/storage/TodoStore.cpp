#include "TodoStore.hpp"
#include "Logger.hpp"
#include "TodoError.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>

TodoStore::TodoStore(std::shared_ptr<IKeyValueStore> backend, QString key)
    : m_backend(std::move(backend)), m_key(std::move(key)) {}

std::vector<Todo> TodoStore::load() const {
    std::vector<Todo> out;

    std::optional<QString> text;
    if (!m_backend->value(m_key, text)) {
        throw PersistenceError(
            QStringLiteral("Failed to read todos under key '%1'").arg(m_key));
    }
    if (!text) {
        qInfo(appStore) << "No stored todos under" << m_key;
        return out;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(text->toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw CorruptStorageError(
            QStringLiteral("Stored todos are not valid JSON: %1").arg(parseError.errorString()));
    }
    if (!doc.isArray()) {
        throw CorruptStorageError(QStringLiteral("Stored todos are not a JSON array"));
    }

    const QJsonArray items = doc.array();
    out.reserve(static_cast<std::size_t>(items.size()));
    QSet<QString> seenIds;

    for (qsizetype i = 0; i < items.size(); ++i) {
        const QJsonValue item = items.at(i);
        if (!item.isObject()) {
            throw CorruptStorageError(
                QStringLiteral("Stored todo #%1 is not an object").arg(i));
        }

        QString decodeError;
        auto todo = Todo::fromJson(item.toObject(), &decodeError);
        if (!todo) {
            throw CorruptStorageError(
                QStringLiteral("Stored todo #%1: %2").arg(i).arg(decodeError));
        }
        if (seenIds.contains(todo->id())) {
            throw CorruptStorageError(
                QStringLiteral("Stored todo #%1: duplicate id %2").arg(i).arg(todo->id()));
        }
        seenIds.insert(todo->id());
        out.push_back(std::move(*todo));
    }

    qInfo(appStore) << "Loaded" << out.size() << "todos from" << m_key;
    return out;
}

void TodoStore::save(const std::vector<Todo> &todos) {
    QJsonArray items;
    for (const Todo &todo : todos) {
        items.append(todo.toJson());
    }

    const QString text =
        QString::fromUtf8(QJsonDocument(items).toJson(QJsonDocument::Compact));

    if (!m_backend->setValue(m_key, text)) {
        qCritical(appStore) << "Failed to save" << todos.size() << "todos under" << m_key;
        throw PersistenceError(
            QStringLiteral("Failed to write todos under key '%1'").arg(m_key));
    }

    qDebug(appStore) << "Saved" << todos.size() << "todos under" << m_key;
}
