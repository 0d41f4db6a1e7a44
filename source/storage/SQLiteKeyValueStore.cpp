#include "SQLiteKeyValueStore.hpp"
#include "Logger.hpp"

#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QUuid>
#include <QVariant>

namespace {

bool ensureSchema(QSqlDatabase db) {
    QSqlQuery q(db);

    if (!q.exec(
            "CREATE TABLE IF NOT EXISTS kv ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");"
            )) {
        qWarning(appStore) << "schema kv:" << q.lastError();
        return false;
    }

    return true;
}

} // END NAMESPACE

SQLiteKeyValueStore::SQLiteKeyValueStore(const QString &dbPath)
    : m_connectionName(QStringLiteral("todokeep-") +
                       QUuid::createUuid().toString(QUuid::WithoutBraces)) {
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(dbPath);

    if (!m_db.open()) {
        qCritical(appStore) << "Failed to open database:" << dbPath
                            << m_db.lastError().text();
        return;
    }

    if (!ensureSchema(m_db)) {
        qCritical(appStore) << "Failed to init schema";
        m_db.close();
        return;
    }

    qInfo(appStore) << "Key-value store opened:" << dbPath;
}

SQLiteKeyValueStore::~SQLiteKeyValueStore() {
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool SQLiteKeyValueStore::isOpen() const {
    return m_db.isOpen();
}

bool SQLiteKeyValueStore::value(const QString &key, std::optional<QString> &out) const {
    out.reset();

    if (!m_db.isOpen()) {
        qCritical(appStore) << "value(" << key << "): database is not open";
        return false;
    }

    QSqlQuery q(m_db);
    q.prepare("SELECT value FROM kv WHERE key = ?");
    q.addBindValue(key);

    if (!q.exec()) {
        qCritical(appStore) << "value:" << q.lastError();
        return false;
    }

    if (q.next()) {
        out = q.value(0).toString();
    }

    return true;
}

bool SQLiteKeyValueStore::setValue(const QString &key, const QString &value) {
    if (!m_db.isOpen()) {
        qWarning(appStore) << "setValue(" << key << "): database is not open";
        return false;
    }

    QSqlQuery q(m_db);
    q.prepare("INSERT INTO kv(key, value) VALUES(?, ?) "
              "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    q.addBindValue(key);
    q.addBindValue(value);

    if (!q.exec()) {
        qCritical(appStore) << "setValue:" << q.lastError();
        return false;
    }

    return true;
}

bool SQLiteKeyValueStore::remove(const QString &key) {
    if (!m_db.isOpen()) {
        qWarning(appStore) << "remove(" << key << "): database is not open";
        return false;
    }

    QSqlQuery q(m_db);
    q.prepare("DELETE FROM kv WHERE key = ?");
    q.addBindValue(key);

    if (!q.exec()) {
        qWarning(appStore) << "remove:" << q.lastError();
        return false;
    }

    return q.numRowsAffected() > 0;
}
