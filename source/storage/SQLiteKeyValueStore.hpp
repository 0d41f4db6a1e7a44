#ifndef TODOKEEP_STORAGE_SQLITEKEYVALUESTORE_HPP
#define TODOKEEP_STORAGE_SQLITEKEYVALUESTORE_HPP

#include "IKeyValueStore.hpp"
#include <QtSql/QSqlDatabase>

class SQLiteKeyValueStore : public IKeyValueStore {
public:
    explicit SQLiteKeyValueStore(const QString &dbPath);
    ~SQLiteKeyValueStore() override;

    SQLiteKeyValueStore(const SQLiteKeyValueStore &) = delete;
    SQLiteKeyValueStore &operator=(const SQLiteKeyValueStore &) = delete;

    bool isOpen() const;

    bool value(const QString &key, std::optional<QString> &out) const override;
    bool setValue(const QString &key, const QString &value) override;
    bool remove(const QString &key) override;

private:
    QString m_connectionName;
    QSqlDatabase m_db;
};

#endif // TODOKEEP_STORAGE_SQLITEKEYVALUESTORE_HPP
