#ifndef TODOKEEP_STORAGE_TODOSTORE_HPP
#define TODOKEEP_STORAGE_TODOSTORE_HPP

#include <QString>
#include <memory>
#include <vector>

#include "IKeyValueStore.hpp"
#include "todo.hpp"

// Persists the whole collection as one JSON array under a single key.
// Every save overwrites the previous value.
class TodoStore {
public:
    static constexpr const char *kDefaultKey = "TODOS";

    explicit TodoStore(std::shared_ptr<IKeyValueStore> backend,
                       QString key = QString::fromLatin1(kDefaultKey));

    const QString &key() const { return m_key; }

    // Throws CorruptStorageError when the stored value cannot be decoded and
    // PersistenceError when the backend cannot be read at all.
    std::vector<Todo> load() const;

    // Throws PersistenceError when the backend rejects the write.
    void save(const std::vector<Todo> &todos);

private:
    std::shared_ptr<IKeyValueStore> m_backend;
    QString m_key;
};

#endif // TODOKEEP_STORAGE_TODOSTORE_HPP
