#ifndef TODOKEEP_STORAGE_IKEYVALUESTORE_HPP
#define TODOKEEP_STORAGE_IKEYVALUESTORE_HPP

#include <QString>
#include <optional>

class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    // False when the read itself failed. An absent key is a successful
    // read that leaves `out` empty.
    virtual bool value(const QString &key, std::optional<QString> &out) const = 0;
    virtual bool setValue(const QString &key, const QString &value) = 0;
    virtual bool remove(const QString &key) = 0;
};

#endif // TODOKEEP_STORAGE_IKEYVALUESTORE_HPP
