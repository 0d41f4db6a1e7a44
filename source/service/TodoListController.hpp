#ifndef TODOKEEP_SERVICE_TODOLISTCONTROLLER_HPP
#define TODOKEEP_SERVICE_TODOLISTCONTROLLER_HPP

#include <QMutex>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "ITodoListController.hpp"
#include "TodoStore.hpp"

// Owns the in-memory collection. Each command validates, replaces the
// collection, saves it and then notifies subscribers. A failed save restores
// the previous collection before PersistenceError reaches the caller.
//
// Commands are serialized by an internal mutex. Subscribers run while it is
// held, so they must not call back into the controller. A subscriber that
// throws is logged and skipped; the command and the other subscribers are
// unaffected.
//
// The constructor lets PersistenceError through when storage cannot be read.
// Unreadable content (CorruptStorageError) only sets loadWarning().
class TodoListController : public ITodoListController {
public:
    explicit TodoListController(std::shared_ptr<TodoStore> store);

    ControllerState state() const override;
    std::optional<QString> loadWarning() const override;

    std::vector<Todo> todos() const override;
    std::optional<Todo> todoById(const QString &id) const override;
    std::vector<Todo> derive(TodoFilter filter, const QString &query) const override;

    Todo add(const QString &title,
             const std::optional<QString> &description = std::nullopt) override;
    Todo edit(const QString &id,
              const std::optional<QString> &title,
              const std::optional<std::optional<QString>> &description,
              std::optional<bool> completed) override;
    bool remove(const QString &id) override;
    Todo toggleCompleted(const QString &id) override;
    void reorder(qsizetype fromIndex, qsizetype toIndex) override;
    bool clear() override;

    SubscriptionId subscribe(TodosSubscriber subscriber) override;
    bool unsubscribe(SubscriptionId id) override;

private:
    std::vector<Todo>::const_iterator findLocked(const QString &id) const;
    Todo editLocked(const QString &id,
                    const std::optional<QString> &title,
                    const std::optional<std::optional<QString>> &description,
                    std::optional<bool> completed);
    void commitLocked(std::vector<Todo> next);
    void notifyLocked() const;

    std::shared_ptr<TodoStore> m_store;

    mutable QMutex m_mutex;
    ControllerState m_state = ControllerState::Uninitialized;
    std::optional<QString> m_loadWarning;
    std::vector<Todo> m_todos;

    std::map<SubscriptionId, TodosSubscriber> m_subscribers;
    SubscriptionId m_nextSubscriptionId = 1;
};

#endif // TODOKEEP_SERVICE_TODOLISTCONTROLLER_HPP
