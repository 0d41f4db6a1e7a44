#ifndef TODOKEEP_SERVICE_ITODOLISTCONTROLLER_HPP
#define TODOKEEP_SERVICE_ITODOLISTCONTROLLER_HPP

#include <QString>
#include <QtGlobal>
#include <functional>
#include <optional>
#include <vector>

#include "todo.hpp"
#include "todo_filter.hpp"

enum class ControllerState {
    Uninitialized,
    Ready
};

using SubscriptionId = quint64;
using TodosSubscriber = std::function<void(const std::vector<Todo> &)>;

class ITodoListController {
public:
    virtual ~ITodoListController() = default;

    virtual ControllerState state() const = 0;
    virtual std::optional<QString> loadWarning() const = 0;

    virtual std::vector<Todo> todos() const = 0;
    virtual std::optional<Todo> todoById(const QString &id) const = 0;
    virtual std::vector<Todo> derive(TodoFilter filter, const QString &query) const = 0;

    virtual Todo add(const QString &title,
                     const std::optional<QString> &description = std::nullopt) = 0;
    virtual Todo edit(const QString &id,
                      const std::optional<QString> &title,
                      const std::optional<std::optional<QString>> &description,
                      std::optional<bool> completed) = 0;
    virtual bool remove(const QString &id) = 0;
    virtual Todo toggleCompleted(const QString &id) = 0;
    virtual void reorder(qsizetype fromIndex, qsizetype toIndex) = 0;
    virtual bool clear() = 0;

    virtual SubscriptionId subscribe(TodosSubscriber subscriber) = 0;
    virtual bool unsubscribe(SubscriptionId id) = 0;
};

#endif // TODOKEEP_SERVICE_ITODOLISTCONTROLLER_HPP
