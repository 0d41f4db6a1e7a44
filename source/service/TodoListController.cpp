#include "TodoListController.hpp"
#include "Logger.hpp"
#include "TodoError.hpp"
#include "ViewComposer.hpp"

#include <QMutexLocker>
#include <algorithm>
#include <iterator>

TodoListController::TodoListController(std::shared_ptr<TodoStore> store)
    : m_store(std::move(store)) {
    try {
        m_todos = m_store->load();
        qInfo(appCore) << "[Core] Loaded" << m_todos.size() << "todos";
    } catch (const CorruptStorageError &e) {
        m_todos.clear();
        m_loadWarning = e.message();
        qWarning(appCore) << "[Core] Stored todos are unreadable, starting empty:"
                          << e.message();
    }

    m_state = ControllerState::Ready;
}

ControllerState TodoListController::state() const {
    QMutexLocker lock(&m_mutex);
    return m_state;
}

std::optional<QString> TodoListController::loadWarning() const {
    QMutexLocker lock(&m_mutex);
    return m_loadWarning;
}

// ───────────────────────────────────────────────
// Reads
// ───────────────────────────────────────────────

std::vector<Todo> TodoListController::todos() const {
    QMutexLocker lock(&m_mutex);
    return m_todos;
}

std::optional<Todo> TodoListController::todoById(const QString &id) const {
    QMutexLocker lock(&m_mutex);
    const auto it = findLocked(id);
    if (it == m_todos.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Todo> TodoListController::derive(TodoFilter filter, const QString &query) const {
    QMutexLocker lock(&m_mutex);
    return ViewComposer::derive(m_todos, filter, query);
}

// ───────────────────────────────────────────────
// Commands
// ───────────────────────────────────────────────

Todo TodoListController::add(const QString &title, const std::optional<QString> &description) {
    QMutexLocker lock(&m_mutex);

    if (normalizeTitle(title).isEmpty()) {
        qWarning(appCore) << "[Core] Attempt to add todo with empty title";
        throw ValidationError(QStringLiteral("Title must not be empty"));
    }

    Todo todo = Todo::create(title, description);

    std::vector<Todo> next;
    next.reserve(m_todos.size() + 1);
    next.push_back(todo);
    next.insert(next.end(), m_todos.cbegin(), m_todos.cend());

    commitLocked(std::move(next));

    qInfo(appCore) << "[Core] Todo added:" << todo.title() << "(id=" << todo.id() << ")";
    return todo;
}

Todo TodoListController::edit(const QString &id,
                              const std::optional<QString> &title,
                              const std::optional<std::optional<QString>> &description,
                              std::optional<bool> completed) {
    QMutexLocker lock(&m_mutex);
    return editLocked(id, title, description, completed);
}

bool TodoListController::remove(const QString &id) {
    QMutexLocker lock(&m_mutex);

    const auto it = findLocked(id);
    if (it == m_todos.cend()) {
        qInfo(appCore) << "[Core] Remove of unknown id" << id << "ignored";
        return false;
    }

    std::vector<Todo> next = m_todos;
    next.erase(next.begin() + std::distance(m_todos.cbegin(), it));

    commitLocked(std::move(next));

    qInfo(appCore) << "[Core] Todo removed (id=" << id << ")";
    return true;
}

Todo TodoListController::toggleCompleted(const QString &id) {
    QMutexLocker lock(&m_mutex);

    const auto it = findLocked(id);
    if (it == m_todos.cend()) {
        qWarning(appCore) << "[Core] Toggle of unknown id" << id;
        throw NotFoundError(id);
    }

    return editLocked(id, std::nullopt, std::nullopt, !it->isCompleted());
}

void TodoListController::reorder(qsizetype fromIndex, qsizetype toIndex) {
    QMutexLocker lock(&m_mutex);

    const auto size = static_cast<qsizetype>(m_todos.size());
    if (fromIndex < 0 || fromIndex >= size) {
        qWarning(appCore) << "[Core] Reorder from invalid index" << fromIndex;
        throw IndexOutOfRangeError(fromIndex, size);
    }
    if (toIndex < 0 || toIndex >= size) {
        qWarning(appCore) << "[Core] Reorder to invalid index" << toIndex;
        throw IndexOutOfRangeError(toIndex, size);
    }

    if (fromIndex == toIndex) {
        return;
    }

    // toIndex addresses the list after the moved item has been taken out.
    std::vector<Todo> next = m_todos;
    Todo moved = next[static_cast<std::size_t>(fromIndex)];
    next.erase(next.begin() + fromIndex);
    next.insert(next.begin() + toIndex, std::move(moved));

    commitLocked(std::move(next));

    qInfo(appCore) << "[Core] Todo moved" << fromIndex << "->" << toIndex;
}

bool TodoListController::clear() {
    QMutexLocker lock(&m_mutex);

    if (m_todos.empty()) {
        return false;
    }

    const auto removed = m_todos.size();
    commitLocked({});

    qInfo(appCore) << "[Core] All todos removed:" << removed;
    return true;
}

// ───────────────────────────────────────────────
// Subscriptions
// ───────────────────────────────────────────────

SubscriptionId TodoListController::subscribe(TodosSubscriber subscriber) {
    QMutexLocker lock(&m_mutex);
    const SubscriptionId id = m_nextSubscriptionId++;
    m_subscribers.emplace(id, std::move(subscriber));
    return id;
}

bool TodoListController::unsubscribe(SubscriptionId id) {
    QMutexLocker lock(&m_mutex);
    return m_subscribers.erase(id) > 0;
}

// ───────────────────────────────────────────────
// Internals (m_mutex held)
// ───────────────────────────────────────────────

std::vector<Todo>::const_iterator TodoListController::findLocked(const QString &id) const {
    return std::find_if(m_todos.cbegin(), m_todos.cend(),
                        [&id](const Todo &todo) { return todo.id() == id; });
}

Todo TodoListController::editLocked(const QString &id,
                                    const std::optional<QString> &title,
                                    const std::optional<std::optional<QString>> &description,
                                    std::optional<bool> completed) {
    const auto it = findLocked(id);
    if (it == m_todos.cend()) {
        qWarning(appCore) << "[Core] Edit of unknown id" << id;
        throw NotFoundError(id);
    }

    Todo updated = it->withChanges(title, description, completed);
    if (updated.title().isEmpty()) {
        qWarning(appCore) << "[Core] Attempt to clear title of" << id;
        throw ValidationError(QStringLiteral("Title must not be empty"));
    }

    std::vector<Todo> next = m_todos;
    next[static_cast<std::size_t>(std::distance(m_todos.cbegin(), it))] = updated;

    commitLocked(std::move(next));

    qInfo(appCore) << "[Core] Todo updated:" << updated.title() << "(id=" << id << ")";
    return updated;
}

void TodoListController::commitLocked(std::vector<Todo> next) {
    std::vector<Todo> previous = std::move(m_todos);
    m_todos = std::move(next);

    try {
        m_store->save(m_todos);
    } catch (const PersistenceError &e) {
        qCritical(appCore) << "[Core] Save failed, restoring previous collection:"
                           << e.message();
        m_todos = std::move(previous);
        notifyLocked();
        throw;
    }

    notifyLocked();
}

void TodoListController::notifyLocked() const {
    for (const auto &entry : m_subscribers) {
        try {
            entry.second(m_todos);
        } catch (const std::exception &e) {
            qCritical(appCore) << "[Core] Subscriber" << entry.first
                               << "threw, ignoring:" << e.what();
        }
    }
}
