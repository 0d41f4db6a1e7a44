#include "ViewComposer.hpp"

namespace ViewComposer {

bool matches(const Todo &todo, TodoFilter filter, const QString &query) {
    if (filter == TodoFilter::Active && todo.isCompleted()) {
        return false;
    }
    if (filter == TodoFilter::Completed && !todo.isCompleted()) {
        return false;
    }
    if (!query.isEmpty() && !todo.title().contains(query, Qt::CaseInsensitive)) {
        return false;
    }
    return true;
}

std::vector<Todo> derive(const std::vector<Todo> &todos, TodoFilter filter,
                         const QString &query) {
    std::vector<Todo> out;
    for (const Todo &todo : todos) {
        if (matches(todo, filter, query)) {
            out.push_back(todo);
        }
    }
    return out;
}

} // namespace ViewComposer
