#ifndef TODOKEEP_SERVICE_VIEWCOMPOSER_HPP
#define TODOKEEP_SERVICE_VIEWCOMPOSER_HPP

#include <QString>
#include <vector>

#include "todo.hpp"
#include "todo_filter.hpp"

namespace ViewComposer {

bool matches(const Todo &todo, TodoFilter filter, const QString &query);

// Filter and title search combined with AND. Source order is preserved.
std::vector<Todo> derive(const std::vector<Todo> &todos, TodoFilter filter,
                         const QString &query = QString());

} // namespace ViewComposer

#endif // TODOKEEP_SERVICE_VIEWCOMPOSER_HPP
