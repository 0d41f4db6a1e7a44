#ifndef TODOKEEP_MODEL_TODO_FILTER_HPP
#define TODOKEEP_MODEL_TODO_FILTER_HPP

#include <QString>
#include <optional>

enum class TodoFilter {
    All,
    Active,
    Completed
};

inline const char *filterName(TodoFilter filter) {
    switch (filter) {
    case TodoFilter::All: return "all";
    case TodoFilter::Active: return "active";
    case TodoFilter::Completed: return "completed";
    }
    return "all";
}

inline std::optional<TodoFilter> parseFilter(const QString &name) {
    const QString key = name.trimmed().toLower();
    if (key.isEmpty() || key == QLatin1String("all")) {
        return TodoFilter::All;
    }
    if (key == QLatin1String("active")) {
        return TodoFilter::Active;
    }
    if (key == QLatin1String("completed")) {
        return TodoFilter::Completed;
    }
    return std::nullopt;
}

#endif // TODOKEEP_MODEL_TODO_FILTER_HPP
