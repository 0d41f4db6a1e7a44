#ifndef TODOKEEP_UTILS_APPCONFIG_HPP
#define TODOKEEP_UTILS_APPCONFIG_HPP

#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

struct AppConfig {
    QString dbPath = QStringLiteral("todos.db");
    quint16 port = 8080;
    QString logFile = QStringLiteral("todokeep.log");
    QString storageKey = QStringLiteral("TODOS");
    bool verbose = false;

    // Environment (TODOKEEP_DB, TODOKEEP_PORT, TODOKEEP_LOG_FILE) seeds the
    // defaults, explicit options win. An environment value is only checked
    // when no option overrides it. Returns nullopt and fills outError on
    // invalid values; --help and --version exit from inside the parser.
    static std::optional<AppConfig> fromArguments(const QStringList &arguments,
                                                  QString *outError = nullptr);
};

#endif // TODOKEEP_UTILS_APPCONFIG_HPP
