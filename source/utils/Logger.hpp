#ifndef TODOKEEP_UTILS_LOGGER_HPP
#define TODOKEEP_UTILS_LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appHttp)
Q_DECLARE_LOGGING_CATEGORY(appStore)

// Rules for the todokeep.* categories. Debug output only when verbose.
QString loggingFilterRules(bool verbose);

// Installs the message handler and the filter rules. Messages always go to
// stderr; with a non-empty path they are appended to that file as well.
// Returns false when the file cannot be opened, logging then stays on stderr.
bool initLogging(const QString& filePath = QString(), bool verbose = false);

// Flushes and closes the log file and restores Qt's default handler.
void shutdownLogging();

#endif // TODOKEEP_UTILS_LOGGER_HPP
