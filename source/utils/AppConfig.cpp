#include "AppConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QtGlobal>

namespace {

std::optional<quint16> parsePort(const QString &text) {
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<quint16>(value);
}

} // END NAMESPACE

std::optional<AppConfig> AppConfig::fromArguments(const QStringList &arguments,
                                                  QString *outError) {
    const auto fail = [outError](const QString &message) -> std::optional<AppConfig> {
        if (outError) {
            *outError = message;
        }
        return std::nullopt;
    };

    AppConfig config;

    if (qEnvironmentVariableIsSet("TODOKEEP_DB")) {
        config.dbPath = qEnvironmentVariable("TODOKEEP_DB");
    }
    if (qEnvironmentVariableIsSet("TODOKEEP_LOG_FILE")) {
        config.logFile = qEnvironmentVariable("TODOKEEP_LOG_FILE");
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Single-user todo list service"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbOption(
        QStringList{"d", "db"}, QStringLiteral("SQLite database file."),
        QStringLiteral("path"), config.dbPath);
    const QCommandLineOption portOption(
        QStringList{"p", "port"}, QStringLiteral("HTTP port to listen on."),
        QStringLiteral("port"));
    const QCommandLineOption logOption(
        QStringList{"l", "log-file"},
        QStringLiteral("Log file, appended to. Empty logs to stderr only."),
        QStringLiteral("path"), config.logFile);
    const QCommandLineOption keyOption(
        QStringList{"storage-key"}, QStringLiteral("Key the todo list is stored under."),
        QStringLiteral("key"), config.storageKey);

    parser.addOption(dbOption);
    parser.addOption(portOption);
    parser.addOption(logOption);
    parser.addOption(keyOption);
    const QCommandLineOption verboseOption(
        QStringList{"v", "verbose"}, QStringLiteral("Enable debug logging."));
    parser.addOption(verboseOption);

    parser.process(arguments);

    config.dbPath = parser.value(dbOption);
    config.logFile = parser.value(logOption);

    config.verbose = parser.isSet(verboseOption);

    if (parser.isSet(portOption)) {
        const auto port = parsePort(parser.value(portOption));
        if (!port) {
            return fail(QStringLiteral("Invalid port: %1").arg(parser.value(portOption)));
        }
        config.port = *port;
    } else if (qEnvironmentVariableIsSet("TODOKEEP_PORT")) {
        const QString envPort = qEnvironmentVariable("TODOKEEP_PORT");
        const auto port = parsePort(envPort);
        if (!port) {
            return fail(QStringLiteral("TODOKEEP_PORT is not a valid port: %1").arg(envPort));
        }
        config.port = *port;
    }

    config.storageKey = parser.value(keyOption).trimmed();
    if (config.storageKey.isEmpty()) {
        return fail(QStringLiteral("Storage key must not be empty"));
    }
    if (config.dbPath.trimmed().isEmpty()) {
        return fail(QStringLiteral("Database path must not be empty"));
    }

    return config;
}
