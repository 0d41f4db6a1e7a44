#include <QCoreApplication>
#include <QtHttpServer/QHttpServer>
#include <QtHttpServer/QHttpServerResponse>
#include <QTcpServer>
#include <QHostAddress>
#include <QDebug>

#include <cstdio>

#include "AppConfig.hpp"
#include "Logger.hpp"
#include "SQLiteKeyValueStore.hpp"
#include "TodoError.hpp"
#include "TodoListController.hpp"
#include "TodoRouter.hpp"
#include "TodoStore.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("todokeep");
    QCoreApplication::setApplicationVersion(TODOKEEP_VERSION);

    QString configError;
    const auto config = AppConfig::fromArguments(app.arguments(), &configError);
    if (!config) {
        fprintf(stderr, "todokeep: %s\n", qPrintable(configError));
        return 1;
    }

    initLogging(config->logFile, config->verbose);

    // ──────────────────────────────
    // 1. Storage
    // ──────────────────────────────
    auto backend = std::make_shared<SQLiteKeyValueStore>(config->dbPath);
    if (!backend->isOpen()) {
        qCritical(appCore) << "Cannot open database" << config->dbPath;
        shutdownLogging();
        return 1;
    }
    auto store = std::make_shared<TodoStore>(backend, config->storageKey);

    // ──────────────────────────────
    // 2. Controller
    // ──────────────────────────────
    std::shared_ptr<TodoListController> controller;
    try {
        controller = std::make_shared<TodoListController>(store);
    } catch (const PersistenceError &e) {
        qCritical(appCore) << "Cannot read stored todos:" << e.message();
        shutdownLogging();
        return 1;
    }
    if (const auto warning = controller->loadWarning()) {
        qWarning(appCore) << "Started with an empty list:" << *warning;
    }

    controller->subscribe([](const std::vector<Todo> &todos) {
        qDebug(appCore) << "Collection changed, size" << todos.size();
    });

    // ──────────────────────────────
    // 3. HTTP
    // ──────────────────────────────
    QHttpServer server;

    TodoRouter router(controller);
    router.registerRoutes(server);

    auto tcp = new QTcpServer(&app);
    if (!tcp->listen(QHostAddress::Any, config->port) || !server.bind(tcp)) {
        qCritical(appHttp) << "Server failed to start on port" << config->port;
        shutdownLogging();
        return 1;
    }

    qInfo(appHttp) << "Server running on port" << tcp->serverPort();

    const int rc = app.exec();
    shutdownLogging();
    return rc;
}
