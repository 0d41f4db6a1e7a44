#include <QJsonArray>
#include <QJsonObject>
#include <QUrlQuery>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "TodoRouter.hpp"
#include "ViewComposer.hpp"
#include "todo_filter.hpp"

using RequestHandler =
    std::function<QHttpServerResponse(const QHttpServerRequest &, const QString &)>;

TodoRouter::TodoRouter(std::shared_ptr<ITodoListController> controller)
    : m_controller(std::move(controller)) {}

static bool parseIdFromQuery(const QHttpServerRequest &request, QString &outId,
                             QString &outError) {
    const QString id =
        request.query().queryItemValue(QStringLiteral("id"), QUrl::FullyDecoded).trimmed();
    if (id.isEmpty()) {
        outError = QStringLiteral("Missing 'id' query param");
        return false;
    }

    outId = id;
    return true;
}

static QHttpServerResponse badRequest(const QString &message, const QString &requestId,
                                      const QString &type = QStringLiteral("bad_request"),
                                      QJsonObject details = {}) {
    return makeApiError(QHttpServerResponse::StatusCode::BadRequest, message, type,
                        std::move(details), requestId);
}

void TodoRouter::registerRoutes(QHttpServer &server) {
    const auto mirrorRoute = [&server](const char *path,
                                       QHttpServerRequest::Method method,
                                       auto handler) {
        server.route(path, method, handler);
        QString withSlash = QString::fromLatin1(path);
        if (!withSlash.endsWith('/')) {
            withSlash.append('/');
        }

        server.route(withSlash.toLatin1().constData(), method, handler);
    };

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /todos?filter=all|active|completed&q=<text>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todos", QHttpServerRequest::Method::Get,
        wrapSafe("GET /todos",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     const QUrlQuery query = request.query();
                     const QString filterParam =
                         query.queryItemValue(QStringLiteral("filter"), QUrl::FullyDecoded);
                     const QString text =
                         query.queryItemValue(QStringLiteral("q"), QUrl::FullyDecoded);

                     qInfo(appHttp) << "[GET] /todos"
                                    << "filter:" << filterParam
                                    << "q:" << text
                                    << "| requestId=" << requestId;

                     const auto filter = parseFilter(filterParam);
                     if (!filter) {
                         return badRequest(
                             QStringLiteral("Unknown filter '%1'").arg(filterParam),
                             requestId, QStringLiteral("validation_error"),
                             QJsonObject{{"field", "filter"},
                                         {"allowed", QJsonArray{"all", "active", "completed"}}});
                     }

                     const auto all = m_controller->todos();
                     const auto items = ViewComposer::derive(all, *filter, text);

                     return makeApiOk("Todos fetched",
                                      QJsonObject{{"items", toJsonArray(items)},
                                                  {"count", static_cast<qint64>(items.size())},
                                                  {"total", static_cast<qint64>(all.size())},
                                                  {"filter", filterName(*filter)},
                                                  {"q", text}},
                                      requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /todo?id=<id>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo", QHttpServerRequest::Method::Get,
        wrapSafe("GET /todo",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[GET] /todo"
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                     QString id;
                     QString parseError;
                     if (!parseIdFromQuery(request, id, parseError)) {
                         return badRequest(parseError, requestId);
                     }

                     const auto todo = m_controller->todoById(id);
                     if (!todo) {
                         throw NotFoundError(id);
                     }

                     return makeApiOk("Todo fetched",
                                      QJsonObject{{"todo", todo->toJson()}}, requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /todo/create  {title, description?}
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo/create", QHttpServerRequest::Method::Post,
        wrapSafe("POST /todo/create",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[POST] /todo/create"
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     QString parseError;
                     const auto body = parseBodyObject(request, &parseError);
                     if (!body) {
                         return badRequest("Invalid JSON: " + parseError, requestId);
                     }

                     const QJsonValue title = body->value("title");
                     if (!title.isString()) {
                         return badRequest(
                             "Field 'title' is required and must be a string", requestId,
                             "validation_error", QJsonObject{{"field", "title"}});
                     }

                     std::optional<QString> description;
                     const QJsonValue descriptionValue = body->value("description");
                     if (descriptionValue.isString()) {
                         description = descriptionValue.toString();
                     } else if (!descriptionValue.isNull() && !descriptionValue.isUndefined()) {
                         return badRequest(
                             "Field 'description' must be a string or null", requestId,
                             "validation_error", QJsonObject{{"field", "description"}});
                     }

                     const Todo created = m_controller->add(title.toString(), description);

                     return makeApiOk("Todo created",
                                      QJsonObject{{"todo", created.toJson()}}, requestId,
                                      QHttpServerResponse::StatusCode::Created);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // PATCH /todo?id=<id>  {title?, description?, completed?}
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo", QHttpServerRequest::Method::Patch,
        wrapSafe("PATCH /todo",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[PATCH] /todo"
                                    << "url:" << request.url().toString()
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     QString id;
                     QString parseError;
                     if (!parseIdFromQuery(request, id, parseError)) {
                         return badRequest(parseError, requestId);
                     }

                     const auto body = parseBodyObject(request, &parseError);
                     if (!body) {
                         return badRequest("Invalid JSON: " + parseError, requestId);
                     }

                     const auto patch = parseTodoPatch(*body, &parseError);
                     if (!patch) {
                         return badRequest(parseError, requestId, "validation_error");
                     }

                     const Todo updated = m_controller->edit(id, patch->title,
                                                             patch->description,
                                                             patch->completed);

                     return makeApiOk("Todo updated",
                                      QJsonObject{{"todo", updated.toJson()}}, requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /todo/toggle?id=<id>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo/toggle", QHttpServerRequest::Method::Post,
        wrapSafe("POST /todo/toggle",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[POST] /todo/toggle"
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                     QString id;
                     QString parseError;
                     if (!parseIdFromQuery(request, id, parseError)) {
                         return badRequest(parseError, requestId);
                     }

                     const Todo toggled = m_controller->toggleCompleted(id);

                     return makeApiOk("Todo toggled",
                                      QJsonObject{{"todo", toggled.toJson()}}, requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /todo?id=<id>   idempotent: unknown ids succeed with removed=false
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo", QHttpServerRequest::Method::Delete,
        wrapSafe("DELETE /todo",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[DELETE] /todo"
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                     QString id;
                     QString parseError;
                     if (!parseIdFromQuery(request, id, parseError)) {
                         return badRequest(parseError, requestId);
                     }

                     const bool removed = m_controller->remove(id);

                     return makeApiOk(removed ? "Todo deleted" : "Todo already absent",
                                      QJsonObject{{"id", id}, {"removed", removed}},
                                      requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /todos/reorder  {from, to}
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todos/reorder", QHttpServerRequest::Method::Post,
        wrapSafe("POST /todos/reorder",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[POST] /todos/reorder"
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     QString parseError;
                     const auto body = parseBodyObject(request, &parseError);
                     if (!body) {
                         return badRequest("Invalid JSON: " + parseError, requestId);
                     }

                     QString missing;
                     if (!requireFields(*body, {"from", "to"}, &missing)) {
                         return badRequest(QStringLiteral("Missing field: %1").arg(missing),
                                           requestId, "validation_error",
                                           QJsonObject{{"field", missing}});
                     }

                     const auto from = readIndex(body->value("from"));
                     const auto to = readIndex(body->value("to"));
                     if (!from || !to) {
                         return badRequest("Fields 'from' and 'to' must be integers",
                                           requestId, "validation_error");
                     }

                     m_controller->reorder(*from, *to);

                     return makeApiOk("Todos reordered",
                                      QJsonObject{{"items", toJsonArray(m_controller->todos())}},
                                      requestId);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /todos
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todos", QHttpServerRequest::Method::Delete,
        wrapSafe("DELETE /todos",
                 std::function<QHttpServerResponse(const QString &)>(
                     [this](const QString &requestId) {
                         qInfo(appHttp) << "[DELETE] /todos (all)"
                                        << "| requestId=" << requestId;

                         const bool cleared = m_controller->clear();

                         return makeApiOk("All todos deleted",
                                          QJsonObject{{"cleared", cleared}}, requestId);
                     })));

    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        sendNotFound(responder, request);
    });
}
