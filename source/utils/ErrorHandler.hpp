#ifndef TODOKEEP_UTILS_ERRORHANDLER_HPP
#define TODOKEEP_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>
#include <functional>

#include "Logger.hpp"
#include "TodoError.hpp"

inline const char *toString(QHttpServerRequest::Method m) {
    using M = QHttpServerRequest::Method;
    switch (m) {
    case M::Get: return "GET";
    case M::Post: return "POST";
    case M::Put: return "PUT";
    case M::Delete: return "DELETE";
    case M::Patch: return "PATCH";
    case M::Head: return "HEAD";
    case M::Options: return "OPTIONS";
    case M::Trace: return "TRACE";
    case M::Connect: return "CONNECT";
    default: return "UNKNOWN";
    }
}

inline QHttpServerResponse::StatusCode statusFor(TodoErrorKind kind) {
    using S = QHttpServerResponse::StatusCode;
    switch (kind) {
    case TodoErrorKind::Validation: return S::BadRequest;
    case TodoErrorKind::NotFound: return S::NotFound;
    case TodoErrorKind::IndexOutOfRange: return S::BadRequest;
    case TodoErrorKind::CorruptStorage: return S::InternalServerError;
    case TodoErrorKind::Persistence: return S::InternalServerError;
    }
    return S::InternalServerError;
}

inline QHttpServerResponse
makeApiError(QHttpServerResponse::StatusCode status, const QString &message,
             const QString &type = QStringLiteral("error"),
             QJsonObject details = {}, const QString &requestId = {}) {
    QJsonObject obj{
                    {"ok", false},
                    {"type", type},
                    {"message", message},
                    {"status", static_cast<int>(status)},
                    {"requestId", requestId.isEmpty()
                                      ? QUuid::createUuid().toString(QUuid::WithoutBraces)
                                      : requestId},
                    {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}};
    if (!details.isEmpty())
        obj.insert("details", details);

    return QHttpServerResponse(obj, status);
}

inline QHttpServerResponse makeApiError(const TodoError &error, const QString &requestId) {
    QJsonObject details;
    if (const auto *notFound = dynamic_cast<const NotFoundError *>(&error)) {
        details.insert("id", notFound->id());
    } else if (const auto *range = dynamic_cast<const IndexOutOfRangeError *>(&error)) {
        details.insert("index", static_cast<qint64>(range->index()));
        details.insert("size", static_cast<qint64>(range->size()));
    }

    return makeApiError(statusFor(error.kind()), error.message(),
                        QString::fromLatin1(toString(error.kind())), details, requestId);
}

inline QHttpServerResponse makeApiOk(const QString &message = QString(),
                                     QJsonObject data = {},
                                     const QString &requestId = {},
                                     QHttpServerResponse::StatusCode status = QHttpServerResponse::StatusCode::Ok) {
    QJsonObject obj{
        {"ok", true},
        {"message", message},
        {"requestId", requestId.isEmpty()
                          ? QUuid::createUuid().toString(QUuid::WithoutBraces)
                          : requestId},
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}
    };
    if (!data.isEmpty())
        obj.insert("data", data);
    return QHttpServerResponse(obj, status);
}

inline void sendNotFound(QHttpServerResponder &responder,
                         const QHttpServerRequest &request) {
    const QString methodString = toString(request.method());
    const QString urlString = request.url().toString();
    qWarning(appHttp) << "404 no route for" << methodString << urlString;

    QHttpServerResponse response = makeApiError(
        QHttpServerResponse::StatusCode::NotFound,
        QStringLiteral("Route not found"), QStringLiteral("not_found"),
        QJsonObject{{"method", methodString},
                    {"path", urlString},
                    {"hint", "Check path, HTTP method and trailing slash"}});
    responder.sendResponse(response);
}

// Runs a route handler with a fresh request id. Domain errors become their
// mapped status; anything else derived from std::exception becomes a 500.
inline QHttpServerResponse runSafe(const char *routeName, const QString &requestId,
                                   const std::function<QHttpServerResponse()> &fn) {
    const qint64 started = QDateTime::currentMSecsSinceEpoch();
    try {
        auto resp = fn();
        qInfo(appHttp) << "[DONE]" << routeName
                       << "| requestId=" << requestId
                       << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
        return resp;
    } catch (const TodoError &e) {
        qWarning(appHttp) << "[FAIL]" << routeName
                          << "| requestId=" << requestId
                          << "| kind=" << toString(e.kind())
                          << "| what=" << e.what();
        return makeApiError(e, requestId);
    } catch (const std::exception &e) {
        qCritical(appHttp) << "[EXC]" << routeName
                           << "| requestId=" << requestId
                           << "| what=" << e.what();
        return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                            "Internal error", "internal_error",
                            QJsonObject{{"what", e.what()}}, requestId);
    }
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &requestId)> fn) {
    return [routeName, fn]() -> QHttpServerResponse {
        const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        return runSafe(routeName, requestId, [&]() { return fn(requestId); });
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QHttpServerRequest &request) -> QHttpServerResponse {
        const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        return runSafe(routeName, requestId, [&]() { return fn(request, requestId); });
    };
}

#endif // TODOKEEP_UTILS_ERRORHANDLER_HPP
