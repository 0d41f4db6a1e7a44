#include <catch2/catch.hpp>

#include <QEventLoop>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpServer>
#include <QTimer>
#include <QtHttpServer/QHttpServer>
#include <memory>

#include "FakeKeyValueStore.hpp"
#include "TodoListController.hpp"
#include "TodoRouter.hpp"

namespace {

struct Reply
{
    int status = 0;
    QJsonObject body;
};

// A server on an ephemeral local port with the todo routes registered.
struct RunningServer
{
    std::shared_ptr< FakeKeyValueStore > backend = std::make_shared< FakeKeyValueStore >();
    std::shared_ptr< TodoListController > controller
        = std::make_shared< TodoListController >( std::make_shared< TodoStore >( backend ) );
    QHttpServer server;
    TodoRouter router{ controller };
    QNetworkAccessManager network;
    quint16 port = 0;

    RunningServer()
    {
        router.registerRoutes( server );
        auto tcp = new QTcpServer();
        REQUIRE( tcp->listen( QHostAddress::LocalHost, 0 ) );
        port = tcp->serverPort();
        REQUIRE( server.bind( tcp ) );
        network.setProxy( QNetworkProxy::NoProxy );
    }

    Reply send( const QByteArray& verb, const QString& pathAndQuery, const QByteArray& body = {} )
    {
        QNetworkRequest request( QUrl( QStringLiteral( "http://127.0.0.1:%1%2" ).arg( port ).arg( pathAndQuery ) ) );
        request.setHeader( QNetworkRequest::ContentTypeHeader, "application/json" );

        QNetworkReply* reply = network.sendCustomRequest( request, verb, body );
        QEventLoop loop;
        QObject::connect( reply, &QNetworkReply::finished, &loop, &QEventLoop::quit );
        QTimer::singleShot( 5000, &loop, &QEventLoop::quit );
        if( !reply->isFinished() )
        {
            loop.exec();
        }
        REQUIRE( reply->isFinished() );

        Reply out;
        out.status = reply->attribute( QNetworkRequest::HttpStatusCodeAttribute ).toInt();
        out.body = QJsonDocument::fromJson( reply->readAll() ).object();
        reply->deleteLater();
        return out;
    }
};

} // namespace

SCENARIO( "todo routes over HTTP" )
{
    RunningServer http;

    GIVEN( "a todo created through the API" )
    {
        const auto created = http.send( "POST", "/todo/create", R"({"title":"  Buy milk  ","description":" "})" );
        REQUIRE( created.status == 201 );
        const auto todo = created.body.value( "data" ).toObject().value( "todo" ).toObject();
        const QString id = todo.value( "id" ).toString();

        THEN( "it is normalized and persisted" )
        {
            REQUIRE( todo.value( "title" ).toString() == "Buy milk" );
            REQUIRE( todo.value( "description" ).isNull() );
            REQUIRE( http.controller->todos().size() == 1 );
            REQUIRE( http.backend->stored( "TODOS" ).has_value() );
        }
        WHEN( "it is toggled and listed by filter" )
        {
            REQUIRE( http.send( "POST", "/todo/toggle?id=" + id ).status == 200 );
            const auto active = http.send( "GET", "/todos?filter=active" );
            const auto completed = http.send( "GET", "/todos?filter=completed&q=MILK" );

            THEN( "the views reflect the change" )
            {
                REQUIRE( active.status == 200 );
                REQUIRE( active.body.value( "data" ).toObject().value( "count" ).toInt() == 0 );
                REQUIRE( completed.body.value( "data" ).toObject().value( "count" ).toInt() == 1 );
                REQUIRE( completed.body.value( "data" ).toObject().value( "total" ).toInt() == 1 );
            }
        }
        WHEN( "it is deleted twice" )
        {
            const auto first = http.send( "DELETE", "/todo?id=" + id );
            const auto second = http.send( "DELETE", "/todo?id=" + id );

            THEN( "both succeed and only the first removes" )
            {
                REQUIRE( first.status == 200 );
                REQUIRE( first.body.value( "data" ).toObject().value( "removed" ).toBool() );
                REQUIRE( second.status == 200 );
                REQUIRE( !second.body.value( "data" ).toObject().value( "removed" ).toBool( true ) );
            }
        }
        WHEN( "a reorder names an index past the end" )
        {
            const auto reply = http.send( "POST", "/todos/reorder", R"({"from":5,"to":0})" );

            THEN( "it is a 400 naming the index and the size" )
            {
                REQUIRE( reply.status == 400 );
                REQUIRE( reply.body.value( "type" ).toString() == "index_out_of_range" );
                const auto details = reply.body.value( "details" ).toObject();
                REQUIRE( details.value( "index" ).toInteger() == 5 );
                REQUIRE( details.value( "size" ).toInteger() == 1 );
            }
        }
        WHEN( "a reorder index does not fit in an integer" )
        {
            const auto reply = http.send( "POST", "/todos/reorder", R"({"from":1e300,"to":0})" );

            THEN( "it is rejected as invalid input" )
            {
                REQUIRE( reply.status == 400 );
                REQUIRE( reply.body.value( "type" ).toString() == "validation_error" );
            }
        }
        WHEN( "storage stops accepting writes" )
        {
            http.backend->failWrites = true;
            const auto reply = http.send( "PATCH", "/todo?id=" + id, R"({"title":"Buy oat milk"})" );

            THEN( "the edit fails with a 500 and nothing changes" )
            {
                REQUIRE( reply.status == 500 );
                REQUIRE( reply.body.value( "type" ).toString() == "persistence_error" );
                REQUIRE( http.controller->todos().front().title() == "Buy milk" );
            }
        }
    }
    GIVEN( "requests the routes reject" )
    {
        THEN( "a blank title is a validation error" )
        {
            const auto reply = http.send( "POST", "/todo/create", R"({"title":"   "})" );
            REQUIRE( reply.status == 400 );
            REQUIRE( reply.body.value( "type" ).toString() == "validation_error" );
        }
        THEN( "an unknown id is a 404 naming it" )
        {
            const auto reply = http.send( "GET", "/todo?id=nope" );
            REQUIRE( reply.status == 404 );
            REQUIRE( reply.body.value( "type" ).toString() == "not_found" );
            REQUIRE( reply.body.value( "details" ).toObject().value( "id" ).toString() == "nope" );
        }
        THEN( "malformed JSON is a bad request" )
        {
            const auto reply = http.send( "POST", "/todo/create", "{not json" );
            REQUIRE( reply.status == 400 );
            REQUIRE( reply.body.value( "type" ).toString() == "bad_request" );
        }
        THEN( "an unknown filter is rejected" )
        {
            const auto reply = http.send( "GET", "/todos?filter=someday" );
            REQUIRE( reply.status == 400 );
            REQUIRE( reply.body.value( "type" ).toString() == "validation_error" );
        }
        THEN( "an unknown route is a 404" )
        {
            const auto reply = http.send( "GET", "/nowhere" );
            REQUIRE( reply.status == 404 );
            REQUIRE( reply.body.value( "type" ).toString() == "not_found" );
        }
    }
}
