#include <catch2/catch.hpp>

#include <QJsonDocument>
#include <limits>

#include "JsonUtils.hpp"

SCENARIO( "PATCH bodies" )
{
    GIVEN( "an empty object" )
    {
        const auto patch = parseTodoPatch( QJsonObject{} );

        THEN( "nothing is overridden" )
        {
            REQUIRE( patch.has_value() );
            REQUIRE( !patch->title );
            REQUIRE( !patch->description );
            REQUIRE( !patch->completed );
        }
    }
    GIVEN( "every field" )
    {
        const auto patch = parseTodoPatch(
            QJsonObject{ { "title", "New" }, { "description", "Notes" }, { "completed", true } } );

        THEN( "each is carried over" )
        {
            REQUIRE( patch.has_value() );
            REQUIRE( patch->title == std::optional< QString >( "New" ) );
            REQUIRE( patch->description.has_value() );
            REQUIRE( *patch->description == std::optional< QString >( "Notes" ) );
            REQUIRE( patch->completed == std::optional< bool >( true ) );
        }
    }
    GIVEN( "a null description" )
    {
        const auto patch = parseTodoPatch( QJsonObject{ { "description", QJsonValue( QJsonValue::Null ) } } );

        THEN( "it clears the description" )
        {
            REQUIRE( patch.has_value() );
            REQUIRE( patch->description.has_value() );
            REQUIRE( !patch->description->has_value() );
        }
    }
    GIVEN( "wrongly typed fields" )
    {
        QString error;

        THEN( "parsing fails" )
        {
            REQUIRE( !parseTodoPatch( QJsonObject{ { "completed", "yes" } }, &error ) );
            REQUIRE( error.contains( "completed" ) );
            REQUIRE( !parseTodoPatch( QJsonObject{ { "title", 5 } } ) );
            REQUIRE( !parseTodoPatch( QJsonObject{ { "description", false } } ) );
        }
    }
}

SCENARIO( "reorder indices" )
{
    THEN( "whole numbers are accepted" )
    {
        REQUIRE( readIndex( QJsonValue( 3 ) ) == std::optional< qint64 >( 3 ) );
        REQUIRE( readIndex( QJsonValue( -1 ) ) == std::optional< qint64 >( -1 ) );
    }
    THEN( "fractions, strings and missing values are rejected" )
    {
        REQUIRE( !readIndex( QJsonValue( 1.5 ) ) );
        REQUIRE( !readIndex( QJsonValue( "1" ) ) );
        REQUIRE( !readIndex( QJsonValue( QJsonValue::Undefined ) ) );
    }
    THEN( "numbers outside the qint64 range are rejected" )
    {
        REQUIRE( !readIndex( QJsonValue( 1e300 ) ) );
        REQUIRE( !readIndex( QJsonValue( -1e300 ) ) );
        REQUIRE( !readIndex( QJsonValue( 9223372036854775808.0 ) ) );
        REQUIRE( readIndex( QJsonValue( -9223372036854775808.0 ) )
                 == std::optional< qint64 >( std::numeric_limits< qint64 >::min() ) );
    }
    THEN( "a body with an oversized index is rejected before reaching the controller" )
    {
        const auto body = QJsonDocument::fromJson( R"({"from": 1e300, "to": 0})" ).object();
        REQUIRE( !readIndex( body.value( "from" ) ) );
        REQUIRE( readIndex( body.value( "to" ) ) == std::optional< qint64 >( 0 ) );
    }
}
