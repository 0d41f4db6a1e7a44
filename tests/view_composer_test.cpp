#include <catch2/catch.hpp>

#include <QSet>

#include "ViewComposer.hpp"

namespace {

std::vector< Todo > sample()
{
    return { Todo::create( "Call Bob", QString( "re: contract" ) ),
             Todo::create( "Buy milk" ).withChanges( std::nullopt, std::nullopt, true ),
             Todo::create( "Buy bread" ),
             Todo::create( "Book dentist" ).withChanges( std::nullopt, std::nullopt, true ) };
}

QStringList titles( const std::vector< Todo >& todos )
{
    QStringList out;
    for( const auto& todo : todos )
    {
        out.append( todo.title() );
    }
    return out;
}

} // namespace

SCENARIO( "ViewComposer filters by completion" )
{
    GIVEN( "a mixed collection" )
    {
        const auto todos = sample();

        THEN( "All keeps everything in order" )
        {
            REQUIRE( ViewComposer::derive( todos, TodoFilter::All ) == todos );
        }
        THEN( "Active keeps incomplete todos in order" )
        {
            REQUIRE( titles( ViewComposer::derive( todos, TodoFilter::Active ) )
                  == QStringList{ "Call Bob", "Buy bread" } );
        }
        THEN( "Completed keeps completed todos in order" )
        {
            REQUIRE( titles( ViewComposer::derive( todos, TodoFilter::Completed ) )
                  == QStringList{ "Buy milk", "Book dentist" } );
        }
        THEN( "Active and Completed partition the collection" )
        {
            const auto active = ViewComposer::derive( todos, TodoFilter::Active );
            const auto completed = ViewComposer::derive( todos, TodoFilter::Completed );

            QSet< QString > activeIds;
            QSet< QString > completedIds;
            for( const auto& t : active ) { activeIds.insert( t.id() ); }
            for( const auto& t : completed ) { completedIds.insert( t.id() ); }

            REQUIRE( !activeIds.intersects( completedIds ) );
            REQUIRE( activeIds.size() + completedIds.size() == static_cast< qsizetype >( todos.size() ) );
        }
    }
}

SCENARIO( "ViewComposer searches titles" )
{
    GIVEN( "a mixed collection" )
    {
        const auto todos = sample();

        THEN( "search is a case-insensitive substring match" )
        {
            REQUIRE( titles( ViewComposer::derive( todos, TodoFilter::All, "BUY" ) )
                  == QStringList{ "Buy milk", "Buy bread" } );
        }
        THEN( "descriptions are not searched" )
        {
            REQUIRE( ViewComposer::derive( todos, TodoFilter::All, "contract" ).empty() );
        }
        THEN( "search and filter must both match" )
        {
            REQUIRE( titles( ViewComposer::derive( todos, TodoFilter::Active, "buy" ) )
                  == QStringList{ "Buy bread" } );
            REQUIRE( titles( ViewComposer::derive( todos, TodoFilter::Completed, "b" ) )
                  == QStringList{ "Buy milk", "Book dentist" } );
        }
        THEN( "an empty query matches everything" )
        {
            REQUIRE( ViewComposer::derive( todos, TodoFilter::All, QString() ).size() == todos.size() );
        }
    }
}

SCENARIO( "filter names" )
{
    THEN( "known names parse, case-insensitively" )
    {
        REQUIRE( parseFilter( "Active" ) == TodoFilter::Active );
        REQUIRE( parseFilter( "completed" ) == TodoFilter::Completed );
        REQUIRE( parseFilter( "all" ) == TodoFilter::All );
        REQUIRE( parseFilter( "" ) == TodoFilter::All );
    }
    THEN( "unknown names are rejected" )
    {
        REQUIRE( !parseFilter( "done" ).has_value() );
    }
    THEN( "names round-trip" )
    {
        for( auto f : { TodoFilter::All, TodoFilter::Active, TodoFilter::Completed } )
        {
            REQUIRE( parseFilter( filterName( f ) ) == f );
        }
    }
}
