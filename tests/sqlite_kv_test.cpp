#include <catch2/catch.hpp>

#include <QTemporaryDir>
#include <memory>

#include "SQLiteKeyValueStore.hpp"
#include "TodoError.hpp"
#include "TodoStore.hpp"

namespace {

std::optional< QString > read( const SQLiteKeyValueStore& kv, const QString& key )
{
    std::optional< QString > out;
    REQUIRE( kv.value( key, out ) );
    return out;
}

} // namespace

SCENARIO( "SQLiteKeyValueStore persists values across connections" )
{
    QTemporaryDir dir;
    REQUIRE( dir.isValid() );
    const QString path = dir.filePath( "todos.db" );

    GIVEN( "a fresh database" )
    {
        SQLiteKeyValueStore kv( path );
        REQUIRE( kv.isOpen() );

        THEN( "unknown keys are absent" )
        {
            REQUIRE( !read( kv, "TODOS" ).has_value() );
        }

        WHEN( "a key is written twice" )
        {
            REQUIRE( kv.setValue( "TODOS", "[]" ) );
            REQUIRE( kv.setValue( "TODOS", "[1]" ) );

            THEN( "the last value wins" )
            {
                REQUIRE( read( kv, "TODOS" ) == std::optional< QString >( "[1]" ) );
            }
            THEN( "it can be removed" )
            {
                REQUIRE( kv.remove( "TODOS" ) );
                REQUIRE( !read( kv, "TODOS" ).has_value() );
                REQUIRE( !kv.remove( "TODOS" ) );
            }
        }
    }
    GIVEN( "a database file that cannot be opened" )
    {
        SQLiteKeyValueStore kv( dir.filePath( "missing/dir/todos.db" ) );

        THEN( "reads and writes fail instead of reporting absence" )
        {
            REQUIRE( !kv.isOpen() );
            std::optional< QString > out = QString( "stale" );
            REQUIRE( !kv.value( "TODOS", out ) );
            REQUIRE( !out.has_value() );
            REQUIRE( !kv.setValue( "TODOS", "[]" ) );
        }
        THEN( "loading through it raises PersistenceError" )
        {
            TodoStore store( std::make_shared< SQLiteKeyValueStore >( dir.filePath( "missing/dir/todos.db" ) ) );
            REQUIRE_THROWS_AS( store.load(), PersistenceError );
        }
    }
    GIVEN( "a collection saved through one connection" )
    {
        const std::vector< Todo > todos{ Todo::create( "Call Bob", QString( "re: contract" ) ),
                                         Todo::create( "Buy milk" ) };
        {
            TodoStore store( std::make_shared< SQLiteKeyValueStore >( path ) );
            store.save( todos );
        }

        THEN( "a new connection loads the same collection" )
        {
            TodoStore reopened( std::make_shared< SQLiteKeyValueStore >( path ) );
            REQUIRE( reopened.load() == todos );
        }
    }
}
