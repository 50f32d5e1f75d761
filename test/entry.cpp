////////////////////////////////////////////////////////////////////////////////
/// ordo ordered_map entry view test suite
////////////////////////////////////////////////////////////////////////////////

#include <ordo/containers/ordered_map.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using OMS = ordo::ordered_map<std::string, int>;

namespace
{
    std::vector<std::string> keys_of( OMS const & map )
    {
        auto const keys{ map.keys() };
        return { keys.begin(), keys.end() };
    }
} // anonymous namespace

//==============================================================================
// entry()
//==============================================================================

TEST( entry, vacant_then_occupied )
{
    OMS m{ { "a", 1 } };

    auto missing{ m.entry( "b" ) };
    EXPECT_TRUE( missing.is_vacant() );
    EXPECT_EQ( missing.key(), "b" );
    EXPECT_EQ( missing.index(), 1 );

    auto present{ m.entry( "a" ) };
    EXPECT_TRUE( present.is_occupied() );
    EXPECT_EQ( present.index(), 0 );
    EXPECT_EQ( present.occupied()->get(), 1 );
}

TEST( entry, or_insert_family )
{
    OMS m;
    m.entry( "x" ).or_insert( 1 ) += 10;
    m.entry( "x" ).or_insert( 100 ) += 10;
    EXPECT_EQ( m.at( "x" ), 21 );

    EXPECT_EQ( m.entry( "y" ).or_insert_with( [] { return 5; } ), 5 );
    EXPECT_EQ( m.entry( "zz" ).or_insert_with_key( []( std::string const & key ) { return static_cast<int>( key.size() ); } ), 2 );
    EXPECT_EQ( m.entry( "w" ).or_default(), 0 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "x", "y", "zz", "w" } ) );
}

TEST( entry, and_modify_only_touches_existing )
{
    OMS m{ { "a", 1 } };
    m.entry( "a" ).and_modify( []( int & v ) { v *= 7; } ).or_insert( 0 );
    m.entry( "b" ).and_modify( []( int & v ) { v *= 7; } ).or_insert( 3 );
    EXPECT_EQ( m.at( "a" ), 7 );
    EXPECT_EQ( m.at( "b" ), 3 );
}

TEST( entry, occupied_insert_and_remove )
{
    OMS m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };

    auto e{ m.entry( "a" ) };
    ASSERT_TRUE( e.is_occupied() );
    auto & occupied{ *e.occupied() };
    EXPECT_EQ( occupied.insert( 10 ), 1 );
    EXPECT_EQ( occupied.get(), 10 );
    occupied.get() = 11;
    EXPECT_EQ( occupied.key(), "a" );
    EXPECT_EQ( occupied.swap_remove(), 11 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "c", "b" } ) );

    auto removed{ m.entry( "c" ).occupied()->shift_remove_entry() };
    EXPECT_EQ( removed.first , "c" );
    EXPECT_EQ( removed.second, 3 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b" } ) );
}

TEST( entry, occupied_move_and_swap_indices )
{
    OMS m{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } };

    auto e{ m.entry( "a" ) };
    auto & occupied{ *e.occupied() };
    occupied.move_index( 2 );
    EXPECT_EQ( occupied.index(), 2 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b", "c", "a", "d" } ) );

    occupied.swap_indices( 3 );
    EXPECT_EQ( occupied.index(), 3 );
    EXPECT_EQ( occupied.get(), 1 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b", "c", "d", "a" } ) );
    EXPECT_THROW( occupied.move_index( 4 ), std::out_of_range );
    EXPECT_EQ( m.get_index_of( "a" ), 3 );
    EXPECT_EQ( m.get_index_of( "d" ), 2 );
}

TEST( entry, vacant_insert_variants )
{
    OMS m{ { "b", 2 }, { "d", 4 } };

    auto c{ m.entry( "c" ) };
    auto const [ pos, value ]{ c.vacant()->insert_sorted( 3 ) };
    EXPECT_EQ( pos, 1 );
    EXPECT_EQ( value, 3 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b", "c", "d" } ) );

    auto a{ m.entry( "a" ) };
    EXPECT_EQ( a.vacant()->shift_insert( 0, 1 ), 1 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "a", "b", "c", "d" } ) );

    auto z{ m.entry( "z" ) };
    EXPECT_THROW( z.vacant()->shift_insert( 9, 0 ), std::out_of_range );
    EXPECT_EQ( z.vacant()->insert( 26 ), 26 );
    EXPECT_EQ( m.get_index_of( "z" ), 4 );

    auto e{ m.entry( "e" ) };
    EXPECT_EQ( e.vacant()->into_key(), "e" );
    EXPECT_FALSE( m.contains( "e" ) );
}

//==============================================================================
// get_index_entry()
//==============================================================================

TEST( entry, indexed_entry )
{
    OMS m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    EXPECT_FALSE( m.get_index_entry( 3 ).has_value() );

    auto indexed{ m.get_index_entry( 1 ) };
    ASSERT_TRUE( indexed.has_value() );
    EXPECT_EQ( indexed->key(), "b" );
    indexed->get() += 40;
    EXPECT_EQ( m.at( "b" ), 42 );

    indexed->move_index( 0 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b", "a", "c" } ) );
    EXPECT_EQ( indexed->remove(), 42 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "a", "c" } ) );
}
