////////////////////////////////////////////////////////////////////////////////
/// ordo ordered_map raw entry test suite
////////////////////////////////////////////////////////////////////////////////

#include <ordo/containers/ordered_map.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using OMS = ordo::ordered_map<std::string, int>;

namespace
{
    std::size_t hash_of( std::string_view const key ) { return std::hash<std::string>{}( std::string{ key } ); }

    auto matches( std::string_view const expected )
    {
        return [ expected ]( std::string const & key ) { return key == expected; };
    }

    std::vector<std::string> keys_of( OMS const & map )
    {
        auto const keys{ map.keys() };
        return { keys.begin(), keys.end() };
    }
} // anonymous namespace

//==============================================================================
// Immutable builder
//==============================================================================

TEST( raw_entry, lookups )
{
    OMS const m{ { "a", 1 }, { "b", 2 } };
    auto const raw{ m.raw_entry_v1() };

    auto const by_key{ raw.from_key( std::string{ "b" } ) };
    ASSERT_TRUE( by_key.has_value() );
    EXPECT_EQ( by_key->second, 2 );

    EXPECT_TRUE( raw.from_key_hashed_nocheck( hash_of( "a" ), std::string{ "a" } ).has_value() );
    EXPECT_FALSE( raw.from_key( std::string{ "q" } ).has_value() );

    auto const by_hash{ raw.from_hash( hash_of( "a" ), matches( "a" ) ) };
    ASSERT_TRUE( by_hash.has_value() );
    EXPECT_EQ( by_hash->first, "a" );

    auto const full{ raw.from_hash_full( hash_of( "b" ), matches( "b" ) ) };
    ASSERT_TRUE( full.has_value() );
    EXPECT_EQ( std::get<0>( *full ), 1 );
    EXPECT_EQ( std::get<2>( *full ), 2 );

    EXPECT_EQ( raw.index_from_hash( hash_of( "b" ), matches( "b" ) ), 1 );
    EXPECT_EQ( raw.index_from_hash( hash_of( "b" ), matches( "a" ) ), std::nullopt );
}

TEST( raw_entry, lookups_on_an_empty_map )
{
    OMS const m;
    EXPECT_FALSE( m.raw_entry_v1().from_key( std::string{ "a" } ).has_value() );
    EXPECT_FALSE( m.raw_entry_v1().from_hash( 0, matches( "a" ) ).has_value() );
}

//==============================================================================
// Mutable builder
//==============================================================================

TEST( raw_entry, vacant_insert )
{
    OMS m{ { "a", 1 } };
    auto entry{ m.raw_entry_mut_v1().from_key( std::string{ "b" } ) };
    ASSERT_FALSE( entry.is_occupied() );
    EXPECT_EQ( entry.index(), 1 );
    auto const [ key, value ]{ entry.vacant()->insert( "b", 2 ) };
    EXPECT_EQ( key, "b" );
    EXPECT_EQ( value, 2 );
    EXPECT_EQ( m.get_index_of( "b" ), 1 );
}

TEST( raw_entry, vacant_shift_insert_hashed )
{
    OMS m{ { "a", 1 }, { "c", 3 } };
    auto entry{ m.raw_entry_mut_v1().from_hash( hash_of( "b" ), matches( "b" ) ) };
    ASSERT_NE( entry.vacant(), nullptr );
    entry.vacant()->shift_insert_hashed_nocheck( 1, hash_of( "b" ), "b", 2 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "a", "b", "c" } ) );
    EXPECT_EQ( m.at( "b" ), 2 );

    auto out_of_range{ m.raw_entry_mut_v1().from_key( std::string{ "z" } ) };
    EXPECT_THROW( out_of_range.vacant()->shift_insert( 4, "z", 0 ), std::out_of_range );
    EXPECT_FALSE( m.contains( "z" ) );
}

TEST( raw_entry, occupied_views )
{
    OMS m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    auto entry{ m.raw_entry_mut_v1().from_key( std::string{ "b" } ) };
    ASSERT_TRUE( entry.is_occupied() );
    auto & occupied{ *entry.occupied() };
    EXPECT_EQ( occupied.index(), 1 );

    auto [ key, value ]{ occupied.get_key_value_mut() };
    value = 20;
    EXPECT_EQ( m.at( "b" ), 20 );

    // equivalent key replacement keeps the entry reachable
    EXPECT_EQ( occupied.insert_key( "b" ), "b" );
    EXPECT_EQ( occupied.insert( 21 ), 20 );

    occupied.move_index( 0 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "b", "a", "c" } ) );
    EXPECT_EQ( occupied.swap_remove(), 21 );
    EXPECT_EQ( keys_of( m ), ( std::vector<std::string>{ "c", "a" } ) );
    EXPECT_EQ( m.get_index_of( "c" ), 0 );
}

TEST( raw_entry, or_insert_and_modify )
{
    OMS m;
    m.raw_entry_mut_v1().from_key( std::string{ "k" } ).or_insert( "k", 1 );
    m.raw_entry_mut_v1().from_key( std::string{ "k" } ).and_modify( []( std::string &, int & v ) { v += 5; } ).or_insert( "k", 100 );
    EXPECT_EQ( m.at( "k" ), 6 );

    auto const [ key, value ]{ m.raw_entry_mut_v1().from_key( std::string{ "n" } ).or_insert_with( [] { return std::pair<std::string, int>{ "n", 9 }; } ) };
    EXPECT_EQ( key, "n" );
    EXPECT_EQ( value, 9 );
    EXPECT_EQ( m.size(), 2 );
}
