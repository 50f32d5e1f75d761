////////////////////////////////////////////////////////////////////////////////
/// ordo splice test suite
////////////////////////////////////////////////////////////////////////////////

#include <ordo/containers/ordered_map.hpp>
#include <ordo/containers/ordered_set.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

using OMC = ordo::ordered_map<int, char>;

namespace
{
    std::vector<std::pair<int, char>> items_of( OMC const & map )
    {
        std::vector<std::pair<int, char>> items;
        for ( auto const [ key, value ] : map )
            items.emplace_back( key, value );
        return items;
    }

    void expect_positions_consistent( OMC const & map )
    {
        std::size_t index{ 0 };
        for ( auto const key : map.keys() )
            EXPECT_EQ( map.get_index_of( key ), index++ ) << key;
    }
} // anonymous namespace

TEST( splice, existing_keys_are_updated_in_place )
{
    OMC m;
    m.insert( 0, '_' );
    m.insert( 1, 'a' );
    m.insert( 2, 'b' );
    m.insert( 3, 'c' );
    m.insert( 4, 'd' );

    std::vector<std::pair<int, char>> const replacement{ { 5, 'E' }, { 4, 'D' }, { 3, 'C' }, { 2, 'B' }, { 1, 'A' } };
    auto const removed{ m.splice( 2, 4, replacement ) };

    EXPECT_EQ( removed, ( OMC::sequence_type{ { 2, 'b' }, { 3, 'c' } } ) );
    EXPECT_EQ
    (
        items_of( m ),
        ( std::vector<std::pair<int, char>>{ { 0, '_' }, { 1, 'A' }, { 5, 'E' }, { 3, 'C' }, { 2, 'B' }, { 4, 'D' } } )
    );
    expect_positions_consistent( m );
}

TEST( splice, empty_range_inserts_at_position )
{
    OMC m{ { 1, 'a' }, { 2, 'b' }, { 3, 'c' } };
    auto const removed{ m.splice( 1, 1, std::vector<std::pair<int, char>>{ { 9, 'z' }, { 8, 'y' } } ) };
    EXPECT_TRUE( removed.empty() );
    EXPECT_EQ
    (
        items_of( m ),
        ( std::vector<std::pair<int, char>>{ { 1, 'a' }, { 9, 'z' }, { 8, 'y' }, { 2, 'b' }, { 3, 'c' } } )
    );
    expect_positions_consistent( m );
}

TEST( splice, empty_replacement_removes_range )
{
    OMC m{ { 1, 'a' }, { 2, 'b' }, { 3, 'c' }, { 4, 'd' } };
    auto const removed{ m.splice( 1, 3, std::vector<std::pair<int, char>>{} ) };
    EXPECT_EQ( removed, ( OMC::sequence_type{ { 2, 'b' }, { 3, 'c' } } ) );
    EXPECT_EQ( items_of( m ), ( std::vector<std::pair<int, char>>{ { 1, 'a' }, { 4, 'd' } } ) );
    expect_positions_consistent( m );
}

TEST( splice, duplicate_new_keys_collapse )
{
    OMC m{ { 1, 'a' }, { 2, 'b' } };
    auto const removed{ m.splice( 2, 2, std::vector<std::pair<int, char>>{ { 7, 'x' }, { 7, 'y' } } ) };
    EXPECT_TRUE( removed.empty() );
    EXPECT_EQ( items_of( m ), ( std::vector<std::pair<int, char>>{ { 1, 'a' }, { 2, 'b' }, { 7, 'y' } } ) );
}

TEST( splice, removed_keys_may_return_into_the_gap )
{
    OMC m{ { 1, 'a' }, { 2, 'b' }, { 3, 'c' } };
    auto const removed{ m.splice( 0, 2, std::vector<std::pair<int, char>>{ { 2, 'B' } } ) };
    EXPECT_EQ( removed, ( OMC::sequence_type{ { 1, 'a' }, { 2, 'b' } } ) );
    EXPECT_EQ( items_of( m ), ( std::vector<std::pair<int, char>>{ { 2, 'B' }, { 3, 'c' } } ) );
    expect_positions_consistent( m );
}

TEST( splice, invalid_range_throws )
{
    OMC m{ { 1, 'a' }, { 2, 'b' } };
    std::vector<std::pair<int, char>> const replacement{ { 5, 'e' } };
    EXPECT_THROW( (void)m.splice( 1, 3, replacement ), std::out_of_range );
    EXPECT_THROW( (void)m.splice( 2, 1, replacement ), std::out_of_range );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_FALSE( m.contains( 5 ) );
}

TEST( splice, set )
{
    ordo::ordered_set<int> s{ 0, 1, 2, 3, 4 };
    auto const removed{ s.splice( 1, 3, std::vector<int>{ 9, 4, 1 } ) };
    EXPECT_EQ( removed, ( ordo::ordered_set<int>::sequence_type{ 1, 2 } ) );
    std::vector<int> const expected{ 0, 9, 1, 3, 4 };
    ASSERT_EQ( s.size(), expected.size() );
    for ( std::size_t i{ 0 }; i != expected.size(); ++i )
    {
        EXPECT_EQ( s.at_index( i ), expected[ i ] );
        EXPECT_EQ( s.get_index_of( expected[ i ] ), i );
    }
}
