////////////////////////////////////////////////////////////////////////////////
/// ordo randomized consistency test suite (ordered_map vs a plain vector model)
////////////////////////////////////////////////////////////////////////////////

#include <ordo/containers/ordered_map.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace
{
    using OM    = ordo::ordered_map<int, int>;
    using model = std::vector<std::pair<int, int>>;

    // a deliberately poor hasher: many keys share a hash
    struct clustering_hash
    {
        std::size_t operator()( int const key ) const noexcept { return static_cast<std::size_t>( key / 4 ); }
    };
    using OMC = ordo::ordered_map<int, int, clustering_hash>;

    std::optional<std::size_t> position_in( model const & reference, int const key )
    {
        auto const found{ std::find_if( reference.begin(), reference.end(), [ = ]( auto const & item ) { return item.first == key; } ) };
        if ( found == reference.end() )
            return std::nullopt;
        return static_cast<std::size_t>( found - reference.begin() );
    }

    void model_move( model & reference, std::size_t const from, std::size_t const to )
    {
        auto const item{ reference[ from ] };
        reference.erase ( reference.begin() + static_cast<std::ptrdiff_t>( from ) );
        reference.insert( reference.begin() + static_cast<std::ptrdiff_t>( to   ), item );
    }

    template <typename Map>
    ::testing::AssertionResult matches( Map const & map, model const & reference, int const key_space )
    {
        if ( map.size() != reference.size() )
            return ::testing::AssertionFailure() << "size " << map.size() << " != " << reference.size();
        for ( std::size_t i{ 0 }; i != reference.size(); ++i )
        {
            auto const entry{ map.get_index( i ) };
            if ( entry->first != reference[ i ].first || entry->second != reference[ i ].second )
                return ::testing::AssertionFailure() << "entry mismatch at " << i;
            if ( map.get_index_of( reference[ i ].first ) != i )
                return ::testing::AssertionFailure() << "key " << reference[ i ].first << " not found at " << i;
        }
        for ( int key{ 0 }; key_space <= 256 && key != key_space; ++key )
        {
            if ( map.contains( key ) != position_in( reference, key ).has_value() )
                return ::testing::AssertionFailure() << "membership mismatch for key " << key;
        }
        return ::testing::AssertionSuccess();
    }

    template <typename Map>
    void run_random_operations( std::uint32_t const seed, int const key_space, int const steps )
    {
        std::mt19937 rng{ seed };
        auto const pick{ [ & ]( std::size_t const bound ) { return static_cast<std::size_t>( rng() % bound ); } };

        Map   map;
        model reference;

        for ( int step{ 0 }; step != steps; ++step )
        {
            auto const key  { static_cast<int>( pick( static_cast<std::size_t>( key_space ) ) ) };
            auto const value{ static_cast<int>( rng() % 1000 ) };
            auto const size { reference.size() };

            switch ( pick( 16 ) )
            {
                case 0: case 1: case 2: case 3: // insert (dominant so that the map grows)
                {
                    map.insert( key, value );
                    if ( auto const pos{ position_in( reference, key ) } ) reference[ *pos ].second = value;
                    else                                                   reference.emplace_back( key, value );
                    break;
                }
                case 4:
                {
                    map.shift_remove( key );
                    if ( auto const pos{ position_in( reference, key ) } )
                        reference.erase( reference.begin() + static_cast<std::ptrdiff_t>( *pos ) );
                    break;
                }
                case 5:
                {
                    map.swap_remove( key );
                    if ( auto const pos{ position_in( reference, key ) } )
                    {
                        reference[ *pos ] = reference.back();
                        reference.pop_back();
                    }
                    break;
                }
                case 6:
                {
                    if ( !size ) break;
                    auto const from{ pick( size ) };
                    auto const to  { pick( size ) };
                    map.move_index( from, to );
                    model_move( reference, from, to );
                    break;
                }
                case 7:
                {
                    if ( !size ) break;
                    auto const a{ pick( size ) };
                    auto const b{ pick( size ) };
                    map.swap_indices( a, b );
                    std::swap( reference[ a ], reference[ b ] );
                    break;
                }
                case 8:
                {
                    auto const index{ pick( size + 1 ) };
                    map.insert_before( index, key, value );
                    if ( auto const pos{ position_in( reference, key ) } )
                    {
                        reference[ *pos ].second = value;
                        model_move( reference, *pos, ( index > *pos ) ? index - 1 : index );
                    }
                    else
                    {
                        reference.insert( reference.begin() + static_cast<std::ptrdiff_t>( index ), { key, value } );
                    }
                    break;
                }
                case 9:
                {
                    auto const pos{ position_in( reference, key ) };
                    auto const index{ pick( pos ? size : size + 1 ) };
                    map.shift_insert( index, key, value );
                    if ( pos )
                    {
                        reference[ *pos ].second = value;
                        model_move( reference, *pos, index );
                    }
                    else
                    {
                        reference.insert( reference.begin() + static_cast<std::ptrdiff_t>( index ), { key, value } );
                    }
                    break;
                }
                case 10:
                {
                    auto const modulus{ static_cast<int>( pick( 5 ) ) + 2 };
                    map.retain( [ = ]( int const k, int ) { return k % modulus != 0; } );
                    std::erase_if( reference, [ = ]( auto const & item ) { return item.first % modulus == 0; } );
                    break;
                }
                case 11:
                {
                    if ( pick( 2 ) )
                    {
                        map.sort_keys();
                        std::sort( reference.begin(), reference.end() );
                    }
                    else
                    {
                        map.sort_by( []( int, int const a, int, int const b ) { return a < b; } );
                        std::stable_sort( reference.begin(), reference.end(), []( auto const & a, auto const & b ) { return a.second < b.second; } );
                    }
                    break;
                }
                case 12:
                {
                    map.reverse();
                    std::reverse( reference.begin(), reference.end() );
                    break;
                }
                case 13:
                {
                    auto const first{ pick( size + 1 ) };
                    auto const last { first + pick( size - first + 1 ) };
                    if ( pick( 2 ) )
                    {
                        auto const drained{ map.drain( first, last ) };
                        EXPECT_TRUE( std::equal( drained.begin(), drained.end(), reference.begin() + static_cast<std::ptrdiff_t>( first ) ) );
                        reference.erase( reference.begin() + static_cast<std::ptrdiff_t>( first ), reference.begin() + static_cast<std::ptrdiff_t>( last ) );
                    }
                    else
                    {
                        model replacement;
                        for ( auto n{ pick( 4 ) }; n; --n )
                            replacement.emplace_back( static_cast<int>( pick( static_cast<std::size_t>( key_space ) ) ), static_cast<int>( rng() % 1000 ) );

                        auto const removed{ map.splice( first, last, replacement ) };
                        EXPECT_TRUE( std::equal( removed.begin(), removed.end(), reference.begin() + static_cast<std::ptrdiff_t>( first ) ) );
                        reference.erase( reference.begin() + static_cast<std::ptrdiff_t>( first ), reference.begin() + static_cast<std::ptrdiff_t>( last ) );
                        model fresh;
                        for ( auto const & item : replacement )
                        {
                            if      ( auto const pos{ position_in( reference, item.first ) } ) reference[ *pos ].second = item.second;
                            else if ( auto const at { position_in( fresh    , item.first ) } ) fresh    [ *at  ].second = item.second;
                            else                                                               fresh.push_back( item );
                        }
                        reference.insert( reference.begin() + static_cast<std::ptrdiff_t>( first ), fresh.begin(), fresh.end() );
                    }
                    break;
                }
                case 14:
                {
                    if ( pick( 4 ) == 0 )
                    {
                        map.clear();
                        reference.clear();
                    }
                    else
                    {
                        auto const new_size{ pick( size + 1 ) };
                        map.truncate( new_size );
                        reference.resize( new_size );
                    }
                    break;
                }
                case 15:
                {
                    if ( !size ) break;
                    if ( pick( 2 ) )
                    {
                        auto const popped{ map.pop() };
                        EXPECT_EQ( popped->first, reference.back().first );
                        reference.pop_back();
                    }
                    else
                    {
                        auto const index{ pick( size ) };
                        map.swap_remove_index( index );
                        reference[ index ] = reference.back();
                        reference.pop_back();
                    }
                    map.shrink_to_fit();
                    break;
                }
            }

            ASSERT_TRUE( matches( map, reference, key_space ) ) << "seed " << seed << ", step " << step;
        }
    }
} // anonymous namespace

TEST( consistency, random_operations )
{
    for ( std::uint32_t seed{ 1 }; seed != 6; ++seed )
        run_random_operations<OM>( seed, 64, 1500 );
}

TEST( consistency, random_operations_large_key_space )
{
    run_random_operations<OM>( 42, 4096, 4000 );
}

TEST( consistency, random_operations_with_colliding_hashes )
{
    for ( std::uint32_t seed{ 7 }; seed != 10; ++seed )
        run_random_operations<OMC>( seed, 64, 1500 );
}
