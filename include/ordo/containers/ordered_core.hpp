////////////////////////////////////////////////////////////////////////////////
/// detail::ordered_core - the engine shared by ordered_map and ordered_set.
///
/// Owns a dense entry_store (iteration order, positional access) and a
/// hash_index (key -> position) and is the sole mutator of both: every
/// primitive below updates the two together so that, for every live entry at
/// position i, the index resolves the entry's key to i (and only to i).
///
/// The engine is generic over the stored value: ordered_map instantiates it
/// with its mapped_type, ordered_set with the empty detail::unit.
///
/// Exception safety: index growth happens up front (reserve before the entry
/// is constructed), index bookkeeping itself never allocates, so a throwing
/// key/value constructor or allocator leaves both structures untouched. Key
/// and value move operations are assumed not to throw (same as the strong
/// guarantee of std::vector::insert).
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <ordo/containers/abi.hpp>
#include <ordo/containers/entry_store.hpp>
#include <ordo/containers/hash_index.hpp>
#include <ordo/containers/komparator.hpp>
#include <ordo/containers/lookup.hpp>
#include <ordo/error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <functional>
#include <numeric>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

/// Outcome of a positional binary search: the position of a matching entry
/// (found) or the position at which an entry would have to be inserted to
/// keep the searched order (not found).
struct search_result
{
    std::size_t index;
    bool        found;

    friend constexpr bool operator==( search_result const &, search_result const & ) noexcept = default;
}; // struct search_result

namespace detail
{
//------------------------------------------------------------------------------

// three-way comparison of keys that may only provide operator< (same fallback
// as the standard's synth-three-way)
struct synth_three_way
{
    template <typename T, typename U>
    [[ gnu::pure ]] constexpr auto operator()( T const & left, U const & right ) const
    {
        if constexpr ( std::three_way_comparable_with<T, U> )
            return left <=> right;
        else
        if ( left < right ) return std::weak_ordering::less;
        else
        if ( right < left ) return std::weak_ordering::greater;
        else
            return std::weak_ordering::equivalent;
    }
}; // struct synth_three_way


template <typename Key, typename Value, typename Hash, typename KeyEqual, typename Allocator, ordered_options options>
class ordered_core
{
public:
    using key_type         = Key;
    using stored_type      = Value;
    using hasher           = Hash;
    using key_equal        = KeyEqual;
    using allocator_type   = Allocator;
    using size_type        = std::size_t;
    using difference_type  = std::ptrdiff_t;
    using store_type       = entry_store<Key, Value, Allocator>;
    using index_type       = hash_index<Allocator, options>;
    using bucket_type      = typename store_type::bucket_type;
    using bucket_container = typename store_type::container_type;
    using probe_result     = typename index_type::probe_result;

    static size_type constexpr npos{ index_type::npos };
    static bool      constexpr transparent{ transparent_lookup<Hash, KeyEqual> };

    ordered_core() = default;

    ordered_core( size_type const capacity, Hash const & hash, KeyEqual const & equal, Allocator const & alloc )
        :
        entries_( typename store_type::allocator_type( alloc ) ),
        index_  ( typename index_type::allocator_type( alloc ) ),
        hash_   ( hash  ),
        key_eq_ ( equal )
    {
        if ( capacity )
            reserve_exact( capacity );
    }

    // allocator-extended copy
    ordered_core( ordered_core const & other, Allocator const & alloc )
        :
        entries_( other.entries_, typename store_type::allocator_type( alloc ) ),
        index_  ( other.index_  , typename index_type::allocator_type( alloc ) ),
        hash_   ( other.hash_   ),
        key_eq_ ( other.key_eq_ )
    {}

    // an empty core sharing the configuration (hasher, key_eq, allocator)
    [[ nodiscard ]] ordered_core clone_empty() const
    {
        return ordered_core( 0, hash_, key_eq_, get_allocator() );
    }

    void swap( ordered_core & other ) noexcept
    {
        using std::swap;
        entries_.swap( other.entries_ );
        index_  .swap( other.index_   );
        swap( hash_  , other.hash_   );
        swap( key_eq_, other.key_eq_ );
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard, gnu::pure ]] size_type size () const noexcept { return entries_.size (); }
    [[ nodiscard, gnu::pure ]] bool      empty() const noexcept { return entries_.empty(); }

    [[ nodiscard ]] size_type max_size() const noexcept { return std::min( entries_.max_size(), index_.max_size() ); }
    [[ nodiscard ]] size_type capacity() const noexcept { return std::min( entries_.capacity(), index_.capacity() ); }

    [[ nodiscard ]] size_type bucket_count() const noexcept { return index_.bucket_count(); }
    [[ nodiscard ]] float     load_factor () const noexcept { return index_.load_factor (); }

    [[ nodiscard ]] hasher         hash_function() const { return hash_  ; }
    [[ nodiscard ]] key_equal      key_eq       () const { return key_eq_; }
    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return allocator_type( entries_.get_allocator() ); }

    [[ nodiscard ]] bucket_type       & at_position( size_type const pos )       noexcept { return entries_[ pos ]; }
    [[ nodiscard ]] bucket_type const & at_position( size_type const pos ) const noexcept { return entries_[ pos ]; }

    [[ nodiscard ]] bucket_type       * buckets_begin()       noexcept { return entries_.begin(); }
    [[ nodiscard ]] bucket_type const * buckets_begin() const noexcept { return entries_.begin(); }
    [[ nodiscard ]] bucket_type       * buckets_end  ()       noexcept { return entries_.end  (); }
    [[ nodiscard ]] bucket_type const * buckets_end  () const noexcept { return entries_.end  (); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <typename K>
    [[ nodiscard ]] std::size_t hash_of( K const & key ) const { return hash_( key ); }

    template <typename K>
    [[ nodiscard ]] probe_result probe( std::size_t const hash, K const & key ) const
    {
        return index_.probe( hash, [ & ]( size_type const pos ) { return key_eq_( key, entries_[ pos ].key ); } );
    }

    template <typename K>
    [[ nodiscard ]] size_type find( K const & key ) const
    {
        if ( empty() )
            return npos;
        return probe( hash_of( key ), key ).index;
    }

    /// Lookup by a caller supplied hash and matcher (`is_match( key_type const & )`).
    template <typename Match>
    [[ nodiscard ]] size_type find_hashed( std::size_t const hash, Match && is_match ) const
    {
        return index_.find( hash, [ & ]( size_type const pos ) { return is_match( std::as_const( entries_[ pos ].key ) ); } );
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Reserves room for one more entry, then looks the key up. A vacant
    /// result stays valid for emplace_vacant() until the next mutation.
    template <typename K>
    [[ nodiscard ]] probe_result prepare_insert( std::size_t const hash, K const & key )
    {
        index_.reserve( size() + 1 );
        return probe( hash, key );
    }

    template <typename K, typename ... V>
    size_type emplace_vacant( probe_result const slot, std::size_t const hash, K && key, V && ... value )
    {
        BOOST_ASSERT_MSG( !slot.found(), "Committing an occupied probe result" );
        auto const pos{ entries_.push( hash, std::forward<K>( key ), std::forward<V>( value )... ) };
        index_.occupy( slot.bucket, hash, pos );
        return pos;
    }

    /// Appends a new entry unless an equivalent key is present (the value
    /// arguments are left untouched in that case).
    template <typename K, typename ... V>
    std::pair<size_type, bool> try_emplace( K && key, V && ... value )
    {
        auto const hash{ hash_of( std::as_const( key ) ) };
        auto const slot{ prepare_insert( hash, std::as_const( key ) ) };
        if ( slot.found() )
            return { slot.index, false };
        return { emplace_vacant( slot, hash, std::forward<K>( key ), std::forward<V>( value )... ), true };
    }

    /// Appends an entry for a key the caller vouches to be absent.
    template <typename K, typename ... V>
    size_type emplace_unchecked( std::size_t const hash, K && key, V && ... value )
    {
        index_.reserve( size() + 1 );
        auto const pos{ entries_.push( hash, std::forward<K>( key ), std::forward<V>( value )... ) };
        index_.insert_unique( hash, pos );
        return pos;
    }

    //--------------------------------------------------------------------------
    // Repositioning
    //--------------------------------------------------------------------------
    void move_index( size_type const from, size_type const to ) noexcept
    {
        BOOST_ASSERT( from < size() && to < size() );
        if ( from == to )
            return;
        auto const moved_hash{ entries_[ from ].hash };
        // park the moving entry on a position no shifted entry can land on
        index_.replace_index( moved_hash, from, size() );
        if ( from < to )
            index_.shift_range( from + 1, to + 1, -1, current_hash() );
        else
            index_.shift_range( to, from, +1, current_hash() );
        index_.replace_index( moved_hash, size(), to );
        entries_.move_between( from, to );
    }

    void swap_indices( size_type const a, size_type const b ) noexcept
    {
        BOOST_ASSERT( a < size() && b < size() );
        if ( a == b )
            return;
        index_.swap_indices( entries_[ a ].hash, a, entries_[ b ].hash, b );
        entries_.swap( a, b );
    }

    /// Rotates [first, size()) so that the entry at `middle` ends up at `first`.
    void rotate_tail( size_type const first, size_type const middle ) noexcept
    {
        BOOST_ASSERT( first <= middle && middle <= size() );
        auto const last{ size() };
        if ( first == middle || middle == last )
            return;
        auto const left { middle - first };
        auto const right{ last - middle  };
        entries_.rotate_tail( first, middle );
        index_.remap( first, last, [ = ]( size_type const pos ) noexcept { return pos < middle ? pos + right : pos - left; } );
    }

    void reverse() noexcept
    {
        auto const count{ size() };
        std::reverse( entries_.begin(), entries_.end() );
        index_.remap( 0, count, [ count ]( size_type const pos ) noexcept { return count - 1 - pos; } );
    }

    //--------------------------------------------------------------------------
    // Removal
    //--------------------------------------------------------------------------
    bucket_type shift_remove( size_type const pos ) noexcept( std::is_nothrow_move_constructible_v<bucket_type> )
    {
        BOOST_ASSERT( pos < size() );
        index_.erase( entries_[ pos ].hash, pos );
        index_.shift_range( pos + 1, size(), -1, current_hash() );
        return entries_.remove_shift( pos );
    }

    bucket_type swap_remove( size_type const pos ) noexcept( std::is_nothrow_move_constructible_v<bucket_type> )
    {
        BOOST_ASSERT( pos < size() );
        auto const last{ size() - 1 };
        index_.erase( entries_[ pos ].hash, pos );
        if ( pos != last )
            index_.replace_index( entries_[ last ].hash, last, pos );
        return entries_.remove_swap( pos );
    }

    void truncate( size_type const new_size )
    {
        auto const old_size{ size() };
        if ( new_size >= old_size )
            return;
        if ( index_.sweep_cheaper( old_size - new_size ) )
        {
            entries_.truncate( new_size );
            rebuild_index();
        }
        else
        {
            for ( auto pos{ new_size }; pos != old_size; ++pos )
                index_.erase( entries_[ pos ].hash, pos );
            entries_.truncate( new_size );
        }
    }

    /// Removes [first, last) preserving the order of the remaining entries and
    /// returns the removed ones in their original order.
    bucket_container drain( size_type const first, size_type const last )
    {
        BOOST_ASSERT( first <= last && last <= size() );
        auto const old_size{ size() };
        auto const count   { last - first };
        // the only allocating step goes first
        auto removed{ entries_.drain( first, last ) };
        if ( count == 0 )
            return removed;
        if ( index_.sweep_cheaper( old_size - first ) )
        {
            rebuild_index();
        }
        else
        {
            for ( size_type i{ 0 }; i != count; ++i )
                index_.erase( removed[ i ].hash, first + i );
            index_.shift_range
            (
                last, old_size, -static_cast<difference_type>( count ),
                [ this, count ]( size_type const old_pos ) noexcept { return entries_[ old_pos - count ].hash; }
            );
        }
        return removed;
    }

    /// Single forward pass: kept entries are compacted toward the front in
    /// their original relative order, the index is rebuilt once at the end.
    /// `keep( bucket_type & )` may modify the entry's value.
    template <typename Keep>
    void retain( Keep && keep )
    {
        auto & entries{ entries_.raw() };
        auto out{ entries.begin() };
        auto it { entries.begin() };
        try
        {
            for ( ; it != entries.end(); ++it )
            {
                if ( !keep( *it ) )
                    continue;
                if ( out != it )
                    *out = std::move( *it );
                ++out;
            }
        }
        catch ( ... )
        {
            // keep the unvisited tail
            out = std::move( it, entries.end(), out );
            entries.erase( out, entries.end() );
            rebuild_index();
            throw;
        }
        if ( out == entries.end() )
            return;
        entries.erase( out, entries.end() );
        rebuild_index();
    }

    void clear() noexcept
    {
        entries_.clear();
        index_  .clear();
    }

    //--------------------------------------------------------------------------
    // Sorting
    //--------------------------------------------------------------------------

    /// `less( bucket_type const &, bucket_type const & )`. Both sorts order a
    /// list of positions and move the entries only once it is complete, so a
    /// throwing comparator leaves the container unchanged.
    template <typename Less>
    void sort_stable( Less && less )
    {
        auto order{ positions() };
        Komparator{ by_position( less ) }.stable_sort( order.begin(), order.end() );
        permute( order, []( size_type const pos ) noexcept { return pos; } );
    }

    template <typename Less>
    void sort_unstable( Less && less )
    {
        auto order{ positions() };
        Komparator{ by_position( less ) }.sort( order.begin(), order.end() );
        permute( order, []( size_type const pos ) noexcept { return pos; } );
    }

    /// Calls `key_of( bucket_type const & )` once per entry, then orders the
    /// entries by the cached results (stable).
    template <typename KeyOf>
    void sort_by_cached_key( KeyOf && key_of )
    {
        using cached_type = std::remove_cvref_t<std::invoke_result_t<KeyOf &, bucket_type const &>>;
        std::vector<std::pair<cached_type, size_type>> keys;
        keys.reserve( size() );
        for ( size_type pos{ 0 }; pos != size(); ++pos )
            keys.emplace_back( key_of( std::as_const( entries_[ pos ] ) ), pos );
        // ties are broken by the original position
        Komparator{ []( auto const & left, auto const & right ) { return left < right; } }.sort( keys.begin(), keys.end() );
        permute( keys, []( auto const & key ) noexcept { return key.second; } );
    }

    //--------------------------------------------------------------------------
    // Positional search (assumes the caller maintained order)
    //--------------------------------------------------------------------------

    /// `compare( bucket_type const & )` returns the ordering of the entry
    /// relative to the searched-for target.
    template <typename Compare>
    [[ nodiscard ]] search_result binary_search_by( Compare && compare ) const
    {
        size_type low { 0      };
        size_type high{ size() };
        while ( low < high )
        {
            auto const mid{ low + ( high - low ) / 2 };
            auto const order{ compare( entries_[ mid ] ) };
            if ( order < 0 )
                low = mid + 1;
            else
            if ( order > 0 )
                high = mid;
            else
                return { mid, true };
        }
        return { low, false };
    }

    template <typename Pred>
    [[ nodiscard ]] size_type partition_point( Pred && pred ) const
    {
        auto const point{ std::partition_point( entries_.begin(), entries_.end(), make_trivially_copyable_predicate( pred ) ) };
        return static_cast<size_type>( point - entries_.begin() );
    }

    //--------------------------------------------------------------------------
    // Splice
    //--------------------------------------------------------------------------

    /// Removes [first, last), then feeds every item of `replacement` to
    /// `insert( ordered_core &, item )` (insert-or-update semantics) and
    /// moves the entries that were appended by it into the gap.
    template <typename Range, typename Insert>
    bucket_container splice( size_type const first, size_type const last, Range && replacement, Insert && insert )
    {
        auto removed{ drain( first, last ) };
        auto const appended_from{ size() };
        for ( auto && item : replacement )
            insert( *this, std::forward<decltype( item )>( item ) );
        rotate_tail( first, appended_from );
        return removed;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    void reserve( size_type const n )
    {
        index_.reserve( n );
        // match the index capacity to avoid entry reallocations the index
        // would not need, fall back to the exact request
        auto const matched{ std::min( index_.capacity(), entries_.max_size() ) };
        if ( matched > n && entries_.try_reserve( matched ) )
            return;
        entries_.reserve( n );
    }

    void reserve_exact( size_type const n )
    {
        index_  .reserve( n );
        entries_.reserve( n );
    }

    fallible_result<> try_reserve( size_type const n ) noexcept
    {
        auto indexed{ index_.try_reserve( n ) };
        if ( !indexed ) [[ unlikely ]]
            return indexed.error();
        auto const matched{ std::min( index_.capacity(), entries_.max_size() ) };
        if ( matched > n && entries_.try_reserve( matched ) )
            return psi::err::success;
        return entries_.try_reserve( n ).as_fallible_result();
    }

    fallible_result<> try_reserve_exact( size_type const n ) noexcept
    {
        auto indexed{ index_.try_reserve( n ) };
        if ( !indexed ) [[ unlikely ]]
            return indexed.error();
        return entries_.try_reserve( n ).as_fallible_result();
    }

    void shrink_to( size_type const n )
    {
        index_  .shrink_to( n );
        entries_.shrink_to( n );
    }

    void rebuild_index() noexcept
    {
        // the bucket count never needs to grow here (size never exceeds the
        // index capacity) so no allocation can take place
        BOOST_ASSERT( size() <= index_.capacity() );
        index_.rebuild( size(), current_hash() );
    }

private:
    [[ nodiscard ]] auto current_hash() const noexcept
    {
        return [ this ]( size_type const pos ) noexcept { return entries_[ pos ].hash; };
    }

    [[ nodiscard ]] std::vector<size_type> positions() const
    {
        std::vector<size_type> order( size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        return order;
    }

    template <typename Less>
    [[ nodiscard ]] auto by_position( Less & less ) const noexcept
    {
        return [ this, &less ]( size_type const left, size_type const right )
        {
            return less( entries_[ left ], entries_[ right ] );
        };
    }

    // the entry that ends up at position i is the one that was at
    // position_of( order[ i ] )
    template <typename Order, typename PositionOf>
    void permute( Order const & order, PositionOf const position_of )
    {
        bucket_container sorted( entries_.get_allocator() );
        sorted.reserve( size() );
        for ( auto const & item : order )
            sorted.push_back( std::move( entries_[ position_of( item ) ] ) );
        entries_.raw().swap( sorted );
        rebuild_index();
    }

private:
    store_type entries_;
    index_type index_  ;
    ORDO_NO_UNIQUE_ADDRESS hasher    hash_  ;
    ORDO_NO_UNIQUE_ADDRESS key_equal key_eq_;
}; // class ordered_core

//------------------------------------------------------------------------------
} // namespace detail
//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
