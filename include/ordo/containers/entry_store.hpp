////////////////////////////////////////////////////////////////////////////////
/// Dense, insertion ordered entry storage for the ordo hashed containers.
///
/// Contents:
///   - detail::unit                      - value type of set entries (empty)
///   - detail::bucket<Key, Value>        - { cached hash, key, value } triple
///   - detail::entry_store<K, V, Alloc>  - contiguous bucket sequence with the
///     positional primitives (push, shift/swap removal, rotation, drain...) the
///     ordered containers compose with their hash index
///   - detail::member_iterator           - random access iterator over one
///     member (key or value) of a bucket sequence (true references)
///
/// The store never looks at the hash index: keeping the two consistent is the
/// job of ordered_core, which calls the matching index update for every
/// positional primitive used here.
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
#include <ordo/error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <iterator>
#include <memory>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------
namespace detail
{
//------------------------------------------------------------------------------

struct unit
{
    friend constexpr bool                 operator== ( unit, unit ) noexcept = default;
    friend constexpr std::strong_ordering operator<=>( unit, unit ) noexcept = default;
}; // struct unit


template <typename Key, typename Value>
struct bucket
{
    template <typename K, typename ... V>
    constexpr bucket( std::size_t const h, K && k, V && ... v )
        : hash{ h }, key( std::forward<K>( k ) ), value( std::forward<V>( v )... ) {}

    std::size_t hash;
    Key         key;
    ORDO_NO_UNIQUE_ADDRESS
    Value       value;
}; // struct bucket


//==============================================================================
// member_iterator - projects a bucket sequence onto one of its members
//==============================================================================

template <typename Bucket, auto Member>
class member_iterator
{
    using member_type = std::remove_reference_t<decltype( std::declval<Bucket &>().*Member )>;

public:
    using iterator_concept  = std::random_access_iterator_tag;
    using iterator_category = std::random_access_iterator_tag;
    using value_type        = std::remove_cv_t<member_type>;
    using difference_type   = std::ptrdiff_t;
    using reference         = member_type &;
    using pointer           = member_type *;

    constexpr member_iterator() noexcept = default;
    explicit constexpr member_iterator( Bucket * const p ) noexcept : p_{ p } {}

    // iterator -> const_iterator
    template <typename OtherBucket>
    requires( std::is_same_v<Bucket, OtherBucket const> )
    constexpr member_iterator( member_iterator<OtherBucket, Member> const other ) noexcept : p_{ other.base() } {}

    [[ nodiscard ]] constexpr Bucket * base() const noexcept { return p_; }

    constexpr reference operator* (                          ) const noexcept { return p_->*Member; }
    constexpr pointer   operator->(                          ) const noexcept { return std::addressof( p_->*Member ); }
    constexpr reference operator[]( difference_type const n ) const noexcept { return p_[ n ].*Member; }

    constexpr member_iterator & operator++(     ) noexcept { ++p_; return *this; }
    constexpr member_iterator   operator++( int ) noexcept { auto tmp{ *this }; ++p_; return tmp; }
    constexpr member_iterator & operator--(     ) noexcept { --p_; return *this; }
    constexpr member_iterator   operator--( int ) noexcept { auto tmp{ *this }; --p_; return tmp; }

    constexpr member_iterator & operator+=( difference_type const n ) noexcept { p_ += n; return *this; }
    constexpr member_iterator & operator-=( difference_type const n ) noexcept { p_ -= n; return *this; }

    friend constexpr member_iterator operator+( member_iterator const it, difference_type const n ) noexcept { return member_iterator{ it.p_ + n }; }
    friend constexpr member_iterator operator+( difference_type const n, member_iterator const it ) noexcept { return member_iterator{ it.p_ + n }; }
    friend constexpr member_iterator operator-( member_iterator const it, difference_type const n ) noexcept { return member_iterator{ it.p_ - n }; }

    friend constexpr difference_type operator-( member_iterator const a, member_iterator const b ) noexcept { return a.p_ - b.p_; }

    friend constexpr bool operator== ( member_iterator const a, member_iterator const b ) noexcept { return a.p_ ==  b.p_; }
    friend constexpr auto operator<=>( member_iterator const a, member_iterator const b ) noexcept { return a.p_ <=> b.p_; }

private:
    Bucket * p_{ nullptr };
}; // class member_iterator


//==============================================================================
// entry_store
//==============================================================================

template <typename Key, typename Value, typename Allocator>
class entry_store
{
public:
    using bucket_type     = bucket<Key, Value>;
    using allocator_type  = typename std::allocator_traits<Allocator>::template rebind_alloc<bucket_type>;
    using container_type  = std::vector<bucket_type, allocator_type>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    constexpr entry_store() = default;
    explicit entry_store( allocator_type const & alloc ) noexcept : entries_( alloc ) {}
    entry_store( entry_store const & other, allocator_type const & alloc ) : entries_( other.entries_, alloc ) {}

    //--------------------------------------------------------------------------
    // Access
    //--------------------------------------------------------------------------
    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return entries_.size    (); }
    [[ nodiscard, gnu::pure ]] bool      empty   () const noexcept { return entries_.empty   (); }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept { return entries_.capacity(); }
    [[ nodiscard            ]] size_type max_size() const noexcept { return entries_.max_size(); }

    [[ nodiscard ]] bucket_type       & operator[]( size_type const pos )       noexcept { BOOST_ASSERT( pos < size() ); return entries_[ pos ]; }
    [[ nodiscard ]] bucket_type const & operator[]( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return entries_[ pos ]; }

    [[ nodiscard ]] bucket_type       * data()       noexcept { return entries_.data(); }
    [[ nodiscard ]] bucket_type const * data() const noexcept { return entries_.data(); }

    [[ nodiscard ]] bucket_type       * begin()       noexcept { return data(); }
    [[ nodiscard ]] bucket_type const * begin() const noexcept { return data(); }
    [[ nodiscard ]] bucket_type       * end  ()       noexcept { return data() + size(); }
    [[ nodiscard ]] bucket_type const * end  () const noexcept { return data() + size(); }

    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return entries_.get_allocator(); }

    // direct access for whole-sequence algorithms (sort, retain) after which
    // the owner rebuilds its index
    [[ nodiscard ]] container_type & raw() noexcept { return entries_; }

    //--------------------------------------------------------------------------
    // Positional primitives
    //--------------------------------------------------------------------------

    /// Appends an entry, returns its position (strong exception guarantee).
    template <typename K, typename ... V>
    size_type push( std::size_t const hash, K && key, V && ... value )
    {
        entries_.emplace_back( hash, std::forward<K>( key ), std::forward<V>( value )... );
        return entries_.size() - 1;
    }

    /// Removes the entry at `pos`, later entries move one position down.
    bucket_type remove_shift( size_type const pos ) noexcept( std::is_nothrow_move_constructible_v<bucket_type> )
    {
        BOOST_ASSERT( pos < size() );
        auto const it{ entries_.begin() + static_cast<difference_type>( pos ) };
        bucket_type removed{ std::move( *it ) };
        entries_.erase( it );
        return removed;
    }

    /// Removes the entry at `pos`, the last entry takes its place.
    bucket_type remove_swap( size_type const pos ) noexcept( std::is_nothrow_move_constructible_v<bucket_type> )
    {
        BOOST_ASSERT( pos < size() );
        bucket_type removed{ std::move( entries_[ pos ] ) };
        if ( pos != size() - 1 )
            entries_[ pos ] = std::move( entries_.back() );
        entries_.pop_back();
        return removed;
    }

    void truncate( size_type const new_size ) noexcept
    {
        if ( new_size < size() )
            entries_.erase( entries_.begin() + static_cast<difference_type>( new_size ), entries_.end() );
    }

    void swap( size_type const a, size_type const b ) noexcept
    {
        using std::swap;
        swap( entries_[ a ], entries_[ b ] );
    }

    /// Moves the entry at `from` to `to`, shifting the ones in between by one.
    void move_between( size_type const from, size_type const to ) noexcept
    {
        BOOST_ASSERT( from < size() && to < size() );
        auto const first{ entries_.begin() };
        if ( from < to )
            std::rotate( first + static_cast<difference_type>( from ), first + static_cast<difference_type>( from + 1 ), first + static_cast<difference_type>( to + 1 ) );
        else
        if ( to < from )
            std::rotate( first + static_cast<difference_type>( to ), first + static_cast<difference_type>( from ), first + static_cast<difference_type>( from + 1 ) );
    }

    /// Rotates [first, end) so that the entry at `middle` becomes the one at
    /// `first`.
    void rotate_tail( size_type const first, size_type const middle ) noexcept
    {
        auto const begin{ entries_.begin() };
        std::rotate( begin + static_cast<difference_type>( first ), begin + static_cast<difference_type>( middle ), entries_.end() );
    }

    /// Moves [first, last) out into a new sequence (sharing the allocator).
    container_type drain( size_type const first, size_type const last )
    {
        BOOST_ASSERT( first <= last && last <= size() );
        auto const f{ entries_.begin() + static_cast<difference_type>( first ) };
        auto const l{ entries_.begin() + static_cast<difference_type>( last  ) };
        container_type removed( get_allocator() );
        removed.reserve( last - first );
        removed.insert( removed.end(), std::make_move_iterator( f ), std::make_move_iterator( l ) );
        entries_.erase( f, l );
        return removed;
    }

    void clear() noexcept { entries_.clear(); }

    void swap( entry_store & other ) noexcept { entries_.swap( other.entries_ ); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    void reserve( size_type const n ) { entries_.reserve( n ); }

    result_or_error<> try_reserve( size_type const n ) noexcept
    {
        if ( n > max_size() )
            return try_reserve_error{ try_reserve_error::kind::capacity_overflow, n };
        try
        {
            entries_.reserve( n );
        }
        catch ( std::length_error const & )
        {
            return try_reserve_error{ try_reserve_error::kind::capacity_overflow, n };
        }
        catch ( std::bad_alloc const & )
        {
            return try_reserve_error{ try_reserve_error::kind::allocation_failure, n };
        }
        return psi::err::success;
    }

    /// Reallocates to the smallest capacity >= max( n, size() ) (no-op if the
    /// current capacity is already that small).
    void shrink_to( size_type const n )
    {
        auto const target{ std::max( n, size() ) };
        if ( target >= capacity() )
            return;
        container_type shrunk( get_allocator() );
        shrunk.reserve( target );
        shrunk.insert( shrunk.end(), std::make_move_iterator( entries_.begin() ), std::make_move_iterator( entries_.end() ) );
        entries_.swap( shrunk );
    }

private:
    container_type entries_;
}; // class entry_store

//------------------------------------------------------------------------------
} // namespace detail
//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
