////////////////////////////////////////////////////////////////////////////////
/// Open addressing hash index: maps a key's hash to the position of its entry
/// in a separate, dense, order preserving entry store.
///
/// Buckets hold back-references (positions) plus the cached full hash - never
/// keys or values - so entries can be relocated (sorted, rotated, swapped) by
/// rewriting positions only, and the table can be grown, shrunk or have its
/// buckets shuffled (backward shift deletion) without touching the entries.
///
/// Probing: linear, starting at the Fibonacci-hashed home bucket; deletion is
/// tombstone free (backward shift) so a probe sequence always terminates at the
/// first empty bucket and the vacant bucket found by a failed lookup is exactly
/// where that key would be inserted (see probe()/occupy()).
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
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

struct ratio
{
    std::uint8_t num;
    std::uint8_t den;
}; // struct ratio

struct ordered_options
{
    // maximum fraction of occupied buckets before the index grows
    ratio max_load       { .num = 3, .den = 4 };
    // position shift cascades (shift removal/insertion, range removal) that
    // touch more entries than this fraction of the bucket count update the
    // index with a single sweep over all buckets instead of one lookup per
    // moved entry
    ratio sweep_threshold{ .num = 1, .den = 2 };
}; // struct ordered_options


template <typename Allocator, ordered_options options = {}>
class hash_index
{
    static_assert( options.max_load.num > 0 && options.max_load.num < options.max_load.den, "Open addressing requires a max load factor in (0, 1)" );
    static_assert( options.sweep_threshold.den > 0 );

public:
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    static size_type constexpr npos{ std::numeric_limits<size_type>::max() };

    struct slot
    {
        size_type   index{ npos }; // position in the entry store, npos for an empty bucket
        std::size_t hash { 0    };

        [[ gnu::pure ]] constexpr bool empty() const noexcept { return index == npos; }
    }; // struct slot
    static_assert( std::is_trivially_copyable_v<slot> );

    // result of a lookup: the matching position, or npos together with the
    // vacant bucket at which the searched-for key has to be inserted
    struct probe_result
    {
        size_type bucket;
        size_type index ;

        [[ gnu::pure ]] constexpr bool found() const noexcept { return index != npos; }
    }; // struct probe_result

    using allocator_type = typename std::allocator_traits<Allocator>::template rebind_alloc<slot>;

private:
    using al_traits = std::allocator_traits<allocator_type>;

    static size_type     constexpr min_bucket_count{ 8 };
    static size_type     constexpr max_bucket_count{ size_type{ 1 } << ( std::numeric_limits<size_type>::digits - 2 ) };
    static std::uint64_t constexpr fibonacci       { 0x9E3779B97F4A7C15ULL }; // 2^64 / golden ratio

public:
    constexpr hash_index() noexcept( std::is_nothrow_default_constructible_v<allocator_type> ) = default;
    explicit constexpr hash_index( allocator_type const & alloc ) noexcept : alloc_{ alloc } {}

    hash_index( hash_index const & other )
        : hash_index( other, al_traits::select_on_container_copy_construction( other.alloc_ ) ) {}

    hash_index( hash_index const & other, allocator_type const & alloc )
        : alloc_{ alloc }
    {
        copy_slots_from( other );
    }

    hash_index( hash_index && other ) noexcept
        :
        slots_{ std::exchange( other.slots_, nullptr ) },
        mask_ { std::exchange( other.mask_ , 0       ) },
        size_ { std::exchange( other.size_ , 0       ) },
        shift_{ std::exchange( other.shift_, 64      ) },
        alloc_{ std::move( other.alloc_ ) }
    {}

    hash_index & operator=( hash_index const & other )
    {
        if ( this != &other )
        {
            if constexpr ( al_traits::propagate_on_container_copy_assignment::value )
            {
                if ( alloc_ != other.alloc_ )
                    release();
                alloc_ = other.alloc_;
            }
            copy_slots_from( other );
        }
        return *this;
    }

    hash_index & operator=( hash_index && other ) noexcept( al_traits::propagate_on_container_move_assignment::value || al_traits::is_always_equal::value )
    {
        if ( this == &other )
            return *this;
        if constexpr ( !al_traits::propagate_on_container_move_assignment::value && !al_traits::is_always_equal::value )
        {
            if ( alloc_ != other.alloc_ )
            {
                // cannot adopt memory owned by a different arena: copy instead
                copy_slots_from( other );
                other.clear();
                return *this;
            }
        }
        release();
        if constexpr ( al_traits::propagate_on_container_move_assignment::value )
            alloc_ = std::move( other.alloc_ );
        slots_ = std::exchange( other.slots_, nullptr );
        mask_  = std::exchange( other.mask_ , 0       );
        size_  = std::exchange( other.size_ , 0       );
        shift_ = std::exchange( other.shift_, 64      );
        return *this;
    }

    ~hash_index() noexcept { release(); }

    void swap( hash_index & other ) noexcept
    {
        using std::swap;
        if constexpr ( al_traits::propagate_on_container_swap::value )
            swap( alloc_, other.alloc_ );
        else
            BOOST_ASSERT_MSG( alloc_ == other.alloc_, "Swapping indices with unequal non-propagating allocators" );
        swap( slots_, other.slots_ );
        swap( mask_ , other.mask_  );
        swap( size_ , other.size_  );
        swap( shift_, other.shift_ );
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard, gnu::pure ]] size_type size        () const noexcept { return size_; }
    [[ nodiscard, gnu::pure ]] bool      empty       () const noexcept { return size_ == 0; }
    [[ nodiscard, gnu::pure ]] size_type bucket_count() const noexcept { return slots_ ? mask_ + 1 : 0; }
    [[ nodiscard, gnu::pure ]] size_type capacity    () const noexcept { return growth_limit( bucket_count() ); }
    [[ nodiscard, gnu::pure ]] float     load_factor () const noexcept { return slots_ ? static_cast<float>( size_ ) / static_cast<float>( bucket_count() ) : 0.0f; }

    [[ nodiscard ]] size_type max_size() const noexcept
    {
        return growth_limit( std::min<size_type>( al_traits::max_size( alloc_ ), max_bucket_count ) );
    }

    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return alloc_; }

    /// Makes room for at least `n` positions (default growth path: allocation
    /// failure propagates as std::bad_alloc).
    void reserve( size_type const n )
    {
        if ( n <= capacity() ) [[ likely ]]
            return;
        if ( n > max_size() ) [[ unlikely ]]
            detail::throw_bad_alloc();
        rehash_to( buckets_for( n ) );
    }

    /// Fallible counterpart of reserve(): reports overflow and allocation
    /// failure instead of throwing.
    result_or_error<> try_reserve( size_type const n ) noexcept
    {
        if ( n <= capacity() )
            return psi::err::success;
        if ( n > max_size() )
            return try_reserve_error{ try_reserve_error::kind::capacity_overflow, n };
        auto const new_bucket_count{ buckets_for( n ) };
        slot * new_slots;
        try
        {
            new_slots = al_traits::allocate( alloc_, new_bucket_count );
        }
        catch ( std::bad_alloc const & )
        {
            return try_reserve_error{ try_reserve_error::kind::allocation_failure, n };
        }
        adopt( new_slots, new_bucket_count );
        return psi::err::success;
    }

    /// Shrinks the bucket array to the smallest size that still holds
    /// max( n, size() ) positions (never implicitly invoked by removals).
    void shrink_to( size_type const n )
    {
        auto const target{ buckets_for( std::max( n, size_ ) ) };
        if ( target < bucket_count() )
            rehash_to( target );
    }

    void clear() noexcept
    {
        std::fill_n( slots_, bucket_count(), slot{} );
        size_ = 0;
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    /// Searches for the position whose entry satisfies `is_match( position )`
    /// among those stored under `hash`. Always terminates (the table is never
    /// full).
    template <typename Match>
    [[ nodiscard ]] probe_result probe( std::size_t const hash, Match && is_match ) const
    {
        if ( !slots_ ) [[ unlikely ]]
            return { 0, npos };
        for ( auto bucket{ home( hash ) }; ; bucket = ( bucket + 1 ) & mask_ )
        {
            auto const & s{ slots_[ bucket ] };
            if ( s.empty() )
                return { bucket, npos };
            if ( ( s.hash == hash ) && is_match( s.index ) )
                return { bucket, s.index };
        }
    }

    template <typename Match>
    [[ nodiscard ]] size_type find( std::size_t const hash, Match && is_match ) const
    {
        return probe( hash, std::forward<Match>( is_match ) ).index;
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //
    // None of these allocate: growth happens only through reserve(), which the
    // owning container calls before it commits a new entry, so every
    // modification below is noexcept and cannot leave the index half updated.
    //--------------------------------------------------------------------------

    /// Commits a vacant probe_result (obtained after reserving room for the
    /// new position) for the entry at `index`.
    void occupy( size_type const bucket, std::size_t const hash, size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( size_ < capacity()              , "occupy() without prior reserve()" );
        BOOST_ASSERT_MSG( slots_[ bucket ].empty()        , "Committing an occupied bucket" );
        BOOST_ASSERT_MSG( index != npos                   , "npos is not a valid position" );
        slots_[ bucket ] = { index, hash };
        ++size_;
    }

    /// Inserts a position known not to be present (rehash, rebuild, raw
    /// 'nocheck' insertion).
    void insert_unique( std::size_t const hash, size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( size_ < capacity(), "insert_unique() without prior reserve()" );
        occupy( vacant_bucket( hash ), hash, index );
    }

    void erase( std::size_t const hash, size_type const index ) noexcept
    {
        erase_bucket( bucket_of( hash, index ) );
    }

    void replace_index( std::size_t const hash, size_type const old_index, size_type const new_index ) noexcept
    {
        slots_[ bucket_of( hash, old_index ) ].index = new_index;
    }

    void swap_indices( std::size_t const hash_a, size_type const a, std::size_t const hash_b, size_type const b ) noexcept
    {
        auto & slot_a{ slots_[ bucket_of( hash_a, a ) ] };
        auto & slot_b{ slots_[ bucket_of( hash_b, b ) ] };
        std::swap( slot_a.index, slot_b.index );
    }

    /// Entries at positions [first, last) moved by `delta` (entries at the
    /// destination positions must already have been erased or moved out of
    /// the way in the direction of the shift). `hash_of( position )` returns
    /// the hash of the entry currently at `position` (i.e. before the move).
    template <typename HashOf>
    void shift_range( size_type const first, size_type const last, difference_type const delta, HashOf && hash_of ) noexcept
    {
        BOOST_ASSERT( first <= last );
        if ( first == last || delta == 0 )
            return;
        if ( sweep_cheaper( last - first ) )
        {
            for ( auto & s : slots() )
                if ( !s.empty() && s.index >= first && s.index < last )
                    s.index = static_cast<size_type>( static_cast<difference_type>( s.index ) + delta );
        }
        else
        if ( delta < 0 )
        {
            // ascending: each destination was vacated by the previous step
            for ( auto i{ first }; i != last; ++i )
                replace_index( hash_of( i ), i, static_cast<size_type>( static_cast<difference_type>( i ) + delta ) );
        }
        else
        {
            for ( auto i{ last }; i-- != first; )
                replace_index( hash_of( i ), i, static_cast<size_type>( static_cast<difference_type>( i ) + delta ) );
        }
    }

    /// Applies an arbitrary permutation of the positions in [first, last)
    /// with a single sweep (rotations, reversals).
    template <typename NewPosition>
    void remap( size_type const first, size_type const last, NewPosition && new_position ) noexcept
    {
        for ( auto & s : slots() )
            if ( !s.empty() && s.index >= first && s.index < last )
                s.index = new_position( s.index );
    }

    /// Clears and repopulates the index for `count` entries at positions
    /// [0, count).
    template <typename HashOf>
    void rebuild( size_type const count, HashOf && hash_of )
    {
        auto const required{ buckets_for( count ) };
        if ( required > bucket_count() )
        {
            auto * const new_slots{ al_traits::allocate( alloc_, required ) };
            release();
            std::uninitialized_fill_n( new_slots, required, slot{} );
            set_buckets( new_slots, required );
        }
        else
        {
            clear();
        }
        for ( size_type i{ 0 }; i != count; ++i )
            insert_unique( hash_of( i ), i );
    }

    [[ nodiscard, gnu::pure ]] bool sweep_cheaper( size_type const affected_positions ) const noexcept
    {
        return affected_positions * options.sweep_threshold.den > bucket_count() * options.sweep_threshold.num;
    }

private:
    [[ gnu::pure ]] static constexpr size_type growth_limit( size_type const bucket_count ) noexcept
    {
        return bucket_count / options.max_load.den * options.max_load.num + bucket_count % options.max_load.den * options.max_load.num / options.max_load.den;
    }

    [[ gnu::const ]] static size_type buckets_for( size_type const n ) noexcept
    {
        if ( n == 0 )
            return 0;
        // smallest power of two with growth_limit( b ) >= n
        auto const required{ ( n / options.max_load.num ) * options.max_load.den + ( ( n % options.max_load.num ) * options.max_load.den + options.max_load.num - 1 ) / options.max_load.num };
        auto buckets{ std::max( min_bucket_count, std::bit_ceil( required ) ) };
        while ( growth_limit( buckets ) < n )
            buckets *= 2;
        return buckets;
    }

    // Fibonacci hashing (cf. sh::robinhood hash_clamp): folds the high bits
    // into the low ones first so that poor (e.g. identity) hashers still
    // spread over the table
    [[ gnu::pure ]] size_type home( std::size_t const hash ) const noexcept
    {
        auto const h{ static_cast<std::uint64_t>( hash ) };
        return static_cast<size_type>( ( ( h ^ ( h >> shift_ ) ) * fibonacci ) >> shift_ );
    }

    [[ gnu::pure ]] size_type vacant_bucket( std::size_t const hash ) const noexcept
    {
        auto bucket{ home( hash ) };
        while ( !slots_[ bucket ].empty() )
            bucket = ( bucket + 1 ) & mask_;
        return bucket;
    }

    [[ gnu::pure ]] size_type bucket_of( std::size_t const hash, size_type const index ) const noexcept
    {
        auto const result{ probe( hash, [ index ]( size_type const candidate ) noexcept { return candidate == index; } ) };
        BOOST_ASSERT_MSG( result.found(), "Index out of sync with the entry store" );
        return result.bucket;
    }

    // backward shift deletion: pull subsequent members of the probe run into
    // the hole unless their home bucket lies cyclically in (hole, next]
    void erase_bucket( size_type const bucket ) noexcept
    {
        auto hole{ bucket };
        for ( auto next{ ( hole + 1 ) & mask_ }; !slots_[ next ].empty(); next = ( next + 1 ) & mask_ )
        {
            auto const desired{ home( slots_[ next ].hash ) };
            bool const stays
            {
                ( hole <= next )
                    ? ( ( hole < desired ) && ( desired <= next ) )
                    : ( ( hole < desired ) || ( desired <= next ) )
            };
            if ( stays )
                continue;
            slots_[ hole ] = slots_[ next ];
            hole = next;
        }
        slots_[ hole ] = slot{};
        --size_;
    }

    void rehash_to( size_type const new_bucket_count )
    {
        adopt( new_bucket_count ? al_traits::allocate( alloc_, new_bucket_count ) : nullptr, new_bucket_count );
    }

    // moves all positions into a freshly allocated bucket array (noexcept from
    // here on)
    void adopt( slot * const new_slots, size_type const new_bucket_count ) noexcept
    {
        std::uninitialized_fill_n( new_slots, new_bucket_count, slot{} );
        auto * const old_slots       { slots_ };
        auto   const old_bucket_count{ bucket_count() };
        set_buckets( new_slots, new_bucket_count );
        size_ = 0;
        for ( size_type b{ 0 }; b != old_bucket_count; ++b )
            if ( !old_slots[ b ].empty() )
                insert_unique( old_slots[ b ].hash, old_slots[ b ].index );
        if ( old_slots )
            al_traits::deallocate( alloc_, old_slots, old_bucket_count );
    }

    void set_buckets( slot * const new_slots, size_type const new_bucket_count ) noexcept
    {
        BOOST_ASSERT( !new_bucket_count || std::has_single_bit( new_bucket_count ) );
        slots_ = new_slots;
        mask_  = new_bucket_count ? new_bucket_count - 1 : 0;
        shift_ = static_cast<std::uint8_t>( 64 - ( new_bucket_count ? std::countr_zero( new_bucket_count ) : 0 ) );
    }

    void copy_slots_from( hash_index const & other )
    {
        auto const other_buckets{ other.bucket_count() };
        if ( other_buckets != bucket_count() )
        {
            auto * const new_slots{ other_buckets ? al_traits::allocate( alloc_, other_buckets ) : nullptr };
            release();
            set_buckets( new_slots, other_buckets );
        }
        std::uninitialized_copy_n( other.slots_, other_buckets, slots_ );
        size_ = other.size_;
    }

    void release() noexcept
    {
        if ( slots_ )
            al_traits::deallocate( alloc_, slots_, bucket_count() );
        slots_ = nullptr;
        mask_  = 0;
        size_  = 0;
        shift_ = 64;
    }

    [[ gnu::pure ]] std::span<slot> slots() const noexcept { return { slots_, bucket_count() }; }

private:
    slot *       slots_{ nullptr };
    size_type    mask_ { 0 };
    size_type    size_ { 0 };
    std::uint8_t shift_{ 64 };
    ORDO_NO_UNIQUE_ADDRESS
    allocator_type alloc_;
}; // class hash_index

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
