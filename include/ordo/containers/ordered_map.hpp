////////////////////////////////////////////////////////////////////////////////
/// ordered_map - hash map with insertion (or explicitly arranged) iteration
/// order and O(1) positional access.
///
/// Layout:
///   ordered_map privately inherits detail::ordered_core<Key, T, ...>, the
///   engine that keeps a dense entry sequence (order, positions) and an open
///   addressing hash index (key -> position) mutually consistent. This class
///   is the typed façade: map vocabulary, iterators, entry views and the
///   order-sensitive comparison operators.
///
/// Removal comes in two disciplines, chosen per call:
///   - shift_* : O(n), preserves the relative order of all remaining entries
///   - swap_*  : O(1), the formerly last entry takes the removed position
///   remove()/erase() are the order preserving (shift) variants.
///
/// Differences from std::unordered_map:
///   - iteration follows insertion order (updates of existing keys keep
///     their position), iterators are random access
///   - equality, ordering and hashing are order sensitive
///   - insert( key, value ) returns the replaced value (if any)
///   - positional API: get_index, move_index, swap_indices, splice, drain...
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
#include <ordo/containers/entry.hpp>
#include <ordo/containers/lookup.hpp>
#include <ordo/containers/mutable_keys.hpp>
#include <ordo/containers/ordered_core.hpp>
#include <ordo/containers/raw_entry.hpp>
#include <ordo/error.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename T,
    typename Hash              = std::hash<Key>,
    typename KeyEqual          = std::equal_to<Key>,
    typename Allocator         = std::allocator<std::pair<Key, T>>,
    ordered_options options = {}
>
class ordered_map
    : private detail::ordered_core<Key, T, Hash, KeyEqual, Allocator, options>
{
    using base      = detail::ordered_core<Key, T, Hash, KeyEqual, Allocator, options>;
    using core_type = base;
    using bucket_type = typename base::bucket_type;

    friend class mutable_keys_access<ordered_map>;

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using allocator_type  = Allocator;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using size_type       = typename base::size_type;
    using difference_type = typename base::difference_type;

    // removed entries (drain, splice, sorted_by...), in order
    using sequence_type = std::vector<value_type, typename std::allocator_traits<Allocator>::template rebind_alloc<value_type>>;

    using entry_type          = ordo::entry         <core_type>;
    using occupied_entry_type = ordo::occupied_entry<core_type>;
    using vacant_entry_type   = ordo::vacant_entry  <core_type>;
    using indexed_entry_type  = ordo::indexed_entry <core_type>;

    static bool constexpr transparent{ base::transparent };

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
private:
    template <bool IsConst, bool KeyMutable = false>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = ordered_map::value_type;
        using difference_type   = ordered_map::difference_type;
        using reference         = std::conditional_t
        <
            IsConst,
            ordered_map::const_reference,
            std::conditional_t<KeyMutable, std::pair<key_type &, mapped_type &>, ordered_map::reference>
        >;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend ordered_map;
        friend iterator_impl<!IsConst, KeyMutable>;

        using map_ptr = std::conditional_t<IsConst, ordered_map const *, ordered_map *>;

        map_ptr         map_{ nullptr };
        difference_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, difference_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst, KeyMutable> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        [[ nodiscard ]] constexpr size_type index() const noexcept { return static_cast<size_type>( idx_ ); }

        constexpr reference operator*() const noexcept {
            auto & b{ map_->base::at_position( static_cast<size_type>( idx_ ) ) };
            return { b.key, b.value };
        }

        constexpr arrow_proxy operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept {
            return *( *this + n );
        }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator== ( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ ==  b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

    using key_mutable_iterator = iterator_impl<false, true>;

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    using key_iterator         = detail::member_iterator<bucket_type const, &bucket_type::key  >;
    using value_iterator       = detail::member_iterator<bucket_type      , &bucket_type::value>;
    using const_value_iterator = detail::member_iterator<bucket_type const, &bucket_type::value>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    ordered_map() = default;

    explicit ordered_map
    (
        size_type        const   capacity,
        Hash             const & hash  = Hash     (),
        KeyEqual         const & equal = KeyEqual (),
        Allocator        const & alloc = Allocator()
    )
        : base( capacity, hash, equal, alloc ) {}

    explicit ordered_map( Allocator const & alloc )
        : base( 0, Hash(), KeyEqual(), alloc ) {}

    template <std::input_iterator InputIt>
    ordered_map
    (
        InputIt first, InputIt const last,
        size_type        const   capacity = 0,
        Hash             const & hash     = Hash     (),
        KeyEqual         const & equal    = KeyEqual (),
        Allocator        const & alloc    = Allocator()
    )
        : base( capacity, hash, equal, alloc )
    {
        insert( first, last );
    }

    ordered_map
    (
        std::initializer_list<value_type> const il,
        size_type        const   capacity = 0,
        Hash             const & hash     = Hash     (),
        KeyEqual         const & equal    = KeyEqual (),
        Allocator        const & alloc    = Allocator()
    )
        : ordered_map( il.begin(), il.end(), capacity ? capacity : il.size(), hash, equal, alloc ) {}

    ordered_map( ordered_map const & ) = default;
    ordered_map( ordered_map && )      = default;

    ordered_map( ordered_map const & other, Allocator const & alloc ) : base( other, alloc ) {}

    ordered_map & operator=( ordered_map const & ) = default;
    ordered_map & operator=( ordered_map && )      = default;

    ordered_map & operator=( std::initializer_list<value_type> const il )
    {
        clear();
        insert( il );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators and views
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( size() ) }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    const_reverse_iterator crend  () const noexcept { return rend  (); }

    [[ nodiscard ]] auto keys() const noexcept
    {
        return std::ranges::subrange{ key_iterator{ base::buckets_begin() }, key_iterator{ base::buckets_end() } };
    }
    [[ nodiscard ]] auto values() noexcept
    {
        return std::ranges::subrange{ value_iterator{ base::buckets_begin() }, value_iterator{ base::buckets_end() } };
    }
    [[ nodiscard ]] auto values() const noexcept
    {
        return std::ranges::subrange{ const_value_iterator{ base::buckets_begin() }, const_value_iterator{ base::buckets_end() } };
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    using base::empty;
    using base::size;
    using base::max_size;
    using base::capacity;
    using base::reserve;
    using base::reserve_exact;
    using base::try_reserve;
    using base::try_reserve_exact;
    using base::shrink_to;

    void shrink_to_fit() { base::shrink_to( 0 ); }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    using base::hash_function;
    using base::key_eq;
    using base::get_allocator;
    using base::bucket_count;
    using base::load_factor;

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool contains( LookupType<transparent, key_type> auto const & key ) const { return base::find( key ) != base::npos; }

    [[ nodiscard ]] iterator       find( LookupType<transparent, key_type> auto const & key )       { return { this, position_or_end( base::find( key ) ) }; }
    [[ nodiscard ]] const_iterator find( LookupType<transparent, key_type> auto const & key ) const { return { this, position_or_end( base::find( key ) ) }; }

    [[ nodiscard ]] std::optional<size_type> get_index_of( LookupType<transparent, key_type> auto const & key ) const
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        return pos;
    }

    /// Pointer to the mapped value, nullptr if the key is absent.
    [[ nodiscard ]] mapped_type const * get( LookupType<transparent, key_type> auto const & key ) const
    {
        auto const pos{ base::find( key ) };
        return ( pos == base::npos ) ? nullptr : &base::at_position( pos ).value;
    }
    [[ nodiscard ]] mapped_type * get( LookupType<transparent, key_type> auto const & key )
    {
        auto const pos{ base::find( key ) };
        return ( pos == base::npos ) ? nullptr : &base::at_position( pos ).value;
    }
    [[ nodiscard ]] mapped_type * get_mut( LookupType<transparent, key_type> auto const & key ) { return get( key ); }

    [[ nodiscard ]] std::optional<const_reference> get_key_value( LookupType<transparent, key_type> auto const & key ) const
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        return make_reference( pos );
    }

    [[ nodiscard ]] std::optional<std::tuple<size_type, key_type const &, mapped_type const &>> get_full( LookupType<transparent, key_type> auto const & key ) const
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        auto const & b{ base::at_position( pos ) };
        return std::tuple<size_type, key_type const &, mapped_type const &>{ pos, b.key, b.value };
    }

    [[ nodiscard ]] std::optional<std::tuple<size_type, key_type const &, mapped_type &>> get_full_mut( LookupType<transparent, key_type> auto const & key )
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        auto & b{ base::at_position( pos ) };
        return std::tuple<size_type, key_type const &, mapped_type &>{ pos, b.key, b.value };
    }

    [[ nodiscard ]] mapped_type & at( LookupType<transparent, key_type> auto const & key )
    {
        auto * const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::at" );
        return *value;
    }
    [[ nodiscard ]] mapped_type const & at( LookupType<transparent, key_type> auto const & key ) const
    {
        auto const * const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::at" );
        return *value;
    }

    /// Inserts a value-initialized mapped_type for an absent key.
    mapped_type & operator[]( key_type const & key ) { return base::at_position( base::try_emplace( key            ).first ).value; }
    mapped_type & operator[]( key_type &&      key ) { return base::at_position( base::try_emplace( std::move( key ) ).first ).value; }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// New keys are appended; for an existing key only the value is replaced
    /// (the entry keeps its position) and the old value is returned.
    std::optional<mapped_type> insert( key_type key, mapped_type value )
    {
        return insert_full( std::move( key ), std::move( value ) ).second;
    }

    std::pair<size_type, std::optional<mapped_type>> insert_full( key_type key, mapped_type value )
    {
        auto const [ pos, inserted ]{ base::try_emplace( std::move( key ), std::move( value ) ) };
        if ( inserted )
            return { pos, std::nullopt };
        return { pos, std::exchange( base::at_position( pos ).value, std::move( value ) ) };
    }

    template <std::input_iterator InputIt>
    void insert( InputIt first, InputIt const last )
    {
        if constexpr ( std::forward_iterator<InputIt> )
            reserve_for_extension( static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
            upsert( *this, *first );
    }

    void insert( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    /// Inserts/updates every (key, value) pair of `rg` in order.
    template <std::ranges::input_range R>
    void extend( R && rg )
    {
        if constexpr ( std::ranges::sized_range<R> )
            reserve_for_extension( static_cast<size_type>( std::ranges::size( rg ) ) );
        for ( auto && item : rg )
            upsert( *this, std::forward<decltype( item )>( item ) );
    }

    template <typename M>
    std::pair<iterator, bool> insert_or_assign( key_type key, M && obj )
    {
        auto const [ pos, inserted ]{ base::try_emplace( std::move( key ), std::forward<M>( obj ) ) };
        if ( !inserted )
            base::at_position( pos ).value = std::forward<M>( obj );
        return { iterator{ this, static_cast<difference_type>( pos ) }, inserted };
    }

    template <typename ... Args>
    std::pair<iterator, bool> try_emplace( key_type const & key, Args && ... args )
    {
        auto const [ pos, inserted ]{ base::try_emplace( key, std::forward<Args>( args )... ) };
        return { iterator{ this, static_cast<difference_type>( pos ) }, inserted };
    }
    template <typename ... Args>
    std::pair<iterator, bool> try_emplace( key_type && key, Args && ... args )
    {
        auto const [ pos, inserted ]{ base::try_emplace( std::move( key ), std::forward<Args>( args )... ) };
        return { iterator{ this, static_cast<difference_type>( pos ) }, inserted };
    }

    /// Inserts at the position given by binary_search_keys() (keys assumed
    /// sorted), or replaces the value of an equal key found there.
    std::pair<size_type, std::optional<mapped_type>> insert_sorted( key_type key, mapped_type value )
    {
        auto const position{ binary_search_keys( key ) };
        if ( position.found )
            return { position.index, std::exchange( base::at_position( position.index ).value, std::move( value ) ) };
        return insert_before( position.index, std::move( key ), std::move( value ) );
    }

    /// Inserts a new key before the entry at `index` (index <= size()). An
    /// existing key is moved there instead (to index - 1 when it currently
    /// sits before `index`, so that the entry at `index` keeps its place) and
    /// gets its value replaced. Returns the final position.
    std::pair<size_type, std::optional<mapped_type>> insert_before( size_type const index, key_type key, mapped_type value )
    {
        if ( index > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::insert_before" );
        auto const hash{ base::hash_of( std::as_const( key ) ) };
        auto const slot{ base::prepare_insert( hash, key ) };
        if ( slot.found() )
        {
            auto const target{ ( index > slot.index ) ? index - 1 : index };
            auto old_value{ std::exchange( base::at_position( slot.index ).value, std::move( value ) ) };
            base::move_index( slot.index, target );
            return { target, std::move( old_value ) };
        }
        auto const last{ base::emplace_vacant( slot, hash, std::move( key ), std::move( value ) ) };
        base::move_index( last, index );
        return { index, std::nullopt };
    }

    /// Places the key at `index`: an existing key is moved there (index <
    /// size()) and gets its value replaced, a new one is inserted there
    /// (index <= size()).
    std::optional<mapped_type> shift_insert( size_type const index, key_type key, mapped_type value )
    {
        auto const hash{ base::hash_of( std::as_const( key ) ) };
        if ( index > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::shift_insert" );
        auto const slot{ base::prepare_insert( hash, key ) };
        if ( slot.found() )
        {
            if ( index >= size() ) [[ unlikely ]]
                detail::throw_out_of_range( "ordo::ordered_map::shift_insert" );
            auto old_value{ std::exchange( base::at_position( slot.index ).value, std::move( value ) ) };
            base::move_index( slot.index, index );
            return old_value;
        }
        auto const last{ base::emplace_vacant( slot, hash, std::move( key ), std::move( value ) ) };
        base::move_index( last, index );
        return std::nullopt;
    }

    //--------------------------------------------------------------------------
    // Entry views
    //--------------------------------------------------------------------------
    [[ nodiscard ]] entry_type entry( key_type key )
    {
        auto const hash{ base::hash_of( std::as_const( key ) ) };
        auto const slot{ base::prepare_insert( hash, key ) };
        if ( slot.found() )
            return entry_type{ occupied_entry_type{ core(), slot.index } };
        return entry_type{ vacant_entry_type{ core(), std::move( key ), hash, slot } };
    }

    [[ nodiscard ]] std::optional<indexed_entry_type> get_index_entry( size_type const index )
    {
        if ( index >= size() )
            return std::nullopt;
        return indexed_entry_type{ core(), index };
    }

    //--------------------------------------------------------------------------
    // Removal by key
    //--------------------------------------------------------------------------
    std::optional<mapped_type> remove      ( LookupType<transparent, key_type> auto const & key ) { return shift_remove( key ); }
    std::optional<mapped_type> shift_remove( LookupType<transparent, key_type> auto const & key ) { return remove_value( key, &base::shift_remove ); }
    std::optional<mapped_type> swap_remove ( LookupType<transparent, key_type> auto const & key ) { return remove_value( key, &base::swap_remove  ); }

    std::optional<value_type> remove_entry      ( LookupType<transparent, key_type> auto const & key ) { return shift_remove_entry( key ); }
    std::optional<value_type> shift_remove_entry( LookupType<transparent, key_type> auto const & key ) { return remove_pair( key, &base::shift_remove ); }
    std::optional<value_type> swap_remove_entry ( LookupType<transparent, key_type> auto const & key ) { return remove_pair( key, &base::swap_remove  ); }

    std::optional<std::tuple<size_type, key_type, mapped_type>> shift_remove_full( LookupType<transparent, key_type> auto const & key ) { return remove_full( key, &base::shift_remove ); }
    std::optional<std::tuple<size_type, key_type, mapped_type>> swap_remove_full ( LookupType<transparent, key_type> auto const & key ) { return remove_full( key, &base::swap_remove  ); }

    /// std::unordered_map style: order preserving removal, returns the number
    /// of removed entries.
    size_type erase( LookupType<transparent, key_type> auto const & key )
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return 0;
        base::shift_remove( pos );
        return 1;
    }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::optional<reference> get_index( size_type const index ) noexcept
    {
        if ( index >= size() )
            return std::nullopt;
        return make_reference( index );
    }
    [[ nodiscard ]] std::optional<const_reference> get_index( size_type const index ) const noexcept
    {
        if ( index >= size() )
            return std::nullopt;
        return make_reference( index );
    }
    [[ nodiscard ]] std::optional<reference> get_index_mut( size_type const index ) noexcept { return get_index( index ); }

    /// Checked positional access.
    [[ nodiscard ]] reference at_index( size_type const index )
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::at_index" );
        return make_reference( index );
    }
    [[ nodiscard ]] const_reference at_index( size_type const index ) const
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::at_index" );
        return make_reference( index );
    }

    [[ nodiscard ]] std::optional<reference>       first()       noexcept { return get_index( 0 ); }
    [[ nodiscard ]] std::optional<const_reference> first() const noexcept { return get_index( 0 ); }
    [[ nodiscard ]] std::optional<reference>       last ()       noexcept { return empty() ? std::nullopt : get_index( size() - 1 ); }
    [[ nodiscard ]] std::optional<const_reference> last () const noexcept { return empty() ? std::nullopt : get_index( size() - 1 ); }

    /// The entries at [first, last), nullopt for an invalid range.
    [[ nodiscard ]] std::optional<std::ranges::subrange<iterator>> get_range( size_type const first, size_type const last ) noexcept
    {
        if ( first > last || last > size() )
            return std::nullopt;
        return std::ranges::subrange<iterator>{ begin() + static_cast<difference_type>( first ), begin() + static_cast<difference_type>( last ) };
    }
    [[ nodiscard ]] std::optional<std::ranges::subrange<const_iterator>> get_range( size_type const first, size_type const last ) const noexcept
    {
        if ( first > last || last > size() )
            return std::nullopt;
        return std::ranges::subrange<const_iterator>{ begin() + static_cast<difference_type>( first ), begin() + static_cast<difference_type>( last ) };
    }

    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        return to_value( base::shift_remove( size() - 1 ) );
    }

    std::optional<value_type> shift_remove_index( size_type const index )
    {
        if ( index >= size() )
            return std::nullopt;
        return to_value( base::shift_remove( index ) );
    }
    std::optional<value_type> swap_remove_index( size_type const index )
    {
        if ( index >= size() )
            return std::nullopt;
        return to_value( base::swap_remove( index ) );
    }

    void move_index( size_type const from, size_type const to )
    {
        if ( from >= size() || to >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::move_index" );
        base::move_index( from, to );
    }

    void swap_indices( size_type const a, size_type const b )
    {
        if ( a >= size() || b >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::swap_indices" );
        base::swap_indices( a, b );
    }

    //--------------------------------------------------------------------------
    // Bulk removal
    //--------------------------------------------------------------------------
    using base::truncate;
    using base::clear;

    /// Keeps the entries for which `keep( key_type const &, mapped_type & )`
    /// returns true, in their original relative order.
    template <typename Keep>
    void retain( Keep && keep )
    {
        base::retain( [ & ]( bucket_type & b ) { return static_cast<bool>( keep( std::as_const( b.key ), b.value ) ); } );
    }

    /// Removes and returns the entries at [first, last) in order.
    sequence_type drain( size_type const first, size_type const last )
    {
        check_range( first, last, "ordo::ordered_map::drain" );
        return to_sequence( base::drain( first, last ) );
    }

    /// Splits off the entries at [at, size()) into a new map sharing the
    /// hasher, key_eq and allocator.
    [[ nodiscard ]] ordered_map split_off( size_type const at )
    {
        if ( at > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::split_off" );
        auto tail{ base::drain( at, size() ) };
        ordered_map result( base::clone_empty() );
        result.base::reserve_exact( tail.size() );
        for ( auto & b : tail )
            result.base::emplace_unchecked( b.hash, std::move( b.key ), std::move( b.value ) );
        return result;
    }

    /// Removes [first, last) and inserts the (key, value) items of
    /// `replacement` in the gap. Keys that exist outside the removed range
    /// only get their value updated (in place). Returns the removed entries.
    template <std::ranges::input_range R>
    sequence_type splice( size_type const first, size_type const last, R && replacement )
    {
        check_range( first, last, "ordo::ordered_map::splice" );
        return to_sequence
        (
            base::splice
            (
                first, last, std::forward<R>( replacement ),
                []( base & core, auto && item ) { upsert( core, std::forward<decltype( item )>( item ) ); }
            )
        );
    }

    //--------------------------------------------------------------------------
    // Ordering
    //--------------------------------------------------------------------------
    void sort_keys         () { base::sort_stable  ( key_less() ); }
    void sort_unstable_keys() { base::sort_unstable( key_less() ); }

    /// `less( key_type const &, mapped_type const &, key_type const &, mapped_type const & )`
    template <typename Less>
    void sort_by( Less && less ) { base::sort_stable( entry_less( less ) ); }

    template <typename Less>
    void sort_unstable_by( Less && less ) { base::sort_unstable( entry_less( less ) ); }

    /// Computes `key_of( key_type const &, mapped_type const & )` once per entry.
    template <typename KeyOf>
    void sort_by_cached_key( KeyOf && key_of )
    {
        base::sort_by_cached_key( [ & ]( bucket_type const & b ) { return key_of( b.key, b.value ); } );
    }

    /// Consumes the map, returns its entries ordered by `less`.
    template <typename Less>
    [[ nodiscard ]] sequence_type sorted_by( Less && less ) &&
    {
        sort_by( std::forward<Less>( less ) );
        return to_sequence( base::drain( 0, size() ) );
    }

    template <typename Less>
    [[ nodiscard ]] sequence_type sorted_unstable_by( Less && less ) &&
    {
        sort_unstable_by( std::forward<Less>( less ) );
        return to_sequence( base::drain( 0, size() ) );
    }

    using base::reverse;

    [[ nodiscard ]] search_result binary_search_keys( param_t<key_type> key ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return detail::synth_three_way{}( b.key, key ); } );
    }

    /// `compare( key_type const &, mapped_type const & )` returns the ordering
    /// of the entry relative to the target.
    template <typename Compare>
    [[ nodiscard ]] search_result binary_search_by( Compare && compare ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return compare( b.key, b.value ); } );
    }

    template <typename B, typename KeyOf>
    [[ nodiscard ]] search_result binary_search_by_key( B const & target, KeyOf && key_of ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return detail::synth_three_way{}( key_of( b.key, b.value ), target ); } );
    }

    /// Index of the first entry for which `pred( key_type const &, mapped_type const & )`
    /// is false (entries assumed partitioned).
    template <typename Pred>
    [[ nodiscard ]] size_type partition_point( Pred && pred ) const
    {
        return base::partition_point( [ & ]( bucket_type const & b ) { return static_cast<bool>( pred( b.key, b.value ) ); } );
    }

    //--------------------------------------------------------------------------
    // Capabilities
    //--------------------------------------------------------------------------
    [[ nodiscard ]] raw_entry_builder    <core_type> raw_entry_v1    () const noexcept { return raw_entry_builder    <core_type>{ core() }; }
    [[ nodiscard ]] raw_entry_builder_mut<core_type> raw_entry_mut_v1()       noexcept { return raw_entry_builder_mut<core_type>{ core() }; }

    [[ nodiscard ]] mutable_keys_access<ordered_map> mutable_keys() noexcept { return mutable_keys_access<ordered_map>{ *this }; }

    //--------------------------------------------------------------------------
    // Swap
    //--------------------------------------------------------------------------
    void swap( ordered_map & other ) noexcept { base::swap( other ); }
    friend void swap( ordered_map & left, ordered_map & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Order sensitive comparison and hashing
    //--------------------------------------------------------------------------
    friend bool operator==( ordered_map const & left, ordered_map const & right )
        requires std::equality_comparable<key_type> && std::equality_comparable<mapped_type>
    {
        return std::equal
        (
            left .buckets_begin(), left .buckets_end(),
            right.buckets_begin(), right.buckets_end(),
            []( bucket_type const & a, bucket_type const & b ) { return ( a.key == b.key ) && ( a.value == b.value ); }
        );
    }

    friend auto operator<=>( ordered_map const & left, ordered_map const & right )
        requires std::three_way_comparable<key_type> && std::three_way_comparable<mapped_type>
    {
        using ordering = std::common_comparison_category_t<std::compare_three_way_result_t<key_type>, std::compare_three_way_result_t<mapped_type>>;
        return std::lexicographical_compare_three_way
        (
            left .buckets_begin(), left .buckets_end(),
            right.buckets_begin(), right.buckets_end(),
            []( bucket_type const & a, bucket_type const & b ) -> ordering
            {
                if ( auto const by_key{ a.key <=> b.key }; by_key != 0 )
                    return by_key;
                return a.value <=> b.value;
            }
        );
    }

    /// hash( size ) folded with hash( key ), hash( value ) of every entry in
    /// order (boost::hash protocol: found by boost::hash<ordered_map>).
    friend std::size_t hash_value( ordered_map const & map )
    {
        std::size_t seed{ 0 };
        boost::hash_combine( seed, map.size() );
        for ( auto const & b : std::ranges::subrange{ map.buckets_begin(), map.buckets_end() } )
        {
            boost::hash_combine( seed, b.key   );
            boost::hash_combine( seed, b.value );
        }
        return seed;
    }

private:
    explicit ordered_map( base && core ) noexcept : base( std::move( core ) ) {}

    [[ nodiscard ]] base       & core()       noexcept { return *this; }
    [[ nodiscard ]] base const & core() const noexcept { return *this; }

    [[ nodiscard ]] std::ranges::subrange<key_mutable_iterator> key_mutable_range() noexcept
    {
        return { key_mutable_iterator{ this, 0 }, key_mutable_iterator{ this, static_cast<difference_type>( size() ) } };
    }

    [[ nodiscard ]] difference_type position_or_end( size_type const pos ) const noexcept
    {
        return static_cast<difference_type>( ( pos == base::npos ) ? size() : pos );
    }

    [[ nodiscard ]] reference make_reference( size_type const pos ) noexcept
    {
        auto & b{ base::at_position( pos ) };
        return { b.key, b.value };
    }
    [[ nodiscard ]] const_reference make_reference( size_type const pos ) const noexcept
    {
        auto const & b{ base::at_position( pos ) };
        return { b.key, b.value };
    }

    void check_range( size_type const first, size_type const last, char const * const what ) const
    {
        if ( first > last || last > size() ) [[ unlikely ]]
            detail::throw_out_of_range( what );
    }

    void reserve_for_extension( size_type const incoming )
    {
        // duplicates may collapse many of the incoming items: only reserve for
        // about half of them when the map already has content
        base::reserve( size() + ( empty() ? incoming : ( incoming + 1 ) / 2 ) );
    }

    // insert-or-update from a (key, value) tuple-like item
    template <typename Item>
    static void upsert( base & core, Item && item )
    {
        auto && key  { std::get<0>( std::forward<Item>( item ) ) };
        auto && value{ std::get<1>( std::forward<Item>( item ) ) };
        auto const [ pos, inserted ]{ core.try_emplace( std::forward<decltype( key )>( key ), std::forward<decltype( value )>( value ) ) };
        if ( !inserted )
            core.at_position( pos ).value = std::forward<decltype( value )>( value );
    }

    static value_type to_value( bucket_type && b ) { return { std::move( b.key ), std::move( b.value ) }; }

    sequence_type to_sequence( typename base::bucket_container && buckets ) const
    {
        sequence_type result( typename sequence_type::allocator_type( base::get_allocator() ) );
        result.reserve( buckets.size() );
        for ( auto & b : buckets )
            result.emplace_back( std::move( b.key ), std::move( b.value ) );
        return result;
    }

    template <typename Remove>
    std::optional<mapped_type> remove_value( auto const & key, Remove const remove )
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        return ( this->*remove )( pos ).value;
    }

    template <typename Remove>
    std::optional<value_type> remove_pair( auto const & key, Remove const remove )
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        return to_value( ( this->*remove )( pos ) );
    }

    template <typename Remove>
    std::optional<std::tuple<size_type, key_type, mapped_type>> remove_full( auto const & key, Remove const remove )
    {
        auto const pos{ base::find( key ) };
        if ( pos == base::npos )
            return std::nullopt;
        auto removed{ ( this->*remove )( pos ) };
        return std::tuple<size_type, key_type, mapped_type>{ pos, std::move( removed.key ), std::move( removed.value ) };
    }

    static auto key_less() noexcept
    {
        return []( bucket_type const & a, bucket_type const & b ) { return a.key < b.key; };
    }

    template <typename Less>
    static auto entry_less( Less & less ) noexcept
    {
        return [ &less ]( bucket_type const & a, bucket_type const & b ) { return static_cast<bool>( less( a.key, a.value, b.key, b.value ) ); };
    }
}; // class ordered_map

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, ordo::ordered_options options>
struct std::hash<ordo::ordered_map<Key, T, Hash, KeyEqual, Allocator, options>>
{
    std::size_t operator()( ordo::ordered_map<Key, T, Hash, KeyEqual, Allocator, options> const & map ) const
    {
        return hash_value( map );
    }
};
//------------------------------------------------------------------------------
