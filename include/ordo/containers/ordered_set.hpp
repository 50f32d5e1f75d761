////////////////////////////////////////////////////////////////////////////////
/// ordered_set - hash set with insertion (or explicitly arranged) iteration
/// order and O(1) positional access.
///
/// A projection of the ordered_map engine with an empty mapped part: it
/// privately inherits detail::ordered_core<T, detail::unit, ...> and exposes
/// set vocabulary over it. Iterators are random access and yield
/// value_type const & (stored values are only mutable through the opt-in
/// mutable_values() capability).
///
/// Equality, ordering and hashing are order sensitive (two sets holding the
/// same values in a different order are not ==); set_eq() is the order
/// insensitive comparison.
///
/// The set algebra operations (difference, symmetric_difference,
/// intersection, union_) return lazy views that reference both operands.
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
#include <ordo/containers/lookup.hpp>
#include <ordo/containers/mutable_keys.hpp>
#include <ordo/containers/ordered_core.hpp>
#include <ordo/containers/set_algebra.hpp>
#include <ordo/error.hpp>

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
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

template
<
    typename T,
    typename Hash              = std::hash<T>,
    typename KeyEqual          = std::equal_to<T>,
    typename Allocator         = std::allocator<T>,
    ordered_options options = {}
>
class ordered_set
    : private detail::ordered_core<T, detail::unit, Hash, KeyEqual, Allocator, options>
{
    using base        = detail::ordered_core<T, detail::unit, Hash, KeyEqual, Allocator, options>;
    using core_type   = base;
    using bucket_type = typename base::bucket_type;

    friend class mutable_values_access<ordered_set>;

public:
    using key_type        = T;
    using value_type      = T;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using allocator_type  = Allocator;
    using reference       = value_type const &;
    using const_reference = value_type const &;
    using size_type       = typename base::size_type;
    using difference_type = typename base::difference_type;

    using sequence_type = std::vector<value_type, typename std::allocator_traits<Allocator>::template rebind_alloc<value_type>>;

    using iterator               = detail::member_iterator<bucket_type const, &bucket_type::key>;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;

    static bool constexpr transparent{ base::transparent };

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    ordered_set() = default;

    explicit ordered_set
    (
        size_type        const   capacity,
        Hash             const & hash  = Hash     (),
        KeyEqual         const & equal = KeyEqual (),
        Allocator        const & alloc = Allocator()
    )
        : base( capacity, hash, equal, alloc ) {}

    explicit ordered_set( Allocator const & alloc )
        : base( 0, Hash(), KeyEqual(), alloc ) {}

    template <std::input_iterator InputIt>
    ordered_set
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

    ordered_set
    (
        std::initializer_list<value_type> const il,
        size_type        const   capacity = 0,
        Hash             const & hash     = Hash     (),
        KeyEqual         const & equal    = KeyEqual (),
        Allocator        const & alloc    = Allocator()
    )
        : ordered_set( il.begin(), il.end(), capacity ? capacity : il.size(), hash, equal, alloc ) {}

    ordered_set( ordered_set const & ) = default;
    ordered_set( ordered_set && )      = default;

    ordered_set( ordered_set const & other, Allocator const & alloc ) : base( other, alloc ) {}

    ordered_set & operator=( ordered_set const & ) = default;
    ordered_set & operator=( ordered_set && )      = default;

    ordered_set & operator=( std::initializer_list<value_type> const il )
    {
        clear();
        insert( il );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator begin() const noexcept { return iterator{ base::buckets_begin() }; }
    iterator end  () const noexcept { return iterator{ base::buckets_end  () }; }

    iterator cbegin() const noexcept { return begin(); }
    iterator cend  () const noexcept { return end  (); }

    reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
    reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

    reverse_iterator crbegin() const noexcept { return rbegin(); }
    reverse_iterator crend  () const noexcept { return rend  (); }

    //--------------------------------------------------------------------------
    // Capacity and observers
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

    using base::hash_function;
    using base::key_eq;
    using base::get_allocator;
    using base::bucket_count;
    using base::load_factor;

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool contains( LookupType<transparent, value_type> auto const & value ) const { return base::find( value ) != base::npos; }

    [[ nodiscard ]] iterator find( LookupType<transparent, value_type> auto const & value ) const
    {
        auto const pos{ base::find( value ) };
        return ( pos == base::npos ) ? end() : begin() + static_cast<difference_type>( pos );
    }

    [[ nodiscard ]] std::optional<size_type> get_index_of( LookupType<transparent, value_type> auto const & value ) const
    {
        auto const pos{ base::find( value ) };
        if ( pos == base::npos )
            return std::nullopt;
        return pos;
    }

    /// The stored value equal to `value`, nullptr if absent.
    [[ nodiscard ]] value_type const * get( LookupType<transparent, value_type> auto const & value ) const
    {
        auto const pos{ base::find( value ) };
        return ( pos == base::npos ) ? nullptr : &base::at_position( pos ).key;
    }

    [[ nodiscard ]] std::optional<std::pair<size_type, value_type const &>> get_full( LookupType<transparent, value_type> auto const & value ) const
    {
        auto const pos{ base::find( value ) };
        if ( pos == base::npos )
            return std::nullopt;
        return std::pair<size_type, value_type const &>{ pos, base::at_position( pos ).key };
    }

    //--------------------------------------------------------------------------
    // Insertion
    //--------------------------------------------------------------------------

    /// Appends an absent value, returns false (leaving the set untouched) if
    /// an equal value is already present.
    bool insert( value_type value ) { return insert_full( std::move( value ) ).second; }

    std::pair<size_type, bool> insert_full( value_type value ) { return base::try_emplace( std::move( value ) ); }

    template <std::input_iterator InputIt>
    void insert( InputIt first, InputIt const last )
    {
        if constexpr ( std::forward_iterator<InputIt> )
            reserve_for_extension( static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
            base::try_emplace( *first );
    }

    void insert( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    template <std::ranges::input_range R>
    void extend( R && rg )
    {
        if constexpr ( std::ranges::sized_range<R> )
            reserve_for_extension( static_cast<size_type>( std::ranges::size( rg ) ) );
        for ( auto && value : rg )
            base::try_emplace( std::forward<decltype( value )>( value ) );
    }

    /// Inserts at the position given by binary_search() (values assumed
    /// sorted). An equal value found there is left in place.
    std::pair<size_type, bool> insert_sorted( value_type value )
    {
        auto const position{ binary_search( value ) };
        if ( position.found )
            return { position.index, false };
        return insert_before( position.index, std::move( value ) );
    }

    /// Inserts a new value before the entry at `index` (index <= size()) or
    /// moves an existing one there (to index - 1 when it currently sits
    /// before `index`). Returns the final position and whether it was new.
    std::pair<size_type, bool> insert_before( size_type const index, value_type value )
    {
        if ( index > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::insert_before" );
        auto const hash{ base::hash_of( std::as_const( value ) ) };
        auto const slot{ base::prepare_insert( hash, value ) };
        if ( slot.found() )
        {
            auto const target{ ( index > slot.index ) ? index - 1 : index };
            base::move_index( slot.index, target );
            return { target, false };
        }
        auto const last{ base::emplace_vacant( slot, hash, std::move( value ) ) };
        base::move_index( last, index );
        return { index, true };
    }

    /// Places the value at `index`: an existing value is moved there (index <
    /// size()), a new one is inserted there (index <= size()). Returns
    /// whether the value was new.
    bool shift_insert( size_type const index, value_type value )
    {
        if ( index > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::shift_insert" );
        auto const hash{ base::hash_of( std::as_const( value ) ) };
        auto const slot{ base::prepare_insert( hash, value ) };
        if ( slot.found() )
        {
            if ( index >= size() ) [[ unlikely ]]
                detail::throw_out_of_range( "ordo::ordered_set::shift_insert" );
            base::move_index( slot.index, index );
            return false;
        }
        auto const last{ base::emplace_vacant( slot, hash, std::move( value ) ) };
        base::move_index( last, index );
        return true;
    }

    /// Like insert() but an equal stored value is replaced by `value` (keeping
    /// its position) and returned.
    std::optional<value_type> replace( value_type value ) { return replace_full( std::move( value ) ).second; }

    std::pair<size_type, std::optional<value_type>> replace_full( value_type value )
    {
        auto const hash{ base::hash_of( std::as_const( value ) ) };
        auto const slot{ base::prepare_insert( hash, value ) };
        if ( slot.found() )
            return { slot.index, std::exchange( base::at_position( slot.index ).key, std::move( value ) ) };
        return { base::emplace_vacant( slot, hash, std::move( value ) ), std::nullopt };
    }

    //--------------------------------------------------------------------------
    // Removal by value
    //--------------------------------------------------------------------------
    bool remove      ( LookupType<transparent, value_type> auto const & value ) { return shift_remove( value ); }
    bool shift_remove( LookupType<transparent, value_type> auto const & value ) { return take_value( value, &base::shift_remove ).has_value(); }
    bool swap_remove ( LookupType<transparent, value_type> auto const & value ) { return take_value( value, &base::swap_remove  ).has_value(); }

    /// Removes and returns the stored value equal to `value`.
    std::optional<value_type> take      ( LookupType<transparent, value_type> auto const & value ) { return shift_take( value ); }
    std::optional<value_type> shift_take( LookupType<transparent, value_type> auto const & value ) { return take_value( value, &base::shift_remove ); }
    std::optional<value_type> swap_take ( LookupType<transparent, value_type> auto const & value ) { return take_value( value, &base::swap_remove  ); }

    std::optional<std::pair<size_type, value_type>> shift_remove_full( LookupType<transparent, value_type> auto const & value ) { return take_full( value, &base::shift_remove ); }
    std::optional<std::pair<size_type, value_type>> swap_remove_full ( LookupType<transparent, value_type> auto const & value ) { return take_full( value, &base::swap_remove  ); }

    size_type erase( LookupType<transparent, value_type> auto const & value ) { return shift_remove( value ) ? 1 : 0; }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] value_type const * get_index( size_type const index ) const noexcept
    {
        return ( index < size() ) ? &base::at_position( index ).key : nullptr;
    }

    [[ nodiscard ]] value_type const & at_index( size_type const index ) const
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::at_index" );
        return base::at_position( index ).key;
    }

    [[ nodiscard ]] value_type const * first() const noexcept { return get_index( 0 ); }
    [[ nodiscard ]] value_type const * last () const noexcept { return empty() ? nullptr : get_index( size() - 1 ); }

    [[ nodiscard ]] std::optional<std::ranges::subrange<iterator>> get_range( size_type const first, size_type const last ) const noexcept
    {
        if ( first > last || last > size() )
            return std::nullopt;
        return std::ranges::subrange<iterator>{ begin() + static_cast<difference_type>( first ), begin() + static_cast<difference_type>( last ) };
    }

    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        return std::move( base::shift_remove( size() - 1 ).key );
    }

    std::optional<value_type> shift_remove_index( size_type const index )
    {
        if ( index >= size() )
            return std::nullopt;
        return std::move( base::shift_remove( index ).key );
    }
    std::optional<value_type> swap_remove_index( size_type const index )
    {
        if ( index >= size() )
            return std::nullopt;
        return std::move( base::swap_remove( index ).key );
    }

    void move_index( size_type const from, size_type const to )
    {
        if ( from >= size() || to >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::move_index" );
        base::move_index( from, to );
    }

    void swap_indices( size_type const a, size_type const b )
    {
        if ( a >= size() || b >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::swap_indices" );
        base::swap_indices( a, b );
    }

    //--------------------------------------------------------------------------
    // Bulk removal
    //--------------------------------------------------------------------------
    using base::truncate;
    using base::clear;

    /// Keeps the values for which `keep( value_type const & )` returns true.
    template <typename Keep>
    void retain( Keep && keep )
    {
        base::retain( [ & ]( bucket_type const & b ) { return static_cast<bool>( keep( b.key ) ); } );
    }

    sequence_type drain( size_type const first, size_type const last )
    {
        check_range( first, last, "ordo::ordered_set::drain" );
        return to_sequence( base::drain( first, last ) );
    }

    [[ nodiscard ]] ordered_set split_off( size_type const at )
    {
        if ( at > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_set::split_off" );
        auto tail{ base::drain( at, size() ) };
        ordered_set result( base::clone_empty() );
        result.base::reserve_exact( tail.size() );
        for ( auto & b : tail )
            result.base::emplace_unchecked( b.hash, std::move( b.key ) );
        return result;
    }

    /// Removes [first, last) and inserts the values of `replacement` in the
    /// gap. Values present outside the removed range keep their position.
    /// Returns the removed values.
    template <std::ranges::input_range R>
    sequence_type splice( size_type const first, size_type const last, R && replacement )
    {
        check_range( first, last, "ordo::ordered_set::splice" );
        return to_sequence
        (
            base::splice
            (
                first, last, std::forward<R>( replacement ),
                []( base & core, auto && value ) { core.try_emplace( std::forward<decltype( value )>( value ) ); }
            )
        );
    }

    //--------------------------------------------------------------------------
    // Ordering
    //--------------------------------------------------------------------------
    void sort         () { base::sort_stable  ( value_less() ); }
    void sort_unstable() { base::sort_unstable( value_less() ); }

    /// `less( value_type const &, value_type const & )`
    template <typename Less>
    void sort_by( Less && less ) { base::sort_stable( projected_less( less ) ); }

    template <typename Less>
    void sort_unstable_by( Less && less ) { base::sort_unstable( projected_less( less ) ); }

    template <typename KeyOf>
    void sort_by_cached_key( KeyOf && key_of )
    {
        base::sort_by_cached_key( [ & ]( bucket_type const & b ) { return key_of( b.key ); } );
    }

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

    [[ nodiscard ]] search_result binary_search( param_t<value_type> value ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return detail::synth_three_way{}( b.key, value ); } );
    }

    /// `compare( value_type const & )` returns the ordering of the value
    /// relative to the target.
    template <typename Compare>
    [[ nodiscard ]] search_result binary_search_by( Compare && compare ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return compare( b.key ); } );
    }

    template <typename B, typename KeyOf>
    [[ nodiscard ]] search_result binary_search_by_key( B const & target, KeyOf && key_of ) const
    {
        return base::binary_search_by( [ & ]( bucket_type const & b ) { return detail::synth_three_way{}( key_of( b.key ), target ); } );
    }

    template <typename Pred>
    [[ nodiscard ]] size_type partition_point( Pred && pred ) const
    {
        return base::partition_point( [ & ]( bucket_type const & b ) { return static_cast<bool>( pred( b.key ) ); } );
    }

    //--------------------------------------------------------------------------
    // Set algebra
    //--------------------------------------------------------------------------

    /// Values of *this absent from `other`, in the order of *this.
    template <typename Other>
    [[ nodiscard ]] auto difference( Other const & other ) const { return detail::filter_by_membership<false>( *this, other ); }

    /// Values of *this present in `other`, in the order of *this.
    template <typename Other>
    [[ nodiscard ]] auto intersection( Other const & other ) const { return detail::filter_by_membership<true>( *this, other ); }

    /// difference( other ) followed by other.difference( *this ).
    template <typename Other>
    [[ nodiscard ]] auto symmetric_difference( Other const & other ) const
    {
        return detail::chain_view{ detail::filter_by_membership<false>( *this, other ), detail::filter_by_membership<false>( other, *this ) };
    }

    /// All of *this followed by other.difference( *this ).
    template <typename Other>
    [[ nodiscard ]] auto union_( Other const & other ) const
    {
        return detail::chain_view{ std::views::all( *this ), detail::filter_by_membership<false>( other, *this ) };
    }

    template <typename Other>
    [[ nodiscard ]] bool is_disjoint( Other const & other ) const
    {
        if ( size() <= other.size() )
            return std::none_of( begin(), end(), [ & ]( value_type const & value ) { return other.contains( value ); } );
        return std::none_of( other.begin(), other.end(), [ this ]( auto const & value ) { return contains( value ); } );
    }

    template <typename Other>
    [[ nodiscard ]] bool is_subset( Other const & other ) const
    {
        return ( size() <= other.size() ) && std::all_of( begin(), end(), [ & ]( value_type const & value ) { return other.contains( value ); } );
    }

    template <typename Other>
    [[ nodiscard ]] bool is_superset( Other const & other ) const
    {
        return ( other.size() <= size() ) && std::all_of( other.begin(), other.end(), [ this ]( auto const & value ) { return contains( value ); } );
    }

    /// Order insensitive equality.
    template <typename Other>
    [[ nodiscard ]] bool set_eq( Other const & other ) const { return ( size() == other.size() ) && is_subset( other ); }

    //--------------------------------------------------------------------------
    // Capabilities
    //--------------------------------------------------------------------------
    [[ nodiscard ]] mutable_values_access<ordered_set> mutable_values() noexcept { return mutable_values_access<ordered_set>{ *this }; }

    //--------------------------------------------------------------------------
    // Swap, order sensitive comparison and hashing
    //--------------------------------------------------------------------------
    void swap( ordered_set & other ) noexcept { base::swap( other ); }
    friend void swap( ordered_set & left, ordered_set & right ) noexcept { left.swap( right ); }

    friend bool operator==( ordered_set const & left, ordered_set const & right )
        requires std::equality_comparable<value_type>
    {
        return std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

    friend auto operator<=>( ordered_set const & left, ordered_set const & right )
        requires std::three_way_comparable<value_type>
    {
        return std::lexicographical_compare_three_way( left.begin(), left.end(), right.begin(), right.end() );
    }

    friend std::size_t hash_value( ordered_set const & set )
    {
        std::size_t seed{ 0 };
        boost::hash_combine( seed, set.size() );
        for ( auto const & value : set )
            boost::hash_combine( seed, value );
        return seed;
    }

private:
    explicit ordered_set( base && core ) noexcept : base( std::move( core ) ) {}

    void check_range( size_type const first, size_type const last, char const * const what ) const
    {
        if ( first > last || last > size() ) [[ unlikely ]]
            detail::throw_out_of_range( what );
    }

    void reserve_for_extension( size_type const incoming )
    {
        base::reserve( size() + ( empty() ? incoming : ( incoming + 1 ) / 2 ) );
    }

    sequence_type to_sequence( typename base::bucket_container && buckets ) const
    {
        sequence_type result( typename sequence_type::allocator_type( base::get_allocator() ) );
        result.reserve( buckets.size() );
        for ( auto & b : buckets )
            result.push_back( std::move( b.key ) );
        return result;
    }

    template <typename Remove>
    std::optional<value_type> take_value( auto const & value, Remove const remove )
    {
        auto const pos{ base::find( value ) };
        if ( pos == base::npos )
            return std::nullopt;
        return std::move( ( this->*remove )( pos ).key );
    }

    template <typename Remove>
    std::optional<std::pair<size_type, value_type>> take_full( auto const & value, Remove const remove )
    {
        auto const pos{ base::find( value ) };
        if ( pos == base::npos )
            return std::nullopt;
        return std::pair<size_type, value_type>{ pos, std::move( ( this->*remove )( pos ).key ) };
    }

    static auto value_less() noexcept
    {
        return []( bucket_type const & a, bucket_type const & b ) { return a.key < b.key; };
    }

    template <typename Less>
    static auto projected_less( Less & less ) noexcept
    {
        return [ &less ]( bucket_type const & a, bucket_type const & b ) { return static_cast<bool>( less( a.key, b.key ) ); };
    }
}; // class ordered_set

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------

template <typename T, typename Hash, typename KeyEqual, typename Allocator, ordo::ordered_options options>
struct std::hash<ordo::ordered_set<T, Hash, KeyEqual, Allocator, options>>
{
    std::size_t operator()( ordo::ordered_set<T, Hash, KeyEqual, Allocator, options> const & set ) const
    {
        return hash_value( set );
    }
};
//------------------------------------------------------------------------------
