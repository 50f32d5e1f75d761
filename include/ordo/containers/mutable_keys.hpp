////////////////////////////////////////////////////////////////////////////////
/// Opt-in mutable key access for ordered_map (mutable_keys()) and mutable
/// value access for ordered_set (mutable_values()).
///
/// The stored key of an entry is otherwise only reachable through const
/// references: modifying it in a way that changes its hash or its equality
/// with other keys makes the entry unreachable by key lookup. These access
/// objects hand out mutable references for the cases where that cannot
/// happen (e.g. updating a member of the key that does not take part in
/// hashing and comparison). The hazard is documented, not detected.
///
/// Only the containers can construct the access objects.
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

#include <ordo/containers/entry.hpp>
#include <ordo/containers/lookup.hpp>

#include <cstddef>
#include <optional>
#include <ranges>
#include <tuple>
#include <utility>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

template <typename Map>
class mutable_keys_access
{
public:
    using key_type    = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;
    using size_type   = typename Map::size_type;

    [[ nodiscard ]] std::optional<std::tuple<size_type, key_type &, mapped_type &>> get_full_mut2( LookupType<Map::transparent, key_type> auto const & key ) const
    {
        auto const pos{ core().find( key ) };
        if ( pos == Map::core_type::npos )
            return std::nullopt;
        auto & b{ core().at_position( pos ) };
        return std::tuple<size_type, key_type &, mapped_type &>{ pos, b.key, b.value };
    }

    [[ nodiscard ]] std::optional<std::pair<key_type &, mapped_type &>> get_index_mut2( size_type const index ) const noexcept
    {
        if ( index >= core().size() )
            return std::nullopt;
        auto & b{ core().at_position( index ) };
        return std::pair<key_type &, mapped_type &>{ b.key, b.value };
    }

    /// Random access range of std::pair<key_type &, mapped_type &>.
    [[ nodiscard ]] auto iter_mut2() const noexcept { return map_->key_mutable_range(); }

    /// Keeps the entries for which `keep( key_type &, mapped_type & )`
    /// returns true, in their original relative order.
    template <typename Keep>
    void retain2( Keep && keep ) const
    {
        core().retain( [ & ]( auto & b ) { return static_cast<bool>( keep( b.key, b.value ) ); } );
    }

    template <typename Core> [[ nodiscard ]] key_type & key_mut( occupied_entry<Core> & view ) const noexcept { return view.key_mut(); }
    template <typename Core> [[ nodiscard ]] key_type & key_mut( indexed_entry <Core> & view ) const noexcept { return view.key_mut(); }
    template <typename Core> [[ nodiscard ]] key_type & key_mut( vacant_entry  <Core> & view ) const noexcept { return view.key_mut(); }

    template <typename Core>
    [[ nodiscard ]] key_type & key_mut( entry<Core> & view ) const noexcept
    {
        if ( auto * const found{ view.occupied() } )
            return key_mut( *found );
        return key_mut( *view.vacant() );
    }

private:
    friend Map;

    explicit mutable_keys_access( Map & map ) noexcept : map_{ &map } {}

    [[ nodiscard ]] typename Map::core_type & core() const noexcept { return *map_; }

    Map * map_;
}; // class mutable_keys_access


template <typename Set>
class mutable_values_access
{
public:
    using value_type = typename Set::value_type;
    using size_type  = typename Set::size_type;

    [[ nodiscard ]] std::optional<std::pair<size_type, value_type &>> get_full_mut2( LookupType<Set::transparent, value_type> auto const & value ) const
    {
        auto const pos{ core().find( value ) };
        if ( pos == Set::core_type::npos )
            return std::nullopt;
        return std::pair<size_type, value_type &>{ pos, core().at_position( pos ).key };
    }

    [[ nodiscard ]] value_type * get_index_mut2( size_type const index ) const noexcept
    {
        if ( index >= core().size() )
            return nullptr;
        return &core().at_position( index ).key;
    }

    /// Keeps the values for which `keep( value_type & )` returns true.
    template <typename Keep>
    void retain2( Keep && keep ) const
    {
        core().retain( [ & ]( auto & b ) { return static_cast<bool>( keep( b.key ) ); } );
    }

private:
    friend Set;

    explicit mutable_values_access( Set & set ) noexcept : set_{ &set } {}

    [[ nodiscard ]] typename Set::core_type & core() const noexcept { return *set_; }

    Set * set_;
}; // class mutable_values_access

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
