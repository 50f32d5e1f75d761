////////////////////////////////////////////////////////////////////////////////
/// Raw entry access to ordered_map: lookups and insertions keyed by a caller
/// supplied hash and matcher instead of the map's own key type.
///
/// Escape hatch contract: the hash passed to the *_hashed_nocheck and
/// from_hash* functions must be the one the map's hasher computes for the
/// matching key, and keys must never be mutated (key_mut, insert_key) in a
/// way that changes their hash or equality. Violations are not detected: the
/// affected entries merely become unreachable by key (they are still
/// iterated, positionally accessible and destroyed normally).
///
/// Both builders are capability objects: only ordered_map can create them
/// (raw_entry_v1() / raw_entry_mut_v1()).
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
#include <ordo/containers/ordered_core.hpp>

#include <boost/assert.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

template <typename Core> class raw_entry_builder_mut;
template <typename Core> class raw_entry_mut;

//==============================================================================
// Immutable lookups
//==============================================================================

template <typename Core>
class raw_entry_builder
{
public:
    using key_type        = typename Core::key_type;
    using mapped_type     = typename Core::stored_type;
    using size_type       = typename Core::size_type;
    using const_reference = std::pair<key_type const &, mapped_type const &>;

    template <typename K>
    [[ nodiscard ]] std::optional<const_reference> from_key( K const & key ) const
    {
        return from_key_hashed_nocheck( core_->hash_of( key ), key );
    }

    template <typename K>
    [[ nodiscard ]] std::optional<const_reference> from_key_hashed_nocheck( std::size_t const hash, K const & key ) const
    {
        return at( core_->empty() ? Core::npos : core_->probe( hash, key ).index );
    }

    /// `is_match( key_type const & )`
    template <typename Match>
    [[ nodiscard ]] std::optional<const_reference> from_hash( std::size_t const hash, Match && is_match ) const
    {
        return at( core_->find_hashed( hash, std::forward<Match>( is_match ) ) );
    }

    template <typename Match>
    [[ nodiscard ]] std::optional<std::tuple<size_type, key_type const &, mapped_type const &>> from_hash_full( std::size_t const hash, Match && is_match ) const
    {
        auto const pos{ core_->find_hashed( hash, std::forward<Match>( is_match ) ) };
        if ( pos == Core::npos )
            return std::nullopt;
        auto const & b{ core_->at_position( pos ) };
        return std::tuple<size_type, key_type const &, mapped_type const &>{ pos, b.key, b.value };
    }

    template <typename Match>
    [[ nodiscard ]] std::optional<size_type> index_from_hash( std::size_t const hash, Match && is_match ) const
    {
        auto const pos{ core_->find_hashed( hash, std::forward<Match>( is_match ) ) };
        if ( pos == Core::npos )
            return std::nullopt;
        return pos;
    }

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;

    explicit raw_entry_builder( Core const & core ) noexcept : core_{ &core } {}

    std::optional<const_reference> at( size_type const pos ) const
    {
        if ( pos == Core::npos )
            return std::nullopt;
        auto const & b{ core_->at_position( pos ) };
        return const_reference{ b.key, b.value };
    }

    Core const * core_;
}; // class raw_entry_builder


//==============================================================================
// Mutable views
//==============================================================================

template <typename Core>
class raw_occupied_entry : public detail::positioned_entry<Core>
{
    using base = detail::positioned_entry<Core>;

public:
    using typename base::key_type;
    using typename base::mapped_type;
    using typename base::size_type;

    raw_occupied_entry( raw_occupied_entry && ) noexcept = default;
    raw_occupied_entry & operator=( raw_occupied_entry && ) noexcept = default;

    using base::key_mut;

    [[ nodiscard ]] std::pair<key_type &, mapped_type &> get_key_value_mut() noexcept
    {
        auto & b{ base::bucket() };
        return { b.key, b.value };
    }

    /// Replaces the stored key (which must be equivalent to the old one),
    /// returns the old key.
    key_type insert_key( key_type key )
    {
        return std::exchange( base::bucket().key, std::move( key ) );
    }

private:
    friend class raw_entry_builder_mut<Core>;
    friend class raw_entry_mut<Core>;

    raw_occupied_entry( Core & core, size_type const index ) noexcept : base( core, index ) {}
}; // class raw_occupied_entry


template <typename Core>
class raw_vacant_entry
{
public:
    using key_type    = typename Core::key_type;
    using mapped_type = typename Core::stored_type;
    using size_type   = typename Core::size_type;

    raw_vacant_entry( raw_vacant_entry && other ) noexcept : core_{ std::exchange( other.core_, nullptr ) } {}
    raw_vacant_entry & operator=( raw_vacant_entry && other ) noexcept
    {
        core_ = std::exchange( other.core_, nullptr );
        return *this;
    }

    [[ nodiscard ]] size_type index() const noexcept { return core().size(); }

    std::pair<key_type &, mapped_type &> insert( key_type key, mapped_type value )
    {
        auto const hash{ core().hash_of( std::as_const( key ) ) };
        return insert_hashed_nocheck( hash, std::move( key ), std::move( value ) );
    }

    std::pair<key_type &, mapped_type &> insert_hashed_nocheck( std::size_t const hash, key_type key, mapped_type value )
    {
        auto &     core{ consume() };
        auto const pos { core.emplace_unchecked( hash, std::move( key ), std::move( value ) ) };
        auto &     b   { core.at_position( pos ) };
        return { b.key, b.value };
    }

    std::pair<key_type &, mapped_type &> shift_insert( size_type const index, key_type key, mapped_type value )
    {
        auto const hash{ core().hash_of( std::as_const( key ) ) };
        return shift_insert_hashed_nocheck( index, hash, std::move( key ), std::move( value ) );
    }

    std::pair<key_type &, mapped_type &> shift_insert_hashed_nocheck( size_type const index, std::size_t const hash, key_type key, mapped_type value )
    {
        if ( index > core().size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::raw_vacant_entry::shift_insert" );
        auto &     core{ consume() };
        auto const last{ core.emplace_unchecked( hash, std::move( key ), std::move( value ) ) };
        core.move_index( last, index );
        auto & b{ core.at_position( index ) };
        return { b.key, b.value };
    }

private:
    friend class raw_entry_builder_mut<Core>;
    friend class raw_entry_mut<Core>;

    explicit raw_vacant_entry( Core & core ) noexcept : core_{ &core } {}

    [[ nodiscard ]] Core & core() const noexcept
    {
        BOOST_ASSERT_MSG( core_, "Use of a consumed entry view" );
        return *core_;
    }

    Core & consume() noexcept
    {
        BOOST_ASSERT_MSG( core_, "Entry view consumed twice" );
        return *std::exchange( core_, nullptr );
    }

    Core * core_;
}; // class raw_vacant_entry


template <typename Core>
class raw_entry_mut
{
public:
    using key_type    = typename Core::key_type;
    using mapped_type = typename Core::stored_type;
    using size_type   = typename Core::size_type;

    raw_entry_mut( raw_entry_mut && ) noexcept = default;

    [[ nodiscard ]] bool is_occupied() const noexcept { return state_.index() == 0; }

    [[ nodiscard ]] raw_occupied_entry<Core> * occupied() noexcept { return std::get_if<0>( &state_ ); }
    [[ nodiscard ]] raw_vacant_entry  <Core> * vacant  () noexcept { return std::get_if<1>( &state_ ); }

    [[ nodiscard ]] size_type index() const noexcept
    {
        return std::visit( []( auto const & view ) noexcept { return view.index(); }, state_ );
    }

    std::pair<key_type &, mapped_type &> or_insert( key_type default_key, mapped_type default_value )
    {
        if ( auto * const found{ occupied() } )
            return found->get_key_value_mut();
        return vacant()->insert( std::move( default_key ), std::move( default_value ) );
    }

    /// `make_entry()` returns a std::pair<key_type, mapped_type>.
    template <typename F>
    std::pair<key_type &, mapped_type &> or_insert_with( F && make_entry )
    {
        if ( auto * const found{ occupied() } )
            return found->get_key_value_mut();
        auto [ key, value ]{ std::invoke( std::forward<F>( make_entry ) ) };
        return vacant()->insert( std::move( key ), std::move( value ) );
    }

    /// Calls `modify( key_type &, mapped_type & )` on an occupied entry.
    template <typename F>
    raw_entry_mut & and_modify( F && modify ) &
    {
        if ( auto * const found{ occupied() } )
        {
            auto [ key, value ]{ found->get_key_value_mut() };
            std::invoke( std::forward<F>( modify ), key, value );
        }
        return *this;
    }

    template <typename F>
    raw_entry_mut && and_modify( F && modify ) &&
    {
        return std::move( and_modify( std::forward<F>( modify ) ) );
    }

private:
    friend class raw_entry_builder_mut<Core>;

    explicit raw_entry_mut( raw_occupied_entry<Core> && view ) noexcept : state_{ std::in_place_index<0>, std::move( view ) } {}
    explicit raw_entry_mut( raw_vacant_entry  <Core> && view ) noexcept : state_{ std::in_place_index<1>, std::move( view ) } {}

    std::variant<raw_occupied_entry<Core>, raw_vacant_entry<Core>> state_;
}; // class raw_entry_mut


template <typename Core>
class raw_entry_builder_mut
{
public:
    using size_type = typename Core::size_type;

    template <typename K>
    [[ nodiscard ]] raw_entry_mut<Core> from_key( K const & key )
    {
        return from_key_hashed_nocheck( core_->hash_of( key ), key );
    }

    template <typename K>
    [[ nodiscard ]] raw_entry_mut<Core> from_key_hashed_nocheck( std::size_t const hash, K const & key )
    {
        return make( core_->empty() ? Core::npos : core_->probe( hash, key ).index );
    }

    /// `is_match( key_type const & )`
    template <typename Match>
    [[ nodiscard ]] raw_entry_mut<Core> from_hash( std::size_t const hash, Match && is_match )
    {
        return make( core_->find_hashed( hash, std::forward<Match>( is_match ) ) );
    }

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;

    explicit raw_entry_builder_mut( Core & core ) noexcept : core_{ &core } {}

    raw_entry_mut<Core> make( size_type const pos ) const
    {
        if ( pos != Core::npos )
            return raw_entry_mut<Core>{ raw_occupied_entry<Core>{ *core_, pos } };
        return raw_entry_mut<Core>{ raw_vacant_entry<Core>{ *core_ } };
    }

    Core * core_;
}; // class raw_entry_builder_mut

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
