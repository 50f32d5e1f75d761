////////////////////////////////////////////////////////////////////////////////
/// Entry views of ordered_map: short lived cursors bound to one pending
/// operation.
///
/// Contents:
///   - occupied_entry - found by key, exposes the entry's position, key and
///                      value; mutate, remove (either discipline), reposition
///   - indexed_entry  - the same operation set, found by position
///   - vacant_entry   - the key that was searched for (owned) plus the
///                      prepared index bucket; insert at the end, at the
///                      sorted position or at an explicit position
///   - entry          - occupied or vacant, with the or_insert* family
///
/// Views are move-only and can only be created by the map. Consuming
/// operations (removals, vacant insertions) end the view's usefulness: using
/// a consumed view is a precondition violation (asserted in debug builds). As
/// with any iterator the map must not be mutated through other paths while a
/// view is alive.
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
#include <ordo/containers/ordered_core.hpp>

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, ordered_options options>
class ordered_map;

template <typename Map> class mutable_keys_access;

namespace detail
{
    template <typename Core>
    class positioned_entry
    {
    public:
        using key_type    = typename Core::key_type;
        using mapped_type = typename Core::stored_type;
        using value_type  = std::pair<key_type, mapped_type>;
        using size_type   = typename Core::size_type;

        positioned_entry( positioned_entry && other ) noexcept
            : core_{ std::exchange( other.core_, nullptr ) }, index_{ other.index_ } {}
        positioned_entry & operator=( positioned_entry && other ) noexcept
        {
            core_  = std::exchange( other.core_, nullptr );
            index_ = other.index_;
            return *this;
        }

        [[ nodiscard ]] size_type index() const noexcept { return index_; }

        [[ nodiscard ]] key_type    const & key() const noexcept { return bucket().key  ; }
        [[ nodiscard ]] mapped_type const & get() const noexcept { return bucket().value; }
        [[ nodiscard ]] mapped_type       & get()       noexcept { return bucket().value; }

        // reference to the value, valid for as long as the entry stays in place
        [[ nodiscard ]] mapped_type & into_mut() noexcept { return bucket().value; }

        [[ nodiscard ]] std::pair<key_type const &, mapped_type const &> get_key_value() const noexcept
        {
            auto const & b{ bucket() };
            return { b.key, b.value };
        }

        /// Replaces the value, returns the old one.
        mapped_type insert( mapped_type value )
        {
            return std::exchange( bucket().value, std::move( value ) );
        }

        mapped_type remove      () { return shift_remove(); }
        mapped_type shift_remove() { return consume().shift_remove( index_ ).value; }
        mapped_type swap_remove () { return consume().swap_remove ( index_ ).value; }

        value_type remove_entry      () { return shift_remove_entry(); }
        value_type shift_remove_entry() { return to_value( consume().shift_remove( index_ ) ); }
        value_type swap_remove_entry () { return to_value( consume().swap_remove ( index_ ) ); }

        /// Moves the entry to position `to`, shifting the entries in between.
        void move_index( size_type const to )
        {
            if ( to >= core().size() ) [[ unlikely ]]
                detail::throw_out_of_range( "ordo::ordered_map::entry::move_index" );
            core().move_index( index_, to );
            index_ = to;
        }

        /// Swaps the positions of this entry and the entry at `other`.
        void swap_indices( size_type const other )
        {
            if ( other >= core().size() ) [[ unlikely ]]
                detail::throw_out_of_range( "ordo::ordered_map::entry::swap_indices" );
            core().swap_indices( index_, other );
            index_ = other;
        }

    protected:
        positioned_entry( Core & core, size_type const index ) noexcept : core_{ &core }, index_{ index } {}
        ~positioned_entry() = default;

        // through the mutable_keys/raw entry capabilities only
        [[ nodiscard ]] key_type & key_mut() noexcept { return bucket().key; }

        [[ nodiscard ]] Core & core() const noexcept
        {
            BOOST_ASSERT_MSG( core_, "Use of a consumed entry view" );
            return *core_;
        }

        [[ nodiscard ]] auto & bucket() const noexcept { return core().at_position( index_ ); }

        Core & consume() noexcept
        {
            BOOST_ASSERT_MSG( core_, "Entry view consumed twice" );
            return *std::exchange( core_, nullptr );
        }

        static value_type to_value( typename Core::bucket_type && b ) { return { std::move( b.key ), std::move( b.value ) }; }

    private:
        Core *    core_;
        size_type index_;
    }; // class positioned_entry
} // namespace detail


template <typename Core>
class occupied_entry : public detail::positioned_entry<Core>
{
    using base = detail::positioned_entry<Core>;

public:
    occupied_entry( occupied_entry && ) noexcept = default;
    occupied_entry & operator=( occupied_entry && ) noexcept = default;

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;
    template <typename> friend class mutable_keys_access;

    occupied_entry( Core & core, typename base::size_type const index ) noexcept : base( core, index ) {}
}; // class occupied_entry


template <typename Core>
class indexed_entry : public detail::positioned_entry<Core>
{
    using base = detail::positioned_entry<Core>;

public:
    indexed_entry( indexed_entry && ) noexcept = default;
    indexed_entry & operator=( indexed_entry && ) noexcept = default;

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;
    template <typename> friend class mutable_keys_access;

    indexed_entry( Core & core, typename base::size_type const index ) noexcept : base( core, index ) {}
}; // class indexed_entry


template <typename Core>
class vacant_entry
{
public:
    using key_type     = typename Core::key_type;
    using mapped_type  = typename Core::stored_type;
    using size_type    = typename Core::size_type;
    using probe_result = typename Core::probe_result;

    vacant_entry( vacant_entry && other ) noexcept( std::is_nothrow_move_constructible_v<key_type> )
        :
        core_{ std::exchange( other.core_, nullptr ) },
        key_ { std::move( other.key_ ) },
        hash_{ other.hash_ },
        slot_{ other.slot_ }
    {}
    vacant_entry & operator=( vacant_entry && ) = delete;

    /// The position the new entry would occupy when inserted at the end.
    [[ nodiscard ]] size_type index() const noexcept { return core().size(); }

    [[ nodiscard ]] key_type const & key() const noexcept { return key_; }

    [[ nodiscard ]] key_type into_key()
    {
        consume();
        return std::move( key_ );
    }

    /// Appends the entry, returns a reference to its value.
    mapped_type & insert( mapped_type value )
    {
        auto &     core{ consume() };
        auto const pos { core.emplace_vacant( slot_, hash_, std::move( key_ ), std::move( value ) ) };
        return core.at_position( pos ).value;
    }

    /// Inserts at the position found by a binary search over the keys
    /// (assuming they are sorted; otherwise at some valid position).
    std::pair<size_type, mapped_type &> insert_sorted( mapped_type value )
    {
        auto & core{ consume() };
        auto const pos
        {
            core.binary_search_by
            (
                [ this ]( auto const & b ) { return detail::synth_three_way{}( b.key, std::as_const( key_ ) ); }
            ).index
        };
        auto const last{ core.emplace_vacant( slot_, hash_, std::move( key_ ), std::move( value ) ) };
        core.move_index( last, pos );
        return { pos, core.at_position( pos ).value };
    }

    /// Inserts at `index` (<= size()), shifting the following entries.
    mapped_type & shift_insert( size_type const index, mapped_type value )
    {
        if ( index > core().size() ) [[ unlikely ]]
            detail::throw_out_of_range( "ordo::ordered_map::vacant_entry::shift_insert" );
        auto &     core{ consume() };
        auto const last{ core.emplace_vacant( slot_, hash_, std::move( key_ ), std::move( value ) ) };
        core.move_index( last, index );
        return core.at_position( index ).value;
    }

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;
    template <typename> friend class mutable_keys_access;

    vacant_entry( Core & core, key_type && key, std::size_t const hash, probe_result const slot ) noexcept( std::is_nothrow_move_constructible_v<key_type> )
        : core_{ &core }, key_{ std::move( key ) }, hash_{ hash }, slot_{ slot } {}

    [[ nodiscard ]] key_type & key_mut() noexcept { return key_; }

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

    Core *       core_;
    key_type     key_ ;
    std::size_t  hash_;
    probe_result slot_;
}; // class vacant_entry


template <typename Core>
class entry
{
public:
    using key_type    = typename Core::key_type;
    using mapped_type = typename Core::stored_type;
    using size_type   = typename Core::size_type;

    entry( entry && ) = default;

    [[ nodiscard ]] bool is_occupied() const noexcept { return state_.index() == 0; }
    [[ nodiscard ]] bool is_vacant  () const noexcept { return state_.index() == 1; }

    [[ nodiscard ]] occupied_entry<Core> * occupied() noexcept { return std::get_if<0>( &state_ ); }
    [[ nodiscard ]] vacant_entry  <Core> * vacant  () noexcept { return std::get_if<1>( &state_ ); }

    [[ nodiscard ]] size_type index() const noexcept
    {
        return std::visit( []( auto const & view ) noexcept { return view.index(); }, state_ );
    }

    [[ nodiscard ]] key_type const & key() const noexcept
    {
        return std::visit( []( auto const & view ) noexcept -> key_type const & { return view.key(); }, state_ );
    }

    mapped_type & or_insert( mapped_type default_value )
    {
        if ( auto * const found{ occupied() } )
            return found->into_mut();
        return vacant()->insert( std::move( default_value ) );
    }

    template <typename F>
    mapped_type & or_insert_with( F && make_value )
    {
        if ( auto * const found{ occupied() } )
            return found->into_mut();
        return vacant()->insert( std::invoke( std::forward<F>( make_value ) ) );
    }

    /// `make_value( key_type const & )`
    template <typename F>
    mapped_type & or_insert_with_key( F && make_value )
    {
        if ( auto * const found{ occupied() } )
            return found->into_mut();
        auto & pending{ *vacant() };
        return pending.insert( std::invoke( std::forward<F>( make_value ), pending.key() ) );
    }

    mapped_type & or_default() requires std::default_initializable<mapped_type>
    {
        return or_insert_with( [] { return mapped_type{}; } );
    }

    /// Calls `modify( mapped_type & )` on an occupied entry.
    template <typename F>
    entry & and_modify( F && modify ) &
    {
        if ( auto * const found{ occupied() } )
            std::invoke( std::forward<F>( modify ), found->get() );
        return *this;
    }

    template <typename F>
    entry && and_modify( F && modify ) &&
    {
        return std::move( and_modify( std::forward<F>( modify ) ) );
    }

private:
    template <typename, typename, typename, typename, typename, ordered_options> friend class ordered_map;
    template <typename> friend class mutable_keys_access;

    explicit entry( occupied_entry<Core> && view ) noexcept : state_{ std::in_place_index<0>, std::move( view ) } {}
    explicit entry( vacant_entry  <Core> && view )          : state_{ std::in_place_index<1>, std::move( view ) } {}

    std::variant<occupied_entry<Core>, vacant_entry<Core>> state_;
}; // class entry

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
