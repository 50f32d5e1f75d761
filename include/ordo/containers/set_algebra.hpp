////////////////////////////////////////////////////////////////////////////////
/// Lazy, order preserving set algebra views for ordered_set.
///
/// difference and intersection are filtered views of the left operand;
/// symmetric_difference and union_ concatenate two such views through
/// chain_view. All views reference both operands: they must not outlive them
/// and are invalidated by any mutation of either.
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

#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------
namespace detail
{
//------------------------------------------------------------------------------

template <std::ranges::view First, std::ranges::view Second>
requires std::same_as<std::ranges::range_reference_t<First>, std::ranges::range_reference_t<Second>>
class chain_view : public std::ranges::view_interface<chain_view<First, Second>>
{
    using first_iterator  = std::ranges::iterator_t<First >;
    using second_iterator = std::ranges::iterator_t<Second>;

public:
    class iterator
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = std::ranges::range_value_t<First>;
        using difference_type   = std::ptrdiff_t;
        using reference         = std::ranges::range_reference_t<First>;
        using pointer           = void;

        iterator() = default;
        iterator( first_iterator const first, first_iterator const first_end, second_iterator const second )
            : first_{ first }, first_end_{ first_end }, second_{ second } {}

        reference operator*() const { return ( first_ != first_end_ ) ? *first_ : *second_; }

        iterator & operator++()
        {
            if ( first_ != first_end_ ) ++first_;
            else                        ++second_;
            return *this;
        }
        iterator operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

        friend bool operator==( iterator const & a, iterator const & b ) { return ( a.first_ == b.first_ ) && ( a.second_ == b.second_ ); }

    private:
        first_iterator  first_    {};
        first_iterator  first_end_{};
        second_iterator second_   {};
    }; // class iterator

    chain_view() = default;
    chain_view( First first, Second second ) : first_{ std::move( first ) }, second_{ std::move( second ) } {}

    // filter_view caches its begin so iteration needs a non-const view
    iterator begin() { return { std::ranges::begin( first_ ), std::ranges::end( first_ ), std::ranges::begin( second_ ) }; }
    iterator end  () { return { std::ranges::end  ( first_ ), std::ranges::end( first_ ), std::ranges::end  ( second_ ) }; }

private:
    First  first_ ;
    Second second_;
}; // class chain_view

template <typename First, typename Second>
chain_view( First, Second ) -> chain_view<First, Second>;


/// The elements of `left` that are (Keep == true) or are not (Keep == false)
/// contained in `right`, in the order of `left`.
template <bool Keep, typename Left, typename Right>
[[ nodiscard ]] auto filter_by_membership( Left const & left, Right const & right )
{
    return std::views::filter
    (
        left,
        [ other = &right ]( auto const & value ) { return other->contains( value ) == Keep; }
    );
}

//------------------------------------------------------------------------------
} // namespace detail
//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
