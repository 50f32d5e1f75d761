////////////////////////////////////////////////////////////////////////////////
/// Sort dispatch for the reordering operations of the ordo containers.
///
/// Contents:
///   - Komparator<Comparator> - EBO wrapper with sort() and stable_sort()
///
/// Entry reordering (sort_keys, sort_by, sort_unstable_by...) sorts a list of
/// entry positions, then moves the entries into that order and rebuilds the
/// hash index.
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

#include <boost/move/algo/adaptive_sort.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>

#include <iterator>
#include <type_traits>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

/// Publicly inherits from Comparator for empty-base optimisation. Being an
/// aggregate, Komparator<C>{ c } wraps any comparator (including closures)
/// without forwarding constructors.
///
/// sort():
///   1. Comparator's own sort() if provided (e.g. radix sort)
///   2. pdqsort_branchless if Comparator::is_branchless
///   3. pdqsort (default fallback)
/// stable_sort(): Boost.Move adaptive_sort (in place merge sort which uses
/// no extra allocation, preserving the relative order of equal elements).
template <typename Comparator>
struct Komparator : Comparator
{
    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    template <std::random_access_iterator It>
    constexpr void sort( It const first, It const last ) const
    {
        if constexpr ( requires{ comp().sort( first, last ); } )
            comp().sort( first, last );
        else if constexpr ( requires{ Comparator::is_branchless; requires( Comparator::is_branchless ); } )
            boost::sort::pdqsort_branchless( first, last, make_trivially_copyable_predicate( comp() ) );
        else
            boost::sort::pdqsort( first, last, make_trivially_copyable_predicate( comp() ) );
    }

    template <std::random_access_iterator It>
    void stable_sort( It const first, It const last ) const
    {
        boost::movelib::adaptive_sort( first, last, make_trivially_copyable_predicate( comp() ) );
    }
}; // struct Komparator

template <typename Comparator>
Komparator( Comparator ) -> Komparator<Comparator>;

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
