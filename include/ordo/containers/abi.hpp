////////////////////////////////////////////////////////////////////////////////
/// Parameter passing and cold-path helpers shared by the ordo containers.
///
/// Contents:
///   - can_be_passed_in_reg<T>              (trait: pass by value vs const &)
///   - param_t<T>                           (optimal read-only parameter type)
///   - make_trivially_copyable_predicate()  (for algorithms taking predicates by value)
///   - ORDO_NO_UNIQUE_ADDRESS               (EBO for hasher/key_eq/allocator members)
///   - detail::throw_out_of_range/throw_bad_alloc (out-of-line, cold)
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
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
#ifdef _MSC_VER
#   define ORDO_NO_UNIQUE_ADDRESS [[ msvc::no_unique_address ]]
#else
#   define ORDO_NO_UNIQUE_ADDRESS [[ no_unique_address ]]
#endif
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// Small trivially copyable keys are passed by value, everything else by const
// reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV (ignoring the MS x64 disaster)
}; // can_be_passed_in_reg

template <typename T>
using param_t = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


// utility for passing non trivial predicates to algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && pred ) noexcept
{
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * what );
    [[ noreturn, gnu::cold ]] void throw_bad_alloc   ();
} // namespace detail

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
