////////////////////////////////////////////////////////////////////////////////
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
#include <ordo/containers/abi.hpp>
#include <ordo/error.hpp>

#include <new>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const what ) { throw std::out_of_range( what ); }
    [[ noreturn, gnu::cold ]] void throw_bad_alloc   (                         ) { throw std::bad_alloc(); }
} // namespace detail

char const * try_reserve_error::what() const noexcept
{
    switch ( reason )
    {
        case kind::capacity_overflow : return "ordo: requested capacity exceeds the maximum size";
        case kind::allocation_failure: return "ordo: memory allocation failed";
    }
    return "ordo: unknown reservation error";
}

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
