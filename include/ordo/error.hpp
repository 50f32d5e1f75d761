////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Recoverable error conditions reported by the fallible (try_*) entry points.
///
/// Copyright (c) Domagoj Saric 2015 - 2024.
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

#include <psi/err/fallible_result.hpp>

#include <cstddef>
#include <cstdint>
#include <new>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

struct try_reserve_error
{
    enum class kind : std::uint8_t
    {
        capacity_overflow,  // the requested capacity exceeds max_size() (or overflows size_type)
        allocation_failure, // the allocator failed to provide the memory
    };

    kind        reason   ;
    std::size_t requested; // total number of elements that were asked for

    [[ nodiscard ]] char const * what() const noexcept;

    friend constexpr bool operator==( try_reserve_error const &, try_reserve_error const & ) noexcept = default;

    // what an uninspected failed fallible_result throws
    friend std::bad_alloc make_exception( try_reserve_error const & ) noexcept { return {}; }
}; // struct try_reserve_error

template <typename Result = void>
using fallible_result = psi::err::fallible_result<Result, try_reserve_error>;

template <typename Result = void>
using result_or_error = psi::err::result_or_error<Result, try_reserve_error>;

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
