////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for the ordo hashed containers.
///
/// Provides:
///   - transparent_lookup<Hash, KeyEqual> - trait: heterogeneous lookup enabled?
///   - LookupType concept                 - constrains lookup key types
///
/// Used by ordered_map and ordered_set to merge the traditional two-overload
/// lookup pattern (non-template + constrained template) into a single
/// constrained template per function.
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

#include <concepts>
#include <type_traits>
//------------------------------------------------------------------------------
namespace ordo
{
//------------------------------------------------------------------------------

/// Heterogeneous lookup follows the std unordered container convention
/// (P0919/P1690): it is enabled only when both the hasher and the key
/// equality predicate declare is_transparent, as a transparent KeyEqual paired
/// with a non-transparent Hash would hash a converted temporary and compare the
/// original (or vice versa) - a recipe for silently missed lookups.
template <typename Hash, typename KeyEqual>
bool constexpr transparent_lookup
{
    requires{ typename Hash    ::is_transparent; } &&
    requires{ typename KeyEqual::is_transparent; }
};

/// LookupType - constrains which key types a hashed container's lookup
/// functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the hasher and key_eq are transparent, allowing heterogeneous lookup
///       with any type they accept (e.g. std::string_view for std::string
///       keys), or
///   (b) K is implicitly convertible to key_type - the conversion happens at
///       the hasher/key_eq call sites.
///       (This subsumes the K == key_type case via identity conversion.)
///
/// This replaces the pattern of providing two overloads per lookup:
///   iterator find( key_type const & );                                  // always
///   template<class K> iterator find( K const & ) requires transparent;  // conditional
/// with a single constrained template:
///   iterator find( LookupType<transparent, key_type> auto const & );
template <typename K, bool transparent, typename StoredKeyType>
concept LookupType =
    transparent ||
    std::convertible_to<K const &, StoredKeyType const &>;

//------------------------------------------------------------------------------
} // namespace ordo
//------------------------------------------------------------------------------
