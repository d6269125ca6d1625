// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_IDENTIFICATION_HPP_INCLUDED
#define SPLITMINT_IDENTIFICATION_HPP_INCLUDED

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

namespace splitmint {

template < typename E >
concept Enum = std::is_enum_v< E >;

// TODO C++23: remove and replace usages with std::to_underlying()
constexpr auto to_underlying( Enum auto e ) noexcept
{
   return static_cast< std::underlying_type_t< decltype( e ) > >( e );
}

using token_id_underlying_type = std::uint64_t;

enum class token_id_t : token_id_underlying_type {};

// the smallest unit of the payment asset
using amount_t = std::uint64_t;

// The empty string is the null address, never a valid owner, recipient or administrator
using address_t = std::string;

inline bool is_null_address( const address_t &a ) noexcept
{
   return a.empty();
}

constexpr token_id_t first_token_id{ 1 };
constexpr token_id_t max_allowed_token_id_value{ std::numeric_limits< token_id_underlying_type >::max() - 10 };   // leaving some breathing room...

inline std::ostream &operator<<( std::ostream &os, token_id_t t )
{
   return os << to_underlying( t );
}

}   // namespace splitmint

#endif   // SPLITMINT_IDENTIFICATION_HPP_INCLUDED
