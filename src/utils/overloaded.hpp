// Copyright (c) 2024 Gevorg Voskanyan
// Copyright (c) 2024 The Firo Core developers
// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_UTILS_OVERLOADED_HPP_INCLUDED
#define SPLITMINT_UTILS_OVERLOADED_HPP_INCLUDED

namespace utils {

// visitor built from a set of lambdas, for std::visit()
template < class... Ts >
struct overloaded : Ts... {
   using Ts::operator()...;
};

template < class... Ts >
overloaded( Ts... ) -> overloaded< Ts... >;

}   // namespace utils

#endif   // SPLITMINT_UTILS_OVERLOADED_HPP_INCLUDED
