// Copyright (c) 2025 Gevorg Voskanyan
// Copyright (c) 2025 The Firo Core developers
// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_UTILS_STRING_HPP_INCLUDED
#define SPLITMINT_UTILS_STRING_HPP_INCLUDED

#include <cstddef>
#include <span>
#include <string>

namespace utils {

// Keeps both ends of an overly long string (an address, a metadata URI) and elides its middle
std::string abbreviate_for_display( std::string s, std::size_t threshold = 100 );

// "[a, b, c]", each element abbreviated
std::string join_for_display( std::span< const std::string > items, std::size_t threshold = 24 );

}   // namespace utils

#endif   // SPLITMINT_UTILS_STRING_HPP_INCLUDED
