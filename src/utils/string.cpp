// Copyright (c) 2025 Gevorg Voskanyan
// Copyright (c) 2025 The Firo Core developers
// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "string.hpp"

namespace utils {

std::string abbreviate_for_display( std::string s, const std::size_t threshold )
{
   constexpr std::size_t ellipsis_length = 3;
   if ( s.size() > threshold && threshold > ellipsis_length ) {
      const auto tail_length = ( threshold - ellipsis_length ) / 2;
      const auto head_length = threshold - ellipsis_length - tail_length;
      s.replace( head_length, s.size() - head_length - tail_length, "..." );
   }
   return s;
}

std::string join_for_display( std::span< const std::string > items, const std::size_t threshold )
{
   std::string ret = "[";
   for ( const auto &item : items ) {
      if ( ret.size() > 1 )
         ret += ", ";
      ret += abbreviate_for_display( item, threshold );
   }
   return ret += ']';
}

}   // namespace utils
