// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_CONFIGURATION_HPP_INCLUDED
#define SPLITMINT_CONFIGURATION_HPP_INCLUDED

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "identification.hpp"
#include "log.hpp"

namespace splitmint {

struct MintConfiguration {
   token_id_t max_supply{ 0 };   // highest valid token ID
   amount_t min_mint_amount = 0;
   address_t payment_asset;

   bool operator==( const MintConfiguration &rhs ) const noexcept = default;
};

std::ostream &operator<<( std::ostream &os, const MintConfiguration &c );

// Throws MintError with mint_errc::invalid_configuration unless `c` is usable
void validate( const MintConfiguration &c );

struct Settings {
   address_t administrator;
   MintConfiguration mint;
   LogOptions logging;
   std::vector< std::string > debug;
};

// Reads `key=value` lines, '#' starting a comment. Keys: administrator, maxsupply, minmintamount, paymentasset, logfile, printtoconsole,
// logtimestamps and debug (repeatable). Throws ConfigurationError.
Settings load_settings( const boost::filesystem::path &path );
Settings parse_settings( std::istream &is );

// Hands the logging part of `s` over to the logger
void apply_logging( const Settings &s );

}   // namespace splitmint

#endif   // SPLITMINT_CONFIGURATION_HPP_INCLUDED
