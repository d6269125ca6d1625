// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <cctype>
#include <ostream>

#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "configuration.hpp"
#include "errors.hpp"

namespace po = boost::program_options;

namespace splitmint {

namespace {

std::uint64_t parse_unsigned( const std::string &key, const std::string &value )
{
   if ( value.empty() || !std::ranges::all_of( value, []( unsigned char c ) { return std::isdigit( c ); } ) )
      throw ConfigurationError( "Setting '" + key + "' must be a non-negative integer, got '" + value + "'" );
   try {
      return boost::lexical_cast< std::uint64_t >( value );
   }
   catch ( const boost::bad_lexical_cast & ) {
      throw ConfigurationError( "Setting '" + key + "' is out of range: '" + value + "'" );
   }
}

po::options_description settings_description()
{
   po::options_description d( "splitmint settings" );
   // clang-format off
   d.add_options()
      ( "administrator", po::value< std::string >(), "address of the initial administrator" )
      ( "maxsupply", po::value< std::string >(), "highest token ID that may be minted" )
      ( "minmintamount", po::value< std::string >()->default_value( "0" ), "minimum accepted payment for a paid mint" )
      ( "paymentasset", po::value< std::string >(), "address of the payment asset" )
      ( "logfile", po::value< std::string >(), "log file path" )
      ( "printtoconsole", po::value< bool >()->default_value( false ), "send log output to stdout instead of the log file" )
      ( "logtimestamps", po::value< bool >()->default_value( true ), "prepend log lines with a timestamp" )
      ( "debug", po::value< std::vector< std::string > >()->composing(), "debug logging category, or all / none" );
   // clang-format on
   return d;
}

}   // namespace

std::ostream &operator<<( std::ostream &os, const MintConfiguration &c )
{
   return os << "{max_supply=" << c.max_supply << ", min_mint_amount=" << c.min_mint_amount << ", payment_asset=" << c.payment_asset << '}';
}

void validate( const MintConfiguration &c )
{
   if ( c.max_supply < first_token_id )
      throw MintError( mint_errc::invalid_configuration, "max supply must be at least 1" );
   if ( c.max_supply > max_allowed_token_id_value )
      throw MintError( mint_errc::invalid_configuration, "max supply unsupported: too big" );
   if ( is_null_address( c.payment_asset ) )
      throw MintError( mint_errc::invalid_configuration, "payment asset address is required" );
}

Settings parse_settings( std::istream &is )
{
   po::variables_map vm;
   try {
      po::store( po::parse_config_file( is, settings_description(), false ), vm );
      po::notify( vm );
   }
   catch ( const po::error &e ) {
      throw ConfigurationError( std::string( "Malformed settings: " ) + e.what() );
   }

   Settings s;
   if ( vm.count( "administrator" ) )
      s.administrator = vm[ "administrator" ].as< std::string >();
   if ( vm.count( "maxsupply" ) )
      s.mint.max_supply = token_id_t{ parse_unsigned( "maxsupply", vm[ "maxsupply" ].as< std::string >() ) };
   s.mint.min_mint_amount = parse_unsigned( "minmintamount", vm[ "minmintamount" ].as< std::string >() );
   if ( vm.count( "paymentasset" ) )
      s.mint.payment_asset = vm[ "paymentasset" ].as< std::string >();
   if ( vm.count( "logfile" ) )
      s.logging.log_file = vm[ "logfile" ].as< std::string >();
   s.logging.print_to_console = vm[ "printtoconsole" ].as< bool >();
   s.logging.log_timestamps = vm[ "logtimestamps" ].as< bool >();
   if ( vm.count( "debug" ) )
      s.debug = vm[ "debug" ].as< std::vector< std::string > >();

   if ( is_null_address( s.administrator ) )
      throw ConfigurationError( "Setting 'administrator' is required" );
   if ( s.mint.max_supply < first_token_id )
      throw ConfigurationError( "Setting 'maxsupply' is required and must be at least 1" );
   if ( is_null_address( s.mint.payment_asset ) )
      throw ConfigurationError( "Setting 'paymentasset' is required" );
   return s;
}

Settings load_settings( const boost::filesystem::path &path )
{
   boost::filesystem::ifstream file( path );
   if ( !file.good() )
      throw ConfigurationError( "Unable to open settings file " + path.string() );
   return parse_settings( file );
}

void apply_logging( const Settings &s )
{
   ConfigureLogging( s.logging );
   ShrinkDebugLog();
   InitDebugLogLevels( s.debug );
   if ( splitmint_debug_config )
      PrintToLog( "%s(): administrator=%s, mint configuration %s\n", __func__, s.administrator, s.mint );
}

}   // namespace splitmint
