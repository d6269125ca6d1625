// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_LOG_HPP_INCLUDED
#define SPLITMINT_LOG_HPP_INCLUDED

#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/format.hpp>

namespace splitmint {

struct LogOptions {
   boost::filesystem::path log_file = "splitmint.log";
   bool print_to_console = false;
   bool log_timestamps = true;
};

/** Sets where and how log lines go. Takes effect for the next line printed. */
void ConfigureLogging( const LogOptions &options );

/** Prints to the log file. */
int LogFilePrint( const std::string &str );

/** Determine whether to override compiled debug levels. */
void InitDebugLogLevels( const std::vector< std::string > &debug_levels );

/** Scrolls log file, if it's getting too big. */
void ShrinkDebugLog();

// Debug flags
extern bool splitmint_debug_mint;
extern bool splitmint_debug_payment;
extern bool splitmint_debug_lock;
extern bool splitmint_debug_config;
extern bool splitmint_debug_events;

template < typename... Args >
int PrintToLog( const char *format, Args &&...args )
{
   boost::format f( format );
   ( f % ... % std::forward< Args >( args ) );
   return LogFilePrint( f.str() );
}

inline int PrintToLog( const std::string &str )
{
   return LogFilePrint( str );
}

}   // namespace splitmint

#endif   // SPLITMINT_LOG_HPP_INCLUDED
