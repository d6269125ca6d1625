// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "log.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/once.hpp>

#include <stdio.h>
#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

namespace splitmint {

// Options
static const long LOG_BUFFERSIZE  =  8000000; //  8 MB
static const long LOG_SHRINKSIZE  = 50000000; // 50 MB

// Debug flags
//! Print every accepted and rejected mint
bool splitmint_debug_mint             = 1;
//! Print refused transfers and the split of every distribution
bool splitmint_debug_payment          = 1;
//! Print lock state transitions and blocked transfers
bool splitmint_debug_lock             = 1;
bool splitmint_debug_config           = 0;
bool splitmint_debug_events           = 0;

/**
 * The mutex is created on first use and never destroyed, as log lines may
 * still be printed by global destructors during shutdown.
 */
static boost::once_flag debugLogInitFlag = BOOST_ONCE_INIT;
static boost::mutex* mutexDebugLog = NULL;
static FILE* fileout = NULL;
static LogOptions* logOptions = NULL;
/** Flag to indicate, whether the log file should be reopened. */
static std::atomic<bool> fReopenLog(false);

static void DebugLogInit()
{
    mutexDebugLog = new boost::mutex();
    logOptions = new LogOptions();
}

/**
 * @return The current timestamp in the format: 2009-01-03 18:15:05
 */
static std::string GetTimestamp()
{
    const boost::posix_time::ptime now = boost::posix_time::second_clock::universal_time();
    std::string ret = boost::posix_time::to_iso_extended_string(now);
    std::replace(ret.begin(), ret.end(), 'T', ' ');
    return ret;
}

/**
 * Prints to the standard output, usually the console.
 *
 * @param str[in]  The message to print
 * @param fTimestamp[in]  Whether to prepend a timestamp to a new line
 * @return The total number of characters written
 */
static int ConsolePrint(const std::string& str, bool fTimestamp)
{
    int ret = 0; // Number of characters written
    static bool fStartedNewLine = true;

    if (fTimestamp && fStartedNewLine) {
        ret = fprintf(stdout, "%s %s", GetTimestamp().c_str(), str.c_str());
    } else {
        ret = fwrite(str.data(), 1, str.size(), stdout);
    }
    fStartedNewLine = !str.empty() && str[str.size()-1] == '\n';
    fflush(stdout);

    return ret;
}

static FILE* OpenLogFile(const boost::filesystem::path& pathLog)
{
    if (pathLog.has_parent_path()) {
        boost::system::error_code ec;
        boost::filesystem::create_directories(pathLog.parent_path(), ec);
    }
    FILE* file = fopen(pathLog.string().c_str(), "a");
    if (file) {
        setbuf(file, NULL); // Unbuffered
    } else {
        ConsolePrint("Failed to open debug log file: " + pathLog.string() + "\n", false);
    }
    return file;
}

void ConfigureLogging(const LogOptions& options)
{
    boost::call_once(&DebugLogInit, debugLogInitFlag);
    boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);
    *logOptions = options;
    fReopenLog = true;
}

/**
 * Prints to log file.
 *
 * If printing to the console is enabled, then the message is written to the
 * standard output, usually the console, instead of the log file.
 *
 * @param str[in]  The message to log
 * @return The total number of characters written
 */
int LogFilePrint(const std::string& str)
{
    boost::call_once(&DebugLogInit, debugLogInitFlag);
    boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);

    if (logOptions->print_to_console) {
        return ConsolePrint(str, logOptions->log_timestamps);
    }

    int ret = 0; // Number of characters written
    static bool fStartedNewLine = true;

    // Reopen the log file, if requested
    if (fReopenLog || fileout == NULL) {
        fReopenLog = false;
        if (fileout != NULL) {
            fclose(fileout);
        }
        fileout = OpenLogFile(logOptions->log_file);
    }
    if (fileout == NULL) {
        return ret;
    }

    // Printing log timestamps can be useful for profiling
    if (logOptions->log_timestamps && fStartedNewLine) {
        ret += fprintf(fileout, "%s ", GetTimestamp().c_str());
    }
    fStartedNewLine = !str.empty() && str[str.size()-1] == '\n';
    ret += fwrite(str.data(), 1, str.size(), fileout);

    return ret;
}

/**
 * Determine whether to override compiled debug levels via the "debug" setting.
 *
 * Example usage (granular categories)    : debug=mint debug=lock
 * Example usage (enable all categories)  : debug=all
 * Example usage (disable all debugging)  : debug=none
 * Example usage (disable all except XYZ) : debug=none debug=payment
 */
void InitDebugLogLevels(const std::vector<std::string>& debugLevels)
{
    for (std::vector<std::string>::const_iterator it = debugLevels.begin(); it != debugLevels.end(); ++it) {
        if (*it == "mint") splitmint_debug_mint = true;
        if (*it == "payment") splitmint_debug_payment = true;
        if (*it == "lock") splitmint_debug_lock = true;
        if (*it == "config") splitmint_debug_config = true;
        if (*it == "events") splitmint_debug_events = true;
        if (*it == "none" || *it == "all") {
            bool allDebugState = false;
            if (*it == "all") allDebugState = true;
            splitmint_debug_mint = allDebugState;
            splitmint_debug_payment = allDebugState;
            splitmint_debug_lock = allDebugState;
            splitmint_debug_config = allDebugState;
            splitmint_debug_events = allDebugState;
        }
    }
}

/**
 * Scrolls debug log, if it's getting too big.
 */
void ShrinkDebugLog()
{
    boost::call_once(&DebugLogInit, debugLogInitFlag);
    boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);

    const boost::filesystem::path pathLog = logOptions->log_file;
    boost::system::error_code ec;
    const boost::uintmax_t size = boost::filesystem::file_size(pathLog, ec);
    if (ec || size <= static_cast<boost::uintmax_t>(LOG_SHRINKSIZE)) {
        return;
    }

    FILE* file = fopen(pathLog.string().c_str(), "r");
    if (file == NULL) {
        return;
    }

    // Restart the file with some of the end
    std::vector<char> buffer(LOG_BUFFERSIZE);
    fseek(file, -LOG_BUFFERSIZE, SEEK_END);
    const size_t nBytes = fread(buffer.data(), 1, buffer.size(), file);
    fclose(file);

    if (fileout != NULL) {
        fclose(fileout);
        fileout = NULL;
    }
    file = fopen(pathLog.string().c_str(), "w");
    if (file) {
        fwrite(buffer.data(), 1, nBytes, file);
        fclose(file);
    }
}

}   // namespace splitmint
