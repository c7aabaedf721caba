// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_LOGGING_H
#define SOLAR_LOGGING_H

#include "util/strprintf.h"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

#include <boost/filesystem/path.hpp>

static const bool DEFAULT_LOGTIMESTAMPS = true;

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    LEDGER      = (1 << 0),
    REGISTRY    = (1 << 1),
    REWARD      = (1 << 2),
    UNITS       = (1 << 3),
    DB          = (1 << 4),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    mutable std::mutex m_cs;
    FILE* m_fileout = nullptr;

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    /** Set if the previous line ended with a newline, so the next one gets a timestamp */
    bool m_started_new_line = true;

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;
    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    boost::filesystem::path m_file_path;

    ~Logger();

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const { return m_print_to_console || m_print_to_file; }

    bool OpenDebugLog();
    void DisconnectTestLogger();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

/** Comma separated list of the supported category names */
std::string ListLogCategories();

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = strprintf(fmt, args...);
        } catch (const boost::io::format_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

/** Log an error and return false */
template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", strprintf(fmt, args...));
    return false;
}

#endif // SOLAR_LOGGING_H
