// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2020 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZKSHA512_LOGGING_H
#define ZKSHA512_LOGGING_H

#include <tinyformat.h>

#include <string>

#include <boost/filesystem.hpp>

static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;

extern bool fLogTimestamps;

/** Turn on debug output for a category. "1" or "" enables every category. */
void EnableLogCategory(const std::string& category);

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

/** Send a formatted line to the console and/or the debug log. */
void LogPrintStr(const char* level, const char* category, const std::string& str);

/** Print to debug.log with level DEBUG. */
#define LogPrint(category, ...) do {                       \
    if (LogAcceptCategory(category)) {                     \
        LogPrintInner("debug", category, __VA_ARGS__);     \
    }                                                      \
} while(0)

#define LogPrintInner(level, category, ...) do {           \
    std::string T_MSG = tfm::format(__VA_ARGS__);          \
    if (!T_MSG.empty() && T_MSG[T_MSG.size()-1] == '\n') { \
        T_MSG.erase(T_MSG.size()-1);                       \
    }                                                      \
    LogPrintStr(level, category, T_MSG);                   \
} while(0)

#define LogError(category, ...) ([&]() {          \
    std::string T_MSG = tfm::format(__VA_ARGS__); \
    LogPrintStr("error", category, T_MSG);        \
    return false;                                 \
}())

void SetDebugLogPath(const boost::filesystem::path& path);

#endif // ZKSHA512_LOGGING_H
