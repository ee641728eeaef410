// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "logging.h"

#include <stdio.h>
#include <set>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/mutex.hpp>

using namespace std;

namespace fs = boost::filesystem;

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

bool fPrintToConsole = false;
bool fPrintToDebugLog = true;

bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

namespace {

// Guards the category set, the log path and the writes themselves.
boost::mutex mutexDebugLog;
set<string> setCategories;
fs::path pathDebugLog(DEFAULT_DEBUGLOGFILE);

} // namespace

void SetDebugLogPath(const fs::path& path)
{
    boost::mutex::scoped_lock scoped_lock(mutexDebugLog);
    pathDebugLog = path;
}

void EnableLogCategory(const std::string& category)
{
    boost::mutex::scoped_lock scoped_lock(mutexDebugLog);
    setCategories.insert(category);
}

bool LogAcceptCategory(const char* category)
{
    if (category != NULL)
    {
        boost::mutex::scoped_lock scoped_lock(mutexDebugLog);

        // if not debugging everything and not debugging specific category, LogPrint does nothing.
        if (setCategories.count(string("")) == 0 &&
            setCategories.count(string("1")) == 0 &&
            setCategories.count(string(category)) == 0)
            return false;
    }
    return true;
}

void LogPrintStr(const char* level, const char* category, const std::string& str)
{
    string strLine;
    if (fLogTimestamps) {
        strLine = boost::posix_time::to_iso_extended_string(
            boost::posix_time::microsec_clock::universal_time()) + "Z ";
    }
    strLine += tfm::format("%5s %s: %s\n", level, category, str);

    boost::mutex::scoped_lock scoped_lock(mutexDebugLog);
    if (fPrintToConsole) {
        fwrite(strLine.data(), 1, strLine.size(), stderr);
        fflush(stderr);
    }
    if (fPrintToDebugLog) {
        FILE* file = fopen(pathDebugLog.string().c_str(), "a");
        if (file != NULL) {
            fwrite(strLine.data(), 1, strLine.size(), file);
            fclose(file);
        }
    }
}
