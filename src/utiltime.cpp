// Copyright (c) 2019 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utiltime.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::atomic<int64_t> nMockTime(0); //!< For testing

void SetMockTime(int64_t nMockTimeIn)
{
    nMockTime.store(nMockTimeIn, std::memory_order_relaxed);
}

int64_t GetTime()
{
    const int64_t mocktime = nMockTime.load(std::memory_order_relaxed);
    if (mocktime != 0)
        return mocktime;
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t nTime)
{
    std::time_t timeT = (std::time_t)nTime;
    std::tm tm;
    gmtime_r(&timeT, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
