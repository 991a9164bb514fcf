// Copyright (c) 2019 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_UTILTIME_H
#define TOKENREGISTRY_UTILTIME_H

#include <stdint.h>
#include <string>

/** Seconds since the epoch, or the mocked time when one is set. */
int64_t GetTime();

/** For testing. Zero restores the system clock. */
void SetMockTime(int64_t nMockTimeIn);

/** UTC timestamp of the form 2011-09-30T23:36:17Z, used for log lines. */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // TOKENREGISTRY_UTILTIME_H
