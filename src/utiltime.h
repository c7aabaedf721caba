// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_UTILTIME_H
#define SOLAR_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the mock time when one is set, otherwise the system time.
 * Project creation timestamps come from here.
 */
int64_t GetTime();
int64_t GetSystemTimeInSeconds();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);

std::string FormatISO8601DateTime(int64_t nTime);

#endif // SOLAR_UTILTIME_H
