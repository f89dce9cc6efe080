// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_UTILTIME_H
#define OTCSETTLE_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the ledger clock in seconds since the epoch.
 * When a mock time is set it is returned instead of the system time,
 * which lets tests and the daemon's setmocktime RPC move the clock.
 */
int64_t GetTime();
int64_t GetTimeMillis();
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

std::string FormatISO8601DateTime(int64_t nTime);

#endif // OTCSETTLE_UTILTIME_H
