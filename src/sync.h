// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SYNC_H
#define OTCSETTLE_SYNC_H

#include <mutex>

/** Wrapped mutex: supports recursive locking, but no waiting  */
typedef std::recursive_mutex RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex Mutex;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::lock_guard<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // OTCSETTLE_SYNC_H
