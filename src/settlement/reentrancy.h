// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_REENTRANCY_H
#define OTCSETTLE_SETTLEMENT_REENTRANCY_H

#include <string>

class CValidationState;

/**
 * Re-entry flag of one service.
 *
 * Held for the whole of every operation that both mutates settlement
 * state and calls out to untrusted code. Owner must hold the host's
 * cs_ledger while taking it.
 */
class CReentrancyGuard
{
private:
    bool fEntered{false};

    friend class CReentrancyLock;

public:
    CReentrancyGuard() = default;
    CReentrancyGuard(const CReentrancyGuard&) = delete;
    CReentrancyGuard& operator=(const CReentrancyGuard&) = delete;

    bool IsEntered() const { return fEntered; }
};

/**
 * Scoped try-lock on a CReentrancyGuard.
 *
 *     CReentrancyLock lock(m_guard);
 *     if (!lock) return RejectReentrantCall(state, __func__);
 *
 * Releases the flag on every exit path, exceptions included.
 */
class CReentrancyLock
{
private:
    CReentrancyGuard& guard;
    bool fOwnsLock;

public:
    explicit CReentrancyLock(CReentrancyGuard& guardIn);
    ~CReentrancyLock();

    CReentrancyLock(const CReentrancyLock&) = delete;
    CReentrancyLock& operator=(const CReentrancyLock&) = delete;

    explicit operator bool() const { return fOwnsLock; }
};

/** Fill state with REENTRANT_CALL for strOperation; always returns false */
bool RejectReentrantCall(CValidationState& state, const std::string& strOperation);

#endif // OTCSETTLE_SETTLEMENT_REENTRANCY_H
