// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_HOST_CONTEXT_H
#define OTCSETTLE_HOST_CONTEXT_H

#include "amount.h"
#include "ledger/events.h"
#include "ledger/ledgerview.h"
#include "pubkey.h"

#include <stdint.h>

/** Identity and environment of one ledger call */
struct CCallContext
{
    CAccountID caller;   //!< account that made the call
    CAccountID callee;   //!< account being called (service, asset or receiver)
    CAmount nValue{0};   //!< native value attached to the call
    int64_t nTime{0};    //!< ledger timestamp, fixed for a whole top-level call
    int nDepth{0};       //!< 0 for a top-level call
};

/**
 * CLedgerTx - One frame of a ledger call
 *
 * All reads and writes of the frame go through its cache, which sits on
 * top of the parent frame's cache (or the persistent ledger for a
 * top-level call). Events are staged alongside and published only if the
 * frame commits.
 */
class CLedgerTx
{
public:
    CLedgerViewCache view;
    LedgerEvents events;
    const CCallContext ctx;

    CLedgerTx(CLedgerView* parent, const CCallContext& ctxIn) : view(parent), ctx(ctxIn) {}

    CLedgerTx(const CLedgerTx&) = delete;
    CLedgerTx& operator=(const CLedgerTx&) = delete;

    void Emit(const CLedgerEvent& ev) { events.push_back(ev); }
};

#endif // OTCSETTLE_HOST_CONTEXT_H
