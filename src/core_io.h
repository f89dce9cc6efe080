// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_CORE_IO_H
#define OTCSETTLE_CORE_IO_H

#include "amount.h"
#include "ledger/events.h"

#include <string>

class CValidationState;
class UniValue;
struct CListing;
struct CParticipant;
struct SwapOrder;

// core_read.cpp
/**
 * Read a swap order object. Members are "id", "initiator", "counterparty",
 * "assetA", "assetB", "amountA", "amountB", "expiry"; the typed-data names
 * "swapId", "tokenX", "tokenY", "amountX", "amountY", "expiration" are
 * accepted as well. Integers may be JSON numbers or decimal strings.
 */
bool DecodeSwapOrder(const UniValue& obj, SwapOrder& order, std::string& strError);

// core_write.cpp
UniValue ValueFromAmount(const CAmount& amount);
UniValue SwapOrderToUniv(const SwapOrder& order);
void ParticipantToUniv(const CParticipant& participant, UniValue& entry);
void ListingToUniv(const CListing& listing, UniValue& entry);
void EventToUniv(const CLedgerEvent& ev, UniValue& entry);
UniValue EventsToUniv(const LedgerEvents& events);

#endif // OTCSETTLE_CORE_IO_H
