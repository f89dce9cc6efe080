// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_INIT_H
#define OTCSETTLE_INIT_H

#include "host/host.h"
#include "ledger/ledgerdb.h"
#include "pubkey.h"

#include <memory>
#include <string>

extern std::unique_ptr<CLedgerViewDB> g_ledgerdb;
extern std::unique_ptr<CLedgerHost> g_ledger_host;

/** Tag hashed into the default account id of the swap service */
static const char* const SWAP_CONTRACT_TAG = "otcsettle.swap";
/** Tag hashed into the default account id of the marketplace */
static const char* const MARKET_CONTRACT_TAG = "otcsettle.market";

/** Account id a standard asset with this symbol is created at */
CAccountID GetStandardAssetAddress(const std::string& symbol);

/** Print an error to stderr and the log; returns false */
bool InitError(const std::string& str);

/** Usage text of otcsettled */
std::string HelpMessage();

/** Apply -debug, -printtoconsole and -debuglogfile and start the logger */
bool InitLogging();

/** Start ECC and check it works */
bool InitSanityCheck();
void ShutdownECC();

/**
 * InitLedger - Open <datadir>/ledger and set up the host and both services
 *
 * Reads -dbcache, -wipeledger, -chainid, -swapaddress, -marketaddress,
 * -asset and -mocktime.
 */
bool InitLedger();

/** Tear down services, host and database, in that order */
void ShutdownLedger();

#endif // OTCSETTLE_INIT_H
