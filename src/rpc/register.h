// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_RPC_REGISTER_H
#define OTCSETTLE_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register OTC swap RPC commands (executeswap, cancelswap, signswap, ...) */
void RegisterSwapRPCCommands(CRPCTable& tableRPC);
/** Register marketplace RPC commands (registeruser, listitem, buyitem, withdraw, ...) */
void RegisterMarketRPCCommands(CRPCTable& tableRPC);
/** Register ledger host RPC commands (createasset, mint, approve, deposit, ...) */
void RegisterLedgerRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& tableRPC)
{
    RegisterSwapRPCCommands(tableRPC);
    RegisterMarketRPCCommands(tableRPC);
    RegisterLedgerRPCCommands(tableRPC);
}

#endif // OTCSETTLE_RPC_REGISTER_H
