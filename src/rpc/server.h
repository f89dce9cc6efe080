// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_RPC_SERVER_H
#define OTCSETTLE_RPC_SERVER_H

#include "amount.h"
#include "pubkey.h"
#include "rpc/protocol.h"
#include "uint256.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

class CValidationState;

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;
    //! identity the request acts as ("caller" member of the request object)
    CAccountID caller;
    bool fHaveCaller;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false), fHaveCaller(false) {}

    /** Fill from a request object; throws a JSONRPCError object on malformed input */
    void parse(const UniValue& valRequest);
};

typedef UniValue (*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * OTCSettle RPC command dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The JSONRPCRequest to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if a command with that name is already registered.
     * Commands cannot be overwritten (returns false).
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

/** Set once "stop" was called; the daemon loop exits after the reply */
bool IsRPCShutdownRequested();
void ResetRPCShutdown();

/**
 * Handle one line of input: parse it as a request, dispatch it and
 * return the reply object. Never throws.
 */
UniValue JSONRPCExecOne(const std::string& strLine);

// Parameter helpers. All throw JSONRPCError objects on bad input.
extern CAccountID ParseAccountV(const UniValue& v, const std::string& strName);
extern uint256 ParseHashV(const UniValue& v, const std::string& strName);
extern std::vector<unsigned char> ParseHexV(const UniValue& v, const std::string& strName);
extern uint64_t ParseUInt64V(const UniValue& v, const std::string& strName);

/** Non-negative integer amount, as a JSON number or a decimal string */
extern CAmount AmountFromValue(const UniValue& value);

/** Caller of a mutating command; RPC_CALLER_REQUIRED if the request has none */
extern const CAccountID& GetRequestCaller(const JSONRPCRequest& request);

/** Throw the error object for a failed settlement operation */
[[noreturn]] extern void ThrowSettlementError(const CValidationState& state);

extern std::string HelpExampleCli(const std::string& methodname, const std::string& args);
extern std::string HelpExampleRpc(const std::string& methodname, const std::string& args);

#endif // OTCSETTLE_RPC_SERVER_H
