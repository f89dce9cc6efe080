// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Ledger host administration and queries: assets, native value, clock,
 * event log. These stand in for the environment a deployed engine would
 * run in; they are not settlement operations.
 */

#include "clientversion.h"
#include "consensus/validation.h"
#include "core_io.h"
#include "host/asset.h"
#include "init.h"
#include "logging.h"
#include "market/marketplace.h"
#include "rpc/server.h"
#include "swap/otcswap.h"
#include "util/format.h"
#include "utiltime.h"

#include <univalue.h>

static CLedgerHost& EnsureLedgerHost()
{
    if (!g_ledger_host)
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Ledger host is not running");
    return *g_ledger_host;
}

static std::shared_ptr<CStandardAsset> EnsureStandardAsset(CLedgerHost& host, const CAccountID& address)
{
    std::shared_ptr<CAssetContract> asset = host.GetAsset(address);
    if (!asset)
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "No asset at " + address.ToString());
    std::shared_ptr<CStandardAsset> standard = std::dynamic_pointer_cast<CStandardAsset>(asset);
    if (!standard)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Asset " + address.ToString() + " is not a standard asset");
    return standard;
}

static UniValue AssetToUniv(const CAssetContract& asset)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("symbol", asset.GetSymbol());
    obj.pushKV("address", asset.GetAddress().ToString());
    return obj;
}

UniValue createasset(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "createasset \"symbol\"\n"
            "\nCreate a standard asset contract. Its address is derived from the symbol,\n"
            "so creating the same symbol again returns the existing asset.\n"
            "Assets are not persisted: pass -asset=<symbol> to recreate them at startup.\n"
            "\nArguments:\n"
            "1. \"symbol\"   (string, required) asset symbol\n"
            "\nResult:\n"
            "{\n"
            "  \"symbol\": \"..\",\n"
            "  \"address\": \"0x..\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("createasset", "\"TKX\""));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const std::string symbol = request.params[0].get_str();
    if (symbol.empty())
        throw JSONRPCError(RPC_INVALID_PARAMETER, "symbol must not be empty");

    const CAccountID address = GetStandardAssetAddress(symbol);
    std::shared_ptr<CAssetContract> asset = host.GetAsset(address);
    if (!asset) {
        asset = std::make_shared<CStandardAsset>(address, symbol);
        host.RegisterAsset(asset);
    }
    return AssetToUniv(*asset);
}

UniValue listassets(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "listassets\n"
            "\nAsset contracts known to the host.\n"
            "\nResult:\n"
            "[ { \"symbol\": \"..\", \"address\": \"0x..\" }, ... ]\n"
            "\nExamples:\n" +
            HelpExampleCli("listassets", ""));
    }

    UniValue result(UniValue::VARR);
    for (const auto& asset : EnsureLedgerHost().GetAssets()) {
        result.push_back(AssetToUniv(*asset));
    }
    return result;
}

UniValue mint(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "mint \"asset\" \"to\" amount\n"
            "\nCreate units of a standard asset for an account.\n"
            "\nArguments:\n"
            "1. \"asset\"   (string, required) asset address\n"
            "2. \"to\"      (string, required) receiving account\n"
            "3. amount    (numeric or string, required) units to create\n"
            "\nResult:\n"
            "n    (numeric) new balance of \"to\"\n"
            "\nExamples:\n" +
            HelpExampleCli("mint", "\"0x...\", \"0x...\", 1000"));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const CAccountID address = ParseAccountV(request.params[0], "asset");
    const CAccountID to = ParseAccountV(request.params[1], "to");
    const CAmount nAmount = AmountFromValue(request.params[2]);
    std::shared_ptr<CStandardAsset> asset = EnsureStandardAsset(host, address);

    CValidationState state;
    bool fOk = host.Call(address, address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!asset->Mint(tx, to, nAmount)) return st.Error("bad-asset-balance-overflow");
        return true;
    }, state);
    if (!fOk)
        ThrowSettlementError(state);

    return ValueFromAmount(host.GetAssetBalance(address, to));
}

UniValue approve(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "approve \"asset\" \"spender\" amount\n"
            "\nSet the amount of the caller's asset units spender may move.\n"
            "Parties approve the swap service before an order executes.\n"
            "\nArguments:\n"
            "1. \"asset\"     (string, required) asset address\n"
            "2. \"spender\"   (string, required) account allowed to spend\n"
            "3. amount      (numeric or string, required) allowance, replacing the previous one\n"
            "\nResult:\n"
            "n    (numeric) the allowance\n"
            "\nExamples:\n" +
            HelpExampleCli("approve", "\"0x...\", \"0x...\", 1000"));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const CAccountID& caller = GetRequestCaller(request);
    const CAccountID address = ParseAccountV(request.params[0], "asset");
    const CAccountID spender = ParseAccountV(request.params[1], "spender");
    const CAmount nAmount = AmountFromValue(request.params[2]);
    std::shared_ptr<CStandardAsset> asset = EnsureStandardAsset(host, address);

    CValidationState state;
    bool fOk = host.Call(caller, address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!asset->Approve(tx, caller, spender, nAmount)) return st.Error("bad-asset-allowance");
        return true;
    }, state);
    if (!fOk)
        ThrowSettlementError(state);

    return ValueFromAmount(host.GetAllowance(address, caller, spender));
}

UniValue getassetbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "getassetbalance \"asset\" \"owner\"\n"
            "\nBalance of an account in an asset.\n"
            "\nArguments:\n"
            "1. \"asset\"   (string, required) asset address\n"
            "2. \"owner\"   (string, required) account\n"
            "\nResult:\n"
            "n    (numeric) balance\n"
            "\nExamples:\n" +
            HelpExampleCli("getassetbalance", "\"0x...\", \"0x...\""));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const CAccountID address = ParseAccountV(request.params[0], "asset");
    const CAccountID owner = ParseAccountV(request.params[1], "owner");
    if (!host.GetAsset(address))
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "No asset at " + address.ToString());

    return ValueFromAmount(host.GetAssetBalance(address, owner));
}

UniValue getallowance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "getallowance \"asset\" \"owner\" \"spender\"\n"
            "\nAmount of owner's units spender may still move.\n"
            "\nResult:\n"
            "n    (numeric) allowance\n"
            "\nExamples:\n" +
            HelpExampleCli("getallowance", "\"0x...\", \"0x...\", \"0x...\""));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const CAccountID address = ParseAccountV(request.params[0], "asset");
    const CAccountID owner = ParseAccountV(request.params[1], "owner");
    const CAccountID spender = ParseAccountV(request.params[2], "spender");

    return ValueFromAmount(host.GetAllowance(address, owner, spender));
}

UniValue deposit(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "deposit \"account\" amount\n"
            "\nCredit native value to an account.\n"
            "\nArguments:\n"
            "1. \"account\"   (string, required) receiving account\n"
            "2. amount      (numeric or string, required) native units\n"
            "\nResult:\n"
            "n    (numeric) new native balance\n"
            "\nExamples:\n" +
            HelpExampleCli("deposit", "\"0x...\", 1000"));
    }

    CLedgerHost& host = EnsureLedgerHost();
    const CAccountID account = ParseAccountV(request.params[0], "account");
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CValidationState state;
    if (!host.CreditNative(account, nAmount, state))
        ThrowSettlementError(state);

    return ValueFromAmount(host.GetNativeBalance(account));
}

UniValue getnativebalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getnativebalance \"account\"\n"
            "\nNative value held by an account.\n"
            "\nResult:\n"
            "n    (numeric) balance\n"
            "\nExamples:\n" +
            HelpExampleCli("getnativebalance", "\"0x...\""));
    }

    const CAccountID account = ParseAccountV(request.params[0], "account");
    return ValueFromAmount(EnsureLedgerHost().GetNativeBalance(account));
}

UniValue setmocktime(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setmocktime timestamp\n"
            "\nSet the ledger clock (for testing expiry).\n"
            "\nArguments:\n"
            "1. timestamp  (integer, required) Unix seconds time to set.\n"
            "   Pass 0 to go back to using the system time.\n");
    }

    const int64_t nTime = request.params[0].get_int64();
    if (nTime < 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Timestamp must be 0 or greater");

    LOCK(EnsureLedgerHost().cs_ledger);
    SetMockTime(nTime);
    LogPrint(BCLog::RPC, "setmocktime: %d\n", nTime);

    return NullUniValue;
}

UniValue getevents(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "getevents ( count )\n"
            "\nMost recent events of committed operations, oldest first.\n"
            "\nArguments:\n"
            "1. count   (numeric, optional, default=100) number of events\n"
            "\nResult:\n"
            "[ { \"event\": \"name\", \"emitter\": \"0x..\", ... }, ... ]\n"
            "\nExamples:\n" +
            HelpExampleCli("getevents", "10"));
    }

    int64_t nCount = 100;
    if (request.params.size() > 0 && !request.params[0].isNull())
        nCount = request.params[0].get_int64();
    if (nCount < 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Negative count");

    LedgerEvents events = EnsureLedgerHost().GetEventLog();
    if ((int64_t)events.size() > nCount)
        events.erase(events.begin(), events.end() - nCount);
    return EventsToUniv(events);
}

UniValue getinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getinfo\n"
            "\nState of the daemon.\n"
            "\nResult:\n"
            "{\n"
            "  \"version\": \"..\",\n"
            "  \"time\": n,                 (numeric) ledger time\n"
            "  \"chainId\": n,\n"
            "  \"swap\": \"0x..\",            (string) swap service account\n"
            "  \"market\": \"0x..\",          (string) marketplace account\n"
            "  \"domain_separator\": \"0x..\",\n"
            "  \"items\": n,\n"
            "  \"assets\": n\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getinfo", ""));
    }

    CLedgerHost& host = EnsureLedgerHost();

    UniValue result(UniValue::VOBJ);
    result.pushKV("version", FormatFullVersion());
    result.pushKV("time", CLedgerHost::GetTime());
    if (g_otcswap) {
        result.pushKV("chainId", (int64_t)g_otcswap->GetDomain().nChainId);
        result.pushKV("swap", g_otcswap->GetAddress().ToString());
        result.pushKV("domain_separator", g_otcswap->GetDomain().GetSeparator().ToString());
    }
    if (g_marketplace) {
        result.pushKV("market", g_marketplace->GetAddress().ToString());
        result.pushKV("items", g_marketplace->GetItemCount());
    }
    result.pushKV("assets", (int64_t)host.GetAssets().size());
    return result;
}

static const CRPCCommand commands[] = {
    //  category    name                actor              okSafeMode  argNames
    { "ledger",    "createasset",      &createasset,      true,       {"symbol"} },
    { "ledger",    "listassets",       &listassets,       true,       {} },
    { "ledger",    "mint",             &mint,             true,       {"asset", "to", "amount"} },
    { "ledger",    "approve",          &approve,          true,       {"asset", "spender", "amount"} },
    { "ledger",    "getassetbalance",  &getassetbalance,  true,       {"asset", "owner"} },
    { "ledger",    "getallowance",     &getallowance,     true,       {"asset", "owner", "spender"} },
    { "ledger",    "deposit",          &deposit,          true,       {"account", "amount"} },
    { "ledger",    "getnativebalance", &getnativebalance, true,       {"account"} },
    { "ledger",    "getevents",        &getevents,        true,       {"count"} },
    { "ledger",    "getinfo",          &getinfo,          true,       {} },

    /* Not shown in help */
    { "hidden",    "setmocktime",      &setmocktime,      true,       {"timestamp"} },
};

void RegisterLedgerRPCCommands(CRPCTable& t)
{
    for (const auto& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
