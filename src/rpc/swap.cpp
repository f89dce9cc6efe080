// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * OTC swap RPC commands
 *
 * Orders are passed as JSON objects:
 *   {"id": n, "initiator": "0x..", "counterparty": "0x..", "assetA": "0x..",
 *    "assetB": "0x..", "amountA": n, "amountB": n, "expiry": n}
 * Signatures are 65-byte r||s||v hex strings.
 */

#include "consensus/validation.h"
#include "core_io.h"
#include "key.h"
#include "logging.h"
#include "rpc/server.h"
#include "util/format.h"
#include "settlement/authorization.h"
#include "settlement/fingerprint.h"
#include "swap/otcswap.h"
#include "utilstrencodings.h"

#include <univalue.h>

static const std::string ORDER_HELP =
    "1. order          (object, required) The swap order\n"
    "     {\n"
    "       \"id\": n,               (numeric or string) order id chosen by the initiator\n"
    "       \"initiator\": \"0x..\",   (string) signer of the order, sends assetA\n"
    "       \"counterparty\": \"0x..\",(string) the only identity allowed to execute, sends assetB\n"
    "       \"assetA\": \"0x..\",      (string) asset sent by the initiator\n"
    "       \"assetB\": \"0x..\",      (string) asset sent by the counterparty\n"
    "       \"amountA\": n,          (numeric or string) amount of assetA\n"
    "       \"amountB\": n,          (numeric or string) amount of assetB\n"
    "       \"expiry\": n            (numeric or string) ledger time after which execution fails\n"
    "     }\n";

static const std::string EXAMPLE_ORDER =
    "{\"id\": 1, \"initiator\": \"0xCD2a..\", \"counterparty\": \"0x70997970..\", \"assetA\": \"0x..\", "
    "\"assetB\": \"0x..\", \"amountA\": 1000, \"amountB\": 500, \"expiry\": 1893456000}";

static COTCSwap& EnsureSwapService()
{
    if (!g_otcswap)
        throw JSONRPCError(RPC_INTERNAL_ERROR, "OTC swap service is not running");
    return *g_otcswap;
}

static SwapOrder ParseSwapOrder(const UniValue& v)
{
    SwapOrder order;
    std::string strError;
    if (!DecodeSwapOrder(v, order, strError))
        throw JSONRPCError(RPC_DESERIALIZATION_ERROR, "Invalid order: " + strError);
    return order;
}

UniValue executeswap(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "executeswap order \"signature\"\n"
            "\nSettle a signed swap order. Must be called by the order's counterparty.\n"
            "Both legs move under the allowances the parties granted the swap service,\n"
            "or neither does.\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "2. \"signature\"    (string, required) initiator's 65-byte typed-data signature (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"fingerprint\": \"0x..\",  (string) order fingerprint\n"
            "  \"status\": \"executed\",\n"
            "  \"events\": [...]         (array) emitted events\n"
            "}\n"
            "\nErrors carry \"error\" (InvalidSignature, Expired, UnauthorizedCaller,\n"
            "AlreadySettled, TransferFailed, ReentrantCall) and \"reject_reason\".\n"
            "\nExamples:\n" +
            HelpExampleCli("executeswap", EXAMPLE_ORDER + ", \"0x...\"") +
            HelpExampleRpc("executeswap", EXAMPLE_ORDER + ", \"0x...\""));
    }

    COTCSwap& swap = EnsureSwapService();
    const CAccountID& caller = GetRequestCaller(request);
    SwapOrder order = ParseSwapOrder(request.params[0]);
    std::vector<unsigned char> vchSig = ParseHexV(request.params[1], "signature");

    CValidationState state;
    LedgerEvents events;
    if (!swap.ExecuteSwap(caller, order, vchSig, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("fingerprint", ComputeFingerprint(order).ToString());
    result.pushKV("status", SwapStatusToString(SwapStatus::EXECUTED));
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue cancelswap(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "cancelswap order \"signature\"\n"
            "\nVoid a signed swap order before it executes. Must be called by the order's initiator.\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "2. \"signature\"    (string, required) initiator's 65-byte typed-data signature (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"fingerprint\": \"0x..\",\n"
            "  \"status\": \"cancelled\",\n"
            "  \"events\": [...]\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("cancelswap", EXAMPLE_ORDER + ", \"0x...\""));
    }

    COTCSwap& swap = EnsureSwapService();
    const CAccountID& caller = GetRequestCaller(request);
    SwapOrder order = ParseSwapOrder(request.params[0]);
    std::vector<unsigned char> vchSig = ParseHexV(request.params[1], "signature");

    CValidationState state;
    LedgerEvents events;
    if (!swap.CancelSwap(caller, order, vchSig, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("fingerprint", ComputeFingerprint(order).ToString());
    result.pushKV("status", SwapStatusToString(SwapStatus::CANCELLED));
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue getswapstatus(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getswapstatus \"fingerprint\"\n"
            "\nSettlement status of an order fingerprint.\n"
            "\nArguments:\n"
            "1. \"fingerprint\"  (string, required) order fingerprint (32 bytes hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"fingerprint\": \"0x..\",\n"
            "  \"status\": \"unseen|executed|cancelled\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getswapstatus", "\"0x...\""));
    }

    COTCSwap& swap = EnsureSwapService();
    uint256 fingerprint = ParseHashV(request.params[0], "fingerprint");

    UniValue result(UniValue::VOBJ);
    result.pushKV("fingerprint", fingerprint.ToString());
    result.pushKV("status", SwapStatusToString(swap.GetSwapStatus(fingerprint)));
    return result;
}

UniValue computefingerprint(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "computefingerprint order\n"
            "\nFingerprint of an order: keccak256 of its eight fields, tightly packed (208 bytes).\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "\nResult:\n"
            "{\n"
            "  \"fingerprint\": \"0x..\",\n"
            "  \"packed\": \"..\",          (string) the hashed encoding (hex)\n"
            "  \"order\": {...}           (object) the order as parsed\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("computefingerprint", EXAMPLE_ORDER));
    }

    SwapOrder order = ParseSwapOrder(request.params[0]);

    UniValue result(UniValue::VOBJ);
    result.pushKV("fingerprint", ComputeFingerprint(order).ToString());
    result.pushKV("packed", HexStr(PackSwapOrder(order)));
    result.pushKV("order", SwapOrderToUniv(order));
    return result;
}

UniValue getsigninghash(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getsigninghash order\n"
            "\nThe typed-data digest the initiator signs for this order under the\n"
            "swap service's domain.\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "\nResult:\n"
            "{\n"
            "  \"domain_separator\": \"0x..\",\n"
            "  \"struct_hash\": \"0x..\",\n"
            "  \"signing_hash\": \"0x..\",\n"
            "  \"fingerprint\": \"0x..\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getsigninghash", EXAMPLE_ORDER));
    }

    COTCSwap& swap = EnsureSwapService();
    SwapOrder order = ParseSwapOrder(request.params[0]);

    UniValue result(UniValue::VOBJ);
    result.pushKV("domain_separator", swap.GetDomain().GetSeparator().ToString());
    result.pushKV("struct_hash", GetSwapStructHash(order).ToString());
    result.pushKV("signing_hash", swap.GetSigningHash(order).ToString());
    result.pushKV("fingerprint", ComputeFingerprint(order).ToString());
    return result;
}

UniValue getswapdomain(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getswapdomain\n"
            "\nThe typed-data domain orders are signed under.\n"
            "\nResult:\n"
            "{\n"
            "  \"name\": \"OTCSwap\",\n"
            "  \"version\": \"1\",\n"
            "  \"chainId\": n,\n"
            "  \"verifyingContract\": \"0x..\",\n"
            "  \"separator\": \"0x..\",\n"
            "  \"type\": \"Swap(...)\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getswapdomain", ""));
    }

    const CSigningDomain& domain = EnsureSwapService().GetDomain();

    UniValue result(UniValue::VOBJ);
    result.pushKV("name", domain.name);
    result.pushKV("version", domain.version);
    result.pushKV("chainId", (int64_t)domain.nChainId);
    result.pushKV("verifyingContract", domain.verifyingContract.ToString());
    result.pushKV("separator", domain.GetSeparator().ToString());
    result.pushKV("type", SWAP_TYPE_STRING);
    return result;
}

UniValue signswap(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "signswap order \"privkey\"\n"
            "\nSign an order with a raw private key, the way a wallet signs typed data.\n"
            "For development; the key travels in the request.\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "2. \"privkey\"      (string, required) 32-byte secp256k1 private key (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"signature\": \"0x..\",    (string) 65-byte r||s||v signature\n"
            "  \"signer\": \"0x..\",       (string) account id of the key\n"
            "  \"signing_hash\": \"0x..\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("signswap", EXAMPLE_ORDER + ", \"0x...\""));
    }

    COTCSwap& swap = EnsureSwapService();
    SwapOrder order = ParseSwapOrder(request.params[0]);
    std::vector<unsigned char> vchKey = ParseHexV(request.params[1], "privkey");

    CKey key;
    key.Set(vchKey.begin(), vchKey.end());
    if (!key.IsValid())
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Invalid private key");

    std::vector<unsigned char> vchSig;
    if (!SignSwapOrder(key, swap.GetDomain(), order, vchSig))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Signing failed");

    const CAccountID signer = key.GetPubKey().GetID();
    if (signer != order.initiator) {
        LogPrint(BCLog::RPC, "signswap: key %s is not the initiator %s\n", signer.ToString(), order.initiator.ToString());
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("signature", "0x" + HexStr(vchSig));
    result.pushKV("signer", signer.ToString());
    result.pushKV("signing_hash", swap.GetSigningHash(order).ToString());
    return result;
}

UniValue recoverswapsigner(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "recoverswapsigner order \"signature\"\n"
            "\nRecover the account that signed an order, without checking it against the initiator.\n"
            "\nArguments:\n" +
            ORDER_HELP +
            "2. \"signature\"    (string, required) 65-byte signature (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"signer\": \"0x..\",\n"
            "  \"is_initiator\": true|false\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("recoverswapsigner", EXAMPLE_ORDER + ", \"0x...\""));
    }

    COTCSwap& swap = EnsureSwapService();
    SwapOrder order = ParseSwapOrder(request.params[0]);
    std::vector<unsigned char> vchSig = ParseHexV(request.params[1], "signature");

    CAccountID signer;
    std::string strError;
    if (!RecoverSigner(swap.GetSigningHash(order), vchSig, signer, strError))
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Signature does not recover: " + strError);

    UniValue result(UniValue::VOBJ);
    result.pushKV("signer", signer.ToString());
    result.pushKV("is_initiator", signer == order.initiator);
    return result;
}

static const CRPCCommand commands[] = {
    //  category   name                   actor                 okSafeMode  argNames
    { "swap",     "executeswap",         &executeswap,         true,       {"order", "signature"} },
    { "swap",     "cancelswap",          &cancelswap,          true,       {"order", "signature"} },
    { "swap",     "getswapstatus",       &getswapstatus,       true,       {"fingerprint"} },
    { "swap",     "computefingerprint",  &computefingerprint,  true,       {"order"} },
    { "swap",     "getsigninghash",      &getsigninghash,      true,       {"order"} },
    { "swap",     "getswapdomain",       &getswapdomain,       true,       {} },
    { "swap",     "signswap",            &signswap,            true,       {"order", "privkey"} },
    { "swap",     "recoverswapsigner",   &recoverswapsigner,   true,       {"order", "signature"} },
};

void RegisterSwapRPCCommands(CRPCTable& t)
{
    for (const auto& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
