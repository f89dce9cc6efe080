// Copyright (c) 2012-2016 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"
#include "init.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "test/test_otcsettle.h"
#include "util/format.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <string>

#include <boost/test/unit_test.hpp>

#include <univalue.h>

namespace {

struct RPCTestingSetup : public BasicTestingSetup {
    CKey initiatorKey = KeyFromSeed("initiator");
    CKey counterpartyKey = KeyFromSeed("counterparty");
    std::string initiator;
    std::string counterparty;

    RPCTestingSetup()
    {
        SetMockTime(TEST_LEDGER_TIME);
        gArgs.ForceSetArg("-asset", "TKX");
        BOOST_REQUIRE(InitLedger());
        RegisterAllCoreRPCCommands(tableRPC);
        ResetRPCShutdown();

        initiator = initiatorKey.GetPubKey().GetID().ToString();
        counterparty = counterpartyKey.GetPubKey().GetID().ToString();
    }

    ~RPCTestingSetup()
    {
        ShutdownLedger();
    }

    /** One request line through the dispatcher; returns the whole reply object */
    UniValue Exec(const std::string& method, const std::string& params, const std::string& caller = "")
    {
        std::string strLine = "{\"id\": 7, \"method\": \"" + method + "\", \"params\": " + params;
        if (!caller.empty()) strLine += ", \"caller\": \"" + caller + "\"";
        strLine += "}";
        return JSONRPCExecOne(strLine);
    }

    UniValue CallRPC(const std::string& method, const std::string& params, const std::string& caller = "")
    {
        UniValue reply = Exec(method, params, caller);
        const UniValue& error = find_value(reply, "error");
        BOOST_REQUIRE_MESSAGE(error.isNull(), method + " failed: " + error.write());
        return find_value(reply, "result");
    }

    UniValue CallError(const std::string& method, const std::string& params, const std::string& caller = "")
    {
        UniValue reply = Exec(method, params, caller);
        BOOST_CHECK(find_value(reply, "result").isNull());
        const UniValue& error = find_value(reply, "error");
        BOOST_REQUIRE(error.isObject());
        return error;
    }

    std::string StandardAsset(const std::string& symbol) const
    {
        return GetStandardAssetAddress(symbol).ToString();
    }

    std::string Order(uint64_t nId, CAmount nAmountA, CAmount nAmountB) const
    {
        return strprintf("{\"id\": \"%u\", \"initiator\": \"%s\", \"counterparty\": \"%s\", "
                         "\"assetA\": \"%s\", \"assetB\": \"%s\", \"amountA\": %d, \"amountB\": %d, "
                         "\"expiry\": \"%d\"}",
                         nId, initiator, counterparty, StandardAsset("TKX"), StandardAsset("TKY"),
                         nAmountA, nAmountB, TEST_LEDGER_TIME + 3600);
    }
};

std::string PrivKeyHex(const std::string& seed)
{
    const uint256 secret = Keccak256(seed);
    return HexStr(secret.begin(), secret.end());
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(rpc_tests, RPCTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_protocol_errors)
{
    UniValue reply = JSONRPCExecOne("{not json");
    BOOST_CHECK(find_value(reply, "id").isNull());
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_PARSE_ERROR);

    reply = JSONRPCExecOne("[1, 2]");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_INVALID_REQUEST);

    reply = JSONRPCExecOne("{\"id\": 1}");
    BOOST_CHECK_EQUAL(find_value(find_value(reply, "error"), "code").get_int(), RPC_INVALID_REQUEST);

    UniValue error = CallError("nosuchmethod", "[]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_METHOD_NOT_FOUND);

    // The reply echoes the request id
    reply = Exec("nosuchmethod", "[]");
    BOOST_CHECK_EQUAL(find_value(reply, "id").get_int(), 7);

    // Wrong parameter count returns the help text
    error = CallError("getitem", "[]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_MISC_ERROR);
    BOOST_CHECK(find_value(error, "message").get_str().find("getitem id") == 0);

    error = CallError("getuser", "[\"0x1234\"]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_INVALID_ADDRESS_OR_KEY);

    error = CallError("registeruser", "[\"alice\"]", "0xnothex");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_INVALID_ADDRESS_OR_KEY);
}

BOOST_AUTO_TEST_CASE(rpc_caller_required)
{
    UniValue error = CallError("registeruser", "[\"alice\"]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_CALLER_REQUIRED);

    error = CallError("withdraw", "[]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_CALLER_REQUIRED);
}

BOOST_AUTO_TEST_CASE(rpc_help_and_stop)
{
    const std::string strHelp = CallRPC("help", "[]").get_str();
    BOOST_CHECK(strHelp.find("== Market ==") != std::string::npos);
    BOOST_CHECK(strHelp.find("executeswap") != std::string::npos);
    BOOST_CHECK(strHelp.find("setmocktime") == std::string::npos);

    const std::string strCommandHelp = CallRPC("help", "[\"buyitem\"]").get_str();
    BOOST_CHECK(strCommandHelp.find("buyitem id payment") == 0);

    BOOST_CHECK(!IsRPCShutdownRequested());
    CallRPC("stop", "[]");
    BOOST_CHECK(IsRPCShutdownRequested());
    ResetRPCShutdown();
}

BOOST_AUTO_TEST_CASE(rpc_marketplace_flow)
{
    UniValue result = CallRPC("registeruser", "[\"alice\"]", initiator);
    BOOST_CHECK_EQUAL(find_value(result, "identity").get_str(), initiator);
    const UniValue& events = find_value(result, "events");
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(events[0], "event").get_str(), "ParticipantRegistered");
    BOOST_CHECK_EQUAL(find_value(events[0], "name").get_str(), "alice");

    // Named arguments
    CallRPC("registeruser", "{\"name\": \"bob\"}", counterparty);

    result = CallRPC("listitem", "[\"Item1\", \"Description1\", 100]", initiator);
    BOOST_CHECK_EQUAL(find_value(result, "id").get_str(), "1");
    BOOST_CHECK_EQUAL(CallRPC("getitemcount", "[]").get_int64(), 1);

    CallRPC("deposit", strprintf("[\"%s\", 500]", counterparty));
    result = CallRPC("buyitem", "[\"1\", \"100\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(result, "owner").get_str(), counterparty);

    result = CallRPC("getitem", "[1]");
    BOOST_CHECK_EQUAL(find_value(result, "owner").get_str(), counterparty);
    BOOST_CHECK_EQUAL(find_value(result, "available").get_bool(), false);

    result = CallRPC("getuser", strprintf("[\"%s\"]", initiator));
    BOOST_CHECK_EQUAL(find_value(result, "name").get_str(), "alice");
    BOOST_CHECK_EQUAL(find_value(result, "registered").get_bool(), true);
    BOOST_CHECK_EQUAL(find_value(result, "pending_balance").get_int64(), 100);

    result = CallRPC("withdraw", "[]", initiator);
    BOOST_CHECK_EQUAL(find_value(result, "amount").get_int64(), 100);
    BOOST_CHECK_EQUAL(CallRPC("getnativebalance", strprintf("[\"%s\"]", initiator)).get_int64(), 100);
    BOOST_CHECK_EQUAL(CallRPC("getnativebalance", strprintf("[\"%s\"]", counterparty)).get_int64(), 400);

    // Unknown identities read as unregistered
    result = CallRPC("getuser", "[\"0x00000000000000000000000000000000000000ff\"]");
    BOOST_CHECK_EQUAL(find_value(result, "registered").get_bool(), false);

    UniValue error = CallError("getitem", "[9]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(rpc_settlement_error_object)
{
    CallRPC("registeruser", "[\"alice\"]", initiator);

    UniValue error = CallError("registeruser", "[\"alice\"]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_SETTLEMENT_REJECTED);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "AlreadyRegistered");
    BOOST_CHECK_EQUAL(find_value(error, "reject_reason").get_str(), "bad-market-already-registered");
    BOOST_CHECK_EQUAL(find_value(error, "message").get_str(), "bad-market-already-registered");
    BOOST_CHECK(find_value(error, "failed_leg").isNull());

    error = CallError("registeruser", "[\"alice\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "NameTaken");

    error = CallError("listitem", "[\"Item\", \"\", 0]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "InvalidPrice");

    error = CallError("withdraw", "[]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "NothingToWithdraw");

    // Negative amounts never reach the engine
    error = CallError("listitem", "[\"Item\", \"\", -1]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_TYPE_ERROR);
}

BOOST_AUTO_TEST_CASE(rpc_swap_flow)
{
    const UniValue info = CallRPC("getinfo", "[]");
    const std::string swapAddress = find_value(info, "swap").get_str();
    BOOST_CHECK_EQUAL(find_value(info, "chainId").get_int64(), DEFAULT_CHAIN_ID);

    // TKX comes from -asset, TKY is created here
    UniValue asset = CallRPC("createasset", "[\"TKY\"]");
    BOOST_CHECK_EQUAL(find_value(asset, "address").get_str(), StandardAsset("TKY"));
    BOOST_CHECK_EQUAL(CallRPC("listassets", "[]").size(), 2U);

    CallRPC("mint", strprintf("[\"%s\", \"%s\", 1000]", StandardAsset("TKX"), initiator));
    CallRPC("mint", strprintf("[\"%s\", \"%s\", 1000]", StandardAsset("TKY"), counterparty));
    CallRPC("approve", strprintf("[\"%s\", \"%s\", 1000]", StandardAsset("TKX"), swapAddress), initiator);

    const std::string order = Order(1, 100, 200);
    UniValue signed_order = CallRPC("signswap", "[" + order + ", \"" + PrivKeyHex("initiator") + "\"]");
    const std::string signature = find_value(signed_order, "signature").get_str();
    BOOST_CHECK_EQUAL(find_value(signed_order, "signer").get_str(), initiator);
    BOOST_CHECK_EQUAL(signature.size(), 2U + 2 * 65);

    UniValue recovered = CallRPC("recoverswapsigner", "[" + order + ", \"" + signature + "\"]");
    BOOST_CHECK_EQUAL(find_value(recovered, "signer").get_str(), initiator);
    BOOST_CHECK(find_value(recovered, "is_initiator").get_bool());

    const std::string fingerprint = find_value(CallRPC("computefingerprint", "[" + order + "]"), "fingerprint").get_str();

    // Leg B fails until the counterparty approves
    UniValue error = CallError("executeswap", "[" + order + ", \"" + signature + "\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_SETTLEMENT_REJECTED);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "TransferFailed");
    BOOST_CHECK_EQUAL(find_value(error, "failed_leg").get_int(), 1);

    CallRPC("approve", strprintf("[\"%s\", \"%s\", 1000]", StandardAsset("TKY"), swapAddress), counterparty);

    error = CallError("executeswap", "[" + order + ", \"" + signature + "\"]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "UnauthorizedCaller");

    UniValue result = CallRPC("executeswap", "[" + order + ", \"" + signature + "\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(result, "fingerprint").get_str(), fingerprint);
    BOOST_CHECK_EQUAL(find_value(result, "status").get_str(), "executed");
    const UniValue& events = find_value(result, "events");
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(events[0], "event").get_str(), "SwapExecuted");
    BOOST_CHECK_EQUAL(find_value(events[0], "fingerprint").get_str(), fingerprint);

    result = CallRPC("getswapstatus", "[\"" + fingerprint + "\"]");
    BOOST_CHECK_EQUAL(find_value(result, "status").get_str(), "executed");

    BOOST_CHECK_EQUAL(CallRPC("getassetbalance", strprintf("[\"%s\", \"%s\"]", StandardAsset("TKX"), counterparty)).get_int64(), 100);
    BOOST_CHECK_EQUAL(CallRPC("getassetbalance", strprintf("[\"%s\", \"%s\"]", StandardAsset("TKY"), initiator)).get_int64(), 200);

    error = CallError("executeswap", "[" + order + ", \"" + signature + "\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "AlreadySettled");
    error = CallError("cancelswap", "[" + order + ", \"" + signature + "\"]", initiator);
    BOOST_CHECK_EQUAL(find_value(error, "reject_reason").get_str(), "bad-swap-already-executed");

    // Committed events are kept for getevents
    const UniValue log = CallRPC("getevents", "[1]");
    BOOST_REQUIRE_EQUAL(log.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(log[0], "event").get_str(), "SwapExecuted");
}

BOOST_AUTO_TEST_CASE(rpc_swap_order_parsing)
{
    // Field aliases from typed-data tooling
    const std::string order = strprintf(
        "{\"swapId\": 3, \"initiator\": \"%s\", \"counterparty\": \"%s\", \"tokenX\": \"%s\", \"tokenY\": \"%s\", "
        "\"amountX\": \"10\", \"amountY\": 20, \"expiration\": %d}",
        initiator, counterparty, StandardAsset("TKX"), StandardAsset("TKY"), TEST_LEDGER_TIME + 3600);
    UniValue result = CallRPC("computefingerprint", "[" + order + "]");
    const UniValue& parsed = find_value(result, "order");
    BOOST_CHECK_EQUAL(find_value(parsed, "id").get_str(), "3");
    BOOST_CHECK_EQUAL(find_value(result, "packed").get_str().size(), 2U * PACKED_SWAP_ORDER_SIZE);

    UniValue error = CallError("computefingerprint", "[{\"id\": 1}]");
    BOOST_CHECK_EQUAL(find_value(error, "code").get_int(), RPC_DESERIALIZATION_ERROR);

    // A short signature is the engine's to reject
    error = CallError("executeswap", "[" + Order(1, 10, 20) + ", \"0x1234\"]", counterparty);
    BOOST_CHECK_EQUAL(find_value(error, "error").get_str(), "InvalidSignature");
}

BOOST_AUTO_TEST_SUITE_END()
