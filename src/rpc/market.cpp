// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "core_io.h"
#include "market/marketplace.h"
#include "rpc/server.h"
#include "util/format.h"

#include <univalue.h>

static CMarketplace& EnsureMarketplace()
{
    if (!g_marketplace)
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Marketplace is not running");
    return *g_marketplace;
}

UniValue registeruser(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "registeruser \"name\"\n"
            "\nRegister the caller as a marketplace participant under a unique name.\n"
            "\nArguments:\n"
            "1. \"name\"     (string, required) display name, unique across participants\n"
            "\nResult:\n"
            "{\n"
            "  \"identity\": \"0x..\",\n"
            "  \"name\": \"..\",\n"
            "  \"events\": [...]\n"
            "}\n"
            "\nErrors: AlreadyRegistered, NameTaken\n"
            "\nExamples:\n" +
            HelpExampleCli("registeruser", "\"alice\"") +
            HelpExampleRpc("registeruser", "\"alice\""));
    }

    CMarketplace& market = EnsureMarketplace();
    const CAccountID& caller = GetRequestCaller(request);
    const std::string name = request.params[0].get_str();

    CValidationState state;
    LedgerEvents events;
    if (!market.RegisterParticipant(caller, name, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("identity", caller.ToString());
    result.pushKV("name", name);
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue listitem(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "listitem \"name\" \"description\" price\n"
            "\nList an item for sale, owned by the caller.\n"
            "\nArguments:\n"
            "1. \"name\"         (string, required) item name\n"
            "2. \"description\"  (string, required) item description\n"
            "3. price          (numeric or string, required) price in native units, greater than zero\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": \"n\",        (string) id of the new item\n"
            "  \"events\": [...]\n"
            "}\n"
            "\nErrors: NotRegistered, InvalidPrice\n"
            "\nExamples:\n" +
            HelpExampleCli("listitem", "\"Item1\", \"Description1\", 100"));
    }

    CMarketplace& market = EnsureMarketplace();
    const CAccountID& caller = GetRequestCaller(request);
    const std::string name = request.params[0].get_str();
    const std::string description = request.params[1].get_str();
    const CAmount nPrice = AmountFromValue(request.params[2]);

    CValidationState state;
    LedgerEvents events;
    uint64_t nId = 0;
    if (!market.ListItem(caller, name, description, nPrice, nId, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", strprintf("%u", nId));
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue buyitem(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "buyitem id payment\n"
            "\nBuy an available item, attaching exactly its price from the caller's native balance.\n"
            "The price is credited to the seller's pending balance.\n"
            "\nArguments:\n"
            "1. id        (numeric or string, required) item id\n"
            "2. payment   (numeric or string, required) native value attached to the call\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": \"n\",\n"
            "  \"owner\": \"0x..\",   (string) new owner (the caller)\n"
            "  \"events\": [...]\n"
            "}\n"
            "\nErrors: InsufficientFunds, NotRegistered, ItemUnavailable, SelfPurchase,\n"
            "WrongPaymentAmount, ReentrantCall\n"
            "\nExamples:\n" +
            HelpExampleCli("buyitem", "1, 100"));
    }

    CMarketplace& market = EnsureMarketplace();
    const CAccountID& caller = GetRequestCaller(request);
    const uint64_t nId = ParseUInt64V(request.params[0], "id");
    const CAmount nPayment = AmountFromValue(request.params[1]);

    CValidationState state;
    LedgerEvents events;
    if (!market.BuyItem(caller, nId, nPayment, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", strprintf("%u", nId));
    result.pushKV("owner", caller.ToString());
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue withdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "withdraw\n"
            "\nSend the caller's whole pending balance to the caller.\n"
            "\nResult:\n"
            "{\n"
            "  \"amount\": n,     (numeric) amount withdrawn\n"
            "  \"events\": [...]\n"
            "}\n"
            "\nErrors: NotRegistered, NothingToWithdraw, WithdrawalTransferFailed, ReentrantCall\n"
            "\nExamples:\n" +
            HelpExampleCli("withdraw", ""));
    }

    CMarketplace& market = EnsureMarketplace();
    const CAccountID& caller = GetRequestCaller(request);

    CValidationState state;
    LedgerEvents events;
    CAmount nWithdrawn = 0;
    if (!market.Withdraw(caller, nWithdrawn, state, &events))
        ThrowSettlementError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("amount", ValueFromAmount(nWithdrawn));
    result.pushKV("events", EventsToUniv(events));
    return result;
}

UniValue getuser(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getuser \"identity\"\n"
            "\nRegistration record of a participant.\n"
            "\nArguments:\n"
            "1. \"identity\"   (string, required) account id\n"
            "\nResult:\n"
            "{\n"
            "  \"identity\": \"0x..\",\n"
            "  \"name\": \"..\",\n"
            "  \"registered\": true|false,\n"
            "  \"pending_balance\": n\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getuser", "\"0x...\""));
    }

    CMarketplace& market = EnsureMarketplace();
    const CAccountID identity = ParseAccountV(request.params[0], "identity");

    CParticipant participant;
    if (!market.GetParticipant(identity, participant)) {
        participant.identity = identity;
    }
    UniValue result(UniValue::VOBJ);
    ParticipantToUniv(participant, result);
    return result;
}

UniValue getitem(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getitem id\n"
            "\nA listed item.\n"
            "\nArguments:\n"
            "1. id   (numeric or string, required) item id\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": \"n\",\n"
            "  \"name\": \"..\",\n"
            "  \"description\": \"..\",\n"
            "  \"price\": n,\n"
            "  \"available\": true|false,\n"
            "  \"owner\": \"0x..\"\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getitem", "1"));
    }

    CMarketplace& market = EnsureMarketplace();
    const uint64_t nId = ParseUInt64V(request.params[0], "id");

    CListing listing;
    if (!market.GetItem(nId, listing))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Item %u not found", nId));

    UniValue result(UniValue::VOBJ);
    ListingToUniv(listing, result);
    return result;
}

UniValue getitemcount(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getitemcount\n"
            "\nNumber of items ever listed; ids run from 1 to this count.\n"
            "\nResult:\n"
            "n    (numeric) item count\n"
            "\nExamples:\n" +
            HelpExampleCli("getitemcount", ""));
    }

    return (uint64_t)EnsureMarketplace().GetItemCount();
}

static const CRPCCommand commands[] = {
    //  category    name              actor            okSafeMode  argNames
    { "market",    "registeruser",   &registeruser,   true,       {"name"} },
    { "market",    "listitem",       &listitem,       true,       {"name", "description", "price"} },
    { "market",    "buyitem",        &buyitem,        true,       {"id", "payment"} },
    { "market",    "withdraw",       &withdraw,       true,       {} },
    { "market",    "getuser",        &getuser,        true,       {"identity"} },
    { "market",    "getitem",        &getitem,        true,       {"id"} },
    { "market",    "getitemcount",   &getitemcount,   true,       {} },
};

void RegisterMarketRPCCommands(CRPCTable& t)
{
    for (const auto& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
