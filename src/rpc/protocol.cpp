// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/protocol.h"

#include "consensus/validation.h"

/**
 * JSON-RPC protocol.  otcsettled speaks version 1.0 for maximum compatibility,
 * one request object per input line and one reply object per output line.
 */

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id)
{
    UniValue request(UniValue::VOBJ);
    request.pushKV("method", strMethod);
    request.pushKV("params", params);
    request.pushKV("id", id);
    return request;
}

UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id)
{
    UniValue reply(UniValue::VOBJ);
    if (!error.isNull())
        reply.pushKV("result", NullUniValue);
    else
        reply.pushKV("result", result);
    reply.pushKV("error", error);
    reply.pushKV("id", id);
    return reply;
}

std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id)
{
    UniValue reply = JSONRPCReplyObj(result, error, id);
    return reply.write() + "\n";
}

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

UniValue JSONRPCSettlementError(const CValidationState& state)
{
    const bool fStorage = state.IsError();
    UniValue error = JSONRPCError(fStorage ? RPC_DATABASE_ERROR : RPC_SETTLEMENT_REJECTED,
                                  state.GetRejectReason());
    error.pushKV("error", SettlementErrorName(state.GetError()));
    error.pushKV("reject_reason", state.GetRejectReason());
    if (!state.GetDebugMessage().empty()) {
        error.pushKV("debug", state.GetDebugMessage());
    }
    if (state.GetFailedLeg() >= 0) {
        error.pushKV("failed_leg", state.GetFailedLeg());
    }
    return error;
}
