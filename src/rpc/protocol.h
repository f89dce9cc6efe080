// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_RPC_PROTOCOL_H
#define OTCSETTLE_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

class CValidationState;

//! OTCSettle RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS = -32602,
    RPC_INTERNAL_ERROR = -32603,
    RPC_PARSE_ERROR = -32700,

    //! General application defined errors
    RPC_MISC_ERROR = -1,            //! std::exception thrown in command handling
    RPC_TYPE_ERROR = -3,            //! Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS_OR_KEY = -5, //! Invalid account id or key
    RPC_INVALID_PARAMETER = -8,     //! Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR = -20,       //! Ledger storage error
    RPC_DESERIALIZATION_ERROR = -22, //! Error parsing or validating structure in raw format
    RPC_SETTLEMENT_REJECTED = -26,  //! Settlement operation rejected (see "reject_reason")
    RPC_CALLER_REQUIRED = -27,      //! Request carries no "caller" identity
};

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);
UniValue JSONRPCError(int code, const std::string& message);

/**
 * Error object for a rejected settlement operation:
 *   { "code", "message", "error": taxonomy name, "reject_reason",
 *     "debug" (if any), "failed_leg" (if a transfer leg failed) }
 * Storage failures are reported with RPC_DATABASE_ERROR instead.
 */
UniValue JSONRPCSettlementError(const CValidationState& state);

#endif // OTCSETTLE_RPC_PROTOCOL_H
