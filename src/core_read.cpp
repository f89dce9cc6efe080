// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "settlement/fingerprint.h"
#include "util/format.h"
#include "utilstrencodings.h"

#include <univalue.h>

namespace {

const UniValue& FindMember(const UniValue& obj, const char* name, const char* alias)
{
    const UniValue& v = find_value(obj, name);
    if (!v.isNull()) return v;
    return find_value(obj, alias);
}

bool ReadUInt64(const UniValue& obj, const char* name, const char* alias, uint64_t& n, std::string& strError)
{
    const UniValue& v = FindMember(obj, name, alias);
    if ((!v.isNum() && !v.isStr()) || !ParseUInt64(v.getValStr(), &n)) {
        strError = strprintf("%s must be a non-negative integer", name);
        return false;
    }
    return true;
}

bool ReadAmount(const UniValue& obj, const char* name, const char* alias, CAmount& n, std::string& strError)
{
    const UniValue& v = FindMember(obj, name, alias);
    int64_t value;
    if ((!v.isNum() && !v.isStr()) || !ParseInt64(v.getValStr(), &value)) {
        strError = strprintf("%s must be an integer amount", name);
        return false;
    }
    if (!AmountRange(value)) {
        strError = strprintf("%s out of range", name);
        return false;
    }
    n = value;
    return true;
}

bool ReadAccount(const UniValue& obj, const char* name, const char* alias, CAccountID& id, std::string& strError)
{
    const UniValue& v = FindMember(obj, name, alias);
    if (!v.isStr() || !ParseAccountID(v.get_str(), id)) {
        strError = strprintf("%s must be a 0x-prefixed 20-byte hex account id", name);
        return false;
    }
    return true;
}

} // anonymous namespace

bool DecodeSwapOrder(const UniValue& obj, SwapOrder& order, std::string& strError)
{
    if (!obj.isObject()) {
        strError = "order must be an object";
        return false;
    }
    return ReadUInt64(obj, "id", "swapId", order.nId, strError) &&
           ReadAccount(obj, "initiator", "initiator", order.initiator, strError) &&
           ReadAccount(obj, "counterparty", "counterparty", order.counterparty, strError) &&
           ReadAccount(obj, "assetA", "tokenX", order.assetA, strError) &&
           ReadAccount(obj, "assetB", "tokenY", order.assetB, strError) &&
           ReadAmount(obj, "amountA", "amountX", order.nAmountA, strError) &&
           ReadAmount(obj, "amountB", "amountY", order.nAmountB, strError) &&
           ReadUInt64(obj, "expiry", "expiration", order.nExpiry, strError);
}
