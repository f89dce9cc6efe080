// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

#include "util/format.h"

std::string SettlementErrorName(SettlementError err)
{
    switch (err) {
    case SettlementError::NONE: return "None";
    case SettlementError::INVALID_SIGNATURE: return "InvalidSignature";
    case SettlementError::UNAUTHORIZED_CALLER: return "UnauthorizedCaller";
    case SettlementError::NOT_REGISTERED: return "NotRegistered";
    case SettlementError::ALREADY_SETTLED: return "AlreadySettled";
    case SettlementError::ALREADY_REGISTERED: return "AlreadyRegistered";
    case SettlementError::NAME_TAKEN: return "NameTaken";
    case SettlementError::ITEM_UNAVAILABLE: return "ItemUnavailable";
    case SettlementError::SELF_PURCHASE: return "SelfPurchase";
    case SettlementError::REENTRANT_CALL: return "ReentrantCall";
    case SettlementError::EXPIRED: return "Expired";
    case SettlementError::WRONG_PAYMENT_AMOUNT: return "WrongPaymentAmount";
    case SettlementError::INVALID_PRICE: return "InvalidPrice";
    case SettlementError::NOTHING_TO_WITHDRAW: return "NothingToWithdraw";
    case SettlementError::INSUFFICIENT_FUNDS: return "InsufficientFunds";
    case SettlementError::TRANSFER_FAILED: return "TransferFailed";
    case SettlementError::WITHDRAWAL_TRANSFER_FAILED: return "WithdrawalTransferFailed";
    case SettlementError::INTERNAL: return "Internal";
    } // no default case, so the compiler can warn about missing cases
    return "Unknown";
}

std::string CValidationState::ToString() const
{
    if (IsValid()) return "Valid";
    std::string ret = strprintf("%s (%s)", strRejectReason, SettlementErrorName(m_error));
    if (!strDebugMessage.empty()) ret += ", " + strDebugMessage;
    if (m_failed_leg >= 0) ret += strprintf(", leg %d", m_failed_leg);
    return ret;
}
