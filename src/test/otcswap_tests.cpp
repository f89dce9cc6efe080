// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * OTC swap service tests
 *
 * Test 1: A valid order settles once, both legs move
 * Test 2: Second execution fails with AlreadySettled
 * Test 3: Cancel and execute exclude each other
 * Test 4: Only the counterparty executes, only the initiator cancels
 * Test 5: Expiry boundary follows the ledger clock
 * Test 6: A failed leg rolls back the whole swap
 * Test 7: Settled state survives a ledger restart
 */

#include "consensus/validation.h"
#include "settlement/statemachine.h"
#include "test/test_otcsettle.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

static void CheckReject(const CValidationState& state, SettlementError err, const std::string& reason)
{
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK_EQUAL(SettlementErrorName(state.GetError()), SettlementErrorName(err));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), reason);
}

BOOST_FIXTURE_TEST_SUITE(otcswap_tests, LedgerTestingSetup)

// =============================================================================
// Test 1: Settlement
// =============================================================================

BOOST_AUTO_TEST_CASE(execute_moves_both_legs)
{
    SwapOrder order = MakeOrder();
    order.nAmountA = 100;
    order.nAmountB = 200;
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    LedgerEvents events;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, state, &events));
    BOOST_CHECK(state.IsValid());

    BOOST_CHECK_EQUAL(BalanceX(initiator), 900);
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 100);
    BOOST_CHECK_EQUAL(BalanceY(initiator), 200);
    BOOST_CHECK_EQUAL(BalanceY(counterparty), 800);

    // Allowances are spent by the swap service
    BOOST_CHECK_EQUAL(host->GetAllowance(tokenX->GetAddress(), initiator, swap->GetAddress()), 900);
    BOOST_CHECK_EQUAL(host->GetAllowance(tokenY->GetAddress(), counterparty, swap->GetAddress()), 800);

    const uint256 fingerprint = ComputeFingerprint(order);
    BOOST_CHECK(swap->GetSwapStatus(fingerprint) == SwapStatus::EXECUTED);

    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].type == LedgerEventType::SWAP_EXECUTED);
    BOOST_CHECK(events[0].fingerprint == fingerprint);
    BOOST_CHECK(events[0].emitter == swap->GetAddress());

    const LedgerEvents log = host->GetEventLog();
    BOOST_REQUIRE(!log.empty());
    BOOST_CHECK(log.back().type == LedgerEventType::SWAP_EXECUTED);
    BOOST_CHECK(log.back().fingerprint == fingerprint);
}

BOOST_AUTO_TEST_CASE(distinct_orders_settle_independently)
{
    const SwapOrder order1 = MakeOrder(1);
    const SwapOrder order2 = MakeOrder(2);

    CValidationState state;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order1, Sign(initiatorKey, order1), state));
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order2, Sign(initiatorKey, order2), state));
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 200);
    BOOST_CHECK_EQUAL(BalanceY(initiator), 100);
}

// =============================================================================
// Test 2: Replay
// =============================================================================

BOOST_AUTO_TEST_CASE(double_execute_rejected)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_REQUIRE(swap->ExecuteSwap(counterparty, order, vchSig, state));

    CValidationState replay;
    LedgerEvents events;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, replay, &events));
    CheckReject(replay, SettlementError::ALREADY_SETTLED, "bad-swap-already-executed");
    BOOST_CHECK(events.empty());

    // Settled once only
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 100);
    BOOST_CHECK_EQUAL(BalanceY(initiator), 50);
}

// =============================================================================
// Test 3: Cancellation
// =============================================================================

BOOST_AUTO_TEST_CASE(cancel_then_execute)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    LedgerEvents events;
    BOOST_CHECK(swap->CancelSwap(initiator, order, vchSig, state, &events));
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].type == LedgerEventType::SWAP_CANCELLED);
    BOOST_CHECK(events[0].fingerprint == ComputeFingerprint(order));
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::CANCELLED);

    CValidationState execState;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, execState));
    CheckReject(execState, SettlementError::ALREADY_SETTLED, "bad-swap-already-cancelled");

    CValidationState cancelState;
    BOOST_CHECK(!swap->CancelSwap(initiator, order, vchSig, cancelState));
    CheckReject(cancelState, SettlementError::ALREADY_SETTLED, "bad-swap-already-cancelled");

    BOOST_CHECK_EQUAL(BalanceX(initiator), 1000);
    BOOST_CHECK_EQUAL(BalanceY(counterparty), 1000);
}

BOOST_AUTO_TEST_CASE(execute_then_cancel)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_REQUIRE(swap->ExecuteSwap(counterparty, order, vchSig, state));

    CValidationState cancelState;
    BOOST_CHECK(!swap->CancelSwap(initiator, order, vchSig, cancelState));
    CheckReject(cancelState, SettlementError::ALREADY_SETTLED, "bad-swap-already-executed");
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::EXECUTED);
}

BOOST_AUTO_TEST_CASE(cancel_after_expiry)
{
    SwapOrder order = MakeOrder();
    order.nExpiry = TEST_LEDGER_TIME - 1;
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_CHECK(swap->CancelSwap(initiator, order, vchSig, state));
}

// =============================================================================
// Test 4: Caller authorization
// =============================================================================

BOOST_AUTO_TEST_CASE(wrong_caller_rejected)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState s1;
    BOOST_CHECK(!swap->ExecuteSwap(other, order, vchSig, s1));
    CheckReject(s1, SettlementError::UNAUTHORIZED_CALLER, "bad-swap-caller");

    CValidationState s2;
    BOOST_CHECK(!swap->ExecuteSwap(initiator, order, vchSig, s2));
    CheckReject(s2, SettlementError::UNAUTHORIZED_CALLER, "bad-swap-caller");

    CValidationState s3;
    BOOST_CHECK(!swap->CancelSwap(counterparty, order, vchSig, s3));
    CheckReject(s3, SettlementError::UNAUTHORIZED_CALLER, "bad-swap-caller");

    // Nothing was recorded
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::UNSEEN);
    CValidationState s4;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, s4));
}

BOOST_AUTO_TEST_CASE(signature_by_other_key_rejected)
{
    const SwapOrder order = MakeOrder();

    CValidationState s1;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, Sign(counterpartyKey, order), s1));
    CheckReject(s1, SettlementError::INVALID_SIGNATURE, "bad-swap-signature");

    // Signature over different terms
    SwapOrder altered = order;
    altered.nAmountB = 1;
    CValidationState s2;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, altered, Sign(initiatorKey, order), s2));
    CheckReject(s2, SettlementError::INVALID_SIGNATURE, "bad-swap-signature");

    CValidationState s3;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, std::vector<unsigned char>(64, 1), s3));
    CheckReject(s3, SettlementError::INVALID_SIGNATURE, "bad-swap-signature");
}

// =============================================================================
// Test 5: Expiry
// =============================================================================

BOOST_AUTO_TEST_CASE(expiry_boundary)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    SetMockTime(order.nExpiry);
    CValidationState s1;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, s1));
    CheckReject(s1, SettlementError::EXPIRED, "bad-swap-expired");

    SetMockTime(order.nExpiry - 1);
    CValidationState s2;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, s2));
}

// =============================================================================
// Test 6: Atomicity
// =============================================================================

BOOST_AUTO_TEST_CASE(failed_leg_b_rolls_back)
{
    const SwapOrder order = MakeOrder();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    // Leg B needs 50 TKY from the counterparty
    BOOST_REQUIRE(Approve(tokenY, counterparty, swap->GetAddress(), 10));

    CValidationState state;
    LedgerEvents events;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, state, &events));
    CheckReject(state, SettlementError::TRANSFER_FAILED, "bad-swap-transfer-failed");
    BOOST_CHECK_EQUAL(state.GetFailedLeg(), 1);
    BOOST_CHECK(events.empty());

    // Leg A was undone with the rest of the call
    BOOST_CHECK_EQUAL(BalanceX(initiator), 1000);
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 0);
    BOOST_CHECK_EQUAL(BalanceY(counterparty), 1000);
    BOOST_CHECK_EQUAL(host->GetAllowance(tokenX->GetAddress(), initiator, swap->GetAddress()), 1000);
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::UNSEEN);

    // Same order settles once funds are approved
    BOOST_REQUIRE(Approve(tokenY, counterparty, swap->GetAddress(), 50));
    CValidationState retry;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, retry));
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 100);
    BOOST_CHECK_EQUAL(BalanceY(initiator), 50);
}

BOOST_AUTO_TEST_CASE(failed_leg_a_reported)
{
    SwapOrder order = MakeOrder();
    order.nAmountA = 5000;
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, state));
    CheckReject(state, SettlementError::TRANSFER_FAILED, "bad-swap-transfer-failed");
    BOOST_CHECK_EQUAL(state.GetFailedLeg(), 0);
}

BOOST_AUTO_TEST_CASE(unknown_asset_fails_transfer)
{
    SwapOrder order = MakeOrder();
    order.assetB = CLedgerHost::DeriveContractAddress("test.asset.none");
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, state));
    CheckReject(state, SettlementError::TRANSFER_FAILED, "bad-swap-transfer-failed");
    BOOST_CHECK_EQUAL(state.GetFailedLeg(), 1);
    BOOST_CHECK_EQUAL(BalanceX(initiator), 1000);
}

// =============================================================================
// Test 7: Persistence
// =============================================================================

BOOST_AUTO_TEST_CASE(settled_state_persists)
{
    const SwapOrder executed = MakeOrder(1);
    const SwapOrder cancelled = MakeOrder(2);
    const std::vector<unsigned char> sigExecuted = Sign(initiatorKey, executed);
    const std::vector<unsigned char> sigCancelled = Sign(initiatorKey, cancelled);

    CValidationState state;
    BOOST_REQUIRE(swap->ExecuteSwap(counterparty, executed, sigExecuted, state));
    BOOST_REQUIRE(swap->CancelSwap(initiator, cancelled, sigCancelled, state));

    ReopenLedger();

    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(executed)) == SwapStatus::EXECUTED);
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(cancelled)) == SwapStatus::CANCELLED);
    BOOST_CHECK_EQUAL(BalanceX(counterparty), 100);

    CValidationState replay;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, executed, sigExecuted, replay));
    CheckReject(replay, SettlementError::ALREADY_SETTLED, "bad-swap-already-executed");
}

BOOST_AUTO_TEST_SUITE_END()
