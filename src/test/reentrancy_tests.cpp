// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Re-entrancy tests
 *
 * Test 1: Guard and lock semantics
 * Test 2: A receive hook re-entering withdraw
 * Test 3: A receive hook rejecting the payment
 * Test 4: An asset contract re-entering executeSwap
 * Test 5: Unguarded calls from inside a guarded one
 * Test 6: Nested calls made under another account's identity
 */

#include "consensus/validation.h"
#include "host/context.h"
#include "settlement/reentrancy.h"
#include "test/test_otcsettle.h"

#include <boost/test/unit_test.hpp>

namespace {

/** Receive hook that tries to withdraw again while being paid */
class CReenteringReceiver : public CValueReceiver
{
public:
    CMarketplace* pMarket{nullptr};
    CAccountID identity;
    bool fAccept{true};
    bool fReentered{false};
    bool fNestedResult{false};
    CValidationState nestedState;
    int nCalls{0};

    bool OnReceive(CLedgerHost& host, CLedgerTx& tx, const CAccountID& from, CAmount nAmount) override
    {
        ++nCalls;
        if (pMarket && !fReentered) {
            fReentered = true;
            CAmount nNested = 0;
            fNestedResult = pMarket->Withdraw(identity, nNested, nestedState);
        }
        return fAccept;
    }
};

/** Receive hook that tries to cancel somebody else's order while being paid */
class CCancellingReceiver : public CValueReceiver
{
public:
    COTCSwap* pSwap{nullptr};
    CAccountID cancelAs;
    SwapOrder order;
    std::vector<unsigned char> vchSig;
    bool fAttempted{false};
    bool fCancelled{false};
    CValidationState cancelState;

    bool OnReceive(CLedgerHost& host, CLedgerTx& tx, const CAccountID& from, CAmount nAmount) override
    {
        fAttempted = true;
        fCancelled = pSwap->CancelSwap(cancelAs, order, vchSig, cancelState);
        return true;
    }
};

class CRejectingReceiver : public CValueReceiver
{
public:
    bool OnReceive(CLedgerHost& host, CLedgerTx& tx, const CAccountID& from, CAmount nAmount) override
    {
        return false;
    }
};

/** Standard asset whose transfer calls back into the swap service */
class CReenteringAsset : public CStandardAsset
{
public:
    COTCSwap* pSwap{nullptr};
    CAccountID caller;
    SwapOrder order;
    std::vector<unsigned char> vchSig;
    bool fFailOnRejection{false};
    bool fReentered{false};
    bool fNestedResult{false};
    CValidationState nestedState;

    // Registration through a service that has no guard
    CMarketplace* pMarket{nullptr};
    std::string strRegisterName;
    bool fRegistered{false};

    // Purchase on behalf of another account
    uint64_t nBuyId{0};
    CAccountID buyAs;
    CAmount nBuyPayment{0};
    bool fBuyAttempted{false};
    bool fBought{false};
    CValidationState buyState;

    CReenteringAsset(const CAccountID& address, const std::string& symbol) : CStandardAsset(address, symbol) {}

    bool TransferFrom(CLedgerHost& host, CLedgerTx& tx, const CAccountID& spender,
                      const CAccountID& from, const CAccountID& to, CAmount nAmount) override
    {
        if (pSwap && !fReentered) {
            fReentered = true;
            fNestedResult = pSwap->ExecuteSwap(caller, order, vchSig, nestedState);
            if (!fNestedResult && fFailOnRejection) return false;
        }
        if (pMarket && !strRegisterName.empty()) {
            CValidationState state;
            fRegistered = pMarket->RegisterParticipant(GetAddress(), strRegisterName, state);
        }
        if (pMarket && nBuyId != 0 && !fBuyAttempted) {
            fBuyAttempted = true;
            fBought = pMarket->BuyItem(buyAs, nBuyId, nBuyPayment, buyState);
        }
        return CStandardAsset::TransferFrom(host, tx, spender, from, to, nAmount);
    }
};

struct ReentrancySetup : public LedgerTestingSetup {
    ReentrancySetup()
    {
        CValidationState state;
        BOOST_REQUIRE(market->RegisterParticipant(initiator, "seller", state));
        BOOST_REQUIRE(market->RegisterParticipant(counterparty, "buyer", state));
        uint64_t nId = 0;
        BOOST_REQUIRE(market->ListItem(initiator, "Item", "Description", 100, nId, state));
        BOOST_REQUIRE(market->BuyItem(counterparty, nId, 100, state));
    }

    CAmount Pending(const CAccountID& identity) const
    {
        CParticipant participant;
        if (!market->GetParticipant(identity, participant)) return 0;
        return participant.nPendingBalance;
    }

    std::shared_ptr<CReenteringAsset> MakeReenteringAsset()
    {
        auto asset = std::make_shared<CReenteringAsset>(CLedgerHost::DeriveContractAddress("test.asset.EVIL"), "EVIL");
        host->RegisterAsset(asset);
        BOOST_REQUIRE(Mint(asset, initiator, 1000));
        BOOST_REQUIRE(Approve(asset, initiator, swap->GetAddress(), 1000));
        return asset;
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(reentrancy_tests, ReentrancySetup)

// =============================================================================
// Test 1: Guard
// =============================================================================

BOOST_AUTO_TEST_CASE(guard_lock_semantics)
{
    CReentrancyGuard guard;
    BOOST_CHECK(!guard.IsEntered());
    {
        CReentrancyLock outer(guard);
        BOOST_CHECK(outer);
        BOOST_CHECK(guard.IsEntered());
        {
            CReentrancyLock inner(guard);
            BOOST_CHECK(!inner);
        }
        // The refused lock does not release the guard
        BOOST_CHECK(guard.IsEntered());
    }
    BOOST_CHECK(!guard.IsEntered());

    CReentrancyLock again(guard);
    BOOST_CHECK(again);
}

BOOST_AUTO_TEST_CASE(reject_reentrant_call_state)
{
    CValidationState state;
    BOOST_CHECK(!RejectReentrantCall(state, "withdraw"));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetError() == SettlementError::REENTRANT_CALL);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-reentrant-call");
}

// =============================================================================
// Test 2: Withdraw re-entry
// =============================================================================

BOOST_AUTO_TEST_CASE(reentrant_withdraw_rejected)
{
    auto receiver = std::make_shared<CReenteringReceiver>();
    receiver->pMarket = market.get();
    receiver->identity = initiator;
    host->RegisterReceiver(initiator, receiver);

    CValidationState state;
    CAmount nWithdrawn = 0;
    BOOST_CHECK(market->Withdraw(initiator, nWithdrawn, state));
    BOOST_CHECK_EQUAL(nWithdrawn, 100);

    BOOST_CHECK(receiver->fReentered);
    BOOST_CHECK(!receiver->fNestedResult);
    BOOST_CHECK(receiver->nestedState.GetError() == SettlementError::REENTRANT_CALL);
    BOOST_CHECK_EQUAL(receiver->nestedState.GetRejectReason(), "bad-reentrant-call");

    // Paid exactly once
    BOOST_CHECK_EQUAL(receiver->nCalls, 1);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(initiator), 1100);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(market->GetAddress()), 0);
    BOOST_CHECK_EQUAL(Pending(initiator), 0);

    // Guard released afterwards
    CValidationState again;
    BOOST_CHECK(!market->Withdraw(initiator, nWithdrawn, again));
    BOOST_CHECK(again.GetError() == SettlementError::NOTHING_TO_WITHDRAW);
}

BOOST_AUTO_TEST_CASE(reentrant_withdraw_refused_payment)
{
    auto receiver = std::make_shared<CReenteringReceiver>();
    receiver->pMarket = market.get();
    receiver->identity = initiator;
    receiver->fAccept = false;
    host->RegisterReceiver(initiator, receiver);

    CValidationState state;
    CAmount nWithdrawn = 0;
    BOOST_CHECK(!market->Withdraw(initiator, nWithdrawn, state));
    BOOST_CHECK(state.GetError() == SettlementError::WITHDRAWAL_TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-market-withdraw-transfer");
    BOOST_CHECK(receiver->nestedState.GetError() == SettlementError::REENTRANT_CALL);

    // Everything rolled back, pending balance included
    BOOST_CHECK_EQUAL(nWithdrawn, 0);
    BOOST_CHECK_EQUAL(Pending(initiator), 100);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(initiator), 1000);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(market->GetAddress()), 100);
}

// =============================================================================
// Test 3: Rejecting receiver
// =============================================================================

BOOST_AUTO_TEST_CASE(rejecting_receiver_keeps_pending)
{
    host->RegisterReceiver(initiator, std::make_shared<CRejectingReceiver>());

    CValidationState state;
    CAmount nWithdrawn = 0;
    BOOST_CHECK(!market->Withdraw(initiator, nWithdrawn, state));
    BOOST_CHECK(state.GetError() == SettlementError::WITHDRAWAL_TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(Pending(initiator), 100);

    // A plain account can be paid again once the hook is gone
    host->RegisterReceiver(initiator, nullptr);
    CValidationState retry;
    BOOST_CHECK(market->Withdraw(initiator, nWithdrawn, retry));
    BOOST_CHECK_EQUAL(nWithdrawn, 100);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(initiator), 1100);
}

// =============================================================================
// Test 4: Swap re-entry through an asset contract
// =============================================================================

BOOST_AUTO_TEST_CASE(reentrant_execute_swap_rejected)
{
    auto evil = MakeReenteringAsset();

    SwapOrder order = MakeOrder();
    order.assetA = evil->GetAddress();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    evil->pSwap = swap.get();
    evil->caller = counterparty;
    evil->order = order;
    evil->vchSig = vchSig;

    CValidationState state;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, state));
    BOOST_CHECK(evil->fReentered);
    BOOST_CHECK(!evil->fNestedResult);
    BOOST_CHECK(evil->nestedState.GetError() == SettlementError::REENTRANT_CALL);

    // One settlement only
    BOOST_CHECK_EQUAL(host->GetAssetBalance(evil->GetAddress(), initiator), 900);
    BOOST_CHECK_EQUAL(host->GetAssetBalance(evil->GetAddress(), counterparty), 100);
    BOOST_CHECK_EQUAL(BalanceY(initiator), 50);
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::EXECUTED);
}

BOOST_AUTO_TEST_CASE(reentrant_execute_swap_fails_transfer)
{
    auto evil = MakeReenteringAsset();

    SwapOrder order = MakeOrder();
    order.assetA = evil->GetAddress();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    evil->pSwap = swap.get();
    evil->caller = counterparty;
    evil->order = order;
    evil->vchSig = vchSig;
    evil->fFailOnRejection = true;

    CValidationState state;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, state));
    BOOST_CHECK(state.GetError() == SettlementError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(state.GetFailedLeg(), 0);

    BOOST_CHECK_EQUAL(host->GetAssetBalance(evil->GetAddress(), initiator), 1000);
    BOOST_CHECK_EQUAL(BalanceY(counterparty), 1000);
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::UNSEEN);
}

// =============================================================================
// Test 5: Unguarded nested calls
// =============================================================================

BOOST_AUTO_TEST_CASE(nested_call_commits_with_parent)
{
    auto evil = MakeReenteringAsset();
    evil->pMarket = market.get();
    evil->strRegisterName = "nested";

    // Leg A makes the asset contract register itself
    SwapOrder order = MakeOrder();
    order.assetA = evil->GetAddress();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, state));
    BOOST_CHECK(evil->fRegistered);

    CParticipant participant;
    BOOST_REQUIRE(market->GetParticipant(evil->GetAddress(), participant));
    BOOST_CHECK_EQUAL(participant.name, "nested");
}

BOOST_AUTO_TEST_CASE(nested_call_dropped_with_parent)
{
    auto evil = MakeReenteringAsset();
    evil->pMarket = market.get();
    evil->strRegisterName = "dropped";

    SwapOrder order = MakeOrder();
    order.assetA = evil->GetAddress();
    order.nAmountB = 5000;
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    // Leg A registers and succeeds, leg B cannot be covered
    CValidationState state;
    BOOST_CHECK(!swap->ExecuteSwap(counterparty, order, vchSig, state));
    BOOST_CHECK(state.GetError() == SettlementError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(state.GetFailedLeg(), 1);
    BOOST_CHECK(evil->fRegistered);

    CParticipant participant;
    BOOST_CHECK(!market->GetParticipant(evil->GetAddress(), participant));
}

// =============================================================================
// Test 6: Nested caller identity
// =============================================================================

BOOST_AUTO_TEST_CASE(nested_buy_as_other_account_refused)
{
    CValidationState listState;
    uint64_t nId = 0;
    BOOST_REQUIRE(market->ListItem(initiator, "Second", "Description", 100, nId, listState));

    const CAmount nVictimBalance = host->GetNativeBalance(counterparty);
    const CAmount nMarketBalance = host->GetNativeBalance(market->GetAddress());
    BOOST_REQUIRE_GE(nVictimBalance, 100);

    // Leg A tries to spend the counterparty's native value on the listing
    auto evil = MakeReenteringAsset();
    evil->pMarket = market.get();
    evil->nBuyId = nId;
    evil->buyAs = counterparty;
    evil->nBuyPayment = 100;

    SwapOrder order = MakeOrder();
    order.assetA = evil->GetAddress();
    const std::vector<unsigned char> vchSig = Sign(initiatorKey, order);

    CValidationState state;
    BOOST_CHECK(swap->ExecuteSwap(counterparty, order, vchSig, state));
    BOOST_CHECK(evil->fBuyAttempted);
    BOOST_CHECK(!evil->fBought);
    BOOST_CHECK(evil->buyState.GetError() == SettlementError::UNAUTHORIZED_CALLER);
    BOOST_CHECK_EQUAL(evil->buyState.GetRejectReason(), "bad-call-caller");

    BOOST_CHECK_EQUAL(host->GetNativeBalance(counterparty), nVictimBalance);
    BOOST_CHECK_EQUAL(host->GetNativeBalance(market->GetAddress()), nMarketBalance);
    BOOST_CHECK_EQUAL(Pending(initiator), 100);

    CListing listing;
    BOOST_REQUIRE(market->GetItem(nId, listing));
    BOOST_CHECK(listing.fAvailable);
    BOOST_CHECK(listing.owner == initiator);

    // The swap itself settled normally
    BOOST_CHECK(swap->GetSwapStatus(ComputeFingerprint(order)) == SwapStatus::EXECUTED);
    BOOST_CHECK_EQUAL(host->GetAssetBalance(evil->GetAddress(), counterparty), 100);
}

BOOST_AUTO_TEST_CASE(nested_cancel_as_other_account_refused)
{
    // An order of a third party, whose public signature the hook has seen
    SwapOrder order = MakeOrder();
    order.initiator = other;
    const std::vector<unsigned char> vchSig = Sign(otherKey, order);
    const uint256 fingerprint = ComputeFingerprint(order);

    auto receiver = std::make_shared<CCancellingReceiver>();
    receiver->pSwap = swap.get();
    receiver->cancelAs = other;
    receiver->order = order;
    receiver->vchSig = vchSig;
    host->RegisterReceiver(initiator, receiver);

    CValidationState state;
    CAmount nWithdrawn = 0;
    BOOST_CHECK(market->Withdraw(initiator, nWithdrawn, state));
    BOOST_CHECK_EQUAL(nWithdrawn, 100);

    BOOST_CHECK(receiver->fAttempted);
    BOOST_CHECK(!receiver->fCancelled);
    BOOST_CHECK(receiver->cancelState.GetError() == SettlementError::UNAUTHORIZED_CALLER);
    BOOST_CHECK_EQUAL(receiver->cancelState.GetRejectReason(), "bad-call-caller");
    BOOST_CHECK(swap->GetSwapStatus(fingerprint) == SwapStatus::UNSEEN);

    // Its real initiator can still cancel it
    CValidationState cancelState;
    BOOST_CHECK(swap->CancelSwap(other, order, vchSig, cancelState));
    BOOST_CHECK(swap->GetSwapStatus(fingerprint) == SwapStatus::CANCELLED);
}

BOOST_AUTO_TEST_SUITE_END()
