// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"
#include "host/host.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerview.h"
#include "test/test_otcsettle.h"
#include "util/system.h"

#include <memory>

#include <boost/test/unit_test.hpp>

namespace {

struct LedgerViewSetup : public BasicTestingSetup {
    std::unique_ptr<CLedgerViewDB> db;
    const CAccountID alice = CLedgerHost::DeriveContractAddress("alice");
    const CAccountID bob = CLedgerHost::DeriveContractAddress("bob");
    const CAccountID asset = CLedgerHost::DeriveContractAddress("asset");

    LedgerViewSetup()
    {
        db = std::make_unique<CLedgerViewDB>(GetDataDir() / "ledgertest", 1 << 20, true);
    }

    void Reopen()
    {
        db.reset();
        db = std::make_unique<CLedgerViewDB>(GetDataDir() / "ledgertest", 1 << 20, false);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(ledgerview_tests, LedgerViewSetup)

BOOST_AUTO_TEST_CASE(empty_ledger_defaults)
{
    BOOST_CHECK(db->IsEmpty());
    BOOST_CHECK(db->GetSwapStatus(Keccak256(std::string("01"))) == SwapStatus::UNSEEN);
    BOOST_CHECK_EQUAL(db->GetListingCount(), 0U);
    BOOST_CHECK_EQUAL(db->GetNativeBalance(alice), 0);
    CParticipant participant;
    BOOST_CHECK(!db->GetParticipant(alice, participant));
    CAccountID owner;
    BOOST_CHECK(!db->GetNameOwner("alice", owner));
}

BOOST_AUTO_TEST_CASE(cache_discard)
{
    CLedgerViewCache cache(db.get());
    cache.SetNativeBalance(alice, 10);
    cache.SetAssetBalance(asset, alice, 20);
    BOOST_CHECK_EQUAL(cache.GetNativeBalance(alice), 10);
    BOOST_CHECK_EQUAL(cache.GetAssetBalance(asset, alice), 20);
    BOOST_CHECK_EQUAL(cache.GetCacheSize(), 2U);
    BOOST_CHECK_EQUAL(db->GetNativeBalance(alice), 0);

    cache.Discard();
    BOOST_CHECK_EQUAL(cache.GetCacheSize(), 0U);
    BOOST_CHECK_EQUAL(cache.GetNativeBalance(alice), 0);
    BOOST_CHECK(db->IsEmpty());
}

BOOST_AUTO_TEST_CASE(cache_flush_all_entries)
{
    const uint256 executed = Keccak256(std::string("aa"));
    const uint256 cancelled = Keccak256(std::string("bb"));

    CParticipant participant;
    participant.identity = alice;
    participant.name = "alice";
    participant.fRegistered = true;
    participant.nPendingBalance = 42;

    CListing listing;
    listing.nId = 1;
    listing.name = "Item1";
    listing.description = "Description1";
    listing.nPrice = 100;
    listing.fAvailable = true;
    listing.owner = alice;

    {
        CLedgerViewCache cache(db.get());
        BOOST_CHECK(cache.SetSwapStatus(executed, SwapStatus::EXECUTED));
        BOOST_CHECK(cache.SetSwapStatus(cancelled, SwapStatus::CANCELLED));
        cache.PutParticipant(participant);
        cache.PutNameOwner("alice", alice);
        cache.PutListing(listing);
        cache.SetListingCount(1);
        cache.SetAssetBalance(asset, alice, 500);
        cache.SetAllowance(asset, alice, bob, 70);
        cache.SetNativeBalance(bob, 9);
        BOOST_CHECK(cache.Flush());
        BOOST_CHECK_EQUAL(cache.GetCacheSize(), 0U);
    }

    Reopen();

    BOOST_CHECK(db->GetSwapStatus(executed) == SwapStatus::EXECUTED);
    BOOST_CHECK(db->GetSwapStatus(cancelled) == SwapStatus::CANCELLED);
    CParticipant readParticipant;
    BOOST_REQUIRE(db->GetParticipant(alice, readParticipant));
    BOOST_CHECK(readParticipant.identity == alice);
    BOOST_CHECK_EQUAL(readParticipant.name, "alice");
    BOOST_CHECK(readParticipant.fRegistered);
    BOOST_CHECK_EQUAL(readParticipant.nPendingBalance, 42);
    CAccountID owner;
    BOOST_REQUIRE(db->GetNameOwner("alice", owner));
    BOOST_CHECK(owner == alice);
    CListing readListing;
    BOOST_REQUIRE(db->GetListing(1, readListing));
    BOOST_CHECK_EQUAL(readListing.nId, 1U);
    BOOST_CHECK_EQUAL(readListing.name, "Item1");
    BOOST_CHECK_EQUAL(readListing.description, "Description1");
    BOOST_CHECK_EQUAL(readListing.nPrice, 100);
    BOOST_CHECK(readListing.fAvailable);
    BOOST_CHECK(readListing.owner == alice);
    BOOST_CHECK_EQUAL(db->GetListingCount(), 1U);
    BOOST_CHECK_EQUAL(db->GetAssetBalance(asset, alice), 500);
    BOOST_CHECK_EQUAL(db->GetAllowance(asset, alice, bob), 70);
    BOOST_CHECK_EQUAL(db->GetAllowance(asset, bob, alice), 0);
    BOOST_CHECK_EQUAL(db->GetNativeBalance(bob), 9);
}

BOOST_AUTO_TEST_CASE(nested_cache_merges_into_parent)
{
    CLedgerViewCache parent(db.get());
    parent.SetNativeBalance(alice, 100);
    {
        CLedgerViewCache child(&parent);
        BOOST_CHECK_EQUAL(child.GetNativeBalance(alice), 100);
        child.SetNativeBalance(alice, 60);
        child.SetNativeBalance(bob, 40);
        BOOST_CHECK_EQUAL(parent.GetNativeBalance(bob), 0);
        BOOST_CHECK(child.Flush());
    }
    BOOST_CHECK_EQUAL(parent.GetNativeBalance(alice), 60);
    BOOST_CHECK_EQUAL(parent.GetNativeBalance(bob), 40);
    // Storage untouched until the parent flushes
    BOOST_CHECK(db->IsEmpty());

    {
        CLedgerViewCache child(&parent);
        child.SetNativeBalance(bob, 1000);
        child.Discard();
    }
    BOOST_CHECK_EQUAL(parent.GetNativeBalance(bob), 40);

    BOOST_CHECK(parent.Flush());
    BOOST_CHECK_EQUAL(db->GetNativeBalance(alice), 60);
    BOOST_CHECK_EQUAL(db->GetNativeBalance(bob), 40);
}

BOOST_AUTO_TEST_CASE(zero_amount_erases)
{
    {
        CLedgerViewCache cache(db.get());
        cache.SetNativeBalance(alice, 5);
        cache.SetAssetBalance(asset, alice, 5);
        cache.SetAllowance(asset, alice, bob, 5);
        BOOST_CHECK(cache.Flush());
    }
    BOOST_CHECK(!db->IsEmpty());
    {
        CLedgerViewCache cache(db.get());
        cache.SetNativeBalance(alice, 0);
        cache.SetAssetBalance(asset, alice, 0);
        cache.SetAllowance(asset, alice, bob, 0);
        BOOST_CHECK_EQUAL(cache.GetNativeBalance(alice), 0);
        BOOST_CHECK(cache.Flush());
    }
    BOOST_CHECK_EQUAL(db->GetNativeBalance(alice), 0);
    BOOST_CHECK(db->IsEmpty());
}

BOOST_AUTO_TEST_CASE(terminal_status_is_final)
{
    const uint256 fingerprint = Keccak256(std::string("cc"));
    {
        CLedgerViewCache cache(db.get());
        BOOST_CHECK(cache.SetSwapStatus(fingerprint, SwapStatus::EXECUTED));
        BOOST_CHECK(cache.Flush());
    }

    CLedgerViewCache cache(db.get());
    BOOST_CHECK(!cache.SetSwapStatus(fingerprint, SwapStatus::CANCELLED));
    BOOST_CHECK(!cache.SetSwapStatus(fingerprint, SwapStatus::UNSEEN));
    BOOST_CHECK(cache.GetSwapStatus(fingerprint) == SwapStatus::EXECUTED);

    // UNSEEN is never written
    BOOST_CHECK(!cache.SetSwapStatus(Keccak256(std::string("dd")), SwapStatus::UNSEEN));
    BOOST_CHECK_EQUAL(cache.GetCacheSize(), 0U);
}

BOOST_AUTO_TEST_CASE(db_refuses_unseen_status)
{
    CLedgerDelta delta;
    delta.swaps[Keccak256(std::string("ee"))] = SwapStatus::UNSEEN;
    BOOST_CHECK(!db->BatchWrite(delta));
    BOOST_CHECK(db->IsEmpty());
}

BOOST_AUTO_TEST_CASE(delta_merge_later_wins)
{
    CLedgerDelta first;
    first.nativeBalances[alice] = 1;
    first.nativeBalances[bob] = 2;
    CLedgerDelta second;
    second.nativeBalances[alice] = 3;
    second.fHaveListingCount = true;
    second.nListingCount = 7;

    first.Merge(second);
    BOOST_CHECK_EQUAL(first.nativeBalances[alice], 3);
    BOOST_CHECK_EQUAL(first.nativeBalances[bob], 2);
    BOOST_CHECK(first.fHaveListingCount);
    BOOST_CHECK_EQUAL(first.nListingCount, 7U);
    BOOST_CHECK_EQUAL(first.Size(), 3U);

    first.Clear();
    BOOST_CHECK(first.IsEmpty());
}

BOOST_AUTO_TEST_SUITE_END()
