// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"
#include "settlement/fingerprint.h"
#include "test/test_otcsettle.h"
#include "utilstrencodings.h"

#include <set>
#include <utility>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(fingerprint_tests, BasicTestingSetup)

static SwapOrder SampleOrder()
{
    SwapOrder order;
    order.nId = 0x0102;
    BOOST_REQUIRE(ParseAccountID("0x1111111111111111111111111111111111111111", order.initiator));
    BOOST_REQUIRE(ParseAccountID("0x2222222222222222222222222222222222222222", order.counterparty));
    BOOST_REQUIRE(ParseAccountID("0x3333333333333333333333333333333333333333", order.assetA));
    BOOST_REQUIRE(ParseAccountID("0x4444444444444444444444444444444444444444", order.assetB));
    order.nAmountA = 100;
    order.nAmountB = 200;
    order.nExpiry = 1700003600;
    return order;
}

BOOST_AUTO_TEST_CASE(packed_layout)
{
    const SwapOrder order = SampleOrder();
    const std::vector<unsigned char> packed = PackSwapOrder(order);
    BOOST_REQUIRE_EQUAL(packed.size(), PACKED_SWAP_ORDER_SIZE);

    // id: one big-endian 32-byte word
    BOOST_CHECK_EQUAL(HexStr(packed.begin(), packed.begin() + 32),
                      "0000000000000000000000000000000000000000000000000000000000000102");
    // four addresses, 20 bytes each, no padding
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 32, packed.begin() + 52), "1111111111111111111111111111111111111111");
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 52, packed.begin() + 72), "2222222222222222222222222222222222222222");
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 72, packed.begin() + 92), "3333333333333333333333333333333333333333");
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 92, packed.begin() + 112), "4444444444444444444444444444444444444444");
    // amounts and expiry: 32-byte words
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 112, packed.begin() + 144),
                      "0000000000000000000000000000000000000000000000000000000000000064");
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 144, packed.begin() + 176),
                      "00000000000000000000000000000000000000000000000000000000000000c8");
    BOOST_CHECK_EQUAL(HexStr(packed.begin() + 176, packed.end()),
                      "000000000000000000000000000000000000000000000000000000006553ff10");

    BOOST_CHECK(ComputeFingerprint(order) == Keccak256(packed));
}

BOOST_AUTO_TEST_CASE(fingerprint_is_deterministic)
{
    BOOST_CHECK(ComputeFingerprint(SampleOrder()) == ComputeFingerprint(SampleOrder()));
}

BOOST_AUTO_TEST_CASE(fingerprint_covers_every_field)
{
    const SwapOrder base = SampleOrder();
    std::set<uint256> seen;
    seen.insert(ComputeFingerprint(base));

    CAccountID other;
    BOOST_REQUIRE(ParseAccountID("0x5555555555555555555555555555555555555555", other));

    SwapOrder o;
    o = base; o.nId = 0x0103; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.initiator = other; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.counterparty = other; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.assetA = other; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.assetB = other; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.nAmountA = 101; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.nAmountB = 201; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
    o = base; o.nExpiry = 1700003601; BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);

    // Swapping the two sides is a different order
    o = base;
    std::swap(o.initiator, o.counterparty);
    std::swap(o.assetA, o.assetB);
    std::swap(o.nAmountA, o.nAmountB);
    BOOST_CHECK(seen.insert(ComputeFingerprint(o)).second);
}

BOOST_AUTO_TEST_SUITE_END()
