// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Typed-data authorization tests
 *
 *   1. Domain separator and address derivation known vectors
 *   2. Sign / recover, v aliases
 *   3. Malformed signatures: length, v, high s
 *   4. Any changed field, key or domain invalidates a signature
 */

#include "consensus/validation.h"
#include "hash.h"
#include "key.h"
#include "settlement/authorization.h"
#include "settlement/fingerprint.h"
#include "test/test_otcsettle.h"
#include "utilstrencodings.h"

#include <boost/test/unit_test.hpp>

namespace {

struct AuthorizationSetup : public BasicTestingSetup {
    CKey key;
    CAccountID signer;
    CSigningDomain domain;
    SwapOrder order;

    AuthorizationSetup()
    {
        key = KeyFromSeed("initiator");
        signer = key.GetPubKey().GetID();
        domain = MakeSwapDomain(31337, CLedgerHost::DeriveContractAddress("test.swap"));

        order.nId = 7;
        order.initiator = signer;
        order.counterparty = KeyFromSeed("counterparty").GetPubKey().GetID();
        order.assetA = CLedgerHost::DeriveContractAddress("test.asset.TKX");
        order.assetB = CLedgerHost::DeriveContractAddress("test.asset.TKY");
        order.nAmountA = 100;
        order.nAmountB = 200;
        order.nExpiry = 1700003600;
    }

    std::vector<unsigned char> SignOrder(const SwapOrder& o) const
    {
        std::vector<unsigned char> vchSig;
        BOOST_REQUIRE(SignSwapOrder(key, domain, o, vchSig));
        return vchSig;
    }

    bool Verify(const SwapOrder& o, const std::vector<unsigned char>& vchSig, CValidationState& state) const
    {
        return VerifyOrderSignature(domain, o, vchSig, state);
    }
};

/** s -> n - s on the big-endian s half of a compact signature */
void NegateS(std::vector<unsigned char>& vchSig)
{
    static const std::vector<unsigned char> order =
        ParseHex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");
    int borrow = 0;
    for (int i = 31; i >= 0; --i) {
        int diff = (int)order[i] - (int)vchSig[32 + i] - borrow;
        borrow = diff < 0 ? 1 : 0;
        vchSig[32 + i] = (unsigned char)(diff + (borrow ? 256 : 0));
    }
}

void CheckInvalidSignature(const CValidationState& state)
{
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetError() == SettlementError::INVALID_SIGNATURE);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-swap-signature");
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(authorization_tests, AuthorizationSetup)

// =============================================================================
// Test 1: Known vectors
// =============================================================================
BOOST_AUTO_TEST_CASE(domain_separator_known_vector)
{
    CAccountID contract;
    BOOST_REQUIRE(ParseAccountID("0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC", contract));
    CSigningDomain mail("Ether Mail", "1", 1, contract);
    BOOST_CHECK_EQUAL(mail.GetSeparator().GetHex(), "f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f");
}

BOOST_AUTO_TEST_CASE(address_derivation_known_vector)
{
    CKey cow = KeyFromSeed("cow");
    CAccountID expected;
    BOOST_REQUIRE(ParseAccountID("0xCD2a3d9F938E13CD947Ec05AbC7FE734Df8DD826", expected));
    BOOST_CHECK(cow.GetPubKey().GetID() == expected);
    BOOST_CHECK(cow.VerifyPubKey(cow.GetPubKey()));
}

BOOST_AUTO_TEST_CASE(type_hash_and_domain_fields)
{
    BOOST_CHECK(GetSwapTypeHash() == Keccak256(std::string(SWAP_TYPE_STRING)));
    BOOST_CHECK_EQUAL(domain.name, "OTCSwap");
    BOOST_CHECK_EQUAL(domain.version, "1");
    BOOST_CHECK_EQUAL(domain.nChainId, 31337U);

    // The signing hash commits to the domain
    CSigningDomain other = domain;
    other.nChainId = 1;
    BOOST_CHECK(GetSigningHash(domain, order) != GetSigningHash(other, order));
    other = domain;
    other.verifyingContract = CLedgerHost::DeriveContractAddress("test.other");
    BOOST_CHECK(GetSigningHash(domain, order) != GetSigningHash(other, order));
}

// =============================================================================
// Test 2: Sign and recover
// =============================================================================
BOOST_AUTO_TEST_CASE(sign_and_recover)
{
    std::vector<unsigned char> vchSig = SignOrder(order);
    BOOST_REQUIRE_EQUAL(vchSig.size(), COMPACT_SIGNATURE_SIZE);
    BOOST_CHECK(vchSig[64] == 27 || vchSig[64] == 28);

    CAccountID recovered;
    std::string strError;
    BOOST_CHECK(RecoverSigner(GetSigningHash(domain, order), vchSig, recovered, strError));
    BOOST_CHECK(recovered == signer);

    CValidationState state;
    BOOST_CHECK(Verify(order, vchSig, state));
    BOOST_CHECK(state.IsValid());

    // Signing is deterministic (RFC6979)
    BOOST_CHECK(SignOrder(order) == vchSig);
}

BOOST_AUTO_TEST_CASE(recovery_byte_zero_one_alias)
{
    std::vector<unsigned char> vchSig = SignOrder(order);
    vchSig[64] -= 27;
    CValidationState state;
    BOOST_CHECK(Verify(order, vchSig, state));
}

// =============================================================================
// Test 3: Malformed signatures
// =============================================================================
BOOST_AUTO_TEST_CASE(reject_wrong_length)
{
    std::vector<unsigned char> vchSig = SignOrder(order);

    std::vector<unsigned char> shortSig(vchSig.begin(), vchSig.begin() + 64);
    CValidationState state1;
    BOOST_CHECK(!Verify(order, shortSig, state1));
    CheckInvalidSignature(state1);

    std::vector<unsigned char> longSig = vchSig;
    longSig.push_back(0);
    CValidationState state2;
    BOOST_CHECK(!Verify(order, longSig, state2));
    CheckInvalidSignature(state2);

    CValidationState state3;
    BOOST_CHECK(!Verify(order, std::vector<unsigned char>(), state3));
    CheckInvalidSignature(state3);
}

BOOST_AUTO_TEST_CASE(reject_bad_recovery_byte)
{
    for (unsigned char v : {2, 26, 29, 35, 255}) {
        std::vector<unsigned char> vchSig = SignOrder(order);
        vchSig[64] = v;
        CValidationState state;
        BOOST_CHECK(!Verify(order, vchSig, state));
        CheckInvalidSignature(state);
    }
}

BOOST_AUTO_TEST_CASE(reject_high_s)
{
    std::vector<unsigned char> vchSig = SignOrder(order);
    std::vector<unsigned char> malleated = vchSig;
    NegateS(malleated);
    malleated[64] = (vchSig[64] == 27) ? 28 : 27;
    BOOST_CHECK(malleated != vchSig);

    // (r, n-s, v^1) recovers the same key, so only the low-s rule rejects it
    CAccountID recovered;
    std::string strError;
    BOOST_CHECK(!RecoverSigner(GetSigningHash(domain, order), malleated, recovered, strError));
    BOOST_CHECK(strError.find("high s") != std::string::npos);

    CValidationState state;
    BOOST_CHECK(!Verify(order, malleated, state));
    CheckInvalidSignature(state);
}

BOOST_AUTO_TEST_CASE(reject_zero_signature)
{
    std::vector<unsigned char> vchSig(COMPACT_SIGNATURE_SIZE, 0);
    vchSig[64] = 27;
    CValidationState state;
    BOOST_CHECK(!Verify(order, vchSig, state));
    CheckInvalidSignature(state);
}

// =============================================================================
// Test 4: Perturbations
// =============================================================================
BOOST_AUTO_TEST_CASE(any_field_change_invalidates)
{
    const std::vector<unsigned char> vchSig = SignOrder(order);
    const CAccountID stranger = KeyFromSeed("stranger").GetPubKey().GetID();

    std::vector<SwapOrder> variants;
    SwapOrder o;
    o = order; o.nId += 1; variants.push_back(o);
    o = order; o.counterparty = stranger; variants.push_back(o);
    o = order; o.assetA = stranger; variants.push_back(o);
    o = order; o.assetB = stranger; variants.push_back(o);
    o = order; o.nAmountA += 1; variants.push_back(o);
    o = order; o.nAmountB -= 1; variants.push_back(o);
    o = order; o.nExpiry += 1; variants.push_back(o);
    // Claiming a different initiator: the recovered signer no longer matches
    o = order; o.initiator = stranger; variants.push_back(o);

    for (const SwapOrder& variant : variants) {
        CValidationState state;
        BOOST_CHECK_MESSAGE(!Verify(variant, vchSig, state), variant.ToString());
        CheckInvalidSignature(state);
    }
}

BOOST_AUTO_TEST_CASE(wrong_key_or_domain_invalidates)
{
    std::vector<unsigned char> vchSig;
    BOOST_REQUIRE(SignSwapOrder(KeyFromSeed("stranger"), domain, order, vchSig));
    CValidationState state1;
    BOOST_CHECK(!Verify(order, vchSig, state1));
    CheckInvalidSignature(state1);

    // Signed for another chain
    CSigningDomain otherChain = MakeSwapDomain(1, domain.verifyingContract);
    BOOST_REQUIRE(SignSwapOrder(key, otherChain, order, vchSig));
    CValidationState state2;
    BOOST_CHECK(!Verify(order, vchSig, state2));
    CheckInvalidSignature(state2);

    // Signed for another deployment of the swap service
    CSigningDomain otherContract = MakeSwapDomain(31337, CLedgerHost::DeriveContractAddress("test.other"));
    BOOST_REQUIRE(SignSwapOrder(key, otherContract, order, vchSig));
    CValidationState state3;
    BOOST_CHECK(!Verify(order, vchSig, state3));
    CheckInvalidSignature(state3);

    // Flipped bit in r
    vchSig = SignOrder(order);
    vchSig[5] ^= 0x01;
    CValidationState state4;
    BOOST_CHECK(!Verify(order, vchSig, state4));
    CheckInvalidSignature(state4);
}

BOOST_AUTO_TEST_SUITE_END()
