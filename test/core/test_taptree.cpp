#include <iostream>
#include <algorithm>

#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include "util/translation.h"
#include "util/strencodings.h"
#include "script/interpreter.h"
#include "script/standard.h"
#include "pubkey.h"
#include "univalue.h"

#include "common.hpp"
#include "utils.hpp"
#include "hash_helper.hpp"
#include "public_key.hpp"
#include "script_merkle_tree.hpp"
#include "taproot_info.hpp"

using namespace tapvault;
using namespace tapvault::core;

const std::function<std::string(const char*)> G_TRANSLATION_FUN = nullptr;

static ECCVerifyHandle verify_handle;

static const std::string TAPLEAF_TAG = "TapLeaf";
static const CScript TestScript = CScript() << ParseHex("db1ff3f207771e90ec30747525abaefd3b56ff2b3aecbb76809b7106617c442e") << OP_CHECKSIG;

static const std::vector<std::string> participant_hex = {
        "039d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0",
        "037eeedaa390967956b958e2ebf8dd93cfbf934c9e363a4b64d8e27500e6d0b6e1",
        "0316e90c4a02eb9957a8d06fad448c6784675b1db42aec74f68c62d55279b58f07"};

static std::vector<public_key> Participants()
{
    std::vector<public_key> res;
    for (const auto& s: participant_hex) {
        res.emplace_back(ParsePublicKey(s));
    }
    return res;
}

static uint256 Hash(const std::string& hexstr)
{
    uint256 res;
    bytevector bytes = unhex<bytevector>(hexstr);
    std::copy(bytes.begin(), bytes.end(), res.begin());
    return res;
}


TEST_CASE("TapLeaf hash")
{
    uint256 reference_taghash;
    uint256 reference_hash;
    uint8_t script_size = TestScript.size();

    CSHA256().Write((uint8_t*)TAPLEAF_TAG.data(), TAPLEAF_TAG.size()).Finalize(reference_taghash.data());

    CSHA256()
             .Write(reference_taghash.data(), reference_taghash.size())
             .Write(reference_taghash.data(), reference_taghash.size())
             .Write(&TAPLEAF_VERSION, 1)
             .Write(&script_size, 1)
             .Write(TestScript.data(), TestScript.size())
             .Finalize(reference_hash.data());

    std::clog << "Reference TapLeaf hash: " << hex(reference_hash) << std::endl;

    uint256 bitcoin_hash = ComputeTapleafHash(TAPROOT_LEAF_TAPSCRIPT, TestScript);
    uint256 result_hash = TapLeafHash(TestScript);

    std::clog << "TapLeaf hash: " << hex(result_hash) << std::endl;

    CHECK(bitcoin_hash == reference_hash);
    CHECK(result_hash == reference_hash);
}

TEST_CASE("Tagged hash")
{
    const bytevector message = unhex<bytevector>("0102030405");

    uint256 taghash;
    CSHA256().Write((const uint8_t*)"TapBranch", 9).Finalize(taghash.data());

    uint256 reference;
    CSHA256().Write(taghash.data(), taghash.size())
             .Write(taghash.data(), taghash.size())
             .Write(message.data(), message.size())
             .Finalize(reference.data());

    CHECK(TaggedHash("TapBranch", message) == reference);

    HashWriter writer(TAPBRANCH_HASH);
    writer << Span(message);
    uint256 streamed = writer;
    CHECK(streamed == reference);
}

TEST_CASE("TapBranch hash")
{
    uint256 a = TapLeafHash(TestScript);
    uint256 b = TapLeafHash(CScript() << OP_TRUE);

    CHECK(TapBranchHash(a, b) == TapBranchHash(b, a));
    CHECK(TapBranchHash(a, b) != TapBranchHash(a, a));
}

TEST_CASE("Script tree")
{
    CScript a = TestScript;
    CScript b = CScript() << OP_TRUE;
    CScript c = CScript() << OP_2 << OP_DROP << OP_TRUE;

    xonly_pubkey internal_pk = GetXOnlyPubKey(ParsePublicKey(participant_hex[0]));

    SECTION("Empty tree")
    {
        CHECK_THROWS_AS(ScriptMerkleTree(std::vector<CScript>{}), InputError);
    }

    SECTION("Single leaf")
    {
        ScriptMerkleTree tree({a});

        CHECK_FALSE(tree.CalculateRoot().has_value());
        CHECK(tree.CalculateScriptPath(0).empty());

        bytevector cb = tree.CalculateControlBlock(internal_pk, 1, 0);
        REQUIRE(cb.size() == 33);
        CHECK(cb[0] == 0xc1);
        CHECK(std::equal(internal_pk.begin(), internal_pk.end(), cb.begin() + 1));
    }

    SECTION("Two leaves")
    {
        ScriptMerkleTree tree({a, b});

        auto root = tree.CalculateRoot();
        REQUIRE(root.has_value());
        CHECK(*root == TapBranchHash(TapLeafHash(a), TapLeafHash(b)));

        bytevector cb = tree.CalculateControlBlock(internal_pk, 0, 1);
        REQUIRE(cb.size() == 65);
        CHECK(cb[0] == 0xc0);
        uint256 sibling = TapLeafHash(a);
        CHECK(std::equal(sibling.begin(), sibling.end(), cb.begin() + 33));

        CHECK(tree.CalculateScriptPath(b) == tree.CalculateScriptPath(1));
        CHECK_THROWS_AS(tree.CalculateControlBlock(internal_pk, 0, 2), InputError);
        CHECK_THROWS_AS(tree.CalculateScriptPath(CScript() << OP_FALSE), InputError);
    }

    SECTION("Odd leaf is carried up")
    {
        ScriptMerkleTree tree({a, b, c});

        auto root = tree.CalculateRoot();
        REQUIRE(root.has_value());
        CHECK(*root == TapBranchHash(TapBranchHash(TapLeafHash(a), TapLeafHash(b)), TapLeafHash(c)));

        CHECK(tree.CalculateControlBlock(internal_pk, 0, 0).size() == 97);
        CHECK(tree.CalculateControlBlock(internal_pk, 0, 2).size() == 65);
        CHECK(tree.CalculateScriptPath(2) == std::vector<uint256>{TapBranchHash(TapLeafHash(a), TapLeafHash(b))});
    }
}

TEST_CASE("Public key")
{
    SECTION("Compressed")
    {
        public_key pk = ParsePublicKey(participant_hex[1]);
        CHECK_FALSE(IsXOnly(pk));
        CHECK(hex(GetXOnlyPubKey(pk)) == participant_hex[1].substr(2));
        CHECK(hex(GetCompressedPubKey(pk)) == participant_hex[1]);
    }

    SECTION("X-only")
    {
        public_key pk = ParsePublicKey(participant_hex[2].substr(2));
        CHECK(IsXOnly(pk));
        CHECK(hex(GetXOnlyPubKey(pk)) == participant_hex[2].substr(2));
        CHECK(hex(GetCompressedPubKey(pk)) == "02" + participant_hex[2].substr(2));
        CHECK(hex(GetCompressedPubKey(pk, 1)) == participant_hex[2]);
    }

    SECTION("Malformed")
    {
        CHECK_THROWS_AS(ParsePublicKey("049d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0"), WrongKeyError);
        CHECK_THROWS_AS(ParsePublicKey("9d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61"), WrongKeyError);
        CHECK_THROWS_AS(ParsePublicKey("eefdea4cdb677750a420fee807eacf21eb9898ae79b9768766e4faa04a2d4a34"), WrongKeyError);
        CHECK_THROWS_AS(ParsePublicKey("02eefdea4cdb677750a420fee807eacf21eb9898ae79b9768766e4faa04a2d4a34"), WrongKeyError);
        CHECK_THROWS_AS(ParsePublicKey("zz"), IllegalArgumentError);
    }
}

TEST_CASE("Vault output")
{
    TaprootInfo info = TaprootInfo::Create(Participants(), 800000);

    CHECK(info.GetLockHeight() == 802000);
    CHECK(info.GetThreshold() == 2);
    CHECK(hex(info.GetInternalPubKey()) == participant_hex[0]);

    CHECK(hex(info.GetLeaf(THRESHOLD_LEAF)) ==
          "209d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0ac"
          "207eeedaa390967956b958e2ebf8dd93cfbf934c9e363a4b64d8e27500e6d0b6e1ba"
          "2016e90c4a02eb9957a8d06fad448c6784675b1db42aec74f68c62d55279b58f07ba"
          "529c");
    CHECK(hex(info.GetLeaf(TIMELOCK_LEAF)) ==
          "03d03c0cb175209d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0ac");

    CHECK(TapLeafHash(info.GetLeaf(THRESHOLD_LEAF)) == Hash("e2ecf55f188133c06c7f03fe452325db635362d2d22dd8ce8ee06bc02eebcce3"));
    CHECK(TapLeafHash(info.GetLeaf(TIMELOCK_LEAF)) == Hash("205ab3050b830d9f73966ab6006097e43fa027150254f04e43831330d8e06e1a"));

    REQUIRE(info.GetMerkleRoot().has_value());
    CHECK(*info.GetMerkleRoot() == Hash("bf9b2d8d9aca73dadcf7039809877263a708a3fb1ce875df545c48466175c8a1"));

    CHECK(hex(info.GetOutputPubKey()) == "4526a33fbe55b5f147311b5c7a3b7c646f723112c80dc7b7a64f8a45d63962cc");
    CHECK(info.GetOutputParity() == 1);

    CHECK(hex(info.GetControlBlock(THRESHOLD_LEAF)) ==
          "c19d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0"
          "205ab3050b830d9f73966ab6006097e43fa027150254f04e43831330d8e06e1a");
    CHECK(hex(info.GetControlBlock(TIMELOCK_LEAF)) ==
          "c19d815fa419f816f701e80f6c4f50089fedf0e3d74efad96d9cdb5117930e61c0"
          "e2ecf55f188133c06c7f03fe452325db635362d2d22dd8ce8ee06bc02eebcce3");

    CHECK(hex(info.GetOutputScript()) == "51204526a33fbe55b5f147311b5c7a3b7c646f723112c80dc7b7a64f8a45d63962cc");

    auto address = GENERATE(
            std::make_pair(IBech32Coder::MAINNET, "bc1pg5n2x0a72k6lz3e3rdw85wmuv3hhyvgjeqxu0daxf79yt43evtxqnn3d3d"),
            std::make_pair(IBech32Coder::TESTNET, "tb1pg5n2x0a72k6lz3e3rdw85wmuv3hhyvgjeqxu0daxf79yt43evtxqym8ztz"),
            std::make_pair(IBech32Coder::REGTEST, "bcrt1pg5n2x0a72k6lz3e3rdw85wmuv3hhyvgjeqxu0daxf79yt43evtxqfzdy7c"));

    auto bech = MakeBech32Coder(address.first);
    CHECK(info.GetAddress(*bech) == address.second);
    CHECK(hex(bech->Decode(address.second)) == hex(info.GetOutputPubKey()));
}

TEST_CASE("Vault output matches Bitcoin Core TaprootBuilder")
{
    std::vector<public_key> participants = Participants();
    auto threshold = GENERATE(1, 2, 3);

    TaprootInfo info = TaprootInfo::Create(participants, 750000, 144, threshold, participants[1]);

    XOnlyPubKey internal_pk(info.GetInternalXOnlyPubKey());

    TaprootBuilder builder;
    builder.Add(1, info.GetLeaf(THRESHOLD_LEAF), TAPROOT_LEAF_TAPSCRIPT);
    builder.Add(1, info.GetLeaf(TIMELOCK_LEAF), TAPROOT_LEAF_TAPSCRIPT);
    REQUIRE(builder.IsComplete());
    builder.Finalize(internal_pk);

    WitnessV1Taproot output = builder.GetOutput();
    CHECK(std::equal(output.begin(), output.end(), info.GetOutputPubKey().begin()));

    TaprootSpendData spenddata = builder.GetSpendData();
    REQUIRE(spenddata.merkle_root == *info.GetMerkleRoot());

    for (size_t i = 0; i < info.GetLeaves().size(); ++i) {
        const auto& control_blocks = spenddata.scripts[{info.GetLeaf(i), TAPROOT_LEAF_TAPSCRIPT}];
        std::vector<unsigned char> cb = info.GetControlBlock(i);
        CHECK(control_blocks.count(cb) == 1);
    }

    CHECK(XOnlyPubKey(info.GetOutputPubKey()).CheckTapTweak(internal_pk, *info.GetMerkleRoot(), info.GetOutputParity()));
}

TEST_CASE("Vault output arguments")
{
    std::vector<public_key> participants = Participants();

    CHECK_THROWS_AS(TaprootInfo::Create({}, 800000), IllegalArgumentError);
    CHECK_THROWS_AS(TaprootInfo::Create(participants, 800000, DEFAULT_LOCK_DELTA, 0), IllegalArgumentError);
    CHECK_THROWS_AS(TaprootInfo::Create(participants, 800000, DEFAULT_LOCK_DELTA, 4), IllegalArgumentError);
    CHECK_THROWS_AS(TaprootInfo::Create(participants, LOCKTIME_THRESHOLD - 10, 10), IllegalArgumentError);

    std::vector<public_key> duplicate = {participants[0], participants[1], GetXOnlyPubKey(participants[0])};
    CHECK_THROWS_AS(TaprootInfo::Create(duplicate, 800000), IllegalArgumentError);

    TaprootInfo single = TaprootInfo::Create({participants[2]}, 100, 0, 1);
    CHECK(single.GetLockHeight() == 100);
    CHECK(single.GetParticipants().size() == 1);
    CHECK(single.GetLeaves().size() == 2);

    TaprootInfo xonly_internal = TaprootInfo::Create(participants, 800000, DEFAULT_LOCK_DELTA, 2, GetXOnlyPubKey(participants[2]));
    CHECK(hex(xonly_internal.GetInternalPubKey()) == "02" + participant_hex[2].substr(2));
    CHECK(hex(xonly_internal.GetInternalXOnlyPubKey()) == participant_hex[2].substr(2));
    CHECK_THROWS_AS(xonly_internal.GetLeaf(2), InputError);
}

TEST_CASE("Vault output JSON")
{
    TaprootInfo info = TaprootInfo::Create(Participants(), 800000);
    auto bech = MakeBech32Coder(IBech32Coder::REGTEST);

    std::string json = info.Serialize(*bech);
    std::clog << json << std::endl;

    UniValue res;
    REQUIRE(res.read(json));

    CHECK(res[TaprootInfo::name_address].get_str() == info.GetAddress(*bech));
    CHECK(res[TaprootInfo::name_merkle_root].get_str() == "bf9b2d8d9aca73dadcf7039809877263a708a3fb1ce875df545c48466175c8a1");
    CHECK(res[TaprootInfo::name_lock_height].get_int() == 802000);
    CHECK(res[TaprootInfo::name_threshold].get_int() == 2);
    CHECK(res[TaprootInfo::name_output_parity].get_int() == 1);
    CHECK(res[TaprootInfo::name_participants].size() == 3);
    CHECK(res[TaprootInfo::name_leaves].size() == 2);
    CHECK(res[TaprootInfo::name_control_blocks][1].get_str() == hex(info.GetControlBlock(TIMELOCK_LEAF)));
}
