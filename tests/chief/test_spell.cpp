// CHIEFTALLY - Spell Decoding Tests
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include <gtest/gtest.h>

#include "chief/fake_node.h"
#include "chieftally/chief/pipeline.h"
#include "chieftally/chief/spell.h"
#include "chieftally/db/leveldb.h"

namespace chieftally {
namespace chief {
namespace test {

namespace {

// Per-second rates, as ray words
const char* const RATE_5_PERCENT = "1000000001547125957863212448";
const char* const RATE_5_PERCENT_WORD =
    "0x0000000000000000000000000000000000000000033b2e3cb548ff197d3905a0";
const char* const RATE_2_PERCENT = "1000000000627937192491029810";
const char* const RATE_NEGATIVE = "999999998452874042136787552";

} // namespace

// ============================================================================
// Rate Math
// ============================================================================

class RateTest : public ::testing::Test {
protected:
    BigNum ray_ = BigNum::FromDecimal(RAY_DECIMAL);
};

TEST_F(RateTest, RayPowIdentity) {
    EXPECT_EQ(RayPow(ray_, 0), ray_);
    EXPECT_EQ(RayPow(ray_, SECONDS_PER_YEAR), ray_);
    BigNum two = ray_ * BigNum(2);
    EXPECT_EQ(RayPow(two, 1), two);
    EXPECT_EQ(RayPow(two, 10), ray_ * BigNum(1024));
}

TEST_F(RateTest, RayPowRoundsHalfUp) {
    // 1.5^2 = 2.25 exactly, 1.5^3 = 3.375 exactly
    BigNum threeHalves = ray_ * BigNum(3) / BigNum(2);
    EXPECT_EQ(RayPow(threeHalves, 2), ray_ * BigNum(225) / BigNum(100));
    EXPECT_EQ(RayPow(threeHalves, 3), ray_ * BigNum(3375) / BigNum(1000));
}

TEST_F(RateTest, AnnualPercentage) {
    // Per-second rates compounded over a year
    EXPECT_EQ(AnnualPercentage(BigNum::FromDecimal(RATE_5_PERCENT)), "5.00%");
    EXPECT_EQ(AnnualPercentage(BigNum::FromDecimal(RATE_2_PERCENT)), "2.00%");
    EXPECT_EQ(AnnualPercentage(ray_), "0.00%");
}

TEST_F(RateTest, NegativeAnnualPercentage) {
    EXPECT_EQ(AnnualPercentage(BigNum::FromDecimal(RATE_NEGATIVE)), "-4.76%");
}

TEST_F(RateTest, SecondsPerYear) {
    EXPECT_EQ(SECONDS_PER_YEAR, 31536000u);
}

TEST_F(RateTest, DescribeAction) {
    eth::DecodedCall setFee;
    setFee.name = "setFee";
    setFee.signature = sig::SET_FEE;
    setFee.args.emplace_back("ray", eth::AbiValue::MakeUint(BigNum::FromDecimal(RATE_5_PERCENT)));
    auto desc = DescribeAction(setFee);
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(*desc, "5.00%");

    // Unnamed argument
    setFee.args[0].first = "";
    desc = DescribeAction(setFee);
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(*desc, "5.00%");

    eth::DecodedCall setCap;
    setCap.name = "setCap";
    setCap.signature = "setCap(uint256)";
    setCap.args.emplace_back("wad", eth::AbiValue::MakeUint(BigNum(1000)));
    EXPECT_FALSE(DescribeAction(setCap).has_value());
}

// ============================================================================
// Spell Decoder
// ============================================================================

class SpellDecoderTest : public ::testing::Test {
protected:
    FakeNode node_;
    FakeFetcher fetcher_;
    db::MemoryDatabase store_;
    eth::InterfaceCache interfaces_{store_, fetcher_};

    const Address spell_ = MakeAddress(0x51);
    const Address mom_ = MakeAddress(0x4d);

    void SetUp() override {
        fetcher_.SetAbi(spell_, SPELL_ABI);
        fetcher_.SetAbi(mom_, MOM_ABI);
        node_.SetCall(spell_, eth::EncodeCall(sig::WHOM), WordBytes(mom_.ToWord()));
    }

    void SetSpellData(const Bytes& calldata) {
        node_.SetCall(spell_, eth::EncodeCall(sig::DATA), DynamicBytesReturn(calldata));
    }
};

TEST_F(SpellDecoderTest, DecodesRateChange) {
    SetSpellData(eth::EncodeCall(sig::SET_FEE, {Hash256::FromHex(RATE_5_PERCENT_WORD)}));

    auto spell = SpellDecoder(node_, interfaces_).Decode(spell_);
    ASSERT_TRUE(spell.IsOk()) << spell.GetError().ToString();
    EXPECT_EQ(spell.Value().name, "setFee");
    ASSERT_EQ(spell.Value().args.size(), 1u);
    EXPECT_EQ(spell.Value().args[0].first, "ray");
    EXPECT_EQ(spell.Value().args[0].second.GetNumber(), BigNum::FromDecimal(RATE_5_PERCENT));
    ASSERT_TRUE(spell.Value().desc.has_value());
    EXPECT_EQ(*spell.Value().desc, "5.00%");
}

TEST_F(SpellDecoderTest, OtherActionHasNoDescription) {
    SetSpellData(eth::EncodeCall("setCap(uint256)", {eth::UintWord(50000000)}));

    auto spell = SpellDecoder(node_, interfaces_).Decode(spell_);
    ASSERT_TRUE(spell.IsOk()) << spell.GetError().ToString();
    EXPECT_EQ(spell.Value().name, "setCap");
    EXPECT_EQ(spell.Value().args[0].first, "wad");
    EXPECT_FALSE(spell.Value().desc.has_value());
}

TEST_F(SpellDecoderTest, NotASpell) {
    fetcher_.SetAbi(spell_, MOM_ABI);
    auto spell = SpellDecoder(node_, interfaces_).Decode(spell_);
    EXPECT_TRUE(spell.Is(eth::ErrorKind::InterfaceMismatch));
}

TEST_F(SpellDecoderTest, UnknownMomFunction) {
    SetSpellData(eth::EncodeCall("file(bytes32,uint256)", {Hash256(), eth::UintWord(1)}));
    auto spell = SpellDecoder(node_, interfaces_).Decode(spell_);
    EXPECT_TRUE(spell.Is(eth::ErrorKind::InterfaceMismatch));
}

TEST_F(SpellDecoderTest, MissingInterface) {
    Address unverified = MakeAddress(0x99);
    auto spell = SpellDecoder(node_, interfaces_).Decode(unverified);
    EXPECT_TRUE(spell.Is(eth::ErrorKind::Network));
}

TEST_F(SpellDecoderTest, DecodeAllKeepsSuccesses) {
    SetSpellData(eth::EncodeCall(sig::SET_FEE, {Hash256::FromHex(RATE_5_PERCENT_WORD)}));
    Address plain = MakeAddress(0x77);

    auto spells = SpellDecoder(node_, interfaces_).DecodeAll({plain, spell_, mom_});
    ASSERT_EQ(spells.size(), 1u);
    EXPECT_EQ(spells.count(spell_), 1u);
    EXPECT_EQ(spells[spell_].name, "setFee");
}

TEST_F(SpellDecoderTest, InterfacesFetchedOnce) {
    SetSpellData(eth::EncodeCall(sig::SET_FEE, {Hash256::FromHex(RATE_5_PERCENT_WORD)}));
    SpellDecoder decoder(node_, interfaces_);
    ASSERT_TRUE(decoder.Decode(spell_).IsOk());
    ASSERT_TRUE(decoder.Decode(spell_).IsOk());
    EXPECT_EQ(fetcher_.GetRequestCount(), 2u);
    EXPECT_EQ(interfaces_.GetFetchCount(), 2u);
}

// ============================================================================
// Spells in the Pipeline
// ============================================================================

TEST_F(SpellDecoderTest, PipelineDecodesTopProposals) {
    Address chief = Address::FromHex(DEFAULT_CHIEF_ADDRESS);
    Address voterA = MakeAddress(0xa1);
    Address voterB = MakeAddress(0xb2);
    Address other = MakeAddress(0x52);

    fetcher_.SetAbi(chief, CHIEF_ABI);
    fetcher_.SetAbi(other, SPELL_ABI);
    SetSpellData(eth::EncodeCall(sig::SET_FEE, {Hash256::FromHex(RATE_5_PERCENT_WORD)}));
    node_.SetCall(other, eth::EncodeCall(sig::WHOM), WordBytes(mom_.ToWord()));
    node_.SetCall(other, eth::EncodeCall(sig::DATA),
                  DynamicBytesReturn(eth::EncodeCall("setCap(uint256)", {eth::UintWord(7)})));

    node_.AddVote(chief, voterA, VoteYaysCalldata({spell_}), DEFAULT_CHIEF_BLOCK + 1);
    node_.AddVote(chief, voterB, VoteYaysCalldata({other}), DEFAULT_CHIEF_BLOCK + 2);
    node_.SetDeposit(chief, voterA, Ether(3));
    node_.SetDeposit(chief, voterB, Ether(1));
    node_.SetHat(chief, spell_);

    db::MemoryDatabase slateStore;
    SlateCache slates(slateStore);
    PipelineOptions options;
    options.chief = chief;
    options.fromBlock = DEFAULT_CHIEF_BLOCK;
    options.workers = 2;
    options.maxSpells = 1;

    Report report = Pipeline(node_, interfaces_, slates, options).Run();
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].proposal, spell_);
    ASSERT_EQ(report.spells.size(), 1u);
    EXPECT_EQ(*report.spells[spell_].desc, "5.00%");

    options.maxSpells = 0;
    report = Pipeline(node_, interfaces_, slates, options).Run();
    EXPECT_EQ(report.spells.size(), 2u);
    EXPECT_EQ(report.spells[other].name, "setCap");
}

} // namespace test
} // namespace chief
} // namespace chieftally
