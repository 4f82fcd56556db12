// CHIEFTALLY - Contract ABI Tests
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include <gtest/gtest.h>
#include "chieftally/eth/abi.h"
#include "chieftally/core/hex.h"

#include <string>
#include <vector>

namespace chieftally {
namespace eth {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

const Address kVoter = Address::FromHex("0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5");

void Append(Bytes& out, const Hash256& word) {
    out.insert(out.end(), word.begin(), word.end());
}

Bytes WordBytesOf(const Hash256& word) {
    return Bytes(word.begin(), word.end());
}

/// Length word, then the text right-padded to whole words
void AppendDynamic(Bytes& out, const std::string& text) {
    Append(out, UintWord(text.size()));
    Bytes body(text.begin(), text.end());
    body.resize((text.size() + WORD_SIZE - 1) / WORD_SIZE * WORD_SIZE, 0);
    out.insert(out.end(), body.begin(), body.end());
}

Hash256 FilledWord(Byte fill, Byte last) {
    Hash256 word;
    for (size_t i = 0; i < WORD_SIZE; ++i) word[i] = fill;
    word[WORD_SIZE - 1] = last;
    return word;
}

class AbiTest : public ::testing::Test {
protected:
    static constexpr const char* ABI = R"([
        {"constant":false,"inputs":[{"name":"ray","type":"uint256"}],"name":"setFee","outputs":[],"type":"function"},
        {"inputs":[{"name":"who","type":"address"},{"name":"ok","type":"bool"}],"name":"rely","outputs":[]},
        {"inputs":[{"name":"orders","type":"tuple[]","components":[{"name":"guy","type":"address"},{"name":"wad","type":"uint"}]},{"name":"tag","type":"bytes32"}],"name":"submit","outputs":[],"type":"function"},
        {"anonymous":false,"inputs":[{"indexed":true,"name":"slate","type":"bytes32"}],"name":"Etch","type":"event"},
        {"inputs":[],"payable":false,"type":"constructor"},
        {"payable":true,"type":"fallback"}
    ])";
};

// ============================================================================
// Selectors and Encoding
// ============================================================================

TEST_F(AbiTest, Selectors) {
    Selector sel = FunctionSelector("vote(address[])");
    EXPECT_EQ(BytesToHex(sel.data(), sel.size()), "ed081329");
    EXPECT_EQ(EventTopic("Etch(bytes32)").ToHex(),
              "0x4f0892983790f53eea39a7a496f6cb40e8811b313871337b6a761efc6c67bb1f");
}

TEST_F(AbiTest, NoteTopicIsLeftAligned) {
    Hash256 topic = NoteTopic("vote(bytes32)");
    EXPECT_EQ(topic.ToHex(), "0xa69beaba" + std::string(56, '0'));
}

TEST_F(AbiTest, UintWord) {
    Hash256 word = UintWord(0x0102);
    EXPECT_EQ(word[30], 0x01);
    EXPECT_EQ(word[31], 0x02);
    EXPECT_TRUE(UintWord(0).IsNull());
}

TEST_F(AbiTest, EncodeCall) {
    Hash256 slate = FilledWord(0x5a, 0x01);
    Bytes call = EncodeCall("slates(bytes32,uint256)", {slate, UintWord(3)});
    ASSERT_EQ(call.size(), 4 + 2 * WORD_SIZE);
    EXPECT_EQ(BytesToHex(call.data(), 4), "c2ffc7bb");
    EXPECT_EQ(call[4], 0x5a);
    EXPECT_EQ(call.back(), 3);

    EXPECT_EQ(BytesToHex(EncodeCall("hat()")), "fe95a5ce");
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(AbiTest, DecodeStaticTypes) {
    Bytes data;
    Append(data, kVoter.ToWord());
    Append(data, UintWord(42));
    Append(data, UintWord(1));
    Append(data, FilledWord(0xff, 0xfb));   // int256 -5
    Hash256 fixed;
    fixed[0] = 0xde;
    fixed[1] = 0xad;
    fixed[2] = 0xbe;
    fixed[3] = 0xef;
    Append(data, fixed);

    auto values = DecodeParams({"address", "uint256", "bool", "int256", "bytes4"}, data);
    ASSERT_TRUE(values) << values.GetError().ToString();
    ASSERT_EQ(values->size(), 5u);
    EXPECT_EQ((*values)[0].GetAddress(), kVoter);
    EXPECT_EQ((*values)[1].GetNumber(), BigNum(42));
    EXPECT_TRUE((*values)[2].GetBool());
    EXPECT_TRUE((*values)[3].IsNegative());
    EXPECT_EQ((*values)[3].GetNumber(), BigNum(5));
    EXPECT_EQ((*values)[4].GetBytes(), (Bytes{0xde, 0xad, 0xbe, 0xef}));
}

TEST_F(AbiTest, DecodeDynamicTypes) {
    Bytes data;
    Append(data, UintWord(0x60));
    Append(data, UintWord(0xa0));
    Append(data, UintWord(0xe0));
    AppendDynamic(data, "abc");
    AppendDynamic(data, "hi");
    Append(data, UintWord(2));
    Append(data, kVoter.ToWord());
    Append(data, Address().ToWord());

    auto values = DecodeParams({"bytes", "string", "address[]"}, data);
    ASSERT_TRUE(values) << values.GetError().ToString();
    EXPECT_EQ((*values)[0].GetBytes(), (Bytes{'a', 'b', 'c'}));
    EXPECT_EQ((*values)[1].GetString(), "hi");
    const auto& items = (*values)[2].GetItems();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].GetAddress(), kVoter);
    EXPECT_TRUE(items[1].GetAddress().IsNull());
}

TEST_F(AbiTest, DecodeNestedArray) {
    // string[] holding "x" and "yz"
    Bytes data;
    Append(data, UintWord(0x20));
    Append(data, UintWord(2));
    Append(data, UintWord(0x40));
    Append(data, UintWord(0x80));
    AppendDynamic(data, "x");
    AppendDynamic(data, "yz");

    auto values = DecodeParams({"string[]"}, data);
    ASSERT_TRUE(values) << values.GetError().ToString();
    const auto& items = (*values)[0].GetItems();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].GetString(), "x");
    EXPECT_EQ(items[1].GetString(), "yz");
}

TEST_F(AbiTest, DecodeIsStrict) {
    EXPECT_TRUE(DecodeParams({"address"}, WordBytesOf(FilledWord(0x01, 0x01))).Is(ErrorKind::Decode));
    EXPECT_TRUE(DecodeParams({"bool"}, WordBytesOf(UintWord(2))).Is(ErrorKind::Decode));

    Bytes wide = WordBytesOf(UintWord(256));
    EXPECT_TRUE(DecodeParams({"uint8"}, wide).Is(ErrorKind::Decode));
    EXPECT_TRUE(DecodeParams({"uint16"}, wide).IsOk());

    EXPECT_TRUE(DecodeParams({"uint256"}, Bytes(31, 0)).Is(ErrorKind::Decode));
    EXPECT_TRUE(DecodeParams({"fixed128x18"}, wide).Is(ErrorKind::Decode));
    EXPECT_TRUE(DecodeParams({"bytes33"}, wide).Is(ErrorKind::Decode));
}

TEST_F(AbiTest, DecodeRejectsBadOffsets) {
    EXPECT_TRUE(DecodeParams({"bytes"}, WordBytesOf(UintWord(0x40))).Is(ErrorKind::Decode));

    Bytes lengthPastEnd;
    Append(lengthPastEnd, UintWord(0x20));
    Append(lengthPastEnd, UintWord(100));
    EXPECT_TRUE(DecodeParams({"bytes"}, lengthPastEnd).Is(ErrorKind::Decode));

    Bytes arrayPastEnd;
    Append(arrayPastEnd, UintWord(0x20));
    Append(arrayPastEnd, UintWord(3));
    Append(arrayPastEnd, kVoter.ToWord());
    EXPECT_TRUE(DecodeParams({"address[]"}, arrayPastEnd).Is(ErrorKind::Decode));
}

TEST_F(AbiTest, ReturnDataHelpers) {
    auto addr = DecodeAddress(WordBytesOf(kVoter.ToWord()));
    ASSERT_TRUE(addr);
    EXPECT_EQ(*addr, kVoter);

    auto number = DecodeUint(WordBytesOf(UintWord(7)));
    ASSERT_TRUE(number);
    EXPECT_EQ(*number, BigNum(7));
    EXPECT_TRUE(DecodeUint(Bytes{}).Is(ErrorKind::Decode));

    Bytes dynamic;
    Append(dynamic, UintWord(0x20));
    AppendDynamic(dynamic, "spell");
    auto raw = DecodeDynamicBytes(dynamic);
    ASSERT_TRUE(raw);
    EXPECT_EQ(*raw, (Bytes{'s', 'p', 'e', 'l', 'l'}));
}

// ============================================================================
// AbiValue Rendering
// ============================================================================

TEST_F(AbiTest, ValueToJSON) {
    EXPECT_EQ(AbiValue::MakeUint(BigNum(42)).ToJSON().GetInt(), 42);
    EXPECT_EQ(AbiValue::MakeUint(BigNum::FromDecimal("1000000001547125957863212448")).ToJSON().GetString(),
              "1000000001547125957863212448");
    EXPECT_EQ(AbiValue::MakeInt(BigNum(5), true).ToJSON().GetInt(), -5);
    EXPECT_EQ(AbiValue::MakeAddress(kVoter).ToJSON().GetString(), kVoter.ToChecksumHex());
    EXPECT_EQ(AbiValue::MakeBytes(Bytes{0x01, 0xab}).ToJSON().GetString(), "0x01ab");
    EXPECT_TRUE(AbiValue::MakeBool(true).ToJSON().GetBool());

    rpc::JSONValue arr = AbiValue::MakeArray({AbiValue::MakeUint(BigNum(1)),
                                              AbiValue::MakeString("two")}).ToJSON();
    EXPECT_EQ(arr.ToJSON(), R"([1,"two"])");
}

TEST_F(AbiTest, ValueToString) {
    EXPECT_EQ(AbiValue::MakeInt(BigNum(), true).ToString(), "0");
    EXPECT_EQ(AbiValue::MakeInt(BigNum(3), true).ToString(), "-3");
    EXPECT_EQ(AbiValue::MakeString("a\"b").ToString(), R"("a\"b")");
    EXPECT_EQ(AbiValue::MakeBool(false).ToString(), "false");
    EXPECT_EQ(AbiValue::MakeArray({AbiValue::MakeUint(BigNum(1)),
                                   AbiValue::MakeUint(BigNum(2))}).ToString(), "[1, 2]");
}

// ============================================================================
// Contract Interface
// ============================================================================

TEST_F(AbiTest, ParseInterface) {
    auto iface = ContractInterface::FromJSON(ABI);
    ASSERT_TRUE(iface) << iface.GetError().ToString();
    EXPECT_EQ(iface->GetFunctions().size(), 3u);
    EXPECT_EQ(iface->GetEvents().size(), 1u);

    EXPECT_TRUE(iface->HasFunction("setFee(uint256)"));
    EXPECT_TRUE(iface->HasFunction("rely(address,bool)"));
    EXPECT_TRUE(iface->HasFunction("submit((address,uint256)[],bytes32)"));
    EXPECT_FALSE(iface->HasFunction("setFee(uint128)"));
    EXPECT_TRUE(iface->HasEvent("Etch(bytes32)"));
    EXPECT_EQ(iface->GetSource(), ABI);

    const AbiFunction* fn = iface->FindBySelector(FunctionSelector("setFee(uint256)"));
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->name, "setFee");
    EXPECT_EQ(fn->inputs[0].name, "ray");
}

TEST_F(AbiTest, ParseInterfaceRejectsNonArray) {
    EXPECT_TRUE(ContractInterface::FromJSON("").Is(ErrorKind::Decode));
    EXPECT_TRUE(ContractInterface::FromJSON(R"({"status":"0","result":"Contract source code not verified"})")
                    .Is(ErrorKind::Decode));
    EXPECT_TRUE(ContractInterface::FromJSON("Contract source code not verified").Is(ErrorKind::Decode));

    auto empty = ContractInterface::FromJSON("[]");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->GetFunctions().empty());
}

TEST_F(AbiTest, DecodeFunctionInput) {
    auto iface = ContractInterface::FromJSON(ABI);
    ASSERT_TRUE(iface);

    Bytes calldata = EncodeCall("setFee(uint256)", {UintWord(1000)});
    auto call = iface->DecodeFunctionInput(calldata);
    ASSERT_TRUE(call) << call.GetError().ToString();
    EXPECT_EQ(call->name, "setFee");
    EXPECT_EQ(call->signature, "setFee(uint256)");
    ASSERT_EQ(call->args.size(), 1u);
    const AbiValue* ray = call->Find("ray");
    ASSERT_NE(ray, nullptr);
    EXPECT_EQ(ray->GetNumber(), BigNum(1000));
    EXPECT_EQ(call->Find("wad"), nullptr);
}

TEST_F(AbiTest, DecodeFunctionInputFailures) {
    auto iface = ContractInterface::FromJSON(ABI);
    ASSERT_TRUE(iface);

    EXPECT_TRUE(iface->DecodeFunctionInput(EncodeCall("setCap(uint256)", {UintWord(1)}))
                    .Is(ErrorKind::InterfaceMismatch));
    EXPECT_TRUE(iface->DecodeFunctionInput(Bytes{0x69, 0xfe}).Is(ErrorKind::Decode));
    EXPECT_TRUE(iface->DecodeFunctionInput(EncodeCall("setFee(uint256)")).Is(ErrorKind::Decode));
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, ValueAndError) {
    Result<int> ok(5);
    EXPECT_TRUE(ok.IsOk());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.Value(), 5);
    EXPECT_FALSE(ok.Is(ErrorKind::Network));

    auto failed = Result<int>::Fail(ErrorKind::Range, "execution reverted");
    EXPECT_FALSE(failed);
    EXPECT_TRUE(failed.Is(ErrorKind::Range));
    EXPECT_EQ(failed.GetError().ToString(), "RangeError: execution reverted");
    EXPECT_THROW(failed.Value(), std::logic_error);
}

TEST(ResultTest, ErrorKindNames) {
    EXPECT_STREQ(ErrorKindToString(ErrorKind::Network), "NetworkError");
    EXPECT_STREQ(ErrorKindToString(ErrorKind::Decode), "DecodeError");
    EXPECT_STREQ(ErrorKindToString(ErrorKind::Range), "RangeError");
    EXPECT_STREQ(ErrorKindToString(ErrorKind::InterfaceMismatch), "InterfaceMismatch");
}

} // namespace test
} // namespace eth
} // namespace chieftally
