// CHIEFTALLY - Node and Explorer Client Tests
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include <gtest/gtest.h>

#include "chief/fake_node.h"
#include "chieftally/db/leveldb.h"
#include "chieftally/eth/explorer.h"
#include "chieftally/eth/node.h"

namespace chieftally {
namespace eth {
namespace test {

using chief::test::FakeFetcher;
using chief::test::MakeAddress;

// ============================================================================
// Interface Cache
// ============================================================================

class InterfaceCacheTest : public ::testing::Test {
protected:
    db::MemoryDatabase store_;
    FakeFetcher fetcher_;
    const Address chief_ = MakeAddress(0xc1);

    void SetUp() override {
        fetcher_.SetAbi(chief_, chief::test::CHIEF_ABI);
    }
};

TEST_F(InterfaceCacheTest, FetchesOnceAndMemoizes) {
    InterfaceCache cache(store_, fetcher_);

    auto first = cache.GetInterface(chief_);
    ASSERT_TRUE(first) << first.GetError().ToString();
    EXPECT_TRUE((*first)->HasFunction("vote(address[])"));
    EXPECT_TRUE((*first)->HasEvent("Etch(bytes32)"));

    auto second = cache.GetInterface(chief_);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.Value().get(), second.Value().get());
    EXPECT_EQ(fetcher_.GetRequestCount(), 1u);
    EXPECT_EQ(cache.GetFetchCount(), 1u);
}

TEST_F(InterfaceCacheTest, PersistsAcrossInstances) {
    {
        InterfaceCache cache(store_, fetcher_);
        ASSERT_TRUE(cache.GetInterface(chief_));
    }
    EXPECT_EQ(store_.Size(), 1u);
    std::string stored;
    EXPECT_TRUE(store_.Get(db::MakeKey(db::prefix::INTERFACE, chief_.data(), chief_.size()), &stored).ok());

    InterfaceCache reopened(store_, fetcher_);
    auto iface = reopened.GetInterface(chief_);
    ASSERT_TRUE(iface);
    EXPECT_TRUE((*iface)->HasFunction("hat()"));
    EXPECT_EQ(fetcher_.GetRequestCount(), 1u);
    EXPECT_EQ(reopened.GetFetchCount(), 0u);
}

TEST_F(InterfaceCacheTest, FailureIsNotCached) {
    InterfaceCache cache(store_, fetcher_);
    Address unknown = MakeAddress(0x77);

    EXPECT_TRUE(cache.GetInterface(unknown).Is(ErrorKind::Network));
    EXPECT_EQ(store_.Size(), 0u);

    fetcher_.SetAbi(unknown, chief::test::MOM_ABI);
    auto iface = cache.GetInterface(unknown);
    ASSERT_TRUE(iface);
    EXPECT_TRUE((*iface)->HasFunction("setFee(uint256)"));
    EXPECT_EQ(fetcher_.GetRequestCount(), 2u);
}

TEST_F(InterfaceCacheTest, CorruptStoredAbi) {
    Address broken = MakeAddress(0x66);
    store_.Put(db::MakeKey(db::prefix::INTERFACE, broken.data(), broken.size()), "not json");

    InterfaceCache cache(store_, fetcher_);
    auto iface = cache.GetInterface(broken);
    EXPECT_TRUE(iface.Is(ErrorKind::Decode));
    EXPECT_EQ(fetcher_.GetRequestCount(), 0u);
}

// ============================================================================
// Etherscan Fetcher
// ============================================================================

TEST(EtherscanFetcherTest, BuildRequestUrl) {
    EtherscanFetcher::Config config;
    EtherscanFetcher plain(config);
    Address chief = Address::FromHex("0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5");
    EXPECT_EQ(plain.BuildRequestUrl(chief),
              "http://api.etherscan.io/api?module=contract&action=getabi&format=raw"
              "&address=0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5");

    config.url = "http://explorer.local/api?chain=1";
    config.apiKey = "K Y";
    EtherscanFetcher keyed(config);
    std::string url = keyed.BuildRequestUrl(chief);
    EXPECT_EQ(url.rfind("http://explorer.local/api?chain=1&module=contract", 0), 0u);
    EXPECT_NE(url.find("&apikey=K%20Y"), std::string::npos);
}

TEST(EtherscanFetcherTest, UnreachableExplorer) {
    EtherscanFetcher::Config config;
    config.url = "http://127.0.0.1:1/api";
    config.timeoutSeconds = 2;
    EtherscanFetcher fetcher(config);
    auto abi = fetcher.FetchAbi(MakeAddress(1));
    EXPECT_TRUE(abi.Is(ErrorKind::Network));
}

// ============================================================================
// JSON-RPC Node Client
// ============================================================================

TEST(LogFilterTest, ToJSON) {
    LogFilter filter;
    filter.address = Address::FromHex("0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5");
    filter.topics = {{NoteTopic("vote(address[])"), NoteTopic("vote(bytes32)")}, {}};
    filter.fromBlock = 7705361;

    rpc::JSONValue json = filter.ToJSON();
    EXPECT_EQ(json["address"].GetString(), "0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5");
    EXPECT_EQ(json["fromBlock"].GetString(), "0x759311");
    EXPECT_EQ(json["toBlock"].GetString(), "latest");

    const rpc::JSONValue& topics = json["topics"];
    ASSERT_EQ(topics.Size(), 2u);
    ASSERT_EQ(topics.GetArray()[0].Size(), 2u);
    EXPECT_EQ(topics.GetArray()[0].GetArray()[1].GetString(),
              "0xa69beaba" + std::string(56, '0'));
    EXPECT_TRUE(topics.GetArray()[1].IsNull());

    filter.toBlock = 16;
    EXPECT_EQ(filter.ToJSON()["toBlock"].GetString(), "0x10");
}

TEST(RPCNodeClientTest, ParseLog) {
    auto entry = rpc::JSONValue::Parse(R"({
        "address": "0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5",
        "topics": ["0x4f0892983790f53eea39a7a496f6cb40e8811b313871337b6a761efc6c67bb1f"],
        "data": "0x01ff",
        "blockNumber": "0x759311",
        "logIndex": "0x1a",
        "transactionHash": "0x00000000000000000000000000000000000000000000000000000000000000aa",
        "removed": false
    })");
    auto log = RPCNodeClient::ParseLog(entry);
    ASSERT_TRUE(log) << log.GetError().ToString();
    EXPECT_EQ(log->topics.size(), 1u);
    EXPECT_EQ(log->topics[0], EventTopic("Etch(bytes32)"));
    EXPECT_EQ(log->data, (Bytes{0x01, 0xff}));
    EXPECT_EQ(log->blockNumber, 7705361u);
    EXPECT_EQ(log->logIndex, 26u);
    EXPECT_EQ(log->transactionHash[31], 0xaa);
}

TEST(RPCNodeClientTest, ParseMalformedLog) {
    EXPECT_TRUE(RPCNodeClient::ParseLog(rpc::JSONValue("log")).Is(ErrorKind::Network));

    auto badAddress = rpc::JSONValue::Parse(
        R"({"address":"0x12","topics":[],"data":"0x","blockNumber":"0x1","logIndex":"0x0"})");
    EXPECT_TRUE(RPCNodeClient::ParseLog(badAddress).Is(ErrorKind::Network));

    auto noBlock = rpc::JSONValue::Parse(
        R"({"address":"0x9ef05f7f6deb616fd37ac3c959a2ddd25a54e4f5","topics":[],"data":"0x","logIndex":"0x0"})");
    EXPECT_TRUE(RPCNodeClient::ParseLog(noBlock).Is(ErrorKind::Network));
}

TEST(RPCNodeClientTest, LogOrdering) {
    LogEntry a;
    a.blockNumber = 10;
    a.logIndex = 5;
    LogEntry b;
    b.blockNumber = 11;
    b.logIndex = 0;
    LogEntry c;
    c.blockNumber = 10;
    c.logIndex = 6;
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a < c);
    EXPECT_TRUE(c < b);
    EXPECT_FALSE(b < a);
}

TEST(RPCNodeClientTest, ClassifyCallError) {
    auto reverted = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::EXECUTION_REVERTED, "execution reverted", rpc::JSONValue(1)));
    EXPECT_EQ(reverted.kind, ErrorKind::Range);

    auto vmError = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::SERVER_ERROR, "VM Exception while processing transaction: revert",
                                rpc::JSONValue(1)));
    EXPECT_EQ(vmError.kind, ErrorKind::Range);

    auto opcode = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::SERVER_ERROR, "invalid opcode: INVALID", rpc::JSONValue(1)));
    EXPECT_EQ(opcode.kind, ErrorKind::Range);

    auto refused = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::NETWORK_ERROR, "Connection refused", rpc::JSONValue(1)));
    EXPECT_EQ(refused.kind, ErrorKind::Network);

    auto gethTimeout = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::SERVER_ERROR, "execution aborted (timeout = 5s)",
                                rpc::JSONValue(1)));
    EXPECT_EQ(gethTimeout.kind, ErrorKind::Network);

    auto callTimeout = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::SERVER_ERROR, "request timeout", rpc::JSONValue(1)));
    EXPECT_EQ(callTimeout.kind, ErrorKind::Network);

    auto missingHeader = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(rpc::ErrorCode::SERVER_ERROR, "header not found", rpc::JSONValue(1)));
    EXPECT_EQ(missingHeader.kind, ErrorKind::Network);

    auto limited = RPCNodeClient::ClassifyCallError(
        rpc::RPCResponse::Error(-32005, "daily request count exceeded", rpc::JSONValue(1)));
    EXPECT_EQ(limited.kind, ErrorKind::Network);
}

TEST(RPCNodeClientTest, UnreachableNode) {
    rpc::RPCClientConfig config;
    config.url = "http://127.0.0.1:1";
    config.timeoutSeconds = 2;
    rpc::RPCClient client(config);
    RPCNodeClient node(client);

    EXPECT_TRUE(node.GetLogs(LogFilter{}).Is(ErrorKind::Network));
    EXPECT_TRUE(node.Call(MakeAddress(1), Bytes{0x01}).Is(ErrorKind::Network));
    EXPECT_TRUE(node.BlockNumber().Is(ErrorKind::Network));
}

} // namespace test
} // namespace eth
} // namespace chieftally
