#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "message.h"
#include "connectivity.h"
#include "bencode.h"

using namespace kaddht;

class MessageCodecTest : public ::testing::Test {
protected:
    std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

TEST_F(MessageCodecTest, WireTypeMapping) {
    EXPECT_EQ(message_type_from_wire(0), MessageType::PutValue);
    EXPECT_EQ(message_type_from_wire(1), MessageType::GetValue);
    EXPECT_EQ(message_type_from_wire(2), MessageType::AddProvider);
    EXPECT_EQ(message_type_from_wire(3), MessageType::GetProviders);
    EXPECT_EQ(message_type_from_wire(4), MessageType::FindNode);
    EXPECT_EQ(message_type_from_wire(5), MessageType::Ping);
    EXPECT_EQ(message_type_from_wire(6), MessageType::Unsupported);
    EXPECT_EQ(message_type_from_wire(-1), MessageType::Unsupported);
    EXPECT_STREQ(message_type_to_string(MessageType::GetProviders), "GET_PROVIDERS");
}

TEST_F(MessageCodecTest, FullMessageSurvivesEncoding) {
    Message message(MessageType::GetValue, "/v/key", 3);
    Record record("/v/key", "value");
    record.time_received = "2021-03-04T05:06:07Z";
    message.record = record;
    message.closer_peers.emplace_back("peer-a", std::vector<Multiaddr>{"/ip4/1.1.1.1/tcp/1"}, Connectedness::Connected);
    message.provider_peers.emplace_back("peer-b", std::vector<Multiaddr>{}, Connectedness::CanConnect);

    auto decoded = decode_message(encode_message(message));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::GetValue);
    EXPECT_EQ(decoded->key, "/v/key");
    EXPECT_EQ(decoded->cluster_level, 3);
    ASSERT_TRUE(decoded->record.has_value());
    EXPECT_EQ(*decoded->record, record);
    EXPECT_EQ(decoded->closer_peers, message.closer_peers);
    EXPECT_EQ(decoded->provider_peers, message.provider_peers);
}

TEST_F(MessageCodecTest, UnknownWireTypeDecodesAsUnsupported) {
    auto decoded = decode_message(bytes("d1:k0:1:ti42ee"));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::Unsupported);
}

TEST_F(MessageCodecTest, RejectsMalformedMessages) {
    EXPECT_FALSE(decode_message(bytes("garbage")).has_value());
    EXPECT_FALSE(decode_message(bytes("le")).has_value());
    EXPECT_FALSE(decode_message(bytes("d1:k1:xe")).has_value());
    EXPECT_FALSE(decode_message(bytes("d2:cli4294967296e1:ti5ee")).has_value());
    EXPECT_FALSE(decode_message(bytes("d1:rd5:value1:ve1:ti1ee")).has_value());
}

TEST_F(MessageCodecTest, PeerInfosCarryConnectedness) {
    ConnectionTracker tracker;
    tracker.set_connectedness("peer-a", Connectedness::Connected);

    std::vector<PeerInfo> infos{PeerInfo("peer-a", {"/ip4/1.1.1.1/tcp/1"}), PeerInfo("peer-b", {})};
    std::vector<MessagePeer> peers = peer_infos_to_message_peers(tracker, infos);
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_EQ(peers[0].connection, Connectedness::Connected);
    EXPECT_EQ(peers[1].connection, Connectedness::NotConnected);

    EXPECT_EQ(message_peers_to_peer_infos(peers), infos);
}

TEST_F(MessageCodecTest, ResponseEnvelope) {
    Message response = make_response(MessageType::FindNode, "", 7);
    EXPECT_EQ(response.type, MessageType::FindNode);
    EXPECT_EQ(response.cluster_level, 7);
    EXPECT_FALSE(response.record.has_value());
    EXPECT_TRUE(response.closer_peers.empty());
}
