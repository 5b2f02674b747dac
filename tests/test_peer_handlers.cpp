#include "responder_fixture.h"

using namespace kaddht;
using namespace kaddht::test;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::UnorderedElementsAre;

class PeerHandlersTest : public ResponderTest {
protected:
    Message find_node(const PeerId& target, int32_t cluster_level = 0) {
        return Message(MessageType::FindNode, target, cluster_level);
    }

    size_t count_of(const std::vector<MessagePeer>& peers, const PeerId& id) {
        size_t n = 0;
        for (const auto& peer : peers) {
            if (peer.id == id) {
                ++n;
            }
        }
        return n;
    }
};

TEST_F(PeerHandlersTest, FindSelfReturnsOnlySelf) {
    peerstore_.add_addrs(SELF, {"/ip4/127.0.0.1/tcp/4001"}, PERMANENT_ADDR_TTL);
    for (int i = 0; i < 10; ++i) {
        add_known_peer("peer-" + std::to_string(i));
    }

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node(SELF, 2));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.response->key.empty());
    EXPECT_EQ(result.response->cluster_level, 2);
    EXPECT_THAT(ids_of(result.response->closer_peers), ElementsAre(SELF));
}

TEST_F(PeerHandlersTest, FindSelfDoesNotConsultRoutingTable) {
    MockRoutingTable routing;
    EXPECT_CALL(routing, closer_peers(_, _, _)).Times(0);
    make_responder(nullptr, &routing);
    peerstore_.add_addrs(SELF, {"/ip4/127.0.0.1/tcp/4001"}, PERMANENT_ADDR_TTL);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node(SELF));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.response->closer_peers.size(), 1u);
}

TEST_F(PeerHandlersTest, ReturnsClosestPeersWithAddresses) {
    add_known_peer("peer-1");
    add_known_peer("peer-2");
    add_known_peer("hidden", false);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_THAT(ids_of(result.response->closer_peers), UnorderedElementsAre("peer-1", "peer-2"));
    for (const auto& peer : result.response->closer_peers) {
        EXPECT_FALSE(peer.addrs.empty());
    }
}

TEST_F(PeerHandlersTest, ReportsConnectednessOfReturnedPeers) {
    add_known_peer("peer-1");
    connectivity_.set_connectedness("peer-1", Connectedness::Connected);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.response->closer_peers.size(), 1u);
    EXPECT_EQ(result.response->closer_peers[0].connection, Connectedness::Connected);
}

TEST_F(PeerHandlersTest, ConnectedTargetIsAppended) {
    add_known_peer("peer-1");
    peerstore_.add_addrs("target", {"/ip4/10.1.1.1/tcp/1"}, PERMANENT_ADDR_TTL);
    connectivity_.set_connectedness("target", Connectedness::Connected);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_THAT(ids_of(result.response->closer_peers), ElementsAre("peer-1", "target"));
}

TEST_F(PeerHandlersTest, ConnectableTargetIsAppended) {
    peerstore_.add_addrs("target", {"/ip4/10.1.1.1/tcp/1"}, PERMANENT_ADDR_TTL);
    connectivity_.set_connectedness("target", Connectedness::CanConnect);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_THAT(ids_of(result.response->closer_peers), ElementsAre("target"));
}

TEST_F(PeerHandlersTest, UnreachableTargetIsNotAppended) {
    peerstore_.add_addrs("target", {"/ip4/10.1.1.1/tcp/1"}, PERMANENT_ADDR_TTL);
    connectivity_.set_connectedness("target", Connectedness::CannotConnect);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.response->closer_peers.empty());
}

TEST_F(PeerHandlersTest, TargetAlreadyInRoutingTableAppearsOnce) {
    add_known_peer("target");
    add_known_peer("peer-1");
    connectivity_.set_connectedness("target", Connectedness::Connected);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(count_of(result.response->closer_peers, "target"), 1u);
    EXPECT_EQ(result.response->closer_peers.size(), 2u);
}

TEST_F(PeerHandlersTest, RequesterNeverLearnsAboutItself) {
    add_known_peer(REQUESTER);
    add_known_peer("peer-1");
    connectivity_.set_connectedness(REQUESTER, Connectedness::Connected);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node(REQUESTER));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(count_of(result.response->closer_peers, REQUESTER), 0u);
    EXPECT_THAT(ids_of(result.response->closer_peers), ElementsAre("peer-1"));
}

TEST_F(PeerHandlersTest, RequesterFilteredEvenIfRoutingTableReturnsIt) {
    MockRoutingTable routing;
    EXPECT_CALL(routing, closer_peers(std::string("target"), PeerId(REQUESTER), K_VALUE))
        .WillOnce(Return(std::vector<PeerId>{REQUESTER, "peer-1"}));
    make_responder(nullptr, &routing);
    peerstore_.add_addrs(REQUESTER, {"/ip4/10.9.9.9/tcp/9"}, PERMANENT_ADDR_TTL);
    peerstore_.add_addrs("peer-1", {"/ip4/10.1.1.1/tcp/1"}, PERMANENT_ADDR_TTL);

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_THAT(ids_of(result.response->closer_peers), ElementsAre("peer-1"));
}

TEST_F(PeerHandlersTest, NothingFoundIsAnEmptySuccess) {
    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target", 9));
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->type, MessageType::FindNode);
    EXPECT_EQ(result.response->cluster_level, 9);
    EXPECT_TRUE(result.response->closer_peers.empty());
}

TEST_F(PeerHandlersTest, ClosePeerCountFollowsConfig) {
    DhtConfig config;
    config.closer_peer_count = 3;
    make_responder(nullptr, nullptr, nullptr, config);
    for (int i = 0; i < 10; ++i) {
        add_known_peer("peer-" + std::to_string(i));
    }

    HandlerResult result = responder_->handle_find_node(ctx_, REQUESTER, find_node("target"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.response->closer_peers.size(), 3u);
}

TEST_F(PeerHandlersTest, CancelledFindNodeFails) {
    RequestContext cancelled;
    cancelled.cancel();

    HandlerResult result = responder_->handle_find_node(cancelled, REQUESTER, find_node("target"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, HandlerError::Cancelled);
}

TEST_F(PeerHandlersTest, PingEchoesRequest) {
    Message ping(MessageType::Ping, "anything", 5);

    HandlerResult result = responder_->handle_ping(ctx_, REQUESTER, ping);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->type, MessageType::Ping);
    EXPECT_EQ(result.response->key, "anything");
    EXPECT_EQ(result.response->cluster_level, 5);
}
