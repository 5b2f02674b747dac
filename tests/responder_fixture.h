#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "dht_responder.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kaddht {
namespace test {

// Values look like "<seq>|<payload>"; higher sequence numbers win
inline bool parse_seq(const std::string& value, long long& seq) {
    size_t bar = value.find('|');
    if (bar == std::string::npos || bar == 0) {
        return false;
    }
    seq = 0;
    for (size_t i = 0; i < bar; ++i) {
        if (value[i] < '0' || value[i] > '9') {
            return false;
        }
        seq = seq * 10 + (value[i] - '0');
    }
    return true;
}

inline std::shared_ptr<Validator> make_seq_validator() {
    return std::make_shared<FunctionValidator>(
        [](const std::string&, const std::string& value) {
            long long seq;
            if (!parse_seq(value, seq)) {
                return ValidationResult::Reject("value has no sequence number");
            }
            return ValidationResult::Accept();
        },
        [](const std::string&, const std::vector<std::string>& values) {
            size_t best = 0;
            long long best_seq = -1;
            for (size_t i = 0; i < values.size(); ++i) {
                long long seq;
                if (parse_seq(values[i], seq) && seq > best_seq) {
                    best = i;
                    best_seq = seq;
                }
            }
            if (best_seq < 0) {
                return SelectionResult::Error("no valid values");
            }
            return SelectionResult::Selected(best);
        });
}

class MockDatastore : public Datastore {
public:
    MOCK_METHOD(DatastoreStatus, get, (const std::string& key, std::string& value), (override));
    MOCK_METHOD(DatastoreStatus, put, (const std::string& key, const std::string& value), (override));
    MOCK_METHOD(DatastoreStatus, remove, (const std::string& key), (override));
    MOCK_METHOD(DatastoreStatus, has, (const std::string& key), (override));
};

class MockRoutingTable : public RoutingTable {
public:
    MOCK_METHOD(std::vector<PeerId>, closer_peers,
                (const std::string& target_key, const PeerId& exclude, size_t count), (override));
};

class MockProviderIndex : public ProviderIndex {
public:
    MOCK_METHOD(std::vector<PeerId>, get_providers, (const RequestContext& ctx, const ContentId& cid), (override));
    MOCK_METHOD(void, add_provider, (const RequestContext& ctx, const ContentId& cid, const PeerId& provider), (override));
};

/**
 * Responder wired to in-memory collaborators and a fixed clock.
 * Individual tests swap single collaborators for mocks via make_responder().
 */
class ResponderTest : public ::testing::Test {
protected:
    ResponderTest()
        : routing_table_(SELF), now_(std::chrono::system_clock::time_point(std::chrono::seconds(1700000000))) {
        validator_.add_namespace("v", make_seq_validator());
    }

    void SetUp() override {
        make_responder();
    }

    void make_responder(Datastore* datastore = nullptr,
                        RoutingTable* routing_table = nullptr,
                        ProviderIndex* providers = nullptr,
                        const DhtConfig& config = DhtConfig()) {
        DhtResponderDeps deps{
            datastore ? *datastore : datastore_,
            validator_,
            providers ? *providers : providers_,
            routing_table ? *routing_table : routing_table_,
            peerstore_,
            connectivity_
        };
        responder_ = std::make_unique<DhtResponder>(SELF, deps, config);
        responder_->set_clock([this] { return now_; });
    }

    void add_known_peer(const PeerId& peer, bool with_addrs = true) {
        routing_table_.add_peer(peer);
        if (with_addrs) {
            peerstore_.add_addrs(peer, {"/ip4/10.0.0.1/tcp/4001/" + peer}, PERMANENT_ADDR_TTL);
        }
    }

    Message put_request(const std::string& key, const std::string& value) {
        Message request(MessageType::PutValue, key);
        request.record = Record(key, value);
        return request;
    }

    Message get_request(const std::string& key) {
        return Message(MessageType::GetValue, key);
    }

    std::string content_id_bytes(char fill) const {
        return std::string("\x12\x20", 2) + std::string(32, fill);
    }

    static std::vector<PeerId> ids_of(const std::vector<MessagePeer>& peers) {
        std::vector<PeerId> ids;
        for (const auto& peer : peers) {
            ids.push_back(peer.id);
        }
        return ids;
    }

    static constexpr const char* SELF = "self-node";
    static constexpr const char* REQUESTER = "requester";

    MemoryDatastore datastore_;
    NamespacedValidator validator_;
    ProviderStore providers_;
    KBucketTable routing_table_;
    MemoryPeerstore peerstore_;
    ConnectionTracker connectivity_;
    RequestContext ctx_;

    std::chrono::system_clock::time_point now_;
    std::unique_ptr<DhtResponder> responder_;
};

} // namespace test
} // namespace kaddht
