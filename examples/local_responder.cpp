/**
 * @file local_responder.cpp
 * @brief Runs a DHT responder against in-memory collaborators
 *
 * Plays a short scripted exchange against a single node:
 *   - PING
 *   - PUT_VALUE followed by GET_VALUE, then a stale PUT_VALUE that is refused
 *   - FIND_NODE for a connected peer and for the node itself
 *   - ADD_PROVIDER followed by GET_PROVIDERS
 * and prints each outcome plus the handler statistics.
 *
 * Usage:
 *   local_responder [<config.json>]
 *
 * A missing config file is created with the default settings.
 */

#include "dht_responder.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kaddht;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [<config.json>]\n";
}

// Values are "<seq>|<payload>"; higher sequence numbers win
static bool read_sequence(const std::string& value, unsigned long& seq) {
    size_t bar = value.find('|');
    if (bar == std::string::npos || bar == 0) {
        return false;
    }
    try {
        size_t used = 0;
        seq = std::stoul(value.substr(0, bar), &used);
        return used == bar;
    } catch (const std::exception&) {
        return false;
    }
}

static std::shared_ptr<Validator> make_sequence_validator() {
    return std::make_shared<FunctionValidator>(
        [](const std::string&, const std::string& value) {
            unsigned long seq;
            return read_sequence(value, seq) ? ValidationResult::Accept()
                                             : ValidationResult::Reject("missing sequence number");
        },
        [](const std::string&, const std::vector<std::string>& values) {
            size_t best = 0;
            unsigned long best_seq = 0;
            bool found = false;
            for (size_t i = 0; i < values.size(); ++i) {
                unsigned long seq;
                if (read_sequence(values[i], seq) && (!found || seq > best_seq)) {
                    best = i;
                    best_seq = seq;
                    found = true;
                }
            }
            return found ? SelectionResult::Selected(best) : SelectionResult::Error("no valid values");
        });
}

static void report(const std::string& label, const HandlerResult& result) {
    std::cout << "== " << label << ": ";
    if (!result.success) {
        std::cout << "failed (" << handler_error_to_string(result.error) << ": " << result.error_message << ")\n";
        return;
    }
    if (!result.response) {
        std::cout << "ok, no response\n";
        return;
    }

    const Message& response = *result.response;
    std::cout << "ok";
    if (response.record) {
        std::cout << ", record '" << response.record->value << "' received " << response.record->time_received;
    }
    std::cout << ", " << response.closer_peers.size() << " closer peers"
              << ", " << response.provider_peers.size() << " providers\n";
    for (const auto& peer : response.closer_peers) {
        std::cout << "     closer   " << peer.id << " [" << connectedness_to_string(peer.connection) << "]\n";
    }
    for (const auto& peer : response.provider_peers) {
        std::cout << "     provider " << peer.id << " (" << peer.addrs.size() << " addrs)\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }

    DhtConfig config;
    if (argc == 2 && !load_dht_config(argv[1], config)) {
        std::cerr << "Error: could not load configuration from " << argv[1] << "\n";
        return 1;
    }
    apply_logging_config(config);

    const PeerId self = "local-node";
    const PeerId client = "client-peer";

    MemoryDatastore datastore;
    NamespacedValidator validator;
    validator.add_namespace("v", make_sequence_validator());
    ProviderStore providers(config.provider_validity, config.provider_cleanup_interval);
    KBucketTable routing_table(self);
    MemoryPeerstore peerstore;
    ConnectionTracker connectivity;

    peerstore.add_addrs(self, {"/ip4/127.0.0.1/tcp/4001"}, PERMANENT_ADDR_TTL);
    for (int i = 0; i < 8; ++i) {
        PeerId peer = "peer-" + std::to_string(i);
        routing_table.add_peer(peer);
        peerstore.add_addrs(peer, {"/ip4/10.0.0." + std::to_string(i + 1) + "/tcp/4001"}, PERMANENT_ADDR_TTL);
    }
    peerstore.add_addrs("neighbour", {"/ip4/192.168.1.20/tcp/4001"}, PERMANENT_ADDR_TTL);
    connectivity.set_connectedness("neighbour", Connectedness::Connected);

    providers.start();

    DhtResponderDeps deps{datastore, validator, providers, routing_table, peerstore, connectivity};
    DhtResponder responder(self, deps, config);
    RequestContext ctx = RequestContext().with_timeout(std::chrono::seconds(10));

    report("PING", responder.handle_message(ctx, client, Message(MessageType::Ping, "")));

    Message put(MessageType::PutValue, "/v/greeting");
    put.record = Record("/v/greeting", "2|hello");
    report("PUT_VALUE seq 2", responder.handle_message(ctx, client, put));

    put.record = Record("/v/greeting", "1|older");
    report("PUT_VALUE seq 1", responder.handle_message(ctx, client, put));

    report("GET_VALUE", responder.handle_message(ctx, client, Message(MessageType::GetValue, "/v/greeting")));

    report("FIND_NODE neighbour", responder.handle_message(ctx, client, Message(MessageType::FindNode, "neighbour")));
    report("FIND_NODE self", responder.handle_message(ctx, client, Message(MessageType::FindNode, self)));

    std::string cid;
    append_uvarint(cid, 1);
    append_uvarint(cid, ContentId::CODEC_DAG_PB);
    append_uvarint(cid, ContentId::MULTIHASH_SHA2_256);
    append_uvarint(cid, 32);
    cid += std::string(32, '\x5a');

    Message announce(MessageType::AddProvider, cid);
    announce.provider_peers.emplace_back(client, std::vector<Multiaddr>{"/ip4/192.168.1.30/tcp/4001"},
                                         Connectedness::Connected);
    report("ADD_PROVIDER", responder.handle_message(ctx, client, announce));
    report("GET_PROVIDERS", responder.handle_message(ctx, "peer-3", Message(MessageType::GetProviders, cid)));

    report("UNSUPPORTED", responder.handle_message(ctx, client, Message(MessageType::Unsupported, "")));

    providers.stop();

    std::cout << "\nStatistics:\n" << responder.get_statistics_json().dump(2) << "\n";
    return 0;
}
