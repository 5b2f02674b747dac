#pragma once

#include "kaddht_export.h"
#include "types.h"
#include "record.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace kaddht {

class ConnectivityOracle;

/**
 * DHT message types. Wire values 0..5; anything else decodes to Unsupported.
 */
enum class MessageType : uint8_t {
    PutValue = 0,
    GetValue = 1,
    AddProvider = 2,
    GetProviders = 3,
    FindNode = 4,
    Ping = 5,
    Unsupported = 6
};

constexpr size_t MESSAGE_TYPE_COUNT = 6;

KADDHT_API MessageType message_type_from_wire(int64_t value);
KADDHT_API const char* message_type_to_string(MessageType type);

/**
 * Peer descriptor as carried in messages
 */
struct MessagePeer {
    PeerId id;
    std::vector<Multiaddr> addrs;
    Connectedness connection;

    MessagePeer() : connection(Connectedness::NotConnected) {}
    MessagePeer(const PeerId& peer_id, const std::vector<Multiaddr>& addresses, Connectedness c)
        : id(peer_id), addrs(addresses), connection(c) {}

    bool operator==(const MessagePeer& other) const {
        return id == other.id && addrs == other.addrs && connection == other.connection;
    }
};

/**
 * Request / response envelope. A response carries the request's type and its
 * answer in key, record and the peer lists.
 */
struct Message {
    MessageType type;
    std::string key;
    std::optional<Record> record;
    std::vector<MessagePeer> closer_peers;
    std::vector<MessagePeer> provider_peers;
    int32_t cluster_level;

    Message() : type(MessageType::Ping), cluster_level(0) {}
    Message(MessageType t, const std::string& k, int32_t level = 0)
        : type(t), key(k), cluster_level(level) {}
};

/**
 * Empty response envelope with the given type, key and cluster level
 */
KADDHT_API Message make_response(MessageType type, const std::string& key, int32_t cluster_level);

/**
 * Attach the current connectedness of each peer
 */
KADDHT_API std::vector<MessagePeer> peer_infos_to_message_peers(ConnectivityOracle& connectivity,
                                                                const std::vector<PeerInfo>& infos);

KADDHT_API std::vector<PeerInfo> message_peers_to_peer_infos(const std::vector<MessagePeer>& peers);

/**
 * Wire encoding (bencoded dictionary)
 */
KADDHT_API std::vector<uint8_t> encode_message(const Message& message);

/**
 * @return Message, or nullopt if the bytes are not a well-formed message
 */
KADDHT_API std::optional<Message> decode_message(const std::vector<uint8_t>& data);

} // namespace kaddht
