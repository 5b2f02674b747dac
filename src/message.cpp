#include "message.h"
#include "connectivity.h"
#include "bencode.h"
#include "logger.h"
#include <limits>

#define LOG_CODEC_DEBUG(message) LOG_DEBUG("codec", message)

namespace kaddht {

namespace {

const char* FIELD_TYPE = "t";
const char* FIELD_KEY = "k";
const char* FIELD_RECORD = "r";
const char* FIELD_CLOSER_PEERS = "cp";
const char* FIELD_PROVIDER_PEERS = "pp";
const char* FIELD_CLUSTER_LEVEL = "cl";

const char* FIELD_PEER_ID = "id";
const char* FIELD_PEER_ADDRS = "a";
const char* FIELD_PEER_CONNECTION = "c";

const char* FIELD_RECORD_KEY = "key";
const char* FIELD_RECORD_VALUE = "value";
const char* FIELD_RECORD_TIME = "timeReceived";

BencodeValue encode_peers(const std::vector<MessagePeer>& peers) {
    BencodeValue list = BencodeValue::create_list();
    for (const auto& peer : peers) {
        BencodeValue entry = BencodeValue::create_dict();
        entry[FIELD_PEER_ID] = BencodeValue(peer.id);

        BencodeValue addrs = BencodeValue::create_list();
        for (const auto& addr : peer.addrs) {
            addrs.push_back(BencodeValue(addr));
        }
        entry[FIELD_PEER_ADDRS] = addrs;
        entry[FIELD_PEER_CONNECTION] = BencodeValue(static_cast<int64_t>(peer.connection));
        list.push_back(entry);
    }
    return list;
}

Connectedness connection_from_wire(int64_t value) {
    switch (value) {
        case 1: return Connectedness::Connected;
        case 2: return Connectedness::CanConnect;
        case 3: return Connectedness::CannotConnect;
        default: return Connectedness::NotConnected;
    }
}

std::vector<MessagePeer> decode_peers(const BencodeValue& list) {
    std::vector<MessagePeer> peers;
    for (const auto& item : list.as_list()) {
        MessagePeer peer;
        peer.id = item[FIELD_PEER_ID].as_string();
        if (const BencodeValue* addrs = item.find(FIELD_PEER_ADDRS)) {
            for (const auto& addr : addrs->as_list()) {
                peer.addrs.push_back(addr.as_string());
            }
        }
        if (const BencodeValue* connection = item.find(FIELD_PEER_CONNECTION)) {
            peer.connection = connection_from_wire(connection->as_integer());
        }
        peers.push_back(std::move(peer));
    }
    return peers;
}

} // namespace

MessageType message_type_from_wire(int64_t value) {
    if (value < 0 || value >= static_cast<int64_t>(MESSAGE_TYPE_COUNT)) {
        return MessageType::Unsupported;
    }
    return static_cast<MessageType>(value);
}

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::PutValue:     return "PUT_VALUE";
        case MessageType::GetValue:     return "GET_VALUE";
        case MessageType::AddProvider:  return "ADD_PROVIDER";
        case MessageType::GetProviders: return "GET_PROVIDERS";
        case MessageType::FindNode:     return "FIND_NODE";
        case MessageType::Ping:         return "PING";
        case MessageType::Unsupported:  return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

Message make_response(MessageType type, const std::string& key, int32_t cluster_level) {
    return Message(type, key, cluster_level);
}

std::vector<MessagePeer> peer_infos_to_message_peers(ConnectivityOracle& connectivity,
                                                     const std::vector<PeerInfo>& infos) {
    std::vector<MessagePeer> peers;
    peers.reserve(infos.size());
    for (const auto& info : infos) {
        peers.emplace_back(info.id, info.addrs, connectivity.connectedness(info.id));
    }
    return peers;
}

std::vector<PeerInfo> message_peers_to_peer_infos(const std::vector<MessagePeer>& peers) {
    std::vector<PeerInfo> infos;
    infos.reserve(peers.size());
    for (const auto& peer : peers) {
        infos.emplace_back(peer.id, peer.addrs);
    }
    return infos;
}

std::vector<uint8_t> encode_message(const Message& message) {
    BencodeValue dict = BencodeValue::create_dict();
    dict[FIELD_TYPE] = BencodeValue(static_cast<int64_t>(message.type));
    dict[FIELD_KEY] = BencodeValue(message.key);
    dict[FIELD_CLUSTER_LEVEL] = BencodeValue(static_cast<int64_t>(message.cluster_level));

    if (message.record) {
        BencodeValue record = BencodeValue::create_dict();
        record[FIELD_RECORD_KEY] = BencodeValue(message.record->key);
        record[FIELD_RECORD_VALUE] = BencodeValue(message.record->value);
        if (!message.record->time_received.empty()) {
            record[FIELD_RECORD_TIME] = BencodeValue(message.record->time_received);
        }
        dict[FIELD_RECORD] = record;
    }
    if (!message.closer_peers.empty()) {
        dict[FIELD_CLOSER_PEERS] = encode_peers(message.closer_peers);
    }
    if (!message.provider_peers.empty()) {
        dict[FIELD_PROVIDER_PEERS] = encode_peers(message.provider_peers);
    }

    return dict.encode();
}

std::optional<Message> decode_message(const std::vector<uint8_t>& data) {
    try {
        const BencodeValue dict = BencodeDecoder::decode(data);
        if (!dict.is_dict()) {
            LOG_CODEC_DEBUG("Message is not a dictionary");
            return std::nullopt;
        }

        Message message;
        message.type = message_type_from_wire(dict[FIELD_TYPE].as_integer());

        if (const BencodeValue* key = dict.find(FIELD_KEY)) {
            message.key = key->as_string();
        }
        if (const BencodeValue* level = dict.find(FIELD_CLUSTER_LEVEL)) {
            int64_t value = level->as_integer();
            if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
                LOG_CODEC_DEBUG("Cluster level out of range: " << value);
                return std::nullopt;
            }
            message.cluster_level = static_cast<int32_t>(value);
        }
        if (const BencodeValue* record = dict.find(FIELD_RECORD)) {
            Record rec;
            rec.key = (*record)[FIELD_RECORD_KEY].as_string();
            rec.value = (*record)[FIELD_RECORD_VALUE].as_string();
            if (const BencodeValue* received = record->find(FIELD_RECORD_TIME)) {
                rec.time_received = received->as_string();
            }
            message.record = rec;
        }
        if (const BencodeValue* closer = dict.find(FIELD_CLOSER_PEERS)) {
            message.closer_peers = decode_peers(*closer);
        }
        if (const BencodeValue* providers = dict.find(FIELD_PROVIDER_PEERS)) {
            message.provider_peers = decode_peers(*providers);
        }
        return message;
    } catch (const BencodeError& e) {
        LOG_CODEC_DEBUG("Failed to decode message: " << e.what());
        return std::nullopt;
    }
}

} // namespace kaddht
