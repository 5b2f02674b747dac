#pragma once

#include "kaddht_export.h"
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace kaddht {

// Kademlia replication parameter; also the default number of closer peers per response
constexpr size_t K_VALUE = 20;

/**
 * Peer identifier. Opaque bytes (a multihash of the peer's public key on the wire).
 */
using PeerId = std::string;

/**
 * Network address of a peer, kept as the bytes received on the wire
 */
using Multiaddr = std::string;

/**
 * Peer identifier together with its known addresses
 */
struct PeerInfo {
    PeerId id;
    std::vector<Multiaddr> addrs;

    PeerInfo() = default;
    PeerInfo(const PeerId& peer_id, const std::vector<Multiaddr>& addresses)
        : id(peer_id), addrs(addresses) {}

    bool operator==(const PeerInfo& other) const {
        return id == other.id && addrs == other.addrs;
    }
};

/**
 * Live connectivity towards a peer, as reported by the network layer.
 * Values match the connection type carried in wire peer descriptors.
 */
enum class Connectedness : uint8_t {
    NotConnected = 0,
    Connected = 1,
    CanConnect = 2,
    CannotConnect = 3
};

KADDHT_API const char* connectedness_to_string(Connectedness c);

/**
 * Hex representation of arbitrary bytes (for logging)
 */
KADDHT_API std::string to_hex(const std::string& bytes);

/**
 * Short hex prefix of a peer id, used in log lines
 */
KADDHT_API std::string short_peer_id(const PeerId& id);

} // namespace kaddht
