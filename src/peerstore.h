#pragma once

#include "kaddht_export.h"
#include "types.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <chrono>

namespace kaddht {

// Lifetime of addresses learnt from provider announcements
constexpr std::chrono::minutes PROVIDER_ADDR_TTL(30);

// Addresses added with this TTL never expire
constexpr std::chrono::steady_clock::duration PERMANENT_ADDR_TTL = std::chrono::steady_clock::duration::max();

/**
 * Peer id -> known addresses
 */
class KADDHT_API AddressBook {
public:
    virtual ~AddressBook() = default;

    /**
     * Resolve a peer; unknown peers resolve to an entry without addresses
     */
    virtual PeerInfo peer_info(const PeerId& id) = 0;

    virtual std::vector<PeerInfo> peer_infos(const std::vector<PeerId>& ids);

    virtual void add_addrs(const PeerId& id, const std::vector<Multiaddr>& addrs,
                           std::chrono::steady_clock::duration ttl) = 0;
};

/**
 * Thread-safe in-memory address book with per-address expiry
 */
class KADDHT_API MemoryPeerstore : public AddressBook {
public:
    MemoryPeerstore() = default;

    PeerInfo peer_info(const PeerId& id) override;

    /**
     * Adding a known address again only ever extends its expiry
     */
    void add_addrs(const PeerId& id, const std::vector<Multiaddr>& addrs,
                   std::chrono::steady_clock::duration ttl) override;

    void clear_addrs(const PeerId& id);

    /**
     * Drop expired addresses and peers left without any
     * @return Number of addresses removed
     */
    size_t cleanup_expired();

    size_t peer_count() const;

private:
    struct AddressEntry {
        Multiaddr addr;
        std::chrono::steady_clock::time_point expires_at;
    };

    static std::chrono::steady_clock::time_point expiry_for(std::chrono::steady_clock::duration ttl);

    std::unordered_map<PeerId, std::vector<AddressEntry>> peers_;
    mutable std::mutex peers_mutex_;
};

} // namespace kaddht
