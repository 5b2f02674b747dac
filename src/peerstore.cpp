#include "peerstore.h"
#include "logger.h"
#include <algorithm>

#define LOG_PEERSTORE_DEBUG(message) LOG_DEBUG("peerstore", message)

namespace kaddht {

std::vector<PeerInfo> AddressBook::peer_infos(const std::vector<PeerId>& ids) {
    std::vector<PeerInfo> infos;
    infos.reserve(ids.size());
    for (const auto& id : ids) {
        infos.push_back(peer_info(id));
    }
    return infos;
}

std::chrono::steady_clock::time_point MemoryPeerstore::expiry_for(std::chrono::steady_clock::duration ttl) {
    auto now = std::chrono::steady_clock::now();
    if (ttl >= std::chrono::steady_clock::time_point::max() - now) {
        return std::chrono::steady_clock::time_point::max();
    }
    return now + ttl;
}

PeerInfo MemoryPeerstore::peer_info(const PeerId& id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    PeerInfo info;
    info.id = id;

    auto it = peers_.find(id);
    if (it == peers_.end()) {
        return info;
    }

    auto now = std::chrono::steady_clock::now();
    for (const auto& entry : it->second) {
        if (entry.expires_at > now) {
            info.addrs.push_back(entry.addr);
        }
    }
    return info;
}

void MemoryPeerstore::add_addrs(const PeerId& id, const std::vector<Multiaddr>& addrs,
                                std::chrono::steady_clock::duration ttl) {
    if (addrs.empty() || ttl <= std::chrono::steady_clock::duration::zero()) {
        return;
    }

    auto expires_at = expiry_for(ttl);

    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto& entries = peers_[id];
    for (const auto& addr : addrs) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&addr](const AddressEntry& entry) { return entry.addr == addr; });
        if (it != entries.end()) {
            it->expires_at = (std::max)(it->expires_at, expires_at);
        } else {
            entries.push_back(AddressEntry{addr, expires_at});
        }
    }

    LOG_PEERSTORE_DEBUG("Peer " << short_peer_id(id) << " now has " << entries.size() << " addresses");
}

void MemoryPeerstore::clear_addrs(const PeerId& id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_.erase(id);
}

size_t MemoryPeerstore::cleanup_expired() {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    for (auto it = peers_.begin(); it != peers_.end(); ) {
        auto& entries = it->second;
        size_t before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [now](const AddressEntry& entry) { return entry.expires_at <= now; }),
                      entries.end());
        removed += before - entries.size();

        if (entries.empty()) {
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_PEERSTORE_DEBUG("Expired " << removed << " peer addresses");
    }
    return removed;
}

size_t MemoryPeerstore::peer_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.size();
}

} // namespace kaddht
