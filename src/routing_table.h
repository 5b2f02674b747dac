#pragma once

#include "kaddht_export.h"
#include "types.h"
#include "sha1.h"
#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace kaddht {

constexpr size_t KEYSPACE_BITS = SHA1_DIGEST_SIZE * 8;
constexpr size_t K_BUCKET_SIZE = K_VALUE;

// Position in the routing keyspace (SHA-1 of a peer id or key)
using KeyspaceId = Sha1Digest;

KADDHT_API KeyspaceId keyspace_id_for(const std::string& key);
KADDHT_API KeyspaceId xor_distance(const KeyspaceId& a, const KeyspaceId& b);

/**
 * true if a is strictly closer to target than b
 */
KADDHT_API bool is_closer(const KeyspaceId& a, const KeyspaceId& b, const KeyspaceId& target);

/**
 * Source of "closer peers" for responses
 */
class KADDHT_API RoutingTable {
public:
    virtual ~RoutingTable() = default;

    /**
     * Up to count known peers nearest to target_key, never including exclude
     */
    virtual std::vector<PeerId> closer_peers(const std::string& target_key, const PeerId& exclude, size_t count) = 0;
};

/**
 * Kademlia k-bucket table around a local peer id.
 * A full bucket keeps its current members and rejects newcomers.
 */
class KADDHT_API KBucketTable : public RoutingTable {
public:
    explicit KBucketTable(const PeerId& self, size_t bucket_size = K_BUCKET_SIZE);

    /**
     * @return true if the peer is (now) in the table
     */
    bool add_peer(const PeerId& peer);
    bool remove_peer(const PeerId& peer);
    bool contains(const PeerId& peer) const;
    size_t size() const;

    std::vector<PeerId> nearest_peers(const std::string& target_key, size_t count) const;

    std::vector<PeerId> closer_peers(const std::string& target_key, const PeerId& exclude, size_t count) override;

private:
    struct BucketEntry {
        PeerId id;
        KeyspaceId kad_id;
        std::chrono::steady_clock::time_point last_seen;
    };

    size_t get_bucket_index(const KeyspaceId& id) const;
    std::vector<BucketEntry> collect_candidates(const KeyspaceId& target, size_t count) const;

    PeerId self_;
    KeyspaceId self_kad_id_;
    size_t bucket_size_;
    std::vector<std::vector<BucketEntry>> buckets_;
    mutable std::mutex buckets_mutex_;
};

} // namespace kaddht
