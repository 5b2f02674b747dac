#include "routing_table.h"
#include "logger.h"
#include <algorithm>

#define LOG_ROUTING_DEBUG(message) LOG_DEBUG("routing", message)

namespace kaddht {

KeyspaceId keyspace_id_for(const std::string& key) {
    return Sha1::hash(key);
}

KeyspaceId xor_distance(const KeyspaceId& a, const KeyspaceId& b) {
    KeyspaceId result;
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = a[i] ^ b[i];
    }
    return result;
}

bool is_closer(const KeyspaceId& a, const KeyspaceId& b, const KeyspaceId& target) {
    KeyspaceId dist_a = xor_distance(a, target);
    KeyspaceId dist_b = xor_distance(b, target);
    return std::lexicographical_compare(dist_a.begin(), dist_a.end(),
                                        dist_b.begin(), dist_b.end());
}

KBucketTable::KBucketTable(const PeerId& self, size_t bucket_size)
    : self_(self), self_kad_id_(keyspace_id_for(self)), bucket_size_(bucket_size) {
    buckets_.resize(KEYSPACE_BITS);
}

// Index of the first differing bit between self and id (common prefix length)
size_t KBucketTable::get_bucket_index(const KeyspaceId& id) const {
    KeyspaceId distance = xor_distance(self_kad_id_, id);

    for (size_t i = 0; i < distance.size(); ++i) {
        if (distance[i] != 0) {
            for (int j = 7; j >= 0; --j) {
                if (distance[i] & (1 << j)) {
                    return i * 8 + static_cast<size_t>(7 - j);
                }
            }
        }
    }
    return KEYSPACE_BITS - 1;
}

bool KBucketTable::add_peer(const PeerId& peer) {
    if (peer == self_) {
        return false;
    }

    KeyspaceId kad_id = keyspace_id_for(peer);

    std::lock_guard<std::mutex> lock(buckets_mutex_);
    size_t bucket_index = get_bucket_index(kad_id);
    auto& bucket = buckets_[bucket_index];

    auto it = std::find_if(bucket.begin(), bucket.end(),
                           [&peer](const BucketEntry& existing) { return existing.id == peer; });
    if (it != bucket.end()) {
        it->last_seen = std::chrono::steady_clock::now();
        return true;
    }

    if (bucket.size() >= bucket_size_) {
        LOG_ROUTING_DEBUG("Bucket " << bucket_index << " is full, not adding " << short_peer_id(peer));
        return false;
    }

    bucket.push_back(BucketEntry{peer, kad_id, std::chrono::steady_clock::now()});
    LOG_ROUTING_DEBUG("Added peer " << short_peer_id(peer) << " to bucket " << bucket_index
                      << " (size: " << bucket.size() << "/" << bucket_size_ << ")");
    return true;
}

bool KBucketTable::remove_peer(const PeerId& peer) {
    KeyspaceId kad_id = keyspace_id_for(peer);

    std::lock_guard<std::mutex> lock(buckets_mutex_);
    auto& bucket = buckets_[get_bucket_index(kad_id)];
    auto it = std::find_if(bucket.begin(), bucket.end(),
                           [&peer](const BucketEntry& existing) { return existing.id == peer; });
    if (it == bucket.end()) {
        return false;
    }
    bucket.erase(it);
    return true;
}

bool KBucketTable::contains(const PeerId& peer) const {
    KeyspaceId kad_id = keyspace_id_for(peer);

    std::lock_guard<std::mutex> lock(buckets_mutex_);
    const auto& bucket = buckets_[get_bucket_index(kad_id)];
    return std::any_of(bucket.begin(), bucket.end(),
                       [&peer](const BucketEntry& existing) { return existing.id == peer; });
}

size_t KBucketTable::size() const {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    size_t total = 0;
    for (const auto& bucket : buckets_) {
        total += bucket.size();
    }
    return total;
}

// Caller holds buckets_mutex_
// Buckets above the target's bucket are all closer to the target than any
// bucket below it, so only the lower ones can be cut off early.
std::vector<KBucketTable::BucketEntry> KBucketTable::collect_candidates(const KeyspaceId& target, size_t count) const {
    std::vector<BucketEntry> candidates;
    size_t target_bucket = get_bucket_index(target);

    for (size_t i = target_bucket; i < buckets_.size(); ++i) {
        candidates.insert(candidates.end(), buckets_[i].begin(), buckets_[i].end());
    }

    for (size_t i = target_bucket; i > 0 && candidates.size() < count; --i) {
        const auto& bucket = buckets_[i - 1];
        candidates.insert(candidates.end(), bucket.begin(), bucket.end());
    }
    return candidates;
}

std::vector<PeerId> KBucketTable::nearest_peers(const std::string& target_key, size_t count) const {
    std::vector<PeerId> result;
    if (count == 0) {
        return result;
    }

    KeyspaceId target = keyspace_id_for(target_key);

    std::vector<BucketEntry> candidates;
    {
        std::lock_guard<std::mutex> lock(buckets_mutex_);
        candidates = collect_candidates(target, count);
    }

    size_t sort_count = (std::min)(count, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + sort_count, candidates.end(),
                      [&target](const BucketEntry& a, const BucketEntry& b) {
                          return is_closer(a.kad_id, b.kad_id, target);
                      });

    result.reserve(sort_count);
    for (size_t i = 0; i < sort_count; ++i) {
        result.push_back(candidates[i].id);
    }

    LOG_ROUTING_DEBUG("Found " << result.size() << " nearest peers to key " << to_hex(target_key));
    return result;
}

std::vector<PeerId> KBucketTable::closer_peers(const std::string& target_key, const PeerId& exclude, size_t count) {
    // Ask for one extra so dropping the excluded peer still leaves count entries
    std::vector<PeerId> nearest = nearest_peers(target_key, count + 1);
    nearest.erase(std::remove(nearest.begin(), nearest.end(), exclude), nearest.end());
    if (nearest.size() > count) {
        nearest.resize(count);
    }
    return nearest;
}

} // namespace kaddht
