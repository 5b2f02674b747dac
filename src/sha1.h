#pragma once

#include "kaddht_export.h"
#include <array>
#include <string>
#include <cstdint>
#include <cstddef>

namespace kaddht {

constexpr size_t SHA1_DIGEST_SIZE = 20;

using Sha1Digest = std::array<uint8_t, SHA1_DIGEST_SIZE>;

/**
 * Incremental SHA-1. Used to map peer ids and keys into the routing keyspace.
 */
class KADDHT_API Sha1 {
public:
    Sha1();

    void update(const uint8_t* data, size_t length);
    void update(const std::string& data);

    /**
     * Finish hashing. Further updates are ignored; calling again returns the same digest.
     */
    Sha1Digest digest();

    static Sha1Digest hash(const std::string& input);

private:
    void process_block();

    uint32_t state_[5];
    uint8_t buffer_[64];
    size_t buffer_length_;
    uint64_t total_length_;
    bool finalized_;
    Sha1Digest result_;
};

} // namespace kaddht
