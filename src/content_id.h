#pragma once

#include "kaddht_export.h"
#include <string>
#include <optional>
#include <cstdint>

namespace kaddht {

/**
 * Content identifier (CID) as used for provider records.
 *
 * Accepts CIDv0 (a bare 34-byte sha2-256 multihash) and CIDv1
 * (<version=1><codec><multihash>, all integers as unsigned varints).
 */
class KADDHT_API ContentId {
public:
    static constexpr uint64_t CODEC_DAG_PB = 0x70;
    static constexpr uint64_t MULTIHASH_SHA2_256 = 0x12;

    /**
     * Parse binary CID bytes. The whole input must be consumed.
     */
    static std::optional<ContentId> parse(const std::string& bytes);

    uint64_t version() const { return version_; }
    uint64_t codec() const { return codec_; }
    uint64_t hash_code() const { return hash_code_; }
    const std::string& digest() const { return digest_; }

    // Binary form, identical to the bytes it was parsed from
    const std::string& bytes() const { return bytes_; }

    std::string to_hex() const;

    bool operator==(const ContentId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ContentId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ContentId& other) const { return bytes_ < other.bytes_; }

private:
    ContentId() : version_(0), codec_(0), hash_code_(0) {}

    uint64_t version_;
    uint64_t codec_;
    uint64_t hash_code_;
    std::string digest_;
    std::string bytes_;
};

/**
 * Read an unsigned LEB128 varint (at most 9 bytes, minimal encoding)
 * @param data Input bytes
 * @param pos In: start offset, out: offset past the varint
 * @param value Receives the decoded value
 * @return false on truncated, overlong or non-minimal input
 */
KADDHT_API bool read_uvarint(const std::string& data, size_t& pos, uint64_t& value);

KADDHT_API void append_uvarint(std::string& out, uint64_t value);

} // namespace kaddht
