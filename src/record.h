#pragma once

#include "kaddht_export.h"
#include <string>
#include <optional>
#include <chrono>

namespace kaddht {

// Records older than this (by local receipt time) are treated as absent
constexpr std::chrono::hours MAX_RECORD_AGE(36);

/**
 * A value stored in the DHT.
 *
 * time_received is asserted by the storing node only. It is an RFC 3339 UTC
 * timestamp and is cleared from every record that arrives over the wire.
 */
struct Record {
    std::string key;
    std::string value;
    std::string time_received;

    Record() = default;
    Record(const std::string& k, const std::string& v) : key(k), value(v) {}

    bool operator==(const Record& other) const {
        return key == other.key && value == other.value && time_received == other.time_received;
    }
};

/**
 * Serialize a record into the blob kept in the datastore
 */
KADDHT_API std::string encode_record(const Record& record);

/**
 * Parse a datastore blob
 * @return Record, or nullopt if the blob is not a well-formed record
 */
KADDHT_API std::optional<Record> decode_record(const std::string& data);

/**
 * Drop fields a peer is not allowed to set
 */
KADDHT_API void clean_record(Record& record);

/**
 * Format a time point as RFC 3339 in UTC with up to nanosecond precision
 * (trailing zeros of the fraction are trimmed)
 */
KADDHT_API std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/**
 * Parse an RFC 3339 timestamp ("Z" or numeric offset, optional fraction)
 */
KADDHT_API std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);

/**
 * A record is stale when it carries no parseable receipt time or when it was
 * received more than max_age before now.
 */
KADDHT_API bool is_record_stale(const Record& record,
                                std::chrono::system_clock::time_point now,
                                std::chrono::system_clock::duration max_age);

/**
 * Datastore key for a DHT key: "/" followed by the unpadded base32 encoding,
 * so that arbitrary key bytes are usable as store keys.
 */
KADDHT_API std::string datastore_key_for(const std::string& dht_key);

/**
 * Reverse of datastore_key_for
 */
KADDHT_API std::optional<std::string> dht_key_from_datastore_key(const std::string& ds_key);

} // namespace kaddht
