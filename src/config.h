#pragma once

#include "kaddht_export.h"
#include "types.h"
#include "logger.h"
#include "record.h"
#include "peerstore.h"
#include "provider_store.h"
#include <nlohmann/json.hpp>
#include <string>
#include <chrono>

namespace kaddht {

// Longest duration a config file may set. Leaves room to add it to a
// nanosecond clock reading without overflow.
constexpr std::chrono::seconds MAX_CONFIG_DURATION = std::chrono::hours(24 * 365 * 100);

static_assert(MAX_CONFIG_DURATION <
                  std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()) / 2,
              "MAX_CONFIG_DURATION must fit the system clock");
static_assert(MAX_CONFIG_DURATION <
                  std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max()) / 2,
              "MAX_CONFIG_DURATION must fit the steady clock");

/**
 * Responder configuration
 */
struct DhtConfig {
    size_t closer_peer_count;                             // Closer peers returned per response
    std::chrono::seconds max_record_age;                  // Stored records older than this are dropped on read
    std::chrono::seconds provider_addr_ttl;               // Peerstore lifetime of provider addresses
    std::chrono::seconds provider_validity;               // Lifetime of a provider announcement
    std::chrono::seconds provider_cleanup_interval;       // Period of the provider cleanup thread
    LogLevel log_level;
    bool log_colors;
    bool log_timestamps;

    DhtConfig()
        : closer_peer_count(K_VALUE),
          max_record_age(MAX_RECORD_AGE),
          provider_addr_ttl(PROVIDER_ADDR_TTL),
          provider_validity(PROVIDE_VALIDITY),
          provider_cleanup_interval(PROVIDER_CLEANUP_INTERVAL),
          log_level(LogLevel::INFO),
          log_colors(true),
          log_timestamps(true) {}
};

/**
 * Build a config from JSON. Missing keys keep their defaults; invalid values
 * (non-positive counts, durations outside 1s..MAX_CONFIG_DURATION, unknown
 * log levels) are replaced by the default and reported with a warning.
 */
KADDHT_API DhtConfig dht_config_from_json(const nlohmann::json& json);

KADDHT_API nlohmann::json dht_config_to_json(const DhtConfig& config);

/**
 * Load configuration from a JSON file. A missing file is created with the
 * defaults.
 * @return false if the file could not be read, parsed or created
 */
KADDHT_API bool load_dht_config(const std::string& path, DhtConfig& config);

KADDHT_API bool save_dht_config(const std::string& path, const DhtConfig& config);

/**
 * Push the logging settings into the process-wide Logger
 */
KADDHT_API void apply_logging_config(const DhtConfig& config);

} // namespace kaddht
