#pragma once

#include "kaddht_export.h"
#include <array>
#include <mutex>
#include <string>
#include <cstdint>

namespace kaddht {

/**
 * Fixed set of mutexes shared by all writers, one per possible value of a key's
 * last byte. Two different keys may land on the same stripe; writers then wait
 * on each other even though their keys differ.
 */
class KADDHT_API StripedLockSet {
public:
    static constexpr size_t STRIPE_COUNT = 256;

    StripedLockSet() = default;

    StripedLockSet(const StripedLockSet&) = delete;
    StripedLockSet& operator=(const StripedLockSet&) = delete;

    /**
     * Stripe for a key: its trailing byte, or 0 for the empty key
     */
    static uint8_t stripe_index(const std::string& key) {
        if (key.empty()) {
            return 0;
        }
        return static_cast<uint8_t>(key.back());
    }

    std::mutex& lock_for(const std::string& key) {
        return stripes_[stripe_index(key)];
    }

    std::mutex& stripe(uint8_t index) {
        return stripes_[index];
    }

private:
    std::array<std::mutex, STRIPE_COUNT> stripes_;
};

} // namespace kaddht
