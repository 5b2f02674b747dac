#pragma once

#include "kaddht_export.h"
#include "types.h"
#include "content_id.h"
#include "request_context.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>

namespace kaddht {

// How long a provider announcement stays valid
constexpr std::chrono::hours PROVIDE_VALIDITY(24);

// Period of the background cleanup thread
constexpr std::chrono::hours PROVIDER_CLEANUP_INTERVAL(1);

/**
 * Content id -> providing peers, with expiry owned by the implementation
 */
class KADDHT_API ProviderIndex {
public:
    virtual ~ProviderIndex() = default;

    /**
     * Current providers of a content id, in announcement order
     */
    virtual std::vector<PeerId> get_providers(const RequestContext& ctx, const ContentId& cid) = 0;

    virtual void add_provider(const RequestContext& ctx, const ContentId& cid, const PeerId& provider) = 0;
};

/**
 * In-memory provider index.
 *
 * Re-announcing refreshes an entry without moving it. Expired entries are
 * never returned and are dropped by cleanup_expired(), which the optional
 * background thread runs periodically.
 */
class KADDHT_API ProviderStore : public ProviderIndex {
public:
    explicit ProviderStore(std::chrono::steady_clock::duration validity = PROVIDE_VALIDITY,
                           std::chrono::steady_clock::duration cleanup_interval = PROVIDER_CLEANUP_INTERVAL);
    ~ProviderStore() override;

    ProviderStore(const ProviderStore&) = delete;
    ProviderStore& operator=(const ProviderStore&) = delete;

    std::vector<PeerId> get_providers(const RequestContext& ctx, const ContentId& cid) override;
    void add_provider(const RequestContext& ctx, const ContentId& cid, const PeerId& provider) override;

    /**
     * Drop expired provider entries
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    /**
     * Start / stop the periodic cleanup thread
     */
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    size_t content_count() const;
    size_t provider_count() const;

private:
    struct ProviderEntry {
        PeerId peer;
        std::chrono::steady_clock::time_point announced_at;

        ProviderEntry(const PeerId& p, std::chrono::steady_clock::time_point at)
            : peer(p), announced_at(at) {}
    };

    void cleanup_loop();

    std::chrono::steady_clock::duration validity_;
    std::chrono::steady_clock::duration cleanup_interval_;

    // Keyed by the binary CID
    std::map<std::string, std::vector<ProviderEntry>> providers_;
    mutable std::mutex providers_mutex_;

    std::atomic<bool> running_;
    std::thread cleanup_thread_;
    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;
};

} // namespace kaddht
