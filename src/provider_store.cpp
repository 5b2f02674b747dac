#include "provider_store.h"
#include "logger.h"
#include <algorithm>

#define LOG_PROVIDERS_DEBUG(message) LOG_DEBUG("providers", message)
#define LOG_PROVIDERS_INFO(message)  LOG_INFO("providers", message)

namespace kaddht {

ProviderStore::ProviderStore(std::chrono::steady_clock::duration validity,
                             std::chrono::steady_clock::duration cleanup_interval)
    : validity_(validity), cleanup_interval_(cleanup_interval), running_(false) {}

ProviderStore::~ProviderStore() {
    stop();
}

std::vector<PeerId> ProviderStore::get_providers(const RequestContext& ctx, const ContentId& cid) {
    std::vector<PeerId> result;
    if (ctx.is_done()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(providers_mutex_);
    auto it = providers_.find(cid.bytes());
    if (it == providers_.end()) {
        LOG_PROVIDERS_DEBUG("No providers known for " << cid.to_hex());
        return result;
    }

    auto now = std::chrono::steady_clock::now();
    result.reserve(it->second.size());
    for (const auto& entry : it->second) {
        if (now - entry.announced_at <= validity_) {
            result.push_back(entry.peer);
        }
    }

    LOG_PROVIDERS_DEBUG("Retrieved " << result.size() << " providers for " << cid.to_hex());
    return result;
}

void ProviderStore::add_provider(const RequestContext& ctx, const ContentId& cid, const PeerId& provider) {
    if (ctx.is_done()) {
        return;
    }

    std::lock_guard<std::mutex> lock(providers_mutex_);
    auto& entries = providers_[cid.bytes()];
    auto now = std::chrono::steady_clock::now();

    auto it = std::find_if(entries.begin(), entries.end(),
                           [&provider](const ProviderEntry& entry) {
                               return entry.peer == provider;
                           });

    if (it != entries.end()) {
        it->announced_at = now;
        LOG_PROVIDERS_DEBUG("Refreshed provider " << short_peer_id(provider) << " for " << cid.to_hex());
    } else {
        entries.emplace_back(provider, now);
        LOG_PROVIDERS_DEBUG("Stored new provider " << short_peer_id(provider) << " for " << cid.to_hex()
                            << " (total: " << entries.size() << ")");
    }
}

size_t ProviderStore::cleanup_expired() {
    std::lock_guard<std::mutex> lock(providers_mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    for (auto it = providers_.begin(); it != providers_.end(); ) {
        auto& entries = it->second;
        size_t before = entries.size();

        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [this, now](const ProviderEntry& entry) {
                                         return now - entry.announced_at > validity_;
                                     }), entries.end());

        removed += before - entries.size();

        if (entries.empty()) {
            it = providers_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_PROVIDERS_DEBUG("Cleaned up " << removed << " expired provider records");
    }
    return removed;
}

void ProviderStore::start() {
    if (running_.exchange(true)) {
        return;
    }
    LOG_PROVIDERS_INFO("Starting provider cleanup thread");
    cleanup_thread_ = std::thread(&ProviderStore::cleanup_loop, this);
}

void ProviderStore::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
    }
    shutdown_cv_.notify_all();

    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
    LOG_PROVIDERS_INFO("Provider cleanup thread stopped");
}

void ProviderStore::cleanup_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(shutdown_mutex_);
            shutdown_cv_.wait_for(lock, cleanup_interval_, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        cleanup_expired();
    }
}

size_t ProviderStore::content_count() const {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    return providers_.size();
}

size_t ProviderStore::provider_count() const {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    size_t total = 0;
    for (const auto& pair : providers_) {
        total += pair.second.size();
    }
    return total;
}

} // namespace kaddht
