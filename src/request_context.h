#pragma once

#include "kaddht_export.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace kaddht {

/**
 * Cancellation scope of a single inbound request.
 *
 * Copies share the cancellation flag; with_timeout() derives a context that
 * also expires at a deadline. Handlers check is_done() around every
 * collaborator call and stop without persisting anything once it is set.
 */
class KADDHT_API RequestContext {
public:
    RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * Context that is done once the parent is cancelled or the timeout elapses
     */
    RequestContext with_timeout(std::chrono::steady_clock::duration timeout) const {
        RequestContext child(*this);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!child.deadline_ || deadline < *child.deadline_) {
            child.deadline_ = deadline;
        }
        return child;
    }

    void cancel() { cancelled_->store(true); }

    bool is_cancelled() const { return cancelled_->load(); }

    bool is_expired() const {
        return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
    }

    bool is_done() const { return is_cancelled() || is_expired(); }

    const std::optional<std::chrono::steady_clock::time_point>& deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace kaddht
