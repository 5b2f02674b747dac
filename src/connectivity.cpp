#include "connectivity.h"

namespace kaddht {

Connectedness ConnectionTracker::connectedness(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(peer);
    return it == states_.end() ? Connectedness::NotConnected : it->second;
}

void ConnectionTracker::set_connectedness(const PeerId& peer, Connectedness state) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    if (state == Connectedness::NotConnected) {
        states_.erase(peer);
    } else {
        states_[peer] = state;
    }
}

void ConnectionTracker::forget(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    states_.erase(peer);
}

} // namespace kaddht
