#pragma once

#include "kaddht_export.h"
#include "types.h"
#include <unordered_map>
#include <mutex>

namespace kaddht {

/**
 * Answers whether this node currently has (or can open) a connection to a peer
 */
class KADDHT_API ConnectivityOracle {
public:
    virtual ~ConnectivityOracle() = default;

    virtual Connectedness connectedness(const PeerId& peer) = 0;
};

/**
 * Connectivity state fed by the network layer. Unknown peers are NotConnected.
 */
class KADDHT_API ConnectionTracker : public ConnectivityOracle {
public:
    Connectedness connectedness(const PeerId& peer) override;

    void set_connectedness(const PeerId& peer, Connectedness state);
    void forget(const PeerId& peer);

private:
    std::unordered_map<PeerId, Connectedness> states_;
    std::mutex states_mutex_;
};

} // namespace kaddht
