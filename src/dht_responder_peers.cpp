#include "dht_responder.h"
#include "dht_responder_log.h"
#include <algorithm>

namespace kaddht {

HandlerResult DhtResponder::handle_find_node(const RequestContext& ctx, const PeerId& from, const Message& request) {
    Message response = make_response(request.type, std::string(), request.cluster_level);

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    std::vector<PeerId> closest;
    const PeerId& target = request.key;

    if (target == self_) {
        closest.push_back(self_);
    } else {
        closest = better_peers_to_query(request, from, config_.closer_peer_count);

        // A connected target is worth returning even before it enters the routing table
        if (target != from && !target.empty()) {
            Connectedness state = deps_.connectivity.connectedness(target);
            if ((state == Connectedness::Connected || state == Connectedness::CanConnect) &&
                std::find(closest.begin(), closest.end(), target) == closest.end()) {
                closest.push_back(target);
            }
        }
    }

    if (closest.empty()) {
        LOG_HANDLER_INFO("handleFindPeer: could not find anything for " << short_peer_id(from));
        return HandlerResult::Respond(std::move(response));
    }

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    std::vector<PeerInfo> infos = deps_.peerstore.peer_infos(closest);
    std::vector<PeerInfo> with_addrs;
    with_addrs.reserve(infos.size());
    for (auto& info : infos) {
        if (info.addrs.empty()) {
            continue;
        }
        with_addrs.push_back(std::move(info));
    }

    response.closer_peers = to_message_peers(with_addrs);
    LOG_HANDLER_DEBUG("handleFindPeer: returning " << response.closer_peers.size()
                      << " peers to " << short_peer_id(from));
    return HandlerResult::Respond(std::move(response));
}

} // namespace kaddht
