#include "dht_responder.h"
#include "dht_responder_log.h"
#include "content_id.h"

namespace kaddht {

HandlerResult DhtResponder::handle_get_providers(const RequestContext& ctx, const PeerId& from, const Message& request) {
    std::optional<ContentId> cid = ContentId::parse(request.key);
    if (!cid) {
        return HandlerResult::Error(HandlerError::MalformedRequest, "invalid content id in GET_PROVIDERS key");
    }

    LOG_HANDLER_DEBUG("handleGetProviders for " << cid->to_hex() << " from " << short_peer_id(from));

    Message response = make_response(request.type, request.key, request.cluster_level);

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    // Only a confirmed hit counts; store errors read as "not here"
    DatastoreStatus status = deps_.datastore.has(datastore_key_for(cid->bytes()));
    bool has_locally = status == DatastoreStatus::Ok;
    if (status == DatastoreStatus::Error) {
        LOG_HANDLER_DEBUG("Local presence check failed for " << cid->to_hex() << ", assuming absent");
    }

    std::vector<PeerId> providers = deps_.providers.get_providers(ctx, *cid);
    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    if (has_locally) {
        providers.push_back(self_);
    }

    if (!providers.empty()) {
        response.provider_peers = to_message_peers(deps_.peerstore.peer_infos(providers));
    }

    std::vector<PeerId> closer = better_peers_to_query(request, from, config_.closer_peer_count);
    if (!closer.empty()) {
        response.closer_peers = to_message_peers(deps_.peerstore.peer_infos(closer));
    }

    return HandlerResult::Respond(std::move(response));
}

HandlerResult DhtResponder::handle_add_provider(const RequestContext& ctx, const PeerId& from, const Message& request) {
    std::optional<ContentId> cid = ContentId::parse(request.key);
    if (!cid) {
        return HandlerResult::Error(HandlerError::MalformedRequest, "invalid content id in ADD_PROVIDER key");
    }

    LOG_HANDLER_DEBUG("adding provider " << short_peer_id(from) << " for " << cid->to_hex());

    for (const auto& provider : request.provider_peers) {
        if (provider.id != from) {
            // Peers may only announce themselves
            LOG_HANDLER_DEBUG("handleAddProvider received provider " << short_peer_id(provider.id)
                              << " from " << short_peer_id(from) << ". Ignore.");
            continue;
        }

        if (provider.addrs.empty()) {
            LOG_HANDLER_DEBUG("no valid addresses for provider " << short_peer_id(from));
            continue;
        }

        if (ctx.is_done()) {
            return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
        }

        if (provider.id != self_) {
            deps_.peerstore.add_addrs(provider.id, provider.addrs,
                                      std::chrono::duration_cast<std::chrono::steady_clock::duration>(config_.provider_addr_ttl));
        }
        deps_.providers.add_provider(ctx, *cid, from);
    }

    return HandlerResult::NoResponse();
}

} // namespace kaddht
