#include "dht_responder.h"
#include "dht_responder_log.h"

namespace kaddht {

const char* handler_error_to_string(HandlerError error) {
    switch (error) {
        case HandlerError::None:             return "none";
        case HandlerError::MalformedRequest: return "malformed request";
        case HandlerError::InvalidRecord:    return "invalid record";
        case HandlerError::OldRecord:        return "old record";
        case HandlerError::SelectFailed:     return "select failed";
        case HandlerError::StoreFailure:     return "store failure";
        case HandlerError::Cancelled:        return "cancelled";
        case HandlerError::UnsupportedType:  return "unsupported message type";
    }
    return "unknown";
}

DhtResponder::DhtResponder(const PeerId& self, const DhtResponderDeps& deps, const DhtConfig& config)
    : self_(self), deps_(deps), config_(config),
      clock_([] { return std::chrono::system_clock::now(); }),
      unsupported_requests_(0), stale_records_evicted_(0), puts_rejected_(0) {
    for (size_t i = 0; i < MESSAGE_TYPE_COUNT; ++i) {
        requests_received_[i].store(0);
        requests_failed_[i].store(0);
    }

    LOG_HANDLER_INFO("DHT responder created for peer " << short_peer_id(self_)
                     << " (closer peers: " << config_.closer_peer_count
                     << ", max record age: " << config_.max_record_age.count() << "s)");
}

DhtResponder::Handler DhtResponder::handler_for(MessageType type) {
    switch (type) {
        case MessageType::GetValue:     return &DhtResponder::handle_get_value;
        case MessageType::PutValue:     return &DhtResponder::handle_put_value;
        case MessageType::FindNode:     return &DhtResponder::handle_find_node;
        case MessageType::AddProvider:  return &DhtResponder::handle_add_provider;
        case MessageType::GetProviders: return &DhtResponder::handle_get_providers;
        case MessageType::Ping:         return &DhtResponder::handle_ping;
        case MessageType::Unsupported:  return nullptr;
    }
    return nullptr;
}

HandlerResult DhtResponder::handle_message(const RequestContext& ctx, const PeerId& from, const Message& request) {
    Handler handler = handler_for(request.type);
    if (!handler) {
        unsupported_requests_.fetch_add(1);
        LOG_HANDLER_WARN("Unsupported message type from " << short_peer_id(from));
        return HandlerResult::Error(HandlerError::UnsupportedType, "unsupported message type");
    }

    size_t index = type_index(request.type);
    requests_received_[index].fetch_add(1);

    HandlerResult result = (this->*handler)(ctx, from, request);
    if (!result.success) {
        requests_failed_[index].fetch_add(1);
        LOG_HANDLER_DEBUG(message_type_to_string(request.type) << " from " << short_peer_id(from)
                          << " failed: " << handler_error_to_string(result.error)
                          << " (" << result.error_message << ")");
    }
    return result;
}

HandlerResult DhtResponder::handle_ping(const RequestContext& ctx, const PeerId& from, const Message& request) {
    (void)ctx;
    LOG_HANDLER_DEBUG(short_peer_id(self_) << " responding to ping from " << short_peer_id(from));
    return HandlerResult::Respond(request);
}

std::vector<PeerId> DhtResponder::better_peers_to_query(const Message& request, const PeerId& from, size_t count) {
    std::vector<PeerId> closer = deps_.routing_table.closer_peers(request.key, from, count);
    if (closer.empty()) {
        LOG_HANDLER_DEBUG("No closer peers to send to " << short_peer_id(from));
        return closer;
    }

    std::vector<PeerId> filtered;
    filtered.reserve(closer.size());
    for (const auto& peer : closer) {
        if (peer == self_) {
            LOG_HANDLER_ERROR("Routing table returned this node as a closer peer, sending none");
            return std::vector<PeerId>();
        }
        // Never send a peer back itself
        if (peer == from) {
            continue;
        }
        filtered.push_back(peer);
    }
    return filtered;
}

std::vector<MessagePeer> DhtResponder::to_message_peers(const std::vector<PeerInfo>& infos) {
    return peer_infos_to_message_peers(deps_.connectivity, infos);
}

HandlerStatistics DhtResponder::get_statistics() const {
    HandlerStatistics stats;
    for (size_t i = 0; i < MESSAGE_TYPE_COUNT; ++i) {
        stats.requests_received[i] = requests_received_[i].load();
        stats.requests_failed[i] = requests_failed_[i].load();
    }
    stats.unsupported_requests = unsupported_requests_.load();
    stats.stale_records_evicted = stale_records_evicted_.load();
    stats.puts_rejected = puts_rejected_.load();
    return stats;
}

nlohmann::json DhtResponder::get_statistics_json() const {
    HandlerStatistics stats = get_statistics();

    nlohmann::json json;
    nlohmann::json received;
    nlohmann::json failed;
    for (size_t i = 0; i < MESSAGE_TYPE_COUNT; ++i) {
        const char* name = message_type_to_string(static_cast<MessageType>(i));
        received[name] = stats.requests_received[i];
        failed[name] = stats.requests_failed[i];
    }
    json["requests_received"] = received;
    json["requests_failed"] = failed;
    json["unsupported_requests"] = stats.unsupported_requests;
    json["stale_records_evicted"] = stats.stale_records_evicted;
    json["puts_rejected"] = stats.puts_rejected;
    return json;
}

} // namespace kaddht
