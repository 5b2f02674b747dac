#include "dht_responder.h"
#include "dht_responder_log.h"
#include <mutex>

namespace kaddht {

HandlerResult DhtResponder::handle_get_value(const RequestContext& ctx, const PeerId& from, const Message& request) {
    LOG_HANDLER_DEBUG(short_peer_id(self_) << " handleGetValue for key: " << to_hex(request.key));

    if (request.key.empty()) {
        return HandlerResult::Error(HandlerError::MalformedRequest, "get value request without a key");
    }
    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    Message response = make_response(request.type, request.key, request.cluster_level);

    std::optional<Record> record;
    std::string error;
    if (!check_local_datastore(request.key, record, error)) {
        return HandlerResult::Error(HandlerError::StoreFailure, error);
    }
    response.record = record;

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    std::vector<PeerId> closer = better_peers_to_query(request, from, config_.closer_peer_count);
    if (!closer.empty()) {
        std::vector<PeerInfo> infos = deps_.peerstore.peer_infos(closer);
        for (const auto& info : infos) {
            LOG_HANDLER_DEBUG("handleGetValue returning closer peer: " << short_peer_id(info.id));
            if (info.addrs.empty()) {
                LOG_HANDLER_WARN("No addresses on peer being sent! local: " << short_peer_id(self_)
                                 << " sending: " << short_peer_id(info.id)
                                 << " remote: " << short_peer_id(from));
            }
        }
        response.closer_peers = to_message_peers(infos);
    }

    return HandlerResult::Respond(std::move(response));
}

bool DhtResponder::check_local_datastore(const std::string& key, std::optional<Record>& record, std::string& error) {
    record.reset();

    std::string ds_key = datastore_key_for(key);
    std::string blob;
    DatastoreStatus status = deps_.datastore.get(ds_key, blob);

    if (status == DatastoreStatus::NotFound) {
        return true;
    }
    if (status != DatastoreStatus::Ok) {
        error = "datastore get failed for " + ds_key;
        return false;
    }

    std::optional<Record> stored = decode_record(blob);
    if (!stored) {
        LOG_HANDLER_DEBUG("Failed to unmarshal DHT record from datastore");
        error = "stored record under " + ds_key + " could not be decoded";
        return false;
    }

    // Only the timestamp is checked here. Verifying the value may be costly
    // and is left to the requester.
    if (is_record_stale(*stored, now(), config_.max_record_age)) {
        LOG_HANDLER_DEBUG("Old or undated record found under " << ds_key << ", tossing");
        stale_records_evicted_.fetch_add(1);

        DatastoreStatus removed = deps_.datastore.remove(ds_key);
        if (removed == DatastoreStatus::Error) {
            LOG_HANDLER_ERROR("Failed to delete bad record from datastore: " << ds_key);
        }
        return true;
    }

    record = std::move(stored);
    return true;
}

bool DhtResponder::get_record_from_datastore(const std::string& ds_key, std::optional<Record>& record, std::string& error) {
    record.reset();

    std::string blob;
    DatastoreStatus status = deps_.datastore.get(ds_key, blob);
    if (status == DatastoreStatus::NotFound) {
        return true;
    }
    if (status != DatastoreStatus::Ok) {
        LOG_HANDLER_ERROR("Got error retrieving record with key " << ds_key << " from datastore");
        error = "datastore get failed for " + ds_key;
        return false;
    }

    std::optional<Record> stored = decode_record(blob);
    if (!stored) {
        // Overwritten by the incoming record
        LOG_HANDLER_ERROR("Bad record data stored in datastore with key " << ds_key << ": could not unmarshal record");
        return true;
    }

    ValidationResult validation = deps_.validator.validate(stored->key, stored->value);
    if (!validation.valid) {
        LOG_HANDLER_DEBUG("Local record verify failed: " << validation.reason << " (discarded)");
        return true;
    }

    record = std::move(stored);
    return true;
}

HandlerResult DhtResponder::handle_put_value(const RequestContext& ctx, const PeerId& from, const Message& request) {
    if (!request.record) {
        LOG_HANDLER_INFO("Got nil record from: " << short_peer_id(from));
        return HandlerResult::Error(HandlerError::MalformedRequest, "nil record");
    }

    Record record = *request.record;
    if (record.key != request.key) {
        return HandlerResult::Error(HandlerError::MalformedRequest, "put key doesn't match record key");
    }

    clean_record(record);

    ValidationResult validation = deps_.validator.validate(record.key, record.value);
    if (!validation.valid) {
        puts_rejected_.fetch_add(1);
        LOG_HANDLER_WARN("Bad dht record in PUT from: " << short_peer_id(from) << ". " << validation.reason);
        return HandlerResult::Error(HandlerError::InvalidRecord, validation.reason);
    }

    std::string ds_key = datastore_key_for(record.key);

    std::lock_guard<std::mutex> stripe_lock(put_locks_.lock_for(record.key));

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    // The incoming record must beat what we already hold, so that e.g. a
    // lower sequence number cannot replace a higher one.
    std::optional<Record> existing;
    std::string error;
    if (!get_record_from_datastore(ds_key, existing, error)) {
        return HandlerResult::Error(HandlerError::StoreFailure, error);
    }

    if (existing) {
        SelectionResult selection = deps_.validator.select(record.key, {record.value, existing->value});
        if (!selection.success) {
            puts_rejected_.fetch_add(1);
            LOG_HANDLER_WARN("Bad dht record in PUT from " << short_peer_id(from) << ": " << selection.error_message);
            return HandlerResult::Error(HandlerError::SelectFailed, selection.error_message);
        }
        if (selection.index != 0) {
            puts_rejected_.fetch_add(1);
            LOG_HANDLER_INFO("DHT record in PUT from " << short_peer_id(from) << " is older than existing record. Ignoring");
            return HandlerResult::Error(HandlerError::OldRecord, "old record");
        }
    }

    if (ctx.is_done()) {
        return HandlerResult::Error(HandlerError::Cancelled, "request cancelled");
    }

    record.time_received = format_rfc3339(now());

    DatastoreStatus status = deps_.datastore.put(ds_key, encode_record(record));
    LOG_HANDLER_DEBUG(short_peer_id(self_) << " handlePutValue " << ds_key);
    if (status != DatastoreStatus::Ok) {
        return HandlerResult::Error(HandlerError::StoreFailure, "datastore put failed for " + ds_key);
    }

    Message response = request;
    response.record = std::move(record);
    return HandlerResult::Respond(std::move(response));
}

} // namespace kaddht
