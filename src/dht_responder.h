#pragma once

#include "kaddht_export.h"
#include "types.h"
#include "record.h"
#include "message.h"
#include "config.h"
#include "datastore.h"
#include "validator.h"
#include "provider_store.h"
#include "peerstore.h"
#include "connectivity.h"
#include "routing_table.h"
#include "request_context.h"
#include "striped_lock.h"
#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kaddht {

/**
 * Why a request produced no response
 */
enum class HandlerError {
    None,
    MalformedRequest,   // Empty key, missing record, key/record mismatch, bad content id
    InvalidRecord,      // Validator rejected the incoming value
    OldRecord,          // Validator prefers the record already stored
    SelectFailed,       // Validator could not choose between new and stored value
    StoreFailure,       // Datastore error other than not-found, or unreadable stored record
    Cancelled,          // Request context cancelled or past its deadline
    UnsupportedType     // No handler for the message type
};

KADDHT_API const char* handler_error_to_string(HandlerError error);

/**
 * Outcome of handling one request: a response, an acknowledged request
 * without payload, or an error. Never both a response and an error.
 */
struct HandlerResult {
    bool success = false;
    std::optional<Message> response;
    HandlerError error = HandlerError::None;
    std::string error_message;

    static HandlerResult Respond(Message message) {
        HandlerResult r;
        r.success = true;
        r.response = std::move(message);
        return r;
    }
    static HandlerResult NoResponse() {
        HandlerResult r;
        r.success = true;
        return r;
    }
    static HandlerResult Error(HandlerError code, const std::string& msg) {
        HandlerResult r;
        r.error = code;
        r.error_message = msg;
        return r;
    }
};

/**
 * Collaborators the responder reads from and writes through.
 * They must outlive the responder and synchronise themselves.
 */
struct DhtResponderDeps {
    Datastore& datastore;
    Validator& validator;
    ProviderIndex& providers;
    RoutingTable& routing_table;
    AddressBook& peerstore;
    ConnectivityOracle& connectivity;
};

/**
 * Request counters
 */
struct HandlerStatistics {
    std::array<uint64_t, MESSAGE_TYPE_COUNT> requests_received{};
    std::array<uint64_t, MESSAGE_TYPE_COUNT> requests_failed{};
    uint64_t unsupported_requests = 0;
    uint64_t stale_records_evicted = 0;
    uint64_t puts_rejected = 0;
};

/**
 * DhtResponder - answers inbound DHT requests for the local node.
 *
 * One instance per node. Every handler may run concurrently with any number
 * of others, including for the same key: PUT_VALUE writes are serialised per
 * lock stripe, all other shared state lives in the collaborators.
 */
class KADDHT_API DhtResponder {
public:
    using Handler = HandlerResult (DhtResponder::*)(const RequestContext& ctx, const PeerId& from, const Message& request);
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DhtResponder(const PeerId& self, const DhtResponderDeps& deps, const DhtConfig& config = DhtConfig());

    DhtResponder(const DhtResponder&) = delete;
    DhtResponder& operator=(const DhtResponder&) = delete;

    const PeerId& self() const { return self_; }
    const DhtConfig& config() const { return config_; }

    /**
     * Replace the wall clock used for record receipt times and expiry
     */
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    // =========================================================================
    // Dispatch
    // =========================================================================

    /**
     * Handler for a message type, or nullptr for Unsupported
     */
    static Handler handler_for(MessageType type);

    /**
     * Dispatch a request to its handler and record statistics.
     * Unsupported types fail with HandlerError::UnsupportedType.
     */
    HandlerResult handle_message(const RequestContext& ctx, const PeerId& from, const Message& request);

    // =========================================================================
    // Handlers
    // =========================================================================

    /**
     * GET_VALUE: the stored record for the key (if fresh) plus closer peers.
     * Stale records are deleted as a side effect and reported as absent.
     */
    HandlerResult handle_get_value(const RequestContext& ctx, const PeerId& from, const Message& request);

    /**
     * PUT_VALUE: validate and store a record unless the validator prefers the
     * one already stored. Echoes the request on success.
     */
    HandlerResult handle_put_value(const RequestContext& ctx, const PeerId& from, const Message& request);

    /**
     * FIND_NODE: peers closer to the requested peer id
     */
    HandlerResult handle_find_node(const RequestContext& ctx, const PeerId& from, const Message& request);

    /**
     * GET_PROVIDERS: known providers of a content id (including this node if
     * it holds the content) plus closer peers
     */
    HandlerResult handle_get_providers(const RequestContext& ctx, const PeerId& from, const Message& request);

    /**
     * ADD_PROVIDER: record the requester as provider of a content id.
     * Produces no response payload.
     */
    HandlerResult handle_add_provider(const RequestContext& ctx, const PeerId& from, const Message& request);

    HandlerResult handle_ping(const RequestContext& ctx, const PeerId& from, const Message& request);

    // =========================================================================
    // Statistics
    // =========================================================================

    HandlerStatistics get_statistics() const;
    nlohmann::json get_statistics_json() const;

private:
    /**
     * Read the record for a DHT key, evicting it if stale
     * @return false on a datastore error or an undecodable stored record
     */
    bool check_local_datastore(const std::string& key, std::optional<Record>& record, std::string& error);

    /**
     * Currently valid record stored under ds_key. Not-found, undecodable and
     * no-longer-valid records all come back as an empty optional.
     * @return false only on a datastore error
     */
    bool get_record_from_datastore(const std::string& ds_key, std::optional<Record>& record, std::string& error);

    /**
     * Closer peers for a request, never including the requester.
     * Returns nothing if the routing table ever offers this node itself.
     */
    std::vector<PeerId> better_peers_to_query(const Message& request, const PeerId& from, size_t count);

    std::vector<MessagePeer> to_message_peers(const std::vector<PeerInfo>& infos);

    std::chrono::system_clock::time_point now() const { return clock_(); }

    static size_t type_index(MessageType type) { return static_cast<size_t>(type); }

    PeerId self_;
    DhtResponderDeps deps_;
    DhtConfig config_;
    Clock clock_;

    StripedLockSet put_locks_;

    std::array<std::atomic<uint64_t>, MESSAGE_TYPE_COUNT> requests_received_;
    std::array<std::atomic<uint64_t>, MESSAGE_TYPE_COUNT> requests_failed_;
    std::atomic<uint64_t> unsupported_requests_;
    std::atomic<uint64_t> stale_records_evicted_;
    std::atomic<uint64_t> puts_rejected_;
};

} // namespace kaddht
