#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "esp_err.h"
#include "infra/transport/i_read_transport.hpp"
#include "live/entity_mapper.hpp"

namespace live {

// Live tracking fan-out: many downstream sessions, one upstream subscription.
//
// Each session subscribes for one device/profile pair; the resolved entity
// set is its private filter and it only ever sees `state_update` messages for
// those entities. The upstream subscription (all entities) lives from start()
// to stop() and is never exposed to sessions.
class LiveServer {
public:
    // Sends one text frame to a session. Must not block for long.
    using SendFn = std::function<esp_err_t(int session, const std::string& payload)>;

    LiveServer(transport::IReadTransport& transport, IEntityMapper& mapper, SendFn send);
    ~LiveServer();

    LiveServer(const LiveServer&) = delete;
    LiveServer& operator=(const LiveServer&) = delete;

    esp_err_t start();
    void stop();

    // One inbound text frame of `session`.
    void handle_message(int session, const char* data, size_t len);
    void on_session_closed(int session);

    size_t session_count() const;
    bool has_session(int session) const;

private:
    struct Session {
        std::string device_id;
        std::string profile_id;
        std::set<std::string> entity_ids;
    };

    void handle_subscribe(int session, const cJSON* msg);
    void on_state_change(const std::string& entity_id, const ha::StatePtr& new_state);
    void send(int session, const cJSON* msg);
    void send_error(int session, const char* error);

    transport::IReadTransport& transport_;
    IEntityMapper& mapper_;
    SendFn send_;

    mutable std::mutex mutex_;
    std::map<int, Session> sessions_;
    transport::SubscriptionId upstream_ = transport::kInvalidSubscription;
};

} // namespace live
