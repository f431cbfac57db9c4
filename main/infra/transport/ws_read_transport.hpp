#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/app_config.hpp"
#include "infra/sched/scheduler.hpp"
#include "infra/transport/i_read_transport.hpp"
#include "infra/transport/subscription_registry.hpp"
#include "infra/transport/ws_link.hpp"
#include "infra/transport/ws_messages.hpp"

namespace transport
{

    // Read transport over the Home Assistant WebSocket API.
    //
    // One persistent channel per instance: auth handshake, command/result
    // correlation by id, state_changed fan-out to local subscriptions and
    // automatic reconnect after a drop. Correlation ids restart at 1 on every
    // new channel; requests pending when a channel drops fail with
    // HUB_ERR_CONNECTION_CLOSED.
    class WsReadTransport : public IReadTransport
    {
    public:
        struct Options
        {
            std::string url; // ws://host:8123/api/websocket
            std::string access_token;
            std::uint32_t handshake_timeout_ms = app_config::kWsHandshakeTimeoutMs;
            std::uint32_t request_timeout_ms = app_config::kWsRequestTimeoutMs;
            std::uint32_t reconnect_delay_ms = app_config::kWsReconnectDelayMs;
            std::uint32_t request_sweep_ms = app_config::kWsRequestSweepMs;
        };

        enum class State
        {
            Disconnected,
            Connecting,
            AwaitingAuth,
            Ready,
        };

        // Completion of an asynchronous command: error code and the whole
        // result frame (null unless a result arrived).
        using Completion = std::function<void(esp_err_t err, json::Ptr response)>;

        WsReadTransport(Options options, std::unique_ptr<IWsLink> link, sched::IScheduler &scheduler);
        ~WsReadTransport() override;

        WsReadTransport(const WsReadTransport &) = delete;
        WsReadTransport &operator=(const WsReadTransport &) = delete;

        Kind kind() const override { return Kind::WebSocket; }

        // Blocks until auth_ok (ESP_OK), auth_invalid (HUB_ERR_AUTH), channel
        // failure (HUB_ERR_CONNECTION) or the handshake window (ESP_ERR_TIMEOUT).
        esp_err_t connect() override;
        // Same as connect() with a caller supplied window.
        esp_err_t connect_within(std::uint32_t timeout_ms);
        // Terminal until the next connect(): closes the channel, cancels reconnect.
        void disconnect() override;
        bool is_connected() const override;
        esp_err_t wait_until_ready() override;
        State state() const;

        esp_err_t list_devices(json::Ptr &out) override;
        esp_err_t list_entity_registry(json::Ptr &out) override;
        esp_err_t list_area_registry(json::Ptr &out) override;
        esp_err_t get_services_for_target(const cJSON *target, bool expand_group, json::Ptr &out) override;
        esp_err_t get_services_by_domain(const std::string &domain, std::vector<std::string> &out) override;

        esp_err_t get_state(const std::string &entity_id, ha::StatePtr &out) override;
        esp_err_t get_states(const std::vector<std::string> &entity_ids, ha::StateMap &out) override;
        esp_err_t get_all_states(std::vector<ha::StatePtr> &out) override;

        SubscriptionId subscribe_to_state_changes(const std::vector<std::string> &entity_ids,
                                                  StateChangeCallback cb) override;
        void unsubscribe(SubscriptionId id) override;
        void unsubscribe_all() override;

        // Send `command` ({type, ...}) with a fresh id and wait for its result
        // frame. Waits for Ready first. `response` receives the whole frame;
        // success == false is reported as HUB_ERR_COMMAND_FAILED.
        esp_err_t call(const cJSON *command, json::Ptr &response);

        // Non-blocking variant; `done` runs exactly once on the I/O or timer
        // task. Fails immediately with HUB_ERR_CONNECTION when not Ready.
        // Returns the correlation id, 0 if the command was not sent.
        int call_async(json::Ptr command, Completion done);

        // True once subscribe_events was acknowledged on the current channel.
        bool is_upstream_subscribed() const;

    private:
        struct PendingRequest
        {
            Completion done;
            std::int64_t deadline_ms = 0;
        };

        esp_err_t start_attempt();
        void handle_open();
        void handle_text(const char *data, size_t len);
        void handle_channel_down();
        void on_watchdog();
        void on_reconnect_timer();
        void sweep_expired();
        void activate_state_subscription();
        void teardown(const char *reason, bool close_link);
        static void fail_all(std::map<int, PendingRequest> &pending, esp_err_t err);
        // call() + success check + detach of the "result" member.
        esp_err_t request_result(json::Ptr command, json::Ptr &result);

        const Options options_;
        std::unique_ptr<IWsLink> link_;
        sched::IScheduler &scheduler_;

        // HA requires ids to increase on the wire: id assignment and send
        // happen under send_mutex_. Never taken from a link handler.
        std::mutex send_mutex_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        State state_ = State::Disconnected;
        esp_err_t attempt_result_ = ESP_ERR_NOT_FINISHED;
        bool shutdown_ = false;
        bool auth_failed_ = false;
        bool upstream_subscribed_ = false;
        bool subscribe_in_flight_ = false;
        int next_id_ = 1;
        std::map<int, PendingRequest> pending_;

        SubscriptionRegistry subscriptions_;

        std::unique_ptr<sched::ITimer> reconnect_timer_;
        std::unique_ptr<sched::ITimer> watchdog_timer_;
        std::unique_ptr<sched::ITimer> sweep_timer_;
    };

} // namespace transport
