#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "app/app_config.hpp"
#include "infra/sched/scheduler.hpp"
#include "infra/transport/http_client.hpp"
#include "infra/transport/i_read_transport.hpp"
#include "infra/transport/subscription_registry.hpp"

namespace transport
{

    // Read transport over the Home Assistant REST API.
    //
    // There is no push channel: subscriptions are served by a shared poll
    // timer that fetches a snapshot and diffs it against what each
    // subscription has already seen (state value and last_changed only).
    class RestReadTransport : public IReadTransport
    {
    public:
        struct Options
        {
            std::string base_url; // http://host:8123/api
            std::string access_token;
            std::uint32_t poll_interval_ms = app_config::kRestPollIntervalMs;
        };

        RestReadTransport(Options options, IHttpClient &http, sched::IScheduler &scheduler);
        ~RestReadTransport() override;

        RestReadTransport(const RestReadTransport &) = delete;
        RestReadTransport &operator=(const RestReadTransport &) = delete;

        Kind kind() const override { return Kind::Rest; }

        esp_err_t connect() override;
        void disconnect() override;
        bool is_connected() const override { return connected_; }
        esp_err_t wait_until_ready() override;

        esp_err_t list_devices(json::Ptr &out) override;
        esp_err_t list_entity_registry(json::Ptr &out) override;
        esp_err_t list_area_registry(json::Ptr &out) override;
        // Not available over REST: empty results.
        esp_err_t get_services_for_target(const cJSON *target, bool expand_group, json::Ptr &out) override;
        esp_err_t get_services_by_domain(const std::string &domain, std::vector<std::string> &out) override;

        esp_err_t get_state(const std::string &entity_id, ha::StatePtr &out) override;
        esp_err_t get_states(const std::vector<std::string> &entity_ids, ha::StateMap &out) override;
        esp_err_t get_all_states(std::vector<ha::StatePtr> &out) override;

        SubscriptionId subscribe_to_state_changes(const std::vector<std::string> &entity_ids,
                                                  StateChangeCallback cb) override;
        void unsubscribe(SubscriptionId id) override;
        void unsubscribe_all() override;

        bool is_polling() const;

        // One poll cycle. Runs on the timer task; exposed for tests.
        void poll_once();

    private:
        std::string url(const char *path) const;
        esp_err_t get_json(const std::string &url, json::Ptr &out, int *status = nullptr);
        esp_err_t list_registry(const char *path, const char *fallback_template, json::Ptr &out);
        esp_err_t render_template(const char *tmpl, json::Ptr &out);
        void start_polling();
        void stop_polling();

        const Options options_;
        IHttpClient &http_;
        std::atomic<bool> connected_{false};
        std::atomic<bool> tick_in_progress_{false};

        SubscriptionRegistry subscriptions_;

        std::unique_ptr<sched::ITimer> poll_timer_;
        std::unique_ptr<sched::ITimer> kick_timer_;
    };

} // namespace transport
