#include <memory>

#include "esp_err.h"
#include "esp_log.h"
#include "esp_system.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "app/app_config.hpp"
#include "config/config.hpp"
#include "config/config_store.hpp"
#include "core/hub_err.h"
#include "infra/sched/esp_timer_scheduler.hpp"
#include "infra/transport/esp_http_client_impl.hpp"
#include "infra/transport/esp_ws_link.hpp"
#include "infra/transport/transport_factory.hpp"
#include "live/live_ws_endpoint.hpp"
#include "live/profile_entity_mapper.hpp"
#include "services/write_client.hpp"

static const char *TAG_APP = "app";

static sched::EspTimerScheduler s_scheduler;
static transport::EspHttpClient s_http(app_config::kHttpTimeoutMs);
static transport::Selection s_selection;
static live::ProfileEntityMapper s_mapper;
static std::unique_ptr<ha::WriteClient> s_writer;
static std::unique_ptr<live::LiveWsEndpoint> s_live;

// Nothing can run without Home Assistant; restart so the supervisor sees it.
static void restart_on_fatal(const char *what, esp_err_t err)
{
    ESP_LOGE(TAG_APP, "%s: %s, restarting", what, hub_err_to_name(err));
    vTaskDelay(pdMS_TO_TICKS(100));
    esp_restart();
}

static transport::TransportFactory make_factory(const config::HubSettings &cfg)
{
    transport::TransportFactory factory;
    factory.make_ws = [&cfg]()
    {
        transport::WsReadTransport::Options opts;
        opts.url = cfg.ws_url;
        opts.access_token = cfg.token;
        opts.handshake_timeout_ms = cfg.ws_handshake_timeout_ms;
        opts.request_timeout_ms = cfg.request_timeout_ms;
        opts.reconnect_delay_ms = cfg.reconnect_delay_ms;
        return std::unique_ptr<transport::WsReadTransport>(new transport::WsReadTransport(
            opts, std::unique_ptr<transport::IWsLink>(new transport::EspWsLink()), s_scheduler));
    };
    factory.make_rest = [&cfg]()
    {
        transport::RestReadTransport::Options opts;
        opts.base_url = cfg.base_url;
        opts.access_token = cfg.token;
        opts.poll_interval_ms = cfg.rest_poll_interval_ms;
        return std::unique_ptr<transport::RestReadTransport>(
            new transport::RestReadTransport(opts, s_http, s_scheduler));
    };
    factory.probe_rest = [&cfg]()
    {
        return transport::probe_rest_api(s_http, cfg.base_url, cfg.token);
    };
    return factory;
}

extern "C" void app_main(void)
{
    esp_err_t err = config_store::init();
    if (err != ESP_OK)
    {
        ESP_LOGW(TAG_APP, "NVS init failed (%s), using built-in defaults", esp_err_to_name(err));
    }

    err = config::load();
    if (err != ESP_OK)
        restart_on_fatal("No Home Assistant connection configured", err);
    const config::HubSettings &cfg = config::hub();

    transport::SelectorOptions options;
    options.prefer_websocket = cfg.prefer_websocket;
    options.force_rest = cfg.force_rest;
    options.ws_connect_timeout_ms = cfg.ws_connect_timeout_ms;

    err = transport::select_read_transport(options, make_factory(cfg), s_scheduler, s_selection);
    if (err != ESP_OK)
        restart_on_fatal("Home Assistant unreachable", err);
    ESP_LOGI(TAG_APP, "Read transport: %s (ws=%d rest=%d), writes: rest",
             transport::kind_name(s_selection.status->active),
             s_selection.status->ws_available ? 1 : 0,
             s_selection.status->rest_available ? 1 : 0);

    s_writer.reset(new ha::WriteClient(s_http, cfg.base_url, cfg.token));

    s_live.reset(new live::LiveWsEndpoint(*s_selection.transport, s_mapper, s_selection.status, cfg.live_port));
    err = s_live->start();
    if (err != ESP_OK)
        restart_on_fatal("Live server failed to start", err);

    for (;;)
    {
        vTaskDelay(portMAX_DELAY);
    }
}
