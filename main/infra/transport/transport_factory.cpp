#include "infra/transport/transport_factory.hpp"

#include <utility>

#include "esp_log.h"

#include "core/hub_err.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "transport_sel";
    }

    const char *kind_name(Kind kind)
    {
        switch (kind)
        {
        case Kind::WebSocket:
            return "websocket";
        case Kind::Rest:
        default:
            return "rest";
        }
    }

    bool probe_rest_api(IHttpClient &http, const std::string &base_url, const std::string &access_token)
    {
        HttpResponse res;
        esp_err_t err = http.request("GET", base_url + "/", std::string(), access_token, res);
        return err == ESP_OK && res.ok();
    }

    esp_err_t select_read_transport(const SelectorOptions &options,
                                    const TransportFactory &factory,
                                    sched::IScheduler &scheduler,
                                    Selection &out)
    {
        out = Selection();
        auto status = std::make_shared<TransportStatus>();

        if (options.force_rest)
            ESP_LOGI(TAG, "force_rest set, skipping WebSocket");

        if (options.prefer_websocket && !options.force_rest && factory.make_ws)
        {
            ESP_LOGI(TAG, "Attempting WebSocket connection (%u ms)",
                     static_cast<unsigned>(options.ws_connect_timeout_ms));
            std::unique_ptr<WsReadTransport> ws = factory.make_ws();
            esp_err_t err = ws ? ws->connect_within(options.ws_connect_timeout_ms) : ESP_ERR_NO_MEM;
            if (err == ESP_OK)
            {
                ESP_LOGI(TAG, "WebSocket connection successful");
                status->active = Kind::WebSocket;
                status->ws_available = true;

                if (factory.probe_rest)
                {
                    auto probe = factory.probe_rest;
                    std::weak_ptr<TransportStatus> weak = status;
                    out.probe_timer = scheduler.create_blocking_timer("rest_probe", [probe, weak]()
                                                                      {
                                                                          bool ok = probe();
                                                                          if (auto s = weak.lock())
                                                                              s->rest_available = ok;
                                                                          ESP_LOGI(TAG, "REST probe: %s", ok ? "reachable" : "unreachable"); });
                    out.probe_timer->start_once(0);
                }

                out.transport = std::move(ws);
                out.status = status;
                return ESP_OK;
            }

            ESP_LOGW(TAG, "WebSocket connection failed (%s), trying REST fallback", hub_err_to_name(err));
            if (ws)
                ws->disconnect();
        }

        ESP_LOGI(TAG, "Attempting REST connection");
        std::unique_ptr<RestReadTransport> rest = factory.make_rest ? factory.make_rest() : nullptr;
        if (!rest || rest->connect() != ESP_OK)
        {
            ESP_LOGE(TAG, "Failed to connect to Home Assistant via WebSocket or REST");
            return HUB_ERR_CONNECTION;
        }

        ESP_LOGI(TAG, "REST connection successful (polling mode)");
        status->active = Kind::Rest;
        status->rest_available = true;
        out.transport = std::move(rest);
        out.status = status;
        return ESP_OK;
    }

} // namespace transport
