#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "esp_err.h"

#include "app/app_config.hpp"
#include "infra/sched/scheduler.hpp"
#include "infra/transport/http_client.hpp"
#include "infra/transport/i_read_transport.hpp"
#include "infra/transport/rest_read_transport.hpp"
#include "infra/transport/ws_read_transport.hpp"

namespace transport
{

    // Reachability of both backends, for status surfaces. `active` is fixed
    // at selection time; the flags may still change while the REST probe runs.
    struct TransportStatus
    {
        Kind active = Kind::Rest;
        std::atomic<bool> ws_available{false};
        std::atomic<bool> rest_available{false};
    };

    struct SelectorOptions
    {
        bool prefer_websocket = true;
        bool force_rest = false;
        std::uint32_t ws_connect_timeout_ms = app_config::kWsConnectRaceTimeoutMs;
    };

    // Builders for the two backends; the selector owns whatever it keeps.
    struct TransportFactory
    {
        std::function<std::unique_ptr<WsReadTransport>()> make_ws;
        std::function<std::unique_ptr<RestReadTransport>()> make_rest;
        // Best-effort REST reachability check; runs off the caller's task.
        std::function<bool()> probe_rest;
    };

    struct Selection
    {
        std::unique_ptr<IReadTransport> transport;
        std::shared_ptr<TransportStatus> status;
        // Keeps the background REST probe alive.
        std::unique_ptr<sched::ITimer> probe_timer;
    };

    // Pick the read transport once, at startup.
    // WebSocket first (unless disabled) raced against ws_connect_timeout_ms,
    // then REST. Returns HUB_ERR_CONNECTION if neither backend connects.
    esp_err_t select_read_transport(const SelectorOptions &options,
                                    const TransportFactory &factory,
                                    sched::IScheduler &scheduler,
                                    Selection &out);

    // GET <base_url>/ with the token; true on 2xx.
    bool probe_rest_api(IHttpClient &http, const std::string &base_url, const std::string &access_token);

} // namespace transport
