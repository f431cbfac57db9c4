#pragma once

#include <cstdint>
#include <string>

#include "esp_err.h"

#include "app/app_config.hpp"

namespace config {

enum class Mode {
    Supervisor,
    Standalone,
};

struct HubSettings {
    Mode mode = Mode::Standalone;
    std::string base_url; // always ends in /api
    std::string ws_url;   // ws(s)://.../api/websocket
    std::string token;

    uint32_t ws_connect_timeout_ms = app_config::kWsConnectRaceTimeoutMs;
    uint32_t ws_handshake_timeout_ms = app_config::kWsHandshakeTimeoutMs;
    uint32_t request_timeout_ms = app_config::kWsRequestTimeoutMs;
    uint32_t reconnect_delay_ms = app_config::kWsReconnectDelayMs;
    uint32_t rest_poll_interval_ms = app_config::kRestPollIntervalMs;
    bool prefer_websocket = true;
    bool force_rest = false;
    uint16_t live_port = app_config::kLivePort;
};

// Raw inputs before normalization. Empty / zero / negative means "not set".
struct Sources {
    std::string supervisor_token;
    std::string base_url;
    std::string token;
    int force_rest = -1;
    int prefer_websocket = -1;
    uint32_t rest_poll_interval_ms = 0;
    uint16_t live_port = 0;
};

// Validates and normalizes. ESP_ERR_INVALID_STATE if no credentials.
esp_err_t build_settings(const Sources& src, HubSettings& out);

// "http://host:8123/" -> "http://host:8123/api"
std::string normalize_base_url(const std::string& url);
// "https://host/api" -> "wss://host/api/websocket"
std::string websocket_url(const std::string& base_url);

const char* mode_name(Mode mode);

// Copy safe for logging.
HubSettings redacted(const HubSettings& settings);

// Compile-time defaults (hub_config.h) overlaid with the NVS overrides.
esp_err_t load();
const HubSettings& hub();

} // namespace config
