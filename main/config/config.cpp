#include "config/config.hpp"

#include <cstring>

#include "esp_log.h"

#include "config/config_store.hpp"
#include "hub_config.h"

namespace config
{

    namespace
    {
        constexpr const char *TAG = "config";
        constexpr const char *kRedacted = "***redacted***";

        HubSettings s_cfg{};
        bool s_loaded = false;

        inline std::string trim_trailing_slashes(std::string s)
        {
            while (!s.empty() && s.back() == '/')
                s.pop_back();
            return s;
        }

        inline bool ends_with(const std::string &s, const char *suffix)
        {
            const size_t len = std::strlen(suffix);
            return s.size() >= len && s.compare(s.size() - len, len, suffix) == 0;
        }

        void apply_overrides(Sources &src, const config_store::HubOverrides &o)
        {
            if (o.base_url[0] != '\0')
                src.base_url = o.base_url;
            if (o.token[0] != '\0')
                src.token = o.token;
            if (o.force_rest >= 0)
                src.force_rest = o.force_rest;
            if (o.live_port != 0)
                src.live_port = o.live_port;
            if (o.poll_interval_ms != 0)
                src.rest_poll_interval_ms = o.poll_interval_ms;
        }

    } // namespace

    std::string normalize_base_url(const std::string &url)
    {
        std::string out = trim_trailing_slashes(url);
        if (!ends_with(out, "/api"))
            out += "/api";
        return out;
    }

    std::string websocket_url(const std::string &base_url)
    {
        std::string base = trim_trailing_slashes(base_url);
        if (ends_with(base, "/api"))
            base.erase(base.size() - 4);
        if (base.compare(0, 4, "http") == 0)
            base.replace(0, 4, "ws");
        return base + "/api/websocket";
    }

    const char *mode_name(Mode mode)
    {
        return mode == Mode::Supervisor ? "supervisor" : "standalone";
    }

    esp_err_t build_settings(const Sources &src, HubSettings &out)
    {
        out = HubSettings();

        if (!src.supervisor_token.empty())
        {
            out.mode = Mode::Supervisor;
            out.token = src.supervisor_token;
            out.base_url = normalize_base_url(src.base_url.empty() ? HUB_SUPERVISOR_BASE_URL : src.base_url);
        }
        else if (!src.base_url.empty() && !src.token.empty())
        {
            out.mode = Mode::Standalone;
            out.token = src.token;
            out.base_url = normalize_base_url(src.base_url);
        }
        else
        {
            ESP_LOGE(TAG, "Home Assistant credentials are not configured: "
                          "set a supervisor token, or a base URL and a long-lived token");
            return ESP_ERR_INVALID_STATE;
        }

        out.ws_url = websocket_url(out.base_url);
        if (src.force_rest >= 0)
            out.force_rest = src.force_rest != 0;
        if (src.prefer_websocket >= 0)
            out.prefer_websocket = src.prefer_websocket != 0;
        if (src.rest_poll_interval_ms != 0)
            out.rest_poll_interval_ms = src.rest_poll_interval_ms;
        if (src.live_port != 0)
            out.live_port = src.live_port;
        return ESP_OK;
    }

    HubSettings redacted(const HubSettings &settings)
    {
        HubSettings copy = settings;
        copy.token = kRedacted;
        return copy;
    }

    esp_err_t load()
    {
        if (s_loaded)
            return ESP_OK;

        Sources src;
        src.supervisor_token = HUB_SUPERVISOR_TOKEN;
        src.base_url = HUB_HA_BASE_URL;
        src.token = HUB_HA_TOKEN;
        src.force_rest = HUB_FORCE_REST;
        src.prefer_websocket = HUB_PREFER_WEBSOCKET;
        src.rest_poll_interval_ms = HUB_REST_POLL_INTERVAL_MS;
        src.live_port = HUB_LIVE_PORT;

        config_store::HubOverrides overrides;
        bool found = false;
        esp_err_t err = config_store::load_overrides(overrides, found);
        if (err != ESP_OK)
            ESP_LOGW(TAG, "NVS overrides unavailable: %s", esp_err_to_name(err));
        else if (found)
            apply_overrides(src, overrides);

        err = build_settings(src, s_cfg);
        if (err != ESP_OK)
            return err;

        const HubSettings safe = redacted(s_cfg);
        ESP_LOGI(TAG, "mode=%s base=%s ws=%s token=%s force_rest=%d live_port=%u",
                 mode_name(safe.mode), safe.base_url.c_str(), safe.ws_url.c_str(), safe.token.c_str(),
                 safe.force_rest ? 1 : 0, static_cast<unsigned>(safe.live_port));
        s_loaded = true;
        return ESP_OK;
    }

    const HubSettings &hub()
    {
        if (!s_loaded)
            (void)load();
        return s_cfg;
    }

} // namespace config
