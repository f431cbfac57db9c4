#pragma once

#include "esp_err.h"
#include <cstdint>

// NVS-backed runtime overrides for the Home Assistant connection.
namespace config_store
{

    // Empty strings and zero values mean "not set".
    struct HubOverrides
    {
        char base_url[128]{};
        // Long-lived HA token (can be >180 chars).
        char token[256]{};
        int8_t force_rest{-1}; // -1 unset, 0/1
        uint8_t reserved{};
        uint16_t live_port{0};
        uint32_t poll_interval_ms{0};
    };

    // Initialize the default NVS partition, erasing it if its layout changed.
    esp_err_t init();

    // `found` is false when nothing was ever saved.
    esp_err_t load_overrides(HubOverrides &out, bool &found);

    esp_err_t save_overrides(const HubOverrides &overrides);

    esp_err_t clear_overrides();

} // namespace config_store
