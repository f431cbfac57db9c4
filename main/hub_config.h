#pragma once

// Compile-time defaults. Anything set here can be overridden at runtime
// through the NVS store (see config/config_store.hpp).

// Home Assistant base URL, with or without the trailing /api.
// Example: "http://homeassistant.local:8123"
#ifndef HUB_HA_BASE_URL
#define HUB_HA_BASE_URL ""
#endif

// Long-lived access token from the HA user profile.
#ifndef HUB_HA_TOKEN
#define HUB_HA_TOKEN ""
#endif

// Set when running behind the supervisor proxy; takes precedence over
// HUB_HA_TOKEN and defaults the base URL to HUB_SUPERVISOR_BASE_URL.
#ifndef HUB_SUPERVISOR_TOKEN
#define HUB_SUPERVISOR_TOKEN ""
#endif

#ifndef HUB_SUPERVISOR_BASE_URL
#define HUB_SUPERVISOR_BASE_URL "http://supervisor/core/api"
#endif

// 1 = never try the WebSocket API.
#ifndef HUB_FORCE_REST
#define HUB_FORCE_REST 0
#endif

#ifndef HUB_PREFER_WEBSOCKET
#define HUB_PREFER_WEBSOCKET 1
#endif

#ifndef HUB_REST_POLL_INTERVAL_MS
#define HUB_REST_POLL_INTERVAL_MS 1000
#endif

// Port of the live tracking server (/api/live/ws, /api/status).
#ifndef HUB_LIVE_PORT
#define HUB_LIVE_PORT 42069
#endif
