#pragma once

#include "esp_err.h"

// Error codes for the Home Assistant transport layer.
// Everything else uses the regular ESP_ERR_* values.
#define HUB_ERR_BASE 0x7100

// Channel could not be established or was lost.
#define HUB_ERR_CONNECTION (HUB_ERR_BASE + 1)
// Request failed because its channel closed before a response arrived.
#define HUB_ERR_CONNECTION_CLOSED (HUB_ERR_BASE + 2)
// Home Assistant rejected the access token.
#define HUB_ERR_AUTH (HUB_ERR_BASE + 3)
// A single in-flight command was not answered in time.
#define HUB_ERR_REQUEST_TIMEOUT (HUB_ERR_BASE + 4)
// Home Assistant answered with success == false.
#define HUB_ERR_COMMAND_FAILED (HUB_ERR_BASE + 5)

// Like esp_err_to_name(), but also knows the HUB_ERR_* codes.
const char *hub_err_to_name(esp_err_t err);
