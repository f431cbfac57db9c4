#include "core/hub_err.h"

const char *hub_err_to_name(esp_err_t err)
{
    switch (err)
    {
    case HUB_ERR_CONNECTION:
        return "HUB_ERR_CONNECTION";
    case HUB_ERR_CONNECTION_CLOSED:
        return "HUB_ERR_CONNECTION_CLOSED";
    case HUB_ERR_AUTH:
        return "HUB_ERR_AUTH";
    case HUB_ERR_REQUEST_TIMEOUT:
        return "HUB_ERR_REQUEST_TIMEOUT";
    case HUB_ERR_COMMAND_FAILED:
        return "HUB_ERR_COMMAND_FAILED";
    default:
        return esp_err_to_name(err);
    }
}
