#include "live/status_report.hpp"

namespace live {

json::Ptr build_status_json(const transport::IReadTransport& transport, const transport::TransportStatus& status)
{
    json::Ptr root(cJSON_CreateObject());
    if (!root) return root;
    cJSON_AddStringToObject(root.get(), "readTransport", transport::kind_name(transport.kind()));
    // Writes always go through the REST API.
    cJSON_AddStringToObject(root.get(), "writeTransport", "rest");
    cJSON_AddBoolToObject(root.get(), "wsAvailable", status.ws_available.load());
    cJSON_AddBoolToObject(root.get(), "restAvailable", status.rest_available.load());
    cJSON_AddBoolToObject(root.get(), "connected", transport.is_connected());
    return root;
}

} // namespace live
