#pragma once

#include <string>

#include "esp_err.h"
#include "core/json_util.hpp"
#include "infra/transport/http_client.hpp"

namespace ha {

// Write side of the Home Assistant connection. Always REST, whichever read
// transport is active.
class WriteClient {
public:
    WriteClient(transport::IHttpClient& http, std::string base_url, std::string access_token);

    // POST /api/services/<domain>/<service>. `response` (optional) receives the
    // parsed body when HA returns one; it stays empty otherwise.
    esp_err_t call_service(const char* domain, const char* service, const cJSON* data,
                           bool return_response = false, json::Ptr* response = nullptr);

    esp_err_t set_number(const std::string& entity_id, double value);
    esp_err_t set_select(const std::string& entity_id, const std::string& option);
    esp_err_t set_switch(const std::string& entity_id, bool on);
    esp_err_t set_input_boolean(const std::string& entity_id, bool on);
    esp_err_t set_text(const std::string& entity_id, const std::string& value);

    // POST /api/config/entity_registry/<entity_id> with `updates` as the body.
    esp_err_t update_entity_registry(const std::string& entity_id, const cJSON* updates);

private:
    esp_err_t post(const std::string& path, const cJSON* body, transport::HttpResponse& res);

    transport::IHttpClient& http_;
    const std::string base_url_;
    const std::string token_;
};

} // namespace ha
