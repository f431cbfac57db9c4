#include "services/write_client.hpp"

#include <utility>

#include "esp_log.h"

namespace ha {

namespace {
const char* TAG = "ha_write";

json::Ptr entity_body(const std::string& entity_id)
{
    json::Ptr body(cJSON_CreateObject());
    if (body) {
        cJSON_AddStringToObject(body.get(), "entity_id", entity_id.c_str());
    }
    return body;
}
} // namespace

WriteClient::WriteClient(transport::IHttpClient& http, std::string base_url, std::string access_token)
    : http_(http), base_url_(std::move(base_url)), token_(std::move(access_token))
{
}

esp_err_t WriteClient::post(const std::string& path, const cJSON* body, transport::HttpResponse& res)
{
    std::string payload = body ? json::print(body) : std::string("{}");
    if (payload.empty()) {
        return ESP_ERR_NO_MEM;
    }
    esp_err_t err = http_.request("POST", base_url_ + path, payload, token_, res);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "POST %s failed: %s", path.c_str(), esp_err_to_name(err));
        return err;
    }
    if (!res.ok()) {
        ESP_LOGE(TAG, "POST %s -> %d: %s", path.c_str(), res.status, res.body.c_str());
        return ESP_ERR_INVALID_RESPONSE;
    }
    return ESP_OK;
}

esp_err_t WriteClient::call_service(const char* domain, const char* service, const cJSON* data,
                                    bool return_response, json::Ptr* response)
{
    if (!domain || !service) return ESP_ERR_INVALID_ARG;

    std::string path = "/services/";
    path += domain;
    path += '/';
    path += service;
    if (return_response) {
        path += "?return_response=true";
    }

    ESP_LOGD(TAG, "Calling %s.%s for %s", domain, service, json::get_string(data, "entity_id", "-"));
    transport::HttpResponse res;
    esp_err_t err = post(path, data, res);
    if (err != ESP_OK) return err;

    if (response) {
        // An empty or non-JSON body is a success without response data.
        response->reset();
        if (!res.body.empty()) {
            *response = json::parse(res.body);
        }
    }
    return ESP_OK;
}

esp_err_t WriteClient::set_number(const std::string& entity_id, double value)
{
    json::Ptr body = entity_body(entity_id);
    if (!body) return ESP_ERR_NO_MEM;
    cJSON_AddNumberToObject(body.get(), "value", value);
    return call_service("number", "set_value", body.get());
}

esp_err_t WriteClient::set_select(const std::string& entity_id, const std::string& option)
{
    json::Ptr body = entity_body(entity_id);
    if (!body) return ESP_ERR_NO_MEM;
    cJSON_AddStringToObject(body.get(), "option", option.c_str());
    return call_service("select", "select_option", body.get());
}

esp_err_t WriteClient::set_switch(const std::string& entity_id, bool on)
{
    json::Ptr body = entity_body(entity_id);
    if (!body) return ESP_ERR_NO_MEM;
    return call_service("switch", on ? "turn_on" : "turn_off", body.get());
}

esp_err_t WriteClient::set_input_boolean(const std::string& entity_id, bool on)
{
    json::Ptr body = entity_body(entity_id);
    if (!body) return ESP_ERR_NO_MEM;
    return call_service("input_boolean", on ? "turn_on" : "turn_off", body.get());
}

esp_err_t WriteClient::set_text(const std::string& entity_id, const std::string& value)
{
    json::Ptr body = entity_body(entity_id);
    if (!body) return ESP_ERR_NO_MEM;
    cJSON_AddStringToObject(body.get(), "value", value.c_str());
    return call_service("text", "set_value", body.get());
}

esp_err_t WriteClient::update_entity_registry(const std::string& entity_id, const cJSON* updates)
{
    if (entity_id.empty()) return ESP_ERR_INVALID_ARG;
    transport::HttpResponse res;
    esp_err_t err = post("/config/entity_registry/" + entity_id, updates, res);
    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Entity registry entry %s updated", entity_id.c_str());
    }
    return err;
}

} // namespace ha
