#include "live/live_server.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include "esp_log.h"

namespace live {

namespace {
const char* TAG = "live";

double now_epoch_ms()
{
    using namespace std::chrono;
    return static_cast<double>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

cJSON* attributes_item(const ha::StateRecord& record)
{
    json::Ptr attrs = ha::attributes_copy(record);
    return attrs ? attrs.release() : cJSON_CreateObject();
}
} // namespace

LiveServer::LiveServer(transport::IReadTransport& transport, IEntityMapper& mapper, SendFn send)
    : transport_(transport), mapper_(mapper), send_(std::move(send))
{
}

LiveServer::~LiveServer()
{
    stop();
}

esp_err_t LiveServer::start()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (upstream_ != transport::kInvalidSubscription) return ESP_OK;
    }

    transport::SubscriptionId id = transport_.subscribe_to_state_changes(
        {}, [this](const std::string& entity_id, const ha::StatePtr& new_state, const ha::StatePtr&) {
            on_state_change(entity_id, new_state);
        });
    if (id == transport::kInvalidSubscription) return ESP_FAIL;

    std::lock_guard<std::mutex> lock(mutex_);
    upstream_ = id;
    ESP_LOGI(TAG, "Live fan-out started on %s transport", transport::kind_name(transport_.kind()));
    return ESP_OK;
}

void LiveServer::stop()
{
    transport::SubscriptionId id = transport::kInvalidSubscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = upstream_;
        upstream_ = transport::kInvalidSubscription;
        sessions_.clear();
    }
    if (id != transport::kInvalidSubscription) {
        transport_.unsubscribe(id);
        ESP_LOGI(TAG, "Live fan-out stopped");
    }
}

size_t LiveServer::session_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool LiveServer::has_session(int session) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session) > 0;
}

void LiveServer::send(int session, const cJSON* msg)
{
    const std::string payload = json::print(msg);
    if (payload.empty()) {
        ESP_LOGE(TAG, "Failed to encode message for session %d", session);
        return;
    }
    esp_err_t err = send_ ? send_(session, payload) : ESP_ERR_INVALID_STATE;
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Send to session %d failed: %s", session, esp_err_to_name(err));
    }
}

void LiveServer::send_error(int session, const char* error)
{
    json::Ptr msg(cJSON_CreateObject());
    if (!msg) return;
    cJSON_AddStringToObject(msg.get(), "type", "error");
    cJSON_AddStringToObject(msg.get(), "error", error);
    send(session, msg.get());
}

void LiveServer::handle_message(int session, const char* data, size_t len)
{
    json::Ptr msg = json::parse(data, len);
    const char* type = json::get_string(msg.get(), "type");
    if (!cJSON_IsObject(msg.get()) || !type) {
        ESP_LOGW(TAG, "Session %d: unparseable frame", session);
        send_error(session, "Invalid message format");
        return;
    }

    const std::string kind = type;
    if (kind == "subscribe") {
        handle_subscribe(session, msg.get());
    } else if (kind == "unsubscribe") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(session) > 0) {
            ESP_LOGI(TAG, "Session %d unsubscribed", session);
        }
    } else {
        ESP_LOGW(TAG, "Session %d: unknown message type '%s'", session, type);
        send_error(session, "Invalid message format");
    }
}

void LiveServer::on_session_closed(int session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session) > 0) {
        ESP_LOGI(TAG, "Session %d closed", session);
    }
}

void LiveServer::handle_subscribe(int session, const cJSON* msg)
{
    SubscribeRequest request;
    request.device_id = json::get_string(msg, "deviceId", "");
    request.profile_id = json::get_string(msg, "profileId", "");
    if (request.device_id.empty() || request.profile_id.empty()) {
        send_error(session, "deviceId and profileId required");
        return;
    }
    request.entity_name_prefix = json::get_string(msg, "entityNamePrefix", "");
    const cJSON* mappings = cJSON_GetObjectItemCaseSensitive(msg, "entityMappings");
    if (mappings && !cJSON_IsNull(mappings)) {
        request.entity_mappings = json::duplicate(mappings);
    }

    Resolution resolution;
    std::string error;
    if (mapper_.resolve(request, resolution, error) != ESP_OK) {
        ESP_LOGW(TAG, "Session %d: %s (%s/%s)", session, error.c_str(), request.device_id.c_str(),
                 request.profile_id.c_str());
        send_error(session, error.empty() ? "Invalid message format" : error.c_str());
        return;
    }

    if (!resolution.has_mappings) {
        ESP_LOGW(TAG, "No entity mappings for %s, resolution may be incomplete", request.device_id.c_str());
        json::Ptr warning(cJSON_CreateObject());
        if (warning) {
            cJSON_AddStringToObject(warning.get(), "type", "warning");
            cJSON_AddStringToObject(warning.get(), "code", "MAPPING_NOT_FOUND");
            cJSON_AddStringToObject(warning.get(), "message",
                                    "No entity mappings found for this device. "
                                    "Run entity discovery to auto-match entities.");
            cJSON_AddStringToObject(warning.get(), "deviceId", request.device_id.c_str());
            send(session, warning.get());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session& s = sessions_[session];
        s.device_id = request.device_id;
        s.profile_id = request.profile_id;
        s.entity_ids = std::set<std::string>(resolution.entity_ids.begin(), resolution.entity_ids.end());
    }
    ESP_LOGI(TAG, "Session %d subscribed to %s/%s (%u entities)", session, request.device_id.c_str(),
             request.profile_id.c_str(), static_cast<unsigned>(resolution.entity_ids.size()));

    json::Ptr reply(cJSON_CreateObject());
    if (!reply) return;
    cJSON_AddStringToObject(reply.get(), "type", "subscribed");
    cJSON_AddStringToObject(reply.get(), "deviceId", request.device_id.c_str());
    cJSON_AddStringToObject(reply.get(), "profileId", request.profile_id.c_str());
    cJSON* entities = cJSON_AddArrayToObject(reply.get(), "entities");
    for (const std::string& id : resolution.entity_ids) {
        cJSON_AddItemToArray(entities, cJSON_CreateString(id.c_str()));
    }

    ha::StateMap initial;
    esp_err_t err = transport_.get_states(resolution.entity_ids, initial);
    if (err == ESP_OK) {
        cJSON* states = cJSON_AddObjectToObject(reply.get(), "initialStates");
        for (const auto& kv : initial) {
            cJSON* entry = cJSON_CreateObject();
            cJSON_AddStringToObject(entry, "state", kv.second->state.c_str());
            cJSON_AddItemToObject(entry, "attributes", attributes_item(*kv.second));
            cJSON_AddItemToObject(states, kv.first.c_str(), entry);
        }
    } else {
        ESP_LOGE(TAG, "Failed to fetch initial states: %s", esp_err_to_name(err));
    }
    cJSON_AddBoolToObject(reply.get(), "hasMappings", resolution.has_mappings);
    send(session, reply.get());
}

void LiveServer::on_state_change(const std::string& entity_id, const ha::StatePtr& new_state)
{
    if (entity_id.empty() || !new_state) return;

    std::vector<int> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : sessions_) {
            if (kv.second.entity_ids.count(entity_id)) targets.push_back(kv.first);
        }
    }
    if (targets.empty()) return;

    json::Ptr msg(cJSON_CreateObject());
    if (!msg) return;
    cJSON_AddStringToObject(msg.get(), "type", "state_update");
    cJSON_AddStringToObject(msg.get(), "entityId", entity_id.c_str());
    cJSON_AddStringToObject(msg.get(), "state", new_state->state.c_str());
    cJSON_AddItemToObject(msg.get(), "attributes", attributes_item(*new_state));
    cJSON_AddNumberToObject(msg.get(), "timestamp", now_epoch_ms());

    for (int session : targets) {
        send(session, msg.get());
    }
}

} // namespace live
