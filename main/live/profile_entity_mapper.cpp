#include "live/profile_entity_mapper.hpp"

#include <cstdio>
#include <set>

#include "esp_log.h"
#include "live/device_profiles.hpp"

namespace live {

namespace {
const char* TAG = "entity_map";

const char* const kDomainPrefixes[] = {"sensor.", "binary_sensor.", "number."};
const char* const kDeviceSuffixes[] = {"_occupancy", "_mmwave_target_distance"};
const char* const kTargetProps[] = {"x", "y", "distance", "speed", "angle", "resolution", "active"};

bool starts_with(const std::string& s, const char* prefix, size_t len)
{
    return s.size() >= len && s.compare(0, len, prefix) == 0;
}

bool ends_with(const std::string& s, const char* suffix, size_t len)
{
    return s.size() >= len && s.compare(s.size() - len, len, suffix) == 0;
}

// Object form of entityMappings; JSON text is parsed into `storage`.
const cJSON* mappings_object(const cJSON* raw, json::Ptr& storage)
{
    if (cJSON_IsObject(raw)) return raw;
    if (cJSON_IsString(raw) && raw->valuestring) {
        storage = json::parse(std::string(raw->valuestring));
        if (cJSON_IsObject(storage.get())) return storage.get();
        ESP_LOGW(TAG, "Invalid entityMappings JSON in subscribe request");
    }
    return nullptr;
}

class Collector {
public:
    Collector(const cJSON* mappings, const std::string& name, std::vector<std::string>& out)
        : mappings_(mappings), name_(name), out_(out) {}

    void add(const char* key, const char* pattern)
    {
        const char* stored = json::get_string(mappings_, key);
        if (stored && *stored) {
            push(stored);
        } else if (pattern && !name_.empty()) {
            push(ProfileEntityMapper::expand(pattern, name_));
        }
    }

    void add_target(int target, const char* prop)
    {
        char key[16];
        std::snprintf(key, sizeof(key), "target%d", target);
        const cJSON* targets = cJSON_GetObjectItemCaseSensitive(mappings_, "trackingTargets");
        const char* stored = json::get_string(cJSON_GetObjectItemCaseSensitive(targets, key), prop);
        if (stored && *stored) {
            push(stored);
            return;
        }
        if (name_.empty()) return;
        char id[160];
        std::snprintf(id, sizeof(id), "%s.%s_target_%d_%s",
                      std::string(prop) == "active" ? "binary_sensor" : "sensor", name_.c_str(), target, prop);
        push(id);
    }

private:
    void push(const std::string& id)
    {
        if (seen_.insert(id).second) out_.push_back(id);
    }

    const cJSON* mappings_;
    const std::string& name_;
    std::vector<std::string>& out_;
    std::set<std::string> seen_;
};
} // namespace

std::string ProfileEntityMapper::derive_prefix(const std::string& device_id)
{
    std::string name = device_id;
    for (const char* prefix : kDomainPrefixes) {
        size_t len = std::char_traits<char>::length(prefix);
        if (starts_with(name, prefix, len)) {
            name.erase(0, len);
            break;
        }
    }
    for (const char* suffix : kDeviceSuffixes) {
        size_t len = std::char_traits<char>::length(suffix);
        if (ends_with(name, suffix, len)) {
            name.erase(name.size() - len);
            break;
        }
    }
    return name;
}

std::string ProfileEntityMapper::expand(const char* pattern, const std::string& name)
{
    std::string out = pattern ? pattern : "";
    const std::string token = "${name}";
    size_t pos = out.find(token);
    if (pos != std::string::npos) out.replace(pos, token.size(), name);
    return out;
}

esp_err_t ProfileEntityMapper::resolve(const SubscribeRequest& request, Resolution& out, std::string& error)
{
    out = Resolution();

    const DeviceProfile* profile = find_profile(request.profile_id);
    if (!profile) {
        error = "Profile not found";
        return ESP_ERR_NOT_FOUND;
    }

    const std::string name = request.entity_name_prefix.empty() ? derive_prefix(request.device_id)
                                                                : request.entity_name_prefix;
    if (name.empty()) {
        error = "Could not determine entity name prefix";
        return ESP_ERR_INVALID_ARG;
    }

    json::Ptr parsed;
    const cJSON* mappings = mappings_object(request.entity_mappings.get(), parsed);
    out.has_mappings = mappings != nullptr;

    Collector collect(mappings, name, out.entity_ids);
    for (int i = 0; i < profile->entity_count; ++i) {
        collect.add(profile->entities[i].key, profile->entities[i].pattern);
    }

    if (profile->zone_target_count_pattern || profile->zone_occupancy_pattern) {
        for (int zone = 1; zone <= kZoneCount; ++zone) {
            char key[32];
            char pattern[96];
            if (profile->zone_target_count_pattern) {
                std::snprintf(key, sizeof(key), "zone%dTargetCount", zone);
                std::snprintf(pattern, sizeof(pattern), profile->zone_target_count_pattern, zone);
                collect.add(key, pattern);
            }
            if (profile->zone_occupancy_pattern) {
                std::snprintf(key, sizeof(key), "zone%dOccupancy", zone);
                std::snprintf(pattern, sizeof(pattern), profile->zone_occupancy_pattern, zone);
                collect.add(key, pattern);
            }
        }
    }

    for (int target = 1; target <= kTrackingTargetCount; ++target) {
        for (const char* prop : kTargetProps) {
            collect.add_target(target, prop);
        }
    }

    ESP_LOGI(TAG, "%s/%s -> %u entities (prefix '%s'%s)", request.device_id.c_str(), profile->id,
             static_cast<unsigned>(out.entity_ids.size()), name.c_str(), out.has_mappings ? ", mapped" : "");
    return ESP_OK;
}

} // namespace live
