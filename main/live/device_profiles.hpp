#pragma once

#include <string>

namespace live {

// Entity key (as used in entityMappings) and its `${name}` template.
struct EntityTemplate {
    const char* key;
    const char* pattern;
};

struct DeviceProfile {
    const char* id;
    const char* label;
    const EntityTemplate* entities;
    int entity_count;
    // Zone target-count / occupancy templates, `%d` is the zone number.
    const char* zone_target_count_pattern;
    const char* zone_occupancy_pattern;
};

extern const DeviceProfile g_profiles[];
extern const int g_profile_count;

const DeviceProfile* find_profile(const std::string& id);

constexpr int kZoneCount = 4;
constexpr int kTrackingTargetCount = 3;

} // namespace live
