#include "live/device_profiles.hpp"

namespace live {

namespace {

const EntityTemplate kEp1Entities[] = {
    {"presenceEntity", "binary_sensor.${name}_occupancy"},
    {"mmwaveEntity", "binary_sensor.${name}_mmwave"},
    {"pirEntity", "binary_sensor.${name}_pir"},
    {"temperatureEntity", "sensor.${name}_temperature"},
    {"humidityEntity", "sensor.${name}_humidity"},
    {"illuminanceEntity", "sensor.${name}_illuminance"},
    {"distanceEntity", "sensor.${name}_mmwave_target_distance"},
    {"speedEntity", "sensor.${name}_mmwave_target_speed"},
    {"energyEntity", "sensor.${name}_mmwave_target_energy"},
    {"targetCountEntity", "sensor.${name}_mmwave_target_count"},
    {"modeEntity", "select.${name}_mmwave_mode"},
    {"distanceMaxEntity", "number.${name}_mmwave_distance"},
    {"triggerDistanceEntity", "number.${name}_mmwave_trigger_distance"},
};

const EntityTemplate kEplEntities[] = {
    {"presenceEntity", "binary_sensor.${name}_occupancy"},
    {"illuminanceEntity", "sensor.${name}_illuminance"},
    {"trackingTargetCountEntity", "sensor.${name}_tracking_target_count"},
    {"trackingTargetsEntity", "sensor.${name}_tracking_targets"},
    {"maxDistanceEntity", "number.${name}_max_distance"},
    {"installationAngleEntity", "number.${name}_installation_angle"},
    {"assumedPresent", "binary_sensor.${name}_assumed_present"},
    {"assumedPresentRemaining", "sensor.${name}_assumed_present_remaining"},
};

} // namespace

const DeviceProfile g_profiles[] = {
    {"ep1", "Everything Presence One", kEp1Entities,
     static_cast<int>(sizeof(kEp1Entities) / sizeof(kEp1Entities[0])), nullptr, nullptr},
    {"epl", "Everything Presence Lite", kEplEntities,
     static_cast<int>(sizeof(kEplEntities) / sizeof(kEplEntities[0])),
     "sensor.${name}_zone_%d_target_count", "binary_sensor.${name}_zone_%d_occupancy"},
};

const int g_profile_count = sizeof(g_profiles) / sizeof(g_profiles[0]);

const DeviceProfile* find_profile(const std::string& id)
{
    for (int i = 0; i < g_profile_count; ++i) {
        if (id == g_profiles[i].id) return &g_profiles[i];
    }
    return nullptr;
}

} // namespace live
