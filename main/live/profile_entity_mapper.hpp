#pragma once

#include <string>

#include "live/entity_mapper.hpp"

namespace live {

// Resolves entities from the built-in device profiles: explicit
// entityMappings first, `${name}` templates with the device prefix second.
class ProfileEntityMapper : public IEntityMapper {
public:
    esp_err_t resolve(const SubscribeRequest& request, Resolution& out, std::string& error) override;

    // "binary_sensor.kitchen_occupancy" -> "kitchen"
    static std::string derive_prefix(const std::string& device_id);
    // Replaces the first `${name}` in `pattern`.
    static std::string expand(const char* pattern, const std::string& name);
};

} // namespace live
