#pragma once

#include <string>
#include <vector>

#include "esp_err.h"
#include "core/json_util.hpp"

namespace live {

// Body of a downstream "subscribe" request.
struct SubscribeRequest {
    std::string device_id;
    std::string profile_id;
    std::string entity_name_prefix; // optional
    json::Ptr entity_mappings;      // optional; object or JSON text
};

struct Resolution {
    std::vector<std::string> entity_ids; // no duplicates, stable order
    bool has_mappings = false;
};

// Resolves the entities a session watches for one device/profile pair.
class IEntityMapper {
public:
    virtual ~IEntityMapper() = default;

    // On failure `error` holds the text sent back to the session.
    virtual esp_err_t resolve(const SubscribeRequest& request, Resolution& out, std::string& error) = 0;
};

} // namespace live
