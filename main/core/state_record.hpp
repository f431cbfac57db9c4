#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/json_util.hpp"

namespace ha
{

    // One observation of a Home Assistant entity. Never modified after parse.
    struct StateRecord
    {
        std::string entity_id;
        std::string state;
        std::string last_changed; // ISO 8601, as reported by HA
        std::string last_updated;
        json::Shared attributes; // object, never null after parse
    };

    using StatePtr = std::shared_ptr<const StateRecord>;
    using StateMap = std::map<std::string, StatePtr>;

    // Parse a HA state object ({entity_id, state, attributes, last_changed, ...}).
    // Returns nullptr if `obj` is not an object or has no entity_id.
    StatePtr parse_state(const cJSON *obj);

    // Parse an array of state objects, skipping malformed entries.
    std::vector<StatePtr> parse_state_list(const cJSON *arr);

    // Copy of the attribute object suitable for attaching to an outgoing message.
    json::Ptr attributes_copy(const StateRecord &record);

} // namespace ha
