#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "esp_err.h"

#include "core/json_util.hpp"
#include "core/state_record.hpp"

namespace transport
{

    enum class Kind
    {
        WebSocket,
        Rest,
    };

    const char *kind_name(Kind kind);

    // (entity_id, new_state, old_state). old_state may be null; new_state is null
    // when HA reports the entity as removed.
    using StateChangeCallback = std::function<void(const std::string &entity_id,
                                                    const ha::StatePtr &new_state,
                                                    const ha::StatePtr &old_state)>;

    using SubscriptionId = std::uint32_t;
    constexpr SubscriptionId kInvalidSubscription = 0;

    // Read side of the Home Assistant connection. Both implementations offer
    // the same operations; callers only look at kind() for status reporting.
    class IReadTransport
    {
    public:
        virtual ~IReadTransport() = default;

        virtual Kind kind() const = 0;

        virtual esp_err_t connect() = 0;
        virtual void disconnect() = 0;
        virtual bool is_connected() const = 0;
        virtual esp_err_t wait_until_ready() = 0;

        // Discovery (raw registry arrays as returned by HA).
        virtual esp_err_t list_devices(json::Ptr &out) = 0;
        virtual esp_err_t list_entity_registry(json::Ptr &out) = 0;
        virtual esp_err_t list_area_registry(json::Ptr &out) = 0;
        virtual esp_err_t get_services_for_target(const cJSON *target, bool expand_group, json::Ptr &out) = 0;
        // Sorted "domain.service" names.
        virtual esp_err_t get_services_by_domain(const std::string &domain, std::vector<std::string> &out) = 0;

        // State queries always hit HA directly.
        // ESP_ERR_NOT_FOUND if the entity does not exist.
        virtual esp_err_t get_state(const std::string &entity_id, ha::StatePtr &out) = 0;
        // `out` receives only the ids that exist upstream.
        virtual esp_err_t get_states(const std::vector<std::string> &entity_ids, ha::StateMap &out) = 0;
        virtual esp_err_t get_all_states(std::vector<ha::StatePtr> &out) = 0;

        // Empty `entity_ids` means every entity.
        virtual SubscriptionId subscribe_to_state_changes(const std::vector<std::string> &entity_ids,
                                                          StateChangeCallback cb) = 0;
        virtual void unsubscribe(SubscriptionId id) = 0;
        virtual void unsubscribe_all() = 0;
    };

} // namespace transport
