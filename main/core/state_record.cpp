#include "core/state_record.hpp"

#include "esp_log.h"

namespace ha
{

    namespace
    {
        static const char *TAG = "state_record";
    }

    StatePtr parse_state(const cJSON *obj)
    {
        if (!cJSON_IsObject(obj))
            return nullptr;

        const char *entity_id = json::get_string(obj, "entity_id");
        if (!entity_id || !*entity_id)
        {
            ESP_LOGD(TAG, "state object without entity_id");
            return nullptr;
        }

        auto record = std::make_shared<StateRecord>();
        record->entity_id = entity_id;
        record->state = json::get_string(obj, "state", "");
        record->last_changed = json::get_string(obj, "last_changed", "");
        record->last_updated = json::get_string(obj, "last_updated", "");

        const cJSON *attrs = cJSON_GetObjectItemCaseSensitive(obj, "attributes");
        json::Ptr copy = cJSON_IsObject(attrs) ? json::duplicate(attrs) : json::Ptr(cJSON_CreateObject());
        record->attributes = json::share(std::move(copy));
        return record;
    }

    std::vector<StatePtr> parse_state_list(const cJSON *arr)
    {
        std::vector<StatePtr> out;
        if (!cJSON_IsArray(arr))
            return out;

        out.reserve(static_cast<size_t>(cJSON_GetArraySize(arr)));
        const cJSON *item = nullptr;
        cJSON_ArrayForEach(item, arr)
        {
            StatePtr record = parse_state(item);
            if (record)
                out.push_back(std::move(record));
        }
        return out;
    }

    json::Ptr attributes_copy(const StateRecord &record)
    {
        if (!record.attributes)
            return json::Ptr(cJSON_CreateObject());
        return json::duplicate(record.attributes.get());
    }

} // namespace ha
