#include "core/json_util.hpp"

namespace json
{

    Ptr parse(const char *data, size_t len)
    {
        if (!data || len == 0)
            return Ptr();
        return Ptr(cJSON_ParseWithLength(data, len));
    }

    Ptr duplicate(const cJSON *item)
    {
        if (!item)
            return Ptr();
        return Ptr(cJSON_Duplicate(item, true));
    }

    Shared share(Ptr item)
    {
        return Shared(item.release(), Deleter());
    }

    std::string print(const cJSON *item)
    {
        if (!item)
            return std::string();
        char *text = cJSON_PrintUnformatted(item);
        if (!text)
            return std::string();
        std::string out(text);
        cJSON_free(text);
        return out;
    }

    const char *get_string(const cJSON *obj, const char *key, const char *fallback)
    {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (cJSON_IsString(item) && item->valuestring)
            return item->valuestring;
        return fallback;
    }

    bool get_int(const cJSON *obj, const char *key, int &out)
    {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (!cJSON_IsNumber(item))
            return false;
        out = item->valueint;
        return true;
    }

    bool get_bool(const cJSON *obj, const char *key, bool fallback)
    {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
        if (!cJSON_IsBool(item))
            return fallback;
        return cJSON_IsTrue(item);
    }

} // namespace json
