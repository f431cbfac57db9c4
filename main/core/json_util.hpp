#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "cJSON.h"

namespace json
{

    struct Deleter
    {
        void operator()(cJSON *item) const
        {
            cJSON_Delete(item);
        }
    };

    // Owned cJSON tree.
    using Ptr = std::unique_ptr<cJSON, Deleter>;
    // Immutable tree shared between subscribers.
    using Shared = std::shared_ptr<const cJSON>;

    Ptr parse(const char *data, size_t len);

    inline Ptr parse(const std::string &text)
    {
        return parse(text.data(), text.size());
    }

    // Deep copy; returns an empty pointer for nullptr input.
    Ptr duplicate(const cJSON *item);

    Shared share(Ptr item);

    // Serialize without whitespace. Returns an empty string on failure.
    std::string print(const cJSON *item);

    // String member of an object, or `fallback` if missing / not a string.
    const char *get_string(const cJSON *obj, const char *key, const char *fallback = nullptr);

    // Integer member of an object. Returns false if missing / not a number.
    bool get_int(const cJSON *obj, const char *key, int &out);

    // Boolean member of an object, or `fallback`.
    bool get_bool(const cJSON *obj, const char *key, bool fallback);

} // namespace json
