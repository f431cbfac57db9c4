#include "config/config_store.hpp"

#include "esp_check.h"
#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"

namespace config_store
{

    namespace
    {
        const char *TAG = "cfg_store";
        const char *NS = "hub";
        const char *KEY_OVERRIDES = "overrides";

        esp_err_t open_handle(nvs_handle_t &handle, nvs_open_mode_t mode)
        {
            esp_err_t err = nvs_open(NS, mode, &handle);
            if (err != ESP_OK && err != ESP_ERR_NVS_NOT_FOUND)
            {
                ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(err));
            }
            return err;
        }

        template <typename T>
        esp_err_t load_blob(const char *key, T &item, bool &found)
        {
            found = false;
            nvs_handle_t handle{};
            esp_err_t err = open_handle(handle, NVS_READONLY);
            if (err == ESP_ERR_NVS_NOT_FOUND)
                return ESP_OK; // namespace not created yet
            ESP_RETURN_ON_ERROR(err, TAG, "open_handle failed");

            size_t len = sizeof(T);
            err = nvs_get_blob(handle, key, &item, &len);
            nvs_close(handle);
            if (err == ESP_ERR_NVS_NOT_FOUND)
                return ESP_OK;
            ESP_RETURN_ON_ERROR(err, TAG, "nvs_get_blob %s failed", key);
            if (len != sizeof(T))
            {
                ESP_LOGW(TAG, "%s has unexpected size %u, ignoring", key, static_cast<unsigned>(len));
                item = T();
                return ESP_OK;
            }
            found = true;
            return ESP_OK;
        }

        template <typename T>
        esp_err_t save_blob(const char *key, const T &item)
        {
            nvs_handle_t handle{};
            ESP_RETURN_ON_ERROR(open_handle(handle, NVS_READWRITE), TAG, "open_handle failed");

            esp_err_t err = nvs_set_blob(handle, key, &item, sizeof(T));
            if (err == ESP_OK)
                err = nvs_commit(handle);
            if (err != ESP_OK)
                ESP_LOGE(TAG, "saving %s failed: %s", key, esp_err_to_name(err));
            nvs_close(handle);
            return err;
        }

    } // namespace

    esp_err_t init()
    {
        esp_err_t err = nvs_flash_init();
        if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND)
        {
            ESP_LOGW(TAG, "NVS partition needs erase (%s)", esp_err_to_name(err));
            ESP_RETURN_ON_ERROR(nvs_flash_erase(), TAG, "nvs_flash_erase failed");
            err = nvs_flash_init();
        }
        return err;
    }

    esp_err_t load_overrides(HubOverrides &out, bool &found)
    {
        out = HubOverrides();
        return load_blob(KEY_OVERRIDES, out, found);
    }

    esp_err_t save_overrides(const HubOverrides &overrides)
    {
        return save_blob(KEY_OVERRIDES, overrides);
    }

    esp_err_t clear_overrides()
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle, NVS_READWRITE), TAG, "open_handle failed");
        esp_err_t err = nvs_erase_key(handle, KEY_OVERRIDES);
        if (err == ESP_ERR_NVS_NOT_FOUND)
            err = ESP_OK;
        if (err == ESP_OK)
            err = nvs_commit(handle);
        nvs_close(handle);
        return err;
    }

} // namespace config_store
