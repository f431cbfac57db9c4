#include "infra/transport/esp_http_client_impl.hpp"

#include <strings.h>

#include "esp_http_client.h"
#include "esp_log.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "http";

        constexpr int kReadChunk = 1024;

        esp_http_client_method_t to_method(const char *method)
        {
            if (strcasecmp(method, "POST") == 0)
                return HTTP_METHOD_POST;
            if (strcasecmp(method, "PUT") == 0)
                return HTTP_METHOD_PUT;
            if (strcasecmp(method, "DELETE") == 0)
                return HTTP_METHOD_DELETE;
            if (strcasecmp(method, "PATCH") == 0)
                return HTTP_METHOD_PATCH;
            return HTTP_METHOD_GET;
        }
    } // namespace

    EspHttpClient::EspHttpClient(int timeout_ms)
        : timeout_ms_(timeout_ms)
    {
    }

    esp_err_t EspHttpClient::request(const char *method,
                                     const std::string &url,
                                     const std::string &body,
                                     const std::string &bearer_token,
                                     HttpResponse &out)
    {
        out.status = 0;
        out.body.clear();
        if (!method || url.empty())
            return ESP_ERR_INVALID_ARG;

        esp_http_client_config_t cfg = {};
        cfg.url = url.c_str();
        cfg.timeout_ms = timeout_ms_;
        cfg.disable_auto_redirect = false;
        cfg.buffer_size = 2048;
        cfg.buffer_size_tx = 1024;
        cfg.keep_alive_enable = false;

        esp_http_client_handle_t client = esp_http_client_init(&cfg);
        if (!client)
            return ESP_ERR_NO_MEM;

        esp_http_client_set_method(client, to_method(method));
        esp_http_client_set_header(client, "Accept", "application/json");
        esp_http_client_set_header(client, "Connection", "close");
        esp_http_client_set_header(client, "Accept-Encoding", "identity");
        if (!bearer_token.empty())
        {
            const std::string auth = "Bearer " + bearer_token;
            esp_http_client_set_header(client, "Authorization", auth.c_str());
        }
        if (!body.empty())
            esp_http_client_set_header(client, "Content-Type", "application/json");

        esp_err_t err = esp_http_client_open(client, static_cast<int>(body.size()));
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%s %s: open failed: %s", method, url.c_str(), esp_err_to_name(err));
            esp_http_client_cleanup(client);
            return err;
        }
        if (!body.empty())
        {
            int written = esp_http_client_write(client, body.data(), static_cast<int>(body.size()));
            if (written < 0 || static_cast<size_t>(written) != body.size())
            {
                ESP_LOGW(TAG, "%s %s: short write", method, url.c_str());
                esp_http_client_close(client);
                esp_http_client_cleanup(client);
                return ESP_FAIL;
            }
        }

        int64_t content_length = esp_http_client_fetch_headers(client);
        if (content_length < 0)
        {
            ESP_LOGW(TAG, "%s %s: no response headers", method, url.c_str());
            esp_http_client_close(client);
            esp_http_client_cleanup(client);
            return ESP_FAIL;
        }
        out.status = esp_http_client_get_status_code(client);
        if (content_length > 0)
            out.body.reserve(static_cast<size_t>(content_length));

        char chunk[kReadChunk];
        while (true)
        {
            int r = esp_http_client_read(client, chunk, sizeof(chunk));
            if (r <= 0)
                break;
            out.body.append(chunk, static_cast<size_t>(r));
        }

        ESP_LOGD(TAG, "HTTP %s %s -> %d (%u bytes)", method, url.c_str(), out.status,
                 static_cast<unsigned>(out.body.size()));

        esp_http_client_close(client);
        esp_http_client_cleanup(client);
        return ESP_OK;
    }

} // namespace transport
