#pragma once

#include <string>

#include "esp_err.h"

namespace transport
{

    struct HttpResponse
    {
        int status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    // Blocking request/response HTTP client.
    // Returns ESP_OK whenever a response was received, whatever its status;
    // transport failures are reported as errors with `out.status == 0`.
    class IHttpClient
    {
    public:
        virtual ~IHttpClient() = default;

        // method: "GET", "POST", ...
        // body: sent as application/json when non-empty
        // bearer_token: Authorization: Bearer <token> when non-empty
        virtual esp_err_t request(const char *method,
                                  const std::string &url,
                                  const std::string &body,
                                  const std::string &bearer_token,
                                  HttpResponse &out) = 0;
    };

} // namespace transport
