#pragma once

#include "infra/transport/http_client.hpp"

namespace transport
{

    // IHttpClient over esp_http_client. One connection per request.
    class EspHttpClient : public IHttpClient
    {
    public:
        explicit EspHttpClient(int timeout_ms);

        esp_err_t request(const char *method,
                          const std::string &url,
                          const std::string &body,
                          const std::string &bearer_token,
                          HttpResponse &out) override;

    private:
        int timeout_ms_;
    };

} // namespace transport
