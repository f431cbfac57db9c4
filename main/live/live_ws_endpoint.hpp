#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "esp_err.h"
#include "esp_http_server.h"

#include "infra/transport/i_read_transport.hpp"
#include "infra/transport/transport_factory.hpp"
#include "live/entity_mapper.hpp"
#include "live/live_server.hpp"

namespace live {

// httpd front end of the live server: WebSocket sessions on /api/live/ws
// (one session per socket) and GET /api/status.
class LiveWsEndpoint {
public:
    LiveWsEndpoint(transport::IReadTransport& transport, IEntityMapper& mapper,
                   std::shared_ptr<const transport::TransportStatus> status, uint16_t port);
    ~LiveWsEndpoint();

    LiveWsEndpoint(const LiveWsEndpoint&) = delete;
    LiveWsEndpoint& operator=(const LiveWsEndpoint&) = delete;

    esp_err_t start();
    void stop();

    LiveServer& server() { return server_; }

private:
    static esp_err_t handle_ws(httpd_req_t* req);
    static esp_err_t handle_status(httpd_req_t* req);
    static void handle_close(httpd_handle_t hd, int sockfd);

    esp_err_t send_text(int sockfd, const std::string& payload);

    transport::IReadTransport& transport_;
    std::shared_ptr<const transport::TransportStatus> status_;
    uint16_t port_;
    httpd_handle_t httpd_ = nullptr;
    LiveServer server_;
};

} // namespace live
