#include "live/live_ws_endpoint.hpp"

#include <unistd.h>

#include <utility>

#include "esp_log.h"
#include "live/status_report.hpp"

namespace live {

namespace {
const char* TAG = "live_http";

constexpr size_t kMaxFrameLen = 16 * 1024;

struct SendJob {
    httpd_handle_t hd;
    int fd;
    std::string payload;
};

void run_send_job(void* arg)
{
    std::unique_ptr<SendJob> job(static_cast<SendJob*>(arg));
    httpd_ws_frame_t frame = {};
    frame.final = true;
    frame.type = HTTPD_WS_TYPE_TEXT;
    frame.payload = reinterpret_cast<uint8_t*>(&job->payload[0]);
    frame.len = job->payload.size();
    esp_err_t err = httpd_ws_send_frame_async(job->hd, job->fd, &frame);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "ws send to %d failed: %s", job->fd, esp_err_to_name(err));
    }
}

// The endpoint owns itself; httpd must not free() it.
void keep_user_ctx(void*) {}
} // namespace

LiveWsEndpoint::LiveWsEndpoint(transport::IReadTransport& transport, IEntityMapper& mapper,
                               std::shared_ptr<const transport::TransportStatus> status, uint16_t port)
    : transport_(transport),
      status_(std::move(status)),
      port_(port),
      server_(transport, mapper, [this](int session, const std::string& payload) {
          return send_text(session, payload);
      })
{
}

LiveWsEndpoint::~LiveWsEndpoint()
{
    stop();
}

esp_err_t LiveWsEndpoint::start()
{
    if (httpd_) return ESP_OK;

    httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
    cfg.server_port = port_;
    cfg.ctrl_port = static_cast<uint16_t>(port_ + 1);
    cfg.stack_size = 8192;
    cfg.lru_purge_enable = true;
    cfg.close_fn = &LiveWsEndpoint::handle_close;
    cfg.global_user_ctx = this;
    cfg.global_user_ctx_free_fn = &keep_user_ctx;

    esp_err_t err = httpd_start(&httpd_, &cfg);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "httpd_start failed: %s", esp_err_to_name(err));
        httpd_ = nullptr;
        return err;
    }

    httpd_uri_t ws = {};
    ws.uri = "/api/live/ws";
    ws.method = HTTP_GET;
    ws.handler = &LiveWsEndpoint::handle_ws;
    ws.user_ctx = this;
    ws.is_websocket = true;
    httpd_register_uri_handler(httpd_, &ws);

    httpd_uri_t status = {};
    status.uri = "/api/status";
    status.method = HTTP_GET;
    status.handler = &LiveWsEndpoint::handle_status;
    status.user_ctx = this;
    httpd_register_uri_handler(httpd_, &status);

    err = server_.start();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Live server start failed: %s", esp_err_to_name(err));
        stop();
        return err;
    }

    ESP_LOGI(TAG, "Live tracking on :%u/api/live/ws", static_cast<unsigned>(port_));
    return ESP_OK;
}

void LiveWsEndpoint::stop()
{
    if (httpd_) {
        httpd_stop(httpd_);
        httpd_ = nullptr;
    }
    server_.stop();
}

esp_err_t LiveWsEndpoint::send_text(int sockfd, const std::string& payload)
{
    httpd_handle_t hd = httpd_;
    if (!hd) return ESP_ERR_INVALID_STATE;
    if (httpd_ws_get_fd_info(hd, sockfd) != HTTPD_WS_CLIENT_WEBSOCKET) return ESP_ERR_INVALID_STATE;

    std::unique_ptr<SendJob> job(new SendJob{hd, sockfd, payload});
    esp_err_t err = httpd_queue_work(hd, &run_send_job, job.get());
    if (err != ESP_OK) return err;
    job.release();
    return ESP_OK;
}

esp_err_t LiveWsEndpoint::handle_ws(httpd_req_t* req)
{
    auto* self = static_cast<LiveWsEndpoint*>(req->user_ctx);
    const int session = httpd_req_to_sockfd(req);
    if (req->method == HTTP_GET) {
        ESP_LOGI(TAG, "Live tracking client connected (%d)", session);
        return ESP_OK;
    }

    httpd_ws_frame_t frame = {};
    frame.type = HTTPD_WS_TYPE_TEXT;
    esp_err_t err = httpd_ws_recv_frame(req, &frame, 0);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "ws frame header from %d: %s", session, esp_err_to_name(err));
        return err;
    }
    if (frame.len == 0) return ESP_OK;
    if (frame.len > kMaxFrameLen) {
        ESP_LOGW(TAG, "ws frame from %d too large (%u bytes)", session, static_cast<unsigned>(frame.len));
        return ESP_ERR_INVALID_SIZE;
    }

    std::string buf(frame.len, '\0');
    frame.payload = reinterpret_cast<uint8_t*>(&buf[0]);
    err = httpd_ws_recv_frame(req, &frame, frame.len);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "ws frame body from %d: %s", session, esp_err_to_name(err));
        return err;
    }
    if (frame.type != HTTPD_WS_TYPE_TEXT) return ESP_OK;

    self->server_.handle_message(session, buf.data(), buf.size());
    return ESP_OK;
}

esp_err_t LiveWsEndpoint::handle_status(httpd_req_t* req)
{
    auto* self = static_cast<LiveWsEndpoint*>(req->user_ctx);
    if (!self->status_) {
        return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No transport status");
    }
    json::Ptr body = build_status_json(self->transport_, *self->status_);
    const std::string text = json::print(body.get());
    if (text.empty()) {
        return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
    }
    httpd_resp_set_type(req, "application/json");
    return httpd_resp_send(req, text.c_str(), text.size());
}

void LiveWsEndpoint::handle_close(httpd_handle_t hd, int sockfd)
{
    auto* self = static_cast<LiveWsEndpoint*>(httpd_get_global_user_ctx(hd));
    if (self) {
        self->server_.on_session_closed(sockfd);
    }
    ESP_LOGI(TAG, "Live tracking client disconnected (%d)", sockfd);
    close(sockfd);
}

} // namespace live
