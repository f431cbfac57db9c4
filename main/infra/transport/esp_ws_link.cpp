#include "infra/transport/esp_ws_link.hpp"

#include <utility>

#include "esp_log.h"
#include "freertos/FreeRTOS.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "ws_link";

        constexpr uint8_t kOpText = 0x01;
        constexpr uint8_t kOpContinuation = 0x00;
        constexpr uint8_t kOpClose = 0x08;
    } // namespace

    EspWsLink::~EspWsLink()
    {
        close();
    }

    esp_err_t EspWsLink::open(const std::string &uri, Handlers handlers)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_)
            return ESP_ERR_INVALID_STATE;

        uri_ = uri;
        handlers_ = std::move(handlers);
        connected_ = false;
        close_notified_ = false;
        reset_rx_state();

        esp_websocket_client_config_t cfg = {};
        cfg.uri = uri_.c_str();
        cfg.task_name = "ha_ws";
        cfg.task_prio = 5;
        cfg.task_stack = 6144;
        cfg.buffer_size = 4096;
        cfg.disable_auto_reconnect = true;
        cfg.network_timeout_ms = 10000;

        client_ = esp_websocket_client_init(&cfg);
        if (!client_)
            return ESP_ERR_NO_MEM;

        esp_err_t err = esp_websocket_register_events(client_, WEBSOCKET_EVENT_ANY, &EspWsLink::on_event, this);
        if (err != ESP_OK)
        {
            esp_websocket_client_destroy(client_);
            client_ = nullptr;
            return err;
        }

        err = esp_websocket_client_start(client_);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "Failed to start WebSocket client: %s", esp_err_to_name(err));
            esp_websocket_client_destroy(client_);
            client_ = nullptr;
            return err;
        }

        ESP_LOGI(TAG, "WS client starting -> %s", uri_.c_str());
        return ESP_OK;
    }

    esp_err_t EspWsLink::send_text(const std::string &payload)
    {
        if (payload.empty())
            return ESP_ERR_INVALID_ARG;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!client_ || !connected_ || !esp_websocket_client_is_connected(client_))
            return ESP_ERR_INVALID_STATE;
        int ret = esp_websocket_client_send_text(client_, payload.data(), static_cast<int>(payload.size()),
                                                 pdMS_TO_TICKS(4000));
        return (ret >= 0) ? ESP_OK : ESP_FAIL;
    }

    void EspWsLink::close()
    {
        esp_websocket_client_handle_t client = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client = client_;
            client_ = nullptr;
            // Handlers must not fire once close() returns.
            close_notified_ = true;
            connected_ = false;
        }
        if (!client)
            return;
        if (esp_websocket_client_is_connected(client))
        {
            esp_err_t err = esp_websocket_client_close(client, pdMS_TO_TICKS(2000));
            if (err != ESP_OK)
                ESP_LOGW(TAG, "Graceful close failed: %s", esp_err_to_name(err));
        }
        esp_websocket_client_destroy(client);
        ESP_LOGI(TAG, "WS client closed");
    }

    bool EspWsLink::is_open() const
    {
        return connected_;
    }

    void EspWsLink::reset_rx_state()
    {
        frame_buffer_.clear();
        frame_expected_ = 0;
    }

    void EspWsLink::notify_closed()
    {
        connected_ = false;
        reset_rx_state();
        if (close_notified_.exchange(true))
            return;
        if (handlers_.on_close)
            handlers_.on_close();
    }

    void EspWsLink::on_event(void *handler_args, esp_event_base_t /*base*/, int32_t event_id, void *event_data)
    {
        auto *self = static_cast<EspWsLink *>(handler_args);
        if (self)
            self->handle_event(event_id, static_cast<const esp_websocket_event_data_t *>(event_data));
    }

    void EspWsLink::handle_event(int32_t event_id, const esp_websocket_event_data_t *event)
    {
        switch (event_id)
        {
        case WEBSOCKET_EVENT_CONNECTED:
            connected_ = true;
            ESP_LOGI(TAG, "Connected to %s", uri_.c_str());
            if (!close_notified_ && handlers_.on_open)
                handlers_.on_open();
            break;
        case WEBSOCKET_EVENT_DISCONNECTED:
        case WEBSOCKET_EVENT_CLOSED:
            ESP_LOGW(TAG, "Disconnected from %s", uri_.c_str());
            notify_closed();
            break;
        case WEBSOCKET_EVENT_DATA:
            if (!event)
                break;
            if (event->op_code == kOpClose)
            {
                notify_closed();
                break;
            }
            if (event->op_code != kOpText && event->op_code != kOpContinuation)
                break;
            if (event->payload_offset == 0)
            {
                frame_expected_ = event->payload_len;
                frame_buffer_.clear();
                if (frame_expected_ > 0)
                    frame_buffer_.reserve(frame_expected_);
            }
            if (event->data_len > 0 && event->data_ptr)
            {
                frame_buffer_.append(event->data_ptr, event->data_len);
            }
            if (frame_expected_ > 0 && frame_buffer_.size() >= frame_expected_)
            {
                if (!close_notified_ && handlers_.on_text)
                    handlers_.on_text(frame_buffer_.data(), frame_buffer_.size());
                reset_rx_state();
            }
            break;
        case WEBSOCKET_EVENT_ERROR:
            ESP_LOGE(TAG, "WebSocket error");
            break;
        default:
            break;
        }
    }

} // namespace transport
