#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "esp_event.h"
#include "esp_websocket_client.h"

#include "infra/transport/ws_link.hpp"

namespace transport
{

    // IWsLink over esp_websocket_client. Auto-reconnect is disabled: the
    // owning transport decides when to reopen.
    class EspWsLink : public IWsLink
    {
    public:
        ~EspWsLink() override;

        esp_err_t open(const std::string &uri, Handlers handlers) override;
        esp_err_t send_text(const std::string &payload) override;
        void close() override;
        bool is_open() const override;

    private:
        static void on_event(void *handler_args, esp_event_base_t base, int32_t event_id, void *event_data);
        void handle_event(int32_t event_id, const esp_websocket_event_data_t *event);
        void reset_rx_state();
        void notify_closed();

        std::mutex mutex_;
        esp_websocket_client_handle_t client_ = nullptr;
        std::string uri_;
        Handlers handlers_;
        std::atomic<bool> connected_{false};
        std::atomic<bool> close_notified_{false};
        std::string frame_buffer_;
        size_t frame_expected_ = 0;
    };

} // namespace transport
