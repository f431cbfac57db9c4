#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "esp_err.h"

namespace transport
{

    // One full-duplex text channel. open() is asynchronous: on_open fires once
    // the socket is up, on_close once it is gone (including failed opens).
    // Handlers may run on the link's own task; they must not call close().
    class IWsLink
    {
    public:
        struct Handlers
        {
            std::function<void()> on_open;
            std::function<void(const char *data, size_t len)> on_text;
            std::function<void()> on_close;
        };

        virtual ~IWsLink() = default;

        virtual esp_err_t open(const std::string &uri, Handlers handlers) = 0;
        virtual esp_err_t send_text(const std::string &payload) = 0;
        // Synchronous teardown; no handler fires after close() returns.
        virtual void close() = 0;
        virtual bool is_open() const = 0;
    };

} // namespace transport
