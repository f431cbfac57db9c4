#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "esp_err.h"

namespace sched
{

    // Restartable timer. Callbacks of one timer never overlap.
    class ITimer
    {
    public:
        virtual ~ITimer() = default;
        virtual esp_err_t start_once(std::uint32_t delay_ms) = 0;
        virtual esp_err_t start_periodic(std::uint32_t period_ms) = 0;
        // Stopping an idle timer is a no-op.
        virtual void stop() = 0;
        virtual bool is_active() const = 0;
    };

    class IScheduler
    {
    public:
        using Callback = std::function<void()>;

        virtual ~IScheduler() = default;
        virtual std::unique_ptr<ITimer> create_timer(const char *name, Callback cb) = 0;
        // For callbacks that block on network I/O. They must not hold up
        // the other timers, so implementations run them on a worker task.
        virtual std::unique_ptr<ITimer> create_blocking_timer(const char *name, Callback cb)
        {
            return create_timer(name, std::move(cb));
        }
        // Monotonic milliseconds.
        virtual std::int64_t now_ms() const = 0;
    };

} // namespace sched
