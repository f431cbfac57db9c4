#pragma once

#include <mutex>

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include "infra/sched/scheduler.hpp"

namespace sched
{

    // esp_timer backed scheduler. Plain timer callbacks run on the esp_timer
    // task; blocking ones are handed to the "hub_io" worker task.
    class EspTimerScheduler : public IScheduler
    {
    public:
        std::unique_ptr<ITimer> create_timer(const char *name, Callback cb) override;
        std::unique_ptr<ITimer> create_blocking_timer(const char *name, Callback cb) override;
        std::int64_t now_ms() const override;

    private:
        esp_err_t ensure_worker();
        static void worker_task(void *arg);

        std::mutex mutex_;
        QueueHandle_t queue_ = nullptr;
        TaskHandle_t worker_ = nullptr;
    };

} // namespace sched
