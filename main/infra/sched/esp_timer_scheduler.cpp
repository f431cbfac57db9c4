#include "infra/sched/esp_timer_scheduler.hpp"

#include <atomic>
#include <utility>

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

namespace sched
{

    namespace
    {
        static const char *TAG = "sched";

        class EspTimer : public ITimer
        {
        public:
            EspTimer(const char *name, IScheduler::Callback cb)
                : name_(name ? name : "hub_timer"), cb_(std::move(cb))
            {
                esp_timer_create_args_t args = {};
                args.callback = &EspTimer::on_fire;
                args.arg = this;
                args.dispatch_method = ESP_TIMER_TASK;
                args.name = name_;
                esp_err_t err = esp_timer_create(&args, &handle_);
                if (err != ESP_OK)
                {
                    ESP_LOGE(TAG, "esp_timer_create(%s) failed: %s", name_, esp_err_to_name(err));
                    handle_ = nullptr;
                }
            }

            ~EspTimer() override
            {
                if (!handle_)
                    return;
                stop();
                esp_timer_delete(handle_);
            }

            esp_err_t start_once(std::uint32_t delay_ms) override
            {
                if (!handle_)
                    return ESP_ERR_INVALID_STATE;
                stop();
                return esp_timer_start_once(handle_, static_cast<std::uint64_t>(delay_ms) * 1000ULL);
            }

            esp_err_t start_periodic(std::uint32_t period_ms) override
            {
                if (!handle_)
                    return ESP_ERR_INVALID_STATE;
                stop();
                return esp_timer_start_periodic(handle_, static_cast<std::uint64_t>(period_ms) * 1000ULL);
            }

            void stop() override
            {
                if (handle_ && esp_timer_is_active(handle_))
                {
                    (void)esp_timer_stop(handle_);
                }
            }

            bool is_active() const override
            {
                return handle_ && esp_timer_is_active(handle_);
            }

        private:
            static void on_fire(void *arg)
            {
                auto *self = static_cast<EspTimer *>(arg);
                if (self->cb_)
                    self->cb_();
            }

            const char *name_;
            IScheduler::Callback cb_;
            esp_timer_handle_t handle_ = nullptr;
        };

        // Work item of a blocking timer. Fires are coalesced while one is queued.
        struct IoJob
        {
            IScheduler::Callback cb;
            std::mutex run_mutex;
            std::atomic<bool> queued{false};
            std::atomic<bool> alive{true};
        };

        using IoJobRef = std::weak_ptr<IoJob>;

        // esp_timer only enqueues; the callback itself runs on the worker task.
        class BlockingTimer : public ITimer
        {
        public:
            BlockingTimer(const char *name, QueueHandle_t queue, IScheduler::Callback cb)
                : job_(std::make_shared<IoJob>())
            {
                job_->cb = std::move(cb);
                IoJobRef weak = job_;
                timer_.reset(new EspTimer(name, [queue, weak, name]()
                                          {
                                              std::shared_ptr<IoJob> job = weak.lock();
                                              if (!job || job->queued.exchange(true))
                                                  return;
                                              auto *item = new IoJobRef(job);
                                              if (xQueueSend(queue, &item, 0) != pdTRUE)
                                              {
                                                  ESP_LOGW(TAG, "I/O queue full, %s tick dropped", name ? name : "timer");
                                                  delete item;
                                                  job->queued = false;
                                              } }));
            }

            ~BlockingTimer() override
            {
                timer_.reset();
                job_->alive = false;
                // Wait out a callback that is running right now.
                std::lock_guard<std::mutex> lock(job_->run_mutex);
            }

            esp_err_t start_once(std::uint32_t delay_ms) override { return timer_->start_once(delay_ms); }
            esp_err_t start_periodic(std::uint32_t period_ms) override { return timer_->start_periodic(period_ms); }
            void stop() override { timer_->stop(); }
            bool is_active() const override { return timer_->is_active(); }

        private:
            std::shared_ptr<IoJob> job_;
            std::unique_ptr<EspTimer> timer_;
        };

    } // namespace

    void EspTimerScheduler::worker_task(void *arg)
    {
        QueueHandle_t queue = static_cast<QueueHandle_t>(arg);
        IoJobRef *item = nullptr;
        while (true)
        {
            if (xQueueReceive(queue, &item, portMAX_DELAY) != pdTRUE)
                continue;
            std::shared_ptr<IoJob> job = item->lock();
            delete item;
            if (!job)
                continue;
            job->queued = false;
            std::lock_guard<std::mutex> lock(job->run_mutex);
            if (job->alive && job->cb)
                job->cb();
        }
    }

    esp_err_t EspTimerScheduler::ensure_worker()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_)
            queue_ = xQueueCreate(8, sizeof(IoJobRef *));
        if (!queue_)
            return ESP_ERR_NO_MEM;
        if (!worker_)
        {
            if (xTaskCreate(&EspTimerScheduler::worker_task, "hub_io", 6144, queue_, 4, &worker_) != pdPASS)
            {
                worker_ = nullptr;
                return ESP_FAIL;
            }
        }
        return ESP_OK;
    }

    std::unique_ptr<ITimer> EspTimerScheduler::create_blocking_timer(const char *name, Callback cb)
    {
        esp_err_t err = ensure_worker();
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "I/O worker unavailable (%s), %s runs on the timer task",
                     esp_err_to_name(err), name ? name : "timer");
            return create_timer(name, std::move(cb));
        }
        return std::unique_ptr<ITimer>(new BlockingTimer(name, queue_, std::move(cb)));
    }

    std::unique_ptr<ITimer> EspTimerScheduler::create_timer(const char *name, Callback cb)
    {
        return std::unique_ptr<ITimer>(new EspTimer(name, std::move(cb)));
    }

    std::int64_t EspTimerScheduler::now_ms() const
    {
        return esp_timer_get_time() / 1000;
    }

} // namespace sched
