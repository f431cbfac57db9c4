#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "infra/sched/esp_timer_scheduler.hpp"

using sched::EspTimerScheduler;

namespace
{

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred())
        {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

} // namespace

TEST(EspTimerSchedulerTest, OneShotTimerFires)
{
    EspTimerScheduler scheduler;
    std::atomic<int> fired{0};
    auto timer = scheduler.create_timer("t_once", [&]()
                                        { ++fired; });
    ASSERT_EQ(ESP_OK, timer->start_once(10));
    EXPECT_TRUE(wait_until([&]()
                           { return fired.load() == 1; },
                           std::chrono::seconds(2)));
    EXPECT_FALSE(timer->is_active());
}

TEST(EspTimerSchedulerTest, BlockingTimerDoesNotHoldUpOthers)
{
    EspTimerScheduler scheduler;
    std::atomic<bool> release{false};
    std::atomic<bool> slow_started{false};
    std::atomic<int> fast{0};

    auto slow = scheduler.create_blocking_timer("t_slow", [&]()
                                                {
                                                    slow_started = true;
                                                    while (!release.load())
                                                        std::this_thread::sleep_for(std::chrono::milliseconds(5)); });
    auto quick = scheduler.create_timer("t_fast", [&]()
                                        { ++fast; });

    ASSERT_EQ(ESP_OK, slow->start_once(0));
    ASSERT_TRUE(wait_until([&]()
                           { return slow_started.load(); },
                           std::chrono::seconds(2)));

    // The slow callback is still running; plain timers keep firing.
    ASSERT_EQ(ESP_OK, quick->start_periodic(10));
    EXPECT_TRUE(wait_until([&]()
                           { return fast.load() >= 3; },
                           std::chrono::seconds(2)));
    quick->stop();

    release = true;
    slow.reset();
}

TEST(EspTimerSchedulerTest, DestroyedBlockingTimerStopsFiring)
{
    EspTimerScheduler scheduler;
    std::atomic<int> fired{0};
    auto timer = scheduler.create_blocking_timer("t_io", [&]()
                                                 { ++fired; });
    ASSERT_EQ(ESP_OK, timer->start_periodic(10));
    ASSERT_TRUE(wait_until([&]()
                           { return fired.load() >= 1; },
                           std::chrono::seconds(2)));
    timer.reset();

    const int seen = fired.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(seen, fired.load());
}
