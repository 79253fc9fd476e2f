/**
 * @file event_loop_test.cpp
 */

#include "tankrtc/event_loop.h"

#include <atomic>
#include <cstdlib>
#include <future>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace tankrtc
{
namespace
{

using std::chrono::milliseconds;

constexpr uint64_t kMs = 1'000'000;

TEST(ManualEventLoopTest, PostedTasksRunInOrder)
{
  ManualEventLoop loop;
  std::vector<int> order;
  loop.post([&] { order.push_back(1); });
  loop.post([&] { order.push_back(2); });

  EXPECT_TRUE(order.empty());
  EXPECT_EQ(loop.run_pending(), 2u);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(ManualEventLoopTest, TasksPostedWhileDrainingAlsoRun)
{
  ManualEventLoop loop;
  int runs = 0;
  loop.post([&] {
    runs++;
    loop.post([&] { runs++; });
  });
  loop.run_pending();
  EXPECT_EQ(runs, 2);
}

TEST(ManualEventLoopTest, ClockMovesOnlyOnAdvance)
{
  ManualEventLoop loop(5 * kMs);
  EXPECT_EQ(loop.now_nanos(), 5 * kMs);
  loop.advance(milliseconds(20));
  EXPECT_EQ(loop.now_nanos(), 25 * kMs);
}

TEST(ManualEventLoopTest, OneShotTimerFiresAtDueTime)
{
  ManualEventLoop loop;
  uint64_t fired_at = 0;
  loop.schedule_once(milliseconds(50), [&] { fired_at = loop.now_nanos(); });

  loop.advance(milliseconds(49));
  EXPECT_EQ(fired_at, 0u);
  loop.advance(milliseconds(10));
  EXPECT_EQ(fired_at, 50 * kMs);
  EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(ManualEventLoopTest, RepeatingTimerFiresEachPeriod)
{
  ManualEventLoop loop;
  int ticks = 0;
  loop.schedule_repeating(milliseconds(100), [&] { ticks++; });

  loop.advance(milliseconds(350));
  EXPECT_EQ(ticks, 3);
  EXPECT_EQ(loop.timer_count(), 1u);
}

TEST(ManualEventLoopTest, CancelledTimerDoesNotFire)
{
  ManualEventLoop loop;
  int ticks = 0;
  TimerId id = loop.schedule_repeating(milliseconds(10), [&] { ticks++; });
  loop.advance(milliseconds(25));
  loop.cancel(id);
  loop.advance(milliseconds(100));
  EXPECT_EQ(ticks, 2);
  loop.cancel(id);
  loop.cancel(INVALID_TIMER);
}

TEST(ManualEventLoopTest, TimerMayCancelItself)
{
  ManualEventLoop loop;
  int ticks = 0;
  TimerId id = INVALID_TIMER;
  id = loop.schedule_repeating(milliseconds(10), [&] {
    ticks++;
    loop.cancel(id);
  });
  loop.advance(milliseconds(100));
  EXPECT_EQ(ticks, 1);
}

TEST(ManualEventLoopTest, SimultaneousTimersFireInSchedulingOrder)
{
  ManualEventLoop loop;
  std::vector<char> order;
  loop.schedule_once(milliseconds(10), [&] { order.push_back('a'); });
  loop.schedule_once(milliseconds(10), [&] { order.push_back('b'); });
  loop.schedule_once(milliseconds(5), [&] { order.push_back('c'); });
  loop.advance(milliseconds(10));
  EXPECT_EQ(order, (std::vector<char>{'c', 'a', 'b'}));
}

TEST(ThreadEventLoopTest, RunsPostedTasksOnWorker)
{
  ThreadEventLoop loop;
  ASSERT_TRUE(loop.start());
  EXPECT_FALSE(loop.start());

  std::promise<std::thread::id> ran_on;
  loop.post([&] { ran_on.set_value(std::this_thread::get_id()); });

  auto future = ran_on.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.is_running());
}

TEST(ThreadEventLoopTest, FiresTimers)
{
  ThreadEventLoop loop;
  ASSERT_TRUE(loop.start());

  std::promise<void> once;
  loop.schedule_once(milliseconds(10), [&] { once.set_value(); });

  std::atomic<int> ticks{0};
  std::promise<void> three_ticks;
  std::atomic<TimerId> id{INVALID_TIMER};
  id = loop.schedule_repeating(milliseconds(5), [&] {
    if (++ticks == 3)
    {
      loop.cancel(id.load());
      three_ticks.set_value();
    }
  });

  EXPECT_EQ(once.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(three_ticks.get_future().wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  loop.stop();
  EXPECT_EQ(ticks.load(), 3);
}

TEST(ThreadEventLoopTest, ClockIsWallTime)
{
  ThreadEventLoop loop;
  auto wall = std::chrono::duration_cast<std::chrono::nanoseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
  auto now = static_cast<int64_t>(loop.now_nanos());
  EXPECT_LT(std::abs(now - wall), static_cast<int64_t>(1000 * kMs));
}

}  // namespace
}  // namespace tankrtc
