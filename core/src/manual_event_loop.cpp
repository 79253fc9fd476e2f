/**
 * @file manual_event_loop.cpp
 * @brief Host-driven event loop
 */

#include <deque>
#include <map>

#include "tankrtc/event_loop.h"

namespace tankrtc
{

namespace
{

constexpr uint64_t kNanosPerMilli = 1'000'000;

struct ManualTimer
{
  uint64_t due_nanos = 0;
  uint64_t period_nanos = 0;  // 0 for one-shot
  Task task;
};

}  // namespace

struct ManualEventLoop::Impl
{
  uint64_t now = 0;
  std::deque<Task> tasks;
  std::map<TimerId, ManualTimer> timers;
  TimerId next_id = 1;

  explicit Impl(uint64_t start) : now(start) {}

  TimerId add_timer(uint64_t delay_nanos, uint64_t period_nanos, Task task)
  {
    TimerId id = next_id++;
    timers.emplace(id, ManualTimer{now + delay_nanos, period_nanos, std::move(task)});
    return id;
  }

  // Earliest timer due at or before limit; ties broken by id
  std::map<TimerId, ManualTimer>::iterator next_due(uint64_t limit)
  {
    auto best = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it)
    {
      if (it->second.due_nanos > limit) continue;
      if (best == timers.end() || it->second.due_nanos < best->second.due_nanos)
      {
        best = it;
      }
    }
    return best;
  }
};

ManualEventLoop::ManualEventLoop(uint64_t start_nanos)
    : impl_(std::make_unique<Impl>(start_nanos))
{
}

ManualEventLoop::~ManualEventLoop() = default;

void ManualEventLoop::post(Task task)
{
  impl_->tasks.push_back(std::move(task));
}

TimerId ManualEventLoop::schedule_once(std::chrono::milliseconds delay, Task task)
{
  return impl_->add_timer(static_cast<uint64_t>(delay.count()) * kNanosPerMilli, 0,
                          std::move(task));
}

TimerId ManualEventLoop::schedule_repeating(std::chrono::milliseconds period, Task task)
{
  uint64_t period_nanos = static_cast<uint64_t>(period.count()) * kNanosPerMilli;
  if (period_nanos == 0)
  {
    period_nanos = 1;
  }
  return impl_->add_timer(period_nanos, period_nanos, std::move(task));
}

void ManualEventLoop::cancel(TimerId id)
{
  impl_->timers.erase(id);
}

uint64_t ManualEventLoop::now_nanos() const
{
  return impl_->now;
}

size_t ManualEventLoop::run_pending()
{
  size_t count = 0;
  while (!impl_->tasks.empty())
  {
    Task task = std::move(impl_->tasks.front());
    impl_->tasks.pop_front();
    if (task)
    {
      task();
    }
    ++count;
  }
  return count;
}

void ManualEventLoop::advance(std::chrono::milliseconds duration)
{
  const uint64_t target = impl_->now + static_cast<uint64_t>(duration.count()) * kNanosPerMilli;

  run_pending();

  while (true)
  {
    auto it = impl_->next_due(target);
    if (it == impl_->timers.end()) break;

    impl_->now = it->second.due_nanos;

    // Copy before running: the task may cancel its own timer
    Task task = it->second.task;
    if (it->second.period_nanos > 0)
    {
      it->second.due_nanos += it->second.period_nanos;
    }
    else
    {
      impl_->timers.erase(it);
    }

    if (task)
    {
      task();
    }
    run_pending();
  }

  impl_->now = target;
  run_pending();
}

size_t ManualEventLoop::timer_count() const
{
  return impl_->timers.size();
}

}  // namespace tankrtc
