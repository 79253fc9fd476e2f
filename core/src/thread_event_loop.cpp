/**
 * @file thread_event_loop.cpp
 * @brief Event loop on a dedicated worker thread
 */

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

#include "tankrtc/event_loop.h"
#include "tankrtc/logging.h"

namespace tankrtc
{

namespace
{

using SteadyClock = std::chrono::steady_clock;

struct ThreadTimer
{
  SteadyClock::time_point due;
  std::chrono::milliseconds period{0};  // 0 for one-shot
  Task task;
};

}  // namespace

struct ThreadEventLoop::Impl
{
  mutable std::mutex mutex;
  std::condition_variable wakeup;

  std::deque<Task> tasks;
  std::map<TimerId, ThreadTimer> timers;
  TimerId next_id = 1;

  std::atomic<bool> running{false};
  std::thread worker;

  TimerId add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds period, Task task)
  {
    TimerId id;
    {
      std::lock_guard lock(mutex);
      id = next_id++;
      timers.emplace(id, ThreadTimer{SteadyClock::now() + delay, period, std::move(task)});
    }
    wakeup.notify_one();
    return id;
  }

  // Pops the next runnable task, waiting for tasks or due timers.
  // Returns false when the loop is stopping.
  bool next_task(Task& out)
  {
    std::unique_lock lock(mutex);
    while (running.load())
    {
      if (!tasks.empty())
      {
        out = std::move(tasks.front());
        tasks.pop_front();
        return true;
      }

      auto earliest = timers.end();
      for (auto it = timers.begin(); it != timers.end(); ++it)
      {
        if (earliest == timers.end() || it->second.due < earliest->second.due)
        {
          earliest = it;
        }
      }

      if (earliest == timers.end())
      {
        wakeup.wait(lock);
        continue;
      }

      auto now = SteadyClock::now();
      if (earliest->second.due <= now)
      {
        out = earliest->second.task;
        if (earliest->second.period.count() > 0)
        {
          earliest->second.due += earliest->second.period;
        }
        else
        {
          timers.erase(earliest);
        }
        return true;
      }

      // Copy: the timer may be cancelled while we wait
      SteadyClock::time_point due = earliest->second.due;
      wakeup.wait_until(lock, due);
    }
    return false;
  }

  void run()
  {
    Task task;
    while (next_task(task))
    {
      if (task)
      {
        task();
      }
      task = nullptr;
    }
  }
};

ThreadEventLoop::ThreadEventLoop() : impl_(std::make_unique<Impl>()) {}

ThreadEventLoop::~ThreadEventLoop()
{
  stop();
}

bool ThreadEventLoop::start()
{
  if (impl_->running.exchange(true))
  {
    return false;
  }

  impl_->worker = std::thread([this]() { impl_->run(); });
  logger()->debug("event loop started");
  return true;
}

void ThreadEventLoop::stop()
{
  {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->running.exchange(false))
    {
      return;
    }
  }
  impl_->wakeup.notify_all();

  if (impl_->worker.joinable())
  {
    impl_->worker.join();
  }

  std::lock_guard lock(impl_->mutex);
  impl_->tasks.clear();
  impl_->timers.clear();
}

bool ThreadEventLoop::is_running() const
{
  return impl_->running.load();
}

void ThreadEventLoop::post(Task task)
{
  {
    std::lock_guard lock(impl_->mutex);
    impl_->tasks.push_back(std::move(task));
  }
  impl_->wakeup.notify_one();
}

TimerId ThreadEventLoop::schedule_once(std::chrono::milliseconds delay, Task task)
{
  return impl_->add_timer(delay, std::chrono::milliseconds(0), std::move(task));
}

TimerId ThreadEventLoop::schedule_repeating(std::chrono::milliseconds period, Task task)
{
  if (period.count() <= 0)
  {
    period = std::chrono::milliseconds(1);
  }
  return impl_->add_timer(period, period, std::move(task));
}

void ThreadEventLoop::cancel(TimerId id)
{
  std::lock_guard lock(impl_->mutex);
  impl_->timers.erase(id);
}

uint64_t ThreadEventLoop::now_nanos() const
{
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

}  // namespace tankrtc
