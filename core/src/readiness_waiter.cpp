/**
 * @file readiness_waiter.cpp
 * @brief Readiness polling implementation
 */

#include "tankrtc/readiness_waiter.h"

#include <algorithm>

#include "tankrtc/error.h"

namespace tankrtc
{

ReadinessWaiter::ReadinessWaiter(EventLoop& loop) : loop_(loop) {}

ReadinessWaiter::~ReadinessWaiter()
{
  cancel();
}

void ReadinessWaiter::start(std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
                            ReadinessCheck check, ReadinessCallback callback)
{
  cancel();

  if (interval.count() <= 0)
  {
    interval = std::chrono::milliseconds(1);
  }

  attempts_ = 0;
  max_attempts_ = static_cast<int>(std::max<int64_t>(1, timeout.count() / interval.count()));
  check_ = std::move(check);
  callback_ = std::move(callback);
  timer_ = loop_.schedule_repeating(interval, [this]() { poll(); });
}

void ReadinessWaiter::cancel()
{
  if (timer_ != INVALID_TIMER)
  {
    loop_.cancel(timer_);
    timer_ = INVALID_TIMER;
  }
  check_ = nullptr;
  callback_ = nullptr;
}

void ReadinessWaiter::poll()
{
  if (check_ && check_())
  {
    finish({});
    return;
  }

  ++attempts_;
  if (attempts_ >= max_attempts_)
  {
    finish(SessionErrc::CHANNEL_OPEN_TIMEOUT);
  }
}

void ReadinessWaiter::finish(std::error_code result)
{
  // Detach before invoking: the callback may restart or destroy the waiter
  auto callback = std::move(callback_);
  loop_.cancel(timer_);
  timer_ = INVALID_TIMER;
  check_ = nullptr;
  callback_ = nullptr;

  if (callback)
  {
    callback(result);
  }
}

}  // namespace tankrtc
