#pragma once

/**
 * @file readiness_waiter.h
 * @brief Bounded, cancellable polling for a readiness condition
 */

#include <chrono>
#include <functional>
#include <system_error>

#include "tankrtc/event_loop.h"

namespace tankrtc
{

/**
 * @brief Predicate polled by the waiter
 */
using ReadinessCheck = std::function<bool()>;

/**
 * @brief Completion: empty code when ready, CHANNEL_OPEN_TIMEOUT otherwise
 */
using ReadinessCallback = std::function<void(std::error_code)>;

/**
 * @brief Waits for a condition by polling it on an event loop
 *
 * The condition is checked once per interval, never synchronously from
 * start(). After max_attempts failed checks the callback receives
 * SessionErrc::CHANNEL_OPEN_TIMEOUT. cancel() stops polling without invoking
 * the callback. Destroying the waiter cancels it.
 */
class ReadinessWaiter
{
 public:
  explicit ReadinessWaiter(EventLoop& loop);
  ~ReadinessWaiter();

  // Disable copy
  ReadinessWaiter(const ReadinessWaiter&) = delete;
  ReadinessWaiter& operator=(const ReadinessWaiter&) = delete;

  /**
   * @brief Begin waiting; a wait already in progress is cancelled first
   * @param interval Poll period
   * @param timeout Total wait budget (attempts = timeout / interval)
   * @param check Readiness predicate
   * @param callback Invoked exactly once unless cancelled
   */
  void start(std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
             ReadinessCheck check, ReadinessCallback callback);

  /**
   * @brief Stop polling; the callback is not invoked
   */
  void cancel();

  [[nodiscard]] bool is_waiting() const
  {
    return timer_ != INVALID_TIMER;
  }

  [[nodiscard]] int attempts() const
  {
    return attempts_;
  }

 private:
  void poll();
  void finish(std::error_code result);

  EventLoop& loop_;
  TimerId timer_ = INVALID_TIMER;
  int attempts_ = 0;
  int max_attempts_ = 0;
  ReadinessCheck check_;
  ReadinessCallback callback_;
};

}  // namespace tankrtc
