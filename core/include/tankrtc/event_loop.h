#pragma once

/**
 * @file event_loop.h
 * @brief Single execution context for session state
 *
 * All session state is mutated from tasks and timers run by one EventLoop.
 * Two implementations are provided:
 * - ManualEventLoop: virtual clock advanced by the host (tests, frame-driven hosts)
 * - ThreadEventLoop: one worker thread with a timer queue
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace tankrtc
{

/**
 * @brief Unit of work run on the loop
 */
using Task = std::function<void()>;

/**
 * @brief Timer identifier (0 is never a valid id)
 */
using TimerId = uint64_t;

constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Event loop interface
 */
class EventLoop
{
 public:
  virtual ~EventLoop() = default;

  /**
   * @brief Queue a task to run on the loop
   */
  virtual void post(Task task) = 0;

  /**
   * @brief Run a task once after a delay
   * @return Timer id usable with cancel()
   */
  virtual TimerId schedule_once(std::chrono::milliseconds delay, Task task) = 0;

  /**
   * @brief Run a task every period, first run one period from now
   * @return Timer id usable with cancel()
   */
  virtual TimerId schedule_repeating(std::chrono::milliseconds period, Task task) = 0;

  /**
   * @brief Cancel a timer; unknown or fired ids are ignored
   */
  virtual void cancel(TimerId id) = 0;

  /**
   * @brief Wall-clock time in nanoseconds since the Unix epoch
   */
  [[nodiscard]] virtual uint64_t now_nanos() const = 0;

 protected:
  EventLoop() = default;
};

/**
 * @brief Event loop driven explicitly by its owner
 *
 * Time only moves on advance(). Posted tasks run on run_pending() or
 * advance(). Timers due at the same instant fire in scheduling order.
 */
class ManualEventLoop : public EventLoop
{
 public:
  explicit ManualEventLoop(uint64_t start_nanos = 0);
  ~ManualEventLoop() override;

  // Disable copy
  ManualEventLoop(const ManualEventLoop&) = delete;
  ManualEventLoop& operator=(const ManualEventLoop&) = delete;

  void post(Task task) override;
  TimerId schedule_once(std::chrono::milliseconds delay, Task task) override;
  TimerId schedule_repeating(std::chrono::milliseconds period, Task task) override;
  void cancel(TimerId id) override;
  [[nodiscard]] uint64_t now_nanos() const override;

  /**
   * @brief Run queued tasks until the queue is empty
   * @return Number of tasks run
   */
  size_t run_pending();

  /**
   * @brief Move the clock forward, firing due timers in order
   *
   * Pending tasks are drained before and after every timer.
   */
  void advance(std::chrono::milliseconds duration);

  /**
   * @brief Number of live timers
   */
  [[nodiscard]] size_t timer_count() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Event loop running on its own worker thread
 */
class ThreadEventLoop : public EventLoop
{
 public:
  ThreadEventLoop();
  ~ThreadEventLoop() override;

  // Disable copy
  ThreadEventLoop(const ThreadEventLoop&) = delete;
  ThreadEventLoop& operator=(const ThreadEventLoop&) = delete;

  /**
   * @brief Start the worker thread
   * @return False if already running
   */
  bool start();

  /**
   * @brief Stop the worker thread; queued tasks are dropped
   */
  void stop();

  [[nodiscard]] bool is_running() const;

  void post(Task task) override;
  TimerId schedule_once(std::chrono::milliseconds delay, Task task) override;
  TimerId schedule_repeating(std::chrono::milliseconds period, Task task) override;
  void cancel(TimerId id) override;
  [[nodiscard]] uint64_t now_nanos() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tankrtc
