/**
 * @file readiness_waiter_test.cpp
 */

#include "tankrtc/readiness_waiter.h"

#include <memory>
#include <optional>

#include <gtest/gtest.h>

#include "tankrtc/error.h"

namespace tankrtc
{
namespace
{

using std::chrono::milliseconds;

class ReadinessWaiterTest : public ::testing::Test
{
 protected:
  void start(milliseconds timeout = milliseconds(500))
  {
    waiter_.start(milliseconds(100), timeout, [this] { return ready_; },
                  [this](std::error_code ec) {
                    calls_++;
                    result_ = ec;
                  });
  }

  ManualEventLoop loop_;
  ReadinessWaiter waiter_{loop_};
  bool ready_ = false;
  int calls_ = 0;
  std::optional<std::error_code> result_;
};

TEST_F(ReadinessWaiterTest, NeverCompletesSynchronously)
{
  ready_ = true;
  start();
  loop_.run_pending();
  EXPECT_FALSE(result_.has_value());
  EXPECT_TRUE(waiter_.is_waiting());
}

TEST_F(ReadinessWaiterTest, CompletesOnFirstPollAfterReady)
{
  start();
  loop_.advance(milliseconds(250));
  EXPECT_FALSE(result_.has_value());

  ready_ = true;
  loop_.advance(milliseconds(100));
  ASSERT_TRUE(result_.has_value());
  EXPECT_FALSE(*result_);
  EXPECT_EQ(calls_, 1);
  EXPECT_FALSE(waiter_.is_waiting());
}

TEST_F(ReadinessWaiterTest, TimesOutAfterBoundedAttempts)
{
  start(milliseconds(500));
  loop_.advance(milliseconds(400));
  EXPECT_FALSE(result_.has_value());

  loop_.advance(milliseconds(100));
  ASSERT_TRUE(result_.has_value());
  EXPECT_EQ(*result_, SessionErrc::CHANNEL_OPEN_TIMEOUT);
  EXPECT_EQ(waiter_.attempts(), 5);

  loop_.advance(milliseconds(1000));
  EXPECT_EQ(calls_, 1);
  EXPECT_EQ(loop_.timer_count(), 0u);
}

TEST_F(ReadinessWaiterTest, FiveSecondBudgetIsFiftyAttempts)
{
  start(milliseconds(5000));
  loop_.advance(milliseconds(4900));
  EXPECT_FALSE(result_.has_value());
  loop_.advance(milliseconds(100));
  ASSERT_TRUE(result_.has_value());
  EXPECT_EQ(waiter_.attempts(), 50);
}

TEST_F(ReadinessWaiterTest, CancelSuppressesCallback)
{
  start();
  loop_.advance(milliseconds(200));
  waiter_.cancel();
  ready_ = true;
  loop_.advance(milliseconds(1000));
  EXPECT_EQ(calls_, 0);
  EXPECT_EQ(loop_.timer_count(), 0u);
}

TEST_F(ReadinessWaiterTest, RestartReplacesPendingWait)
{
  start();
  loop_.advance(milliseconds(300));
  start();
  loop_.advance(milliseconds(400));
  EXPECT_EQ(calls_, 0);
  loop_.advance(milliseconds(100));
  EXPECT_EQ(calls_, 1);
}

TEST_F(ReadinessWaiterTest, DestructionCancels)
{
  auto waiter = std::make_unique<ReadinessWaiter>(loop_);
  bool called = false;
  waiter->start(milliseconds(100), milliseconds(500), [] { return true; },
                [&](std::error_code) { called = true; });
  waiter.reset();
  loop_.advance(milliseconds(500));
  EXPECT_FALSE(called);
  EXPECT_EQ(loop_.timer_count(), 0u);
}

}  // namespace
}  // namespace tankrtc
