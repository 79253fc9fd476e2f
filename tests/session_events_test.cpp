/**
 * @file session_events_test.cpp
 */

#include "tankrtc/session/session_events.h"

#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tankrtc/session/leg_state.h"

namespace tankrtc
{
namespace session
{
namespace
{

TEST(EventBusTest, DeliversToAllSubscribersInOrder)
{
  EventBus bus;
  std::vector<std::string> seen;
  bus.subscribe([&](const SessionEvent& e) { seen.push_back(std::string("a:") + event_name(e)); });
  bus.subscribe([&](const SessionEvent& e) { seen.push_back(std::string("b:") + event_name(e)); });

  bus.publish(Connected{});
  EXPECT_EQ(seen, (std::vector<std::string>{"a:connected", "b:connected"}));
}

TEST(EventBusTest, UnsubscribeStopsDelivery)
{
  EventBus bus;
  int count = 0;
  SubscriptionId id = bus.subscribe([&](const SessionEvent&) { count++; });
  bus.publish(Connected{});
  EXPECT_TRUE(bus.unsubscribe(id));
  EXPECT_FALSE(bus.unsubscribe(id));
  bus.publish(Connected{});
  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST(EventBusTest, HandlerMayUnsubscribeAnotherDuringPublish)
{
  EventBus bus;
  int second_calls = 0;
  SubscriptionId second = 0;
  bus.subscribe([&](const SessionEvent&) { bus.unsubscribe(second); });
  second = bus.subscribe([&](const SessionEvent&) { second_calls++; });

  bus.publish(Disconnected{});
  EXPECT_EQ(second_calls, 0);
}

TEST(EventBusTest, PayloadIsDeliveredIntact)
{
  EventBus bus;
  std::optional<SourceAdded> added;
  bus.subscribe([&](const SessionEvent& e) {
    if (auto* p = std::get_if<SourceAdded>(&e))
    {
      added = *p;
    }
  });

  bus.publish(SourceAdded{"p1", 42});
  ASSERT_TRUE(added.has_value());
  EXPECT_EQ(added->participant_id, "p1");
  EXPECT_EQ(added->handle_id, 42u);
}

TEST(EventBusTest, EventNames)
{
  EXPECT_STREQ(event_name(SourceRemoved{"p"}), "source-removed");
  EXPECT_STREQ(event_name(FrameUpdated{"p", 1, 2}), "frame-updated");
  EXPECT_STREQ(event_name(LegStateChanged{LegKind::VIEW_VIDEO, true}), "leg-state-changed");
  EXPECT_STREQ(event_name(SessionError{"m", {}, "c"}), "error");
}

TEST(LegStateTest, FamiliesAndSiblings)
{
  EXPECT_EQ(family_of(LegKind::SEND_AUDIO), ChannelFamily::AUDIO);
  EXPECT_EQ(family_of(LegKind::LISTEN_AUDIO), ChannelFamily::AUDIO);
  EXPECT_EQ(family_of(LegKind::SEND_VIDEO), ChannelFamily::VIDEO);
  EXPECT_EQ(family_of(LegKind::VIEW_VIDEO), ChannelFamily::VIDEO);

  for (LegKind leg : ALL_LEGS)
  {
    EXPECT_EQ(sibling_of(sibling_of(leg)), leg);
    EXPECT_EQ(family_of(sibling_of(leg)), family_of(leg));
    EXPECT_NE(sibling_of(leg), leg);
  }

  EXPECT_STREQ(to_string(LegKind::VIEW_VIDEO), "view-video");
  EXPECT_STREQ(to_string(LegState::STARTING), "starting");
  EXPECT_TRUE(is_send_leg(LegKind::SEND_VIDEO));
  EXPECT_FALSE(is_send_leg(LegKind::LISTEN_AUDIO));
}

}  // namespace
}  // namespace session
}  // namespace tankrtc
