#pragma once

/**
 * @file session_events.h
 * @brief Typed session events and the subscriber list they go to
 */

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "tankrtc/session/leg_state.h"
#include "tankrtc/video/frame_codec.h"

namespace tankrtc
{
namespace session
{

struct Connected
{
};

struct Disconnected
{
};

/**
 * @brief First accepted frame from a participant
 */
struct SourceAdded
{
  video::ParticipantId participant_id;
  uint64_t handle_id = 0;
};

/**
 * @brief Participant evicted, removed by the server, or cleared on leg stop
 */
struct SourceRemoved
{
  video::ParticipantId participant_id;
};

/**
 * @brief Newer frame accepted for a known participant
 */
struct FrameUpdated
{
  video::ParticipantId participant_id;
  uint64_t handle_id = 0;
  uint32_t sequence_number = 0;
};

struct LegStateChanged
{
  LegKind leg = LegKind::SEND_AUDIO;
  bool active = false;
};

/**
 * @brief Leg lifecycle failure or server-reported error
 */
struct SessionError
{
  std::string message;
  std::error_code code;
  std::string cause;
};

using SessionEvent = std::variant<Connected, Disconnected, SourceAdded, SourceRemoved,
                                  FrameUpdated, LegStateChanged, SessionError>;

using EventHandler = std::function<void(const SessionEvent& event)>;

using SubscriptionId = uint64_t;

/**
 * @brief Short name of an event kind, for logs
 */
[[nodiscard]] const char* event_name(const SessionEvent& event);

/**
 * @brief Ordered list of event subscribers
 *
 * Handlers run synchronously in subscription order. A handler may subscribe
 * or unsubscribe during publish; changes apply from the next publish, except
 * that an unsubscribed handler is not called again.
 */
class EventBus
{
 public:
  EventBus() = default;

  // Disable copy
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(EventHandler handler);

  /**
   * @return False if the id is unknown
   */
  bool unsubscribe(SubscriptionId id);

  void publish(const SessionEvent& event);

  [[nodiscard]] size_t subscriber_count() const
  {
    return subscribers_.size();
  }

 private:
  struct Subscriber
  {
    SubscriptionId id;
    EventHandler handler;
  };

  std::vector<Subscriber> subscribers_;
  SubscriptionId next_id_ = 1;
};

}  // namespace session
}  // namespace tankrtc
