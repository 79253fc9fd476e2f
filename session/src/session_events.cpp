/**
 * @file session_events.cpp
 */

#include "tankrtc/session/session_events.h"

#include <algorithm>
#include <type_traits>

namespace tankrtc
{
namespace session
{

const char* event_name(const SessionEvent& event)
{
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>)
          return "connected";
        else if constexpr (std::is_same_v<T, Disconnected>)
          return "disconnected";
        else if constexpr (std::is_same_v<T, SourceAdded>)
          return "source-added";
        else if constexpr (std::is_same_v<T, SourceRemoved>)
          return "source-removed";
        else if constexpr (std::is_same_v<T, FrameUpdated>)
          return "frame-updated";
        else if constexpr (std::is_same_v<T, LegStateChanged>)
          return "leg-state-changed";
        else
          return "error";
      },
      event);
}

SubscriptionId EventBus::subscribe(EventHandler handler)
{
  SubscriptionId id = next_id_++;
  subscribers_.push_back({id, std::move(handler)});
  return id;
}

bool EventBus::unsubscribe(SubscriptionId id)
{
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == subscribers_.end())
  {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

void EventBus::publish(const SessionEvent& event)
{
  // Snapshot so handlers can change the list while we iterate
  std::vector<Subscriber> snapshot = subscribers_;
  for (const auto& subscriber : snapshot)
  {
    bool still_subscribed =
        std::any_of(subscribers_.begin(), subscribers_.end(),
                    [&](const Subscriber& s) { return s.id == subscriber.id; });
    if (still_subscribed && subscriber.handler)
    {
      subscriber.handler(event);
    }
  }
}

}  // namespace session
}  // namespace tankrtc
