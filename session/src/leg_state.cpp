/**
 * @file leg_state.cpp
 */

#include "tankrtc/session/leg_state.h"

namespace tankrtc
{
namespace session
{

const char* to_string(LegKind leg)
{
  switch (leg)
  {
    case LegKind::SEND_AUDIO:
      return "send-audio";
    case LegKind::LISTEN_AUDIO:
      return "listen-audio";
    case LegKind::SEND_VIDEO:
      return "send-video";
    case LegKind::VIEW_VIDEO:
      return "view-video";
  }
  return "unknown";
}

const char* to_string(LegState state)
{
  switch (state)
  {
    case LegState::IDLE:
      return "idle";
    case LegState::STARTING:
      return "starting";
    case LegState::ACTIVE:
      return "active";
    case LegState::STOPPING:
      return "stopping";
  }
  return "unknown";
}

const char* to_string(ChannelFamily family)
{
  return family == ChannelFamily::AUDIO ? "audio" : "video";
}

ChannelFamily family_of(LegKind leg)
{
  switch (leg)
  {
    case LegKind::SEND_AUDIO:
    case LegKind::LISTEN_AUDIO:
      return ChannelFamily::AUDIO;
    case LegKind::SEND_VIDEO:
    case LegKind::VIEW_VIDEO:
      return ChannelFamily::VIDEO;
  }
  return ChannelFamily::AUDIO;
}

LegKind sibling_of(LegKind leg)
{
  switch (leg)
  {
    case LegKind::SEND_AUDIO:
      return LegKind::LISTEN_AUDIO;
    case LegKind::LISTEN_AUDIO:
      return LegKind::SEND_AUDIO;
    case LegKind::SEND_VIDEO:
      return LegKind::VIEW_VIDEO;
    case LegKind::VIEW_VIDEO:
      return LegKind::SEND_VIDEO;
  }
  return leg;
}

bool is_send_leg(LegKind leg)
{
  return leg == LegKind::SEND_AUDIO || leg == LegKind::SEND_VIDEO;
}

}  // namespace session
}  // namespace tankrtc
