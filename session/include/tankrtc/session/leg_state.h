#pragma once

/**
 * @file leg_state.h
 * @brief The four session legs and their lifecycle states
 */

#include <array>

namespace tankrtc
{
namespace session
{

/**
 * @brief Independent capability toggles
 */
enum class LegKind
{
  SEND_AUDIO,
  LISTEN_AUDIO,
  SEND_VIDEO,
  VIEW_VIDEO,
};

/**
 * @brief Leg lifecycle: IDLE -> STARTING -> ACTIVE -> STOPPING -> IDLE
 */
enum class LegState
{
  IDLE,
  STARTING,
  ACTIVE,
  STOPPING,
};

/**
 * @brief Peer link + signaling socket pair shared by two legs
 */
enum class ChannelFamily
{
  AUDIO,
  VIDEO,
};

constexpr std::array<LegKind, 4> ALL_LEGS = {LegKind::SEND_AUDIO, LegKind::LISTEN_AUDIO,
                                             LegKind::SEND_VIDEO, LegKind::VIEW_VIDEO};

[[nodiscard]] const char* to_string(LegKind leg);
[[nodiscard]] const char* to_string(LegState state);
[[nodiscard]] const char* to_string(ChannelFamily family);

/**
 * @brief Family a leg runs on
 */
[[nodiscard]] ChannelFamily family_of(LegKind leg);

/**
 * @brief The other leg sharing the same family
 */
[[nodiscard]] LegKind sibling_of(LegKind leg);

/**
 * @brief True for legs that acquire local media (microphone or camera)
 */
[[nodiscard]] bool is_send_leg(LegKind leg);

/**
 * @brief STARTING or ACTIVE
 */
[[nodiscard]] inline bool is_engaged(LegState state)
{
  return state == LegState::STARTING || state == LegState::ACTIVE;
}

}  // namespace session
}  // namespace tankrtc
