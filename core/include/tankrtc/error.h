#pragma once

/**
 * @file error.h
 * @brief Session error codes
 *
 * Lifecycle and encoding failures are reported as std::error_code in the
 * "tankrtc.session" category.
 */

#include <string>
#include <system_error>

namespace tankrtc
{

/**
 * @brief Session error conditions
 */
enum class SessionErrc
{
  IDENTITY_TOO_LONG = 1,          // Participant id exceeds the envelope limit
  CAPABILITY_ACQUISITION_FAILED,  // Media, peer link or signaling setup failed
  CHANNEL_OPEN_TIMEOUT,           // Data channel did not open in time
  START_CANCELLED,                // Leg was stopped while starting
  FAMILY_TORN_DOWN,               // Channel family closed under a pending operation
  INVALID_CONFIG,                 // Configuration rejected
};

/**
 * @brief Category for SessionErrc values
 */
const std::error_category& session_category() noexcept;

std::error_code make_error_code(SessionErrc e) noexcept;

}  // namespace tankrtc

namespace std
{
template <>
struct is_error_code_enum<tankrtc::SessionErrc> : true_type
{
};
}  // namespace std
