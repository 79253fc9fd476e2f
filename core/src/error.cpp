/**
 * @file error.cpp
 * @brief Session error category
 */

#include "tankrtc/error.h"

namespace tankrtc
{

namespace
{

class SessionCategory : public std::error_category
{
 public:
  const char* name() const noexcept override
  {
    return "tankrtc.session";
  }

  std::string message(int value) const override
  {
    switch (static_cast<SessionErrc>(value))
    {
      case SessionErrc::IDENTITY_TOO_LONG:
        return "participant id longer than 1000 bytes";
      case SessionErrc::CAPABILITY_ACQUISITION_FAILED:
        return "capability acquisition failed";
      case SessionErrc::CHANNEL_OPEN_TIMEOUT:
        return "data channel failed to open in time";
      case SessionErrc::START_CANCELLED:
        return "start cancelled by stop";
      case SessionErrc::FAMILY_TORN_DOWN:
        return "channel family torn down";
      case SessionErrc::INVALID_CONFIG:
        return "invalid configuration";
    }
    return "unknown session error";
  }
};

}  // namespace

const std::error_category& session_category() noexcept
{
  static const SessionCategory category;
  return category;
}

std::error_code make_error_code(SessionErrc e) noexcept
{
  return {static_cast<int>(e), session_category()};
}

}  // namespace tankrtc
