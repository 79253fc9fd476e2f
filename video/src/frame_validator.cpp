/**
 * @file frame_validator.cpp
 * @brief Frame validation implementation
 */

#include "tankrtc/video/frame_validator.h"

#include "tankrtc/session_config.h"
#include "tankrtc/video/jpeg_header.h"

namespace tankrtc
{
namespace video
{

const char* to_string(FrameRejection rejection)
{
  switch (rejection)
  {
    case FrameRejection::STALE:
      return "stale";
    case FrameRejection::NOT_AN_IMAGE:
      return "not an image";
    case FrameRejection::DIMENSION_MISMATCH:
      return "dimension mismatch";
    case FrameRejection::UNPARSEABLE_CONTAINER:
      return "unparseable container";
  }
  return "unknown";
}

FrameValidatorConfig FrameValidatorConfig::from_session(const SessionConfig& config)
{
  FrameValidatorConfig result;
  result.stale_threshold = config.stale_frame_threshold;
  result.expected_width = config.video_width;
  result.expected_height = config.video_height;
  return result;
}

FrameValidator::FrameValidator(FrameValidatorConfig config) : config_(config) {}

std::optional<FrameRejection> FrameValidator::validate(const VideoFrameEnvelope& envelope,
                                                       uint64_t now_nanos) const
{
  // Signed age: a sender clock ahead of ours yields a negative age, not a stale frame
  const int64_t age_nanos =
      static_cast<int64_t>(now_nanos) - static_cast<int64_t>(envelope.capture_timestamp_nanos);
  const double age_ms = static_cast<double>(age_nanos) / 1e6;
  if (age_ms > static_cast<double>(config_.stale_threshold.count()))
  {
    return FrameRejection::STALE;
  }

  if (!has_jpeg_signature(envelope.payload))
  {
    return FrameRejection::NOT_AN_IMAGE;
  }

  auto dims = parse_jpeg_dimensions(envelope.payload);
  if (!dims)
  {
    return FrameRejection::UNPARSEABLE_CONTAINER;
  }

  if (dims->width != config_.expected_width || dims->height != config_.expected_height)
  {
    return FrameRejection::DIMENSION_MISMATCH;
  }

  return std::nullopt;
}

}  // namespace video
}  // namespace tankrtc
