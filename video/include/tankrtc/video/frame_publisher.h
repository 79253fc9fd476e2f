#pragma once

/**
 * @file frame_publisher.h
 * @brief Outbound snapshot pipeline: grab, compress, frame
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tankrtc/video/capture_surface.h"
#include "tankrtc/video/frame_codec.h"
#include "tankrtc/video/image_codec.h"

namespace tankrtc
{
namespace video
{

/**
 * @brief Publisher settings
 */
struct FramePublisherConfig
{
  int width = 64;
  int height = 64;
  float quality = 0.8f;
};

/**
 * @brief Outbound statistics
 */
struct FramePublisherStats
{
  uint64_t frames_produced = 0;
  uint64_t grab_failures = 0;
  uint64_t encode_failures = 0;
  uint64_t bytes_produced = 0;
};

/**
 * @brief Produces wire-ready envelopes from a capture surface
 *
 * The sequence number advances only when an envelope is produced, and keeps
 * counting across surfaces for the life of the publisher.
 */
class FramePublisher
{
 public:
  FramePublisher(ParticipantId participant_id, ImageEncoder& encoder,
                 FramePublisherConfig config = {});

  /**
   * @brief Grab one image, compress it and wrap it in an envelope
   * @param surface Camera surface
   * @param now_nanos Capture timestamp written into the envelope
   * @return Envelope bytes, or nullopt if grabbing or compressing failed
   */
  std::optional<std::vector<uint8_t>> produce(CaptureSurface& surface, uint64_t now_nanos);

  [[nodiscard]] uint32_t next_sequence() const
  {
    return next_sequence_;
  }

  [[nodiscard]] const FramePublisherStats& stats() const
  {
    return stats_;
  }

 private:
  ParticipantId participant_id_;
  ImageEncoder& encoder_;
  FramePublisherConfig config_;
  uint32_t next_sequence_ = 0;
  FramePublisherStats stats_;
};

}  // namespace video
}  // namespace tankrtc
