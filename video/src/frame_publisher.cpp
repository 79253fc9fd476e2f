/**
 * @file frame_publisher.cpp
 * @brief Outbound snapshot pipeline
 */

#include "tankrtc/video/frame_publisher.h"

#include "tankrtc/logging.h"

namespace tankrtc
{
namespace video
{

FramePublisher::FramePublisher(ParticipantId participant_id, ImageEncoder& encoder,
                               FramePublisherConfig config)
    : participant_id_(std::move(participant_id)), encoder_(encoder), config_(config)
{
}

std::optional<std::vector<uint8_t>> FramePublisher::produce(CaptureSurface& surface,
                                                            uint64_t now_nanos)
{
  auto image = surface.grab_frame(config_.width, config_.height);
  if (!image || !image->is_valid())
  {
    stats_.grab_failures++;
    return std::nullopt;
  }

  auto jpeg = encoder_.encode(*image, config_.quality);
  if (!jpeg || jpeg->empty())
  {
    stats_.encode_failures++;
    logger()->warn("failed to compress video frame width={} height={}", image->width,
                   image->height);
    return std::nullopt;
  }

  auto encoded = FrameCodec::encode(participant_id_, now_nanos, next_sequence_, *jpeg);
  if (!encoded.success())
  {
    logger()->error("cannot frame video for clientId length={}: {}", participant_id_.size(),
                    encoded.error.message());
    return std::nullopt;
  }

  next_sequence_++;
  stats_.frames_produced++;
  stats_.bytes_produced += encoded.data.size();
  return std::move(encoded.data);
}

}  // namespace video
}  // namespace tankrtc
