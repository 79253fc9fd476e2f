#pragma once

/**
 * @file capture_surface.h
 * @brief Camera-backed surface the outbound loop grabs snapshots from
 */

#include <optional>

#include "tankrtc/video/image_codec.h"

namespace tankrtc
{
namespace video
{

/**
 * @brief Camera constraints requested when acquiring a surface
 */
struct CaptureConstraints
{
  int width = 64;
  int height = 64;
  int fps = 30;
};

/**
 * @brief Source of scaled snapshots from a live camera
 *
 * Supplied by the media capability; owns the camera stream until stop().
 */
class CaptureSurface
{
 public:
  virtual ~CaptureSurface() = default;

  /**
   * @brief Grab the current camera image scaled to width x height
   * @return Image, or nullopt if the camera has no frame yet
   */
  virtual std::optional<RawImage> grab_frame(int width, int height) = 0;

  /**
   * @brief Stop the camera stream and release the device
   */
  virtual void stop() = 0;

 protected:
  CaptureSurface() = default;
};

}  // namespace video
}  // namespace tankrtc
