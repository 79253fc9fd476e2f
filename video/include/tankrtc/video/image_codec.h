#pragma once

/**
 * @file image_codec.h
 * @brief Still-image compression for outbound snapshots
 *
 * The session treats compression as an opaque capability producing a JPEG
 * container. JpegImageEncoder is the libjpeg implementation.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace tankrtc
{
namespace video
{

/**
 * @brief Pixel layouts accepted by encoders
 */
enum class PixelFormat
{
  RGB24,   // 3 bytes per pixel
  RGBA32,  // 4 bytes per pixel, alpha ignored
  GRAY8,   // 1 byte per pixel
};

[[nodiscard]] int bytes_per_pixel(PixelFormat format);

/**
 * @brief Uncompressed image grabbed from a capture surface
 */
struct RawImage
{
  std::vector<uint8_t> pixels;
  int width = 0;
  int height = 0;
  int stride = 0;  // Bytes per row, 0 means tightly packed
  PixelFormat format = PixelFormat::RGB24;

  [[nodiscard]] int row_bytes() const
  {
    return stride > 0 ? stride : width * bytes_per_pixel(format);
  }

  [[nodiscard]] bool is_valid() const
  {
    return width > 0 && height > 0 &&
           pixels.size() >= static_cast<size_t>(row_bytes()) * static_cast<size_t>(height);
  }
};

/**
 * @brief Image compression capability
 */
class ImageEncoder
{
 public:
  virtual ~ImageEncoder() = default;

  /**
   * @brief Compress an image
   * @param image Source pixels
   * @param quality 0.0-1.0
   * @return Container bytes, or nullopt if compression failed
   */
  virtual std::optional<std::vector<uint8_t>> encode(const RawImage& image, float quality) = 0;

 protected:
  ImageEncoder() = default;
};

/**
 * @brief Baseline JPEG encoder backed by libjpeg
 */
class JpegImageEncoder : public ImageEncoder
{
 public:
  JpegImageEncoder() = default;

  std::optional<std::vector<uint8_t>> encode(const RawImage& image, float quality) override;

  /**
   * @brief Map a 0.0-1.0 quality onto libjpeg's 1-100 scale
   */
  [[nodiscard]] static int to_jpeg_quality(float quality);
};

/**
 * @brief Create the default encoder
 */
std::unique_ptr<ImageEncoder> create_image_encoder();

}  // namespace video
}  // namespace tankrtc
