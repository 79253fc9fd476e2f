#pragma once

/**
 * @file jpeg_header.h
 * @brief Minimal JPEG container inspection
 */

#include <cstdint>
#include <optional>
#include <span>

namespace tankrtc
{
namespace video
{

/**
 * @brief Image size in pixels
 */
struct ImageDimensions
{
  int width = 0;
  int height = 0;

  bool operator==(const ImageDimensions& other) const
  {
    return width == other.width && height == other.height;
  }
};

/**
 * @brief Check for the JPEG start-of-image marker (0xFF 0xD8)
 */
[[nodiscard]] bool has_jpeg_signature(std::span<const uint8_t> data);

/**
 * @brief Read dimensions from the first SOF0-SOF3 segment
 *
 * Walks marker segments after SOI using their length fields. Bytes that are
 * not a marker prefix are skipped one at a time.
 *
 * @return Dimensions, or nullopt if no complete frame header is found
 */
[[nodiscard]] std::optional<ImageDimensions> parse_jpeg_dimensions(std::span<const uint8_t> data);

}  // namespace video
}  // namespace tankrtc
