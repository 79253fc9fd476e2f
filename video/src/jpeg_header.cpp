/**
 * @file jpeg_header.cpp
 * @brief JPEG marker walk
 */

#include "tankrtc/video/jpeg_header.h"

namespace tankrtc
{
namespace video
{

namespace
{

constexpr uint8_t kMarkerPrefix = 0xFF;
constexpr uint8_t kStartOfImage = 0xD8;
constexpr uint8_t kSof0 = 0xC0;  // Baseline
constexpr uint8_t kSof3 = 0xC3;  // Lossless

inline int read_uint16_be(const uint8_t* data)
{
  return (static_cast<int>(data[0]) << 8) | static_cast<int>(data[1]);
}

}  // namespace

bool has_jpeg_signature(std::span<const uint8_t> data)
{
  return data.size() >= 2 && data[0] == kMarkerPrefix && data[1] == kStartOfImage;
}

std::optional<ImageDimensions> parse_jpeg_dimensions(std::span<const uint8_t> data)
{
  const size_t size = data.size();
  size_t offset = 2;  // Skip SOI

  while (offset + 1 < size)
  {
    if (data[offset] != kMarkerPrefix || data[offset + 1] == 0x00)
    {
      ++offset;
      continue;
    }

    const uint8_t marker = data[offset + 1];

    // SOF: FF Cx | length(2) | precision(1) | height(2) | width(2)
    if (marker >= kSof0 && marker <= kSof3 && offset + 9 < size)
    {
      ImageDimensions dims;
      dims.height = read_uint16_be(&data[offset + 5]);
      dims.width = read_uint16_be(&data[offset + 7]);
      return dims;
    }

    if (offset + 3 >= size)
    {
      break;
    }
    offset += 2 + static_cast<size_t>(read_uint16_be(&data[offset + 2]));
  }

  return std::nullopt;
}

}  // namespace video
}  // namespace tankrtc
