/**
 * @file image_codec.cpp
 * @brief libjpeg image encoder
 */

#include "tankrtc/video/image_codec.h"

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>

#include <jpeglib.h>

#include "tankrtc/logging.h"

namespace tankrtc
{
namespace video
{

namespace
{

// Output buffer owned by libjpeg's memory destination. Lives on the heap so
// its contents stay determinate after a longjmp.
struct MemoryDestination
{
  unsigned char* buffer = nullptr;
  unsigned long size = 0;
};

// libjpeg reports fatal errors through error_exit; jump back instead of exiting
struct JpegErrorManager
{
  jpeg_error_mgr pub;
  std::jmp_buf jump;
};

void on_jpeg_error(j_common_ptr cinfo)
{
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  char message[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, message);
  logger()->debug("jpeg encode error: {}", message);
  std::longjmp(err->jump, 1);
}

}  // namespace

int bytes_per_pixel(PixelFormat format)
{
  switch (format)
  {
    case PixelFormat::RGB24:
      return 3;
    case PixelFormat::RGBA32:
      return 4;
    case PixelFormat::GRAY8:
      return 1;
  }
  return 3;
}

int JpegImageEncoder::to_jpeg_quality(float quality)
{
  int scaled = static_cast<int>(std::lround(quality * 100.0f));
  return std::clamp(scaled, 1, 100);
}

std::optional<std::vector<uint8_t>> JpegImageEncoder::encode(const RawImage& image, float quality)
{
  if (!image.is_valid())
  {
    return std::nullopt;
  }

  const bool gray = image.format == PixelFormat::GRAY8;
  const int bpp = bytes_per_pixel(image.format);
  const int row_bytes = image.row_bytes();

  // Declared before setjmp so a jump back does not skip their lifetimes
  std::vector<uint8_t> row(static_cast<size_t>(image.width) * (gray ? 1 : 3));
  std::vector<uint8_t> result;
  auto dest = std::make_unique<MemoryDestination>();

  jpeg_compress_struct cinfo;
  JpegErrorManager jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = on_jpeg_error;

  if (setjmp(jerr.jump))
  {
    jpeg_destroy_compress(&cinfo);
    if (dest->buffer)
    {
      std::free(dest->buffer);
    }
    return std::nullopt;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &dest->buffer, &dest->size);

  cinfo.image_width = static_cast<JDIMENSION>(image.width);
  cinfo.image_height = static_cast<JDIMENSION>(image.height);
  cinfo.input_components = gray ? 1 : 3;
  cinfo.in_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;

  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, to_jpeg_quality(quality), TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  while (cinfo.next_scanline < cinfo.image_height)
  {
    const uint8_t* src = image.pixels.data() + static_cast<size_t>(cinfo.next_scanline) * row_bytes;

    // Drop alpha; RGB and gray rows are copied as-is
    for (int x = 0; x < image.width; ++x)
    {
      if (gray)
      {
        row[x] = src[x];
      }
      else
      {
        row[x * 3 + 0] = src[x * bpp + 0];
        row[x * 3 + 1] = src[x * bpp + 1];
        row[x * 3 + 2] = src[x * bpp + 2];
      }
    }

    JSAMPROW row_pointer = row.data();
    jpeg_write_scanlines(&cinfo, &row_pointer, 1);
  }

  jpeg_finish_compress(&cinfo);
  result.assign(dest->buffer, dest->buffer + dest->size);
  jpeg_destroy_compress(&cinfo);
  std::free(dest->buffer);

  return result;
}

std::unique_ptr<ImageEncoder> create_image_encoder()
{
  return std::make_unique<JpegImageEncoder>();
}

}  // namespace video
}  // namespace tankrtc
