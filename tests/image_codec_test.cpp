/**
 * @file image_codec_test.cpp
 */

#include "tankrtc/video/image_codec.h"

#include <gtest/gtest.h>

#include "tankrtc/video/jpeg_header.h"

namespace tankrtc
{
namespace video
{
namespace
{

RawImage gradient(int width, int height, PixelFormat format)
{
  RawImage image;
  image.width = width;
  image.height = height;
  image.format = format;
  image.pixels.resize(static_cast<size_t>(image.row_bytes()) * height);
  for (size_t i = 0; i < image.pixels.size(); ++i)
  {
    image.pixels[i] = static_cast<uint8_t>(i);
  }
  return image;
}

TEST(ImageCodecTest, EncodesRgbToJpegOfSameSize)
{
  JpegImageEncoder encoder;
  auto jpeg = encoder.encode(gradient(64, 64, PixelFormat::RGB24), 0.8f);
  ASSERT_TRUE(jpeg.has_value());
  ASSERT_TRUE(has_jpeg_signature(*jpeg));

  auto dims = parse_jpeg_dimensions(*jpeg);
  ASSERT_TRUE(dims.has_value());
  EXPECT_EQ(dims->width, 64);
  EXPECT_EQ(dims->height, 64);
}

TEST(ImageCodecTest, EncodesRgbaAndGray)
{
  JpegImageEncoder encoder;

  auto rgba = encoder.encode(gradient(32, 16, PixelFormat::RGBA32), 0.5f);
  ASSERT_TRUE(rgba.has_value());
  EXPECT_EQ(parse_jpeg_dimensions(*rgba), (ImageDimensions{32, 16}));

  auto gray = encoder.encode(gradient(16, 32, PixelFormat::GRAY8), 0.5f);
  ASSERT_TRUE(gray.has_value());
  EXPECT_EQ(parse_jpeg_dimensions(*gray), (ImageDimensions{16, 32}));
}

TEST(ImageCodecTest, HonoursRowStride)
{
  RawImage image = gradient(8, 8, PixelFormat::RGB24);
  image.stride = 8 * 3 + 8;
  image.pixels.resize(static_cast<size_t>(image.stride) * 8);

  JpegImageEncoder encoder;
  auto jpeg = encoder.encode(image, 0.8f);
  ASSERT_TRUE(jpeg.has_value());
  EXPECT_EQ(parse_jpeg_dimensions(*jpeg), (ImageDimensions{8, 8}));
}

TEST(ImageCodecTest, RejectsInvalidImage)
{
  JpegImageEncoder encoder;
  RawImage empty;
  EXPECT_FALSE(encoder.encode(empty, 0.8f).has_value());

  RawImage short_buffer = gradient(4, 4, PixelFormat::RGB24);
  short_buffer.pixels.resize(10);
  EXPECT_FALSE(encoder.encode(short_buffer, 0.8f).has_value());
}

TEST(ImageCodecTest, LowerQualityProducesSmallerOutput)
{
  JpegImageEncoder encoder;
  auto image = gradient(64, 64, PixelFormat::RGB24);
  auto low = encoder.encode(image, 0.1f);
  auto high = encoder.encode(image, 1.0f);
  ASSERT_TRUE(low.has_value());
  ASSERT_TRUE(high.has_value());
  EXPECT_LT(low->size(), high->size());
}

TEST(ImageCodecTest, QualityMapsToLibjpegScale)
{
  EXPECT_EQ(JpegImageEncoder::to_jpeg_quality(0.8f), 80);
  EXPECT_EQ(JpegImageEncoder::to_jpeg_quality(1.0f), 100);
  EXPECT_EQ(JpegImageEncoder::to_jpeg_quality(0.0f), 1);
  EXPECT_EQ(JpegImageEncoder::to_jpeg_quality(2.5f), 100);
}

TEST(ImageCodecTest, FactoryReturnsEncoder)
{
  auto encoder = create_image_encoder();
  ASSERT_NE(encoder, nullptr);
  EXPECT_TRUE(encoder->encode(gradient(8, 8, PixelFormat::RGB24), 0.8f).has_value());
}

}  // namespace
}  // namespace video
}  // namespace tankrtc
