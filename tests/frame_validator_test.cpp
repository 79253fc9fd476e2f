/**
 * @file frame_validator_test.cpp
 */

#include "tankrtc/video/frame_validator.h"

#include <gtest/gtest.h>

#include "tankrtc/session_config.h"
#include "test_images.h"

namespace tankrtc
{
namespace video
{
namespace
{

constexpr uint64_t kMs = 1'000'000;
constexpr uint64_t kNow = 1'700'000'000'000 * kMs;

VideoFrameEnvelope envelope_at(uint64_t capture_nanos, std::vector<uint8_t> payload)
{
  VideoFrameEnvelope envelope;
  envelope.participant_id = "p1";
  envelope.capture_timestamp_nanos = capture_nanos;
  envelope.sequence_number = 1;
  envelope.payload = std::move(payload);
  return envelope;
}

class FrameValidatorTest : public ::testing::Test
{
 protected:
  FrameValidator validator_{FrameValidatorConfig{std::chrono::milliseconds(1000), 64, 64}};
};

TEST_F(FrameValidatorTest, AcceptsFreshFrameOfExpectedSize)
{
  auto result = validator_.validate(envelope_at(kNow - 10 * kMs, fakes::jpeg_header_bytes(64, 64)),
                                    kNow);
  EXPECT_FALSE(result.has_value());
}

TEST_F(FrameValidatorTest, RejectsFrameOlderThanThreshold)
{
  auto result = validator_.validate(
      envelope_at(kNow - 1500 * kMs, fakes::jpeg_header_bytes(64, 64)), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::STALE);
}

TEST_F(FrameValidatorTest, FrameExactlyAtThresholdIsFresh)
{
  auto result = validator_.validate(
      envelope_at(kNow - 1000 * kMs, fakes::jpeg_header_bytes(64, 64)), kNow);
  EXPECT_FALSE(result.has_value());
}

TEST_F(FrameValidatorTest, FutureTimestampIsNotStale)
{
  auto result = validator_.validate(
      envelope_at(kNow + 5000 * kMs, fakes::jpeg_header_bytes(64, 64)), kNow);
  EXPECT_FALSE(result.has_value());
}

TEST_F(FrameValidatorTest, RejectsNonJpegPayload)
{
  auto result = validator_.validate(envelope_at(kNow, {0x89, 'P', 'N', 'G', 0, 0}), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::NOT_AN_IMAGE);
}

TEST_F(FrameValidatorTest, RejectsWrongDimensions)
{
  auto result = validator_.validate(envelope_at(kNow, fakes::jpeg_header_bytes(32, 32)), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::DIMENSION_MISMATCH);
}

TEST_F(FrameValidatorTest, RejectsWhenOnlyOneDimensionDiffers)
{
  auto result = validator_.validate(envelope_at(kNow, fakes::jpeg_header_bytes(64, 63)), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::DIMENSION_MISMATCH);
}

TEST_F(FrameValidatorTest, RejectsContainerWithoutFrameHeader)
{
  auto result = validator_.validate(envelope_at(kNow, {0xFF, 0xD8, 0xFF, 0xD9}), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::UNPARSEABLE_CONTAINER);
}

TEST_F(FrameValidatorTest, StalenessIsCheckedFirst)
{
  auto result = validator_.validate(envelope_at(kNow - 2000 * kMs, {0x00, 0x01}), kNow);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, FrameRejection::STALE);
}

TEST(FrameValidatorConfigTest, TakesLimitsFromSessionConfig)
{
  SessionConfig session;
  session.video_width = 128;
  session.video_height = 96;
  session.stale_frame_threshold = std::chrono::milliseconds(250);

  auto config = FrameValidatorConfig::from_session(session);
  EXPECT_EQ(config.expected_width, 128);
  EXPECT_EQ(config.expected_height, 96);
  EXPECT_EQ(config.stale_threshold, std::chrono::milliseconds(250));
}

}  // namespace
}  // namespace video
}  // namespace tankrtc
