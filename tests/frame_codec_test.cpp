/**
 * @file frame_codec_test.cpp
 */

#include "tankrtc/video/frame_codec.h"

#include <gtest/gtest.h>

#include "tankrtc/error.h"

namespace tankrtc
{
namespace video
{
namespace
{

std::vector<uint8_t> bytes_of(std::initializer_list<uint8_t> values)
{
  return std::vector<uint8_t>(values);
}

// Header with an arbitrary declared identity length and enough filler behind it
std::vector<uint8_t> with_identity_length(uint32_t declared, size_t total_size)
{
  std::vector<uint8_t> data(total_size, 'x');
  data[0] = static_cast<uint8_t>(declared >> 24);
  data[1] = static_cast<uint8_t>(declared >> 16);
  data[2] = static_cast<uint8_t>(declared >> 8);
  data[3] = static_cast<uint8_t>(declared);
  return data;
}

TEST(FrameCodecTest, RoundTripsAllFields)
{
  const std::vector<uint8_t> payload = bytes_of({0xFF, 0xD8, 0x01, 0x02, 0x03});
  auto encoded = FrameCodec::encode("participant-42", 1'700'000'000'123'456'789ULL, 0xDEADBEEF,
                                    payload);
  ASSERT_TRUE(encoded.success());

  auto decoded = FrameCodec::decode(encoded.data);
  ASSERT_TRUE(decoded.success());
  EXPECT_EQ(decoded.envelope.participant_id, "participant-42");
  EXPECT_EQ(decoded.envelope.capture_timestamp_nanos, 1'700'000'000'123'456'789ULL);
  EXPECT_EQ(decoded.envelope.sequence_number, 0xDEADBEEFu);
  EXPECT_EQ(decoded.envelope.payload, payload);
}

TEST(FrameCodecTest, RoundTripsMultibyteIdentity)
{
  const std::string id = "caf\xC3\xA9-\xE6\x88\xA6\xE8\xBB\x8A";
  auto encoded = FrameCodec::encode(id, 5, 6, bytes_of({1}));
  ASSERT_TRUE(encoded.success());

  auto decoded = FrameCodec::decode(encoded.data);
  ASSERT_TRUE(decoded.success());
  EXPECT_EQ(decoded.envelope.participant_id, id);
}

TEST(FrameCodecTest, WritesBigEndianLayout)
{
  auto encoded = FrameCodec::encode("ab", 0x0102030405060708ULL, 0x0A0B0C0D, bytes_of({0xEE}));
  ASSERT_TRUE(encoded.success());

  const std::vector<uint8_t> expected = {
      0x00, 0x00, 0x00, 0x02,                          // identity length
      'a',  'b',                                       // identity
      0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,  // timestamp
      0x0A, 0x0B, 0x0C, 0x0D,                          // sequence
      0xEE,                                            // payload
  };
  EXPECT_EQ(encoded.data, expected);
}

TEST(FrameCodecTest, EnvelopeOverloadMatchesFieldOverload)
{
  VideoFrameEnvelope envelope;
  envelope.participant_id = "p";
  envelope.capture_timestamp_nanos = 99;
  envelope.sequence_number = 3;
  envelope.payload = bytes_of({1, 2, 3});

  EXPECT_EQ(FrameCodec::encode(envelope).data,
            FrameCodec::encode("p", 99, 3, envelope.payload).data);
}

TEST(FrameCodecTest, EncodeRejectsOverlongIdentity)
{
  std::string id(VideoFrameEnvelope::MAX_IDENTITY_LENGTH + 1, 'a');
  auto encoded = FrameCodec::encode(id, 0, 0, bytes_of({1}));
  EXPECT_FALSE(encoded.success());
  EXPECT_EQ(encoded.error, SessionErrc::IDENTITY_TOO_LONG);
  EXPECT_TRUE(encoded.data.empty());
}

TEST(FrameCodecTest, EncodeAcceptsIdentityAtLimit)
{
  std::string id(VideoFrameEnvelope::MAX_IDENTITY_LENGTH, 'a');
  auto encoded = FrameCodec::encode(id, 1, 2, bytes_of({1}));
  ASSERT_TRUE(encoded.success());

  auto decoded = FrameCodec::decode(encoded.data);
  ASSERT_TRUE(decoded.success());
  EXPECT_EQ(decoded.envelope.participant_id.size(), VideoFrameEnvelope::MAX_IDENTITY_LENGTH);
}

TEST(FrameCodecTest, ShortBuffersAreTruncated)
{
  for (size_t size = 0; size < VideoFrameEnvelope::MIN_SIZE; ++size)
  {
    std::vector<uint8_t> data(size, 0x01);
    auto decoded = FrameCodec::decode(data);
    ASSERT_FALSE(decoded.success()) << "size " << size;
    EXPECT_EQ(*decoded.error, DecodeError::TRUNCATED) << "size " << size;
  }
}

TEST(FrameCodecTest, RejectsIdentityLengthAboveLimit)
{
  auto decoded = FrameCodec::decode(with_identity_length(1001, 1001 + 16 + 10));
  ASSERT_FALSE(decoded.success());
  EXPECT_EQ(*decoded.error, DecodeError::INVALID_IDENTITY_LENGTH);
}

TEST(FrameCodecTest, RejectsZeroIdentityLength)
{
  auto decoded = FrameCodec::decode(with_identity_length(0, 32));
  ASSERT_FALSE(decoded.success());
  EXPECT_EQ(*decoded.error, DecodeError::INVALID_IDENTITY_LENGTH);
}

TEST(FrameCodecTest, RejectsIdentityLengthOverrunningBuffer)
{
  // 10 identity bytes need 26 bytes of header; only 24 are present
  auto decoded = FrameCodec::decode(with_identity_length(10, 24));
  ASSERT_FALSE(decoded.success());
  EXPECT_EQ(*decoded.error, DecodeError::INVALID_IDENTITY_LENGTH);
}

TEST(FrameCodecTest, RejectsBlankIdentity)
{
  auto encoded = FrameCodec::encode("   ", 1, 1, bytes_of({1, 2, 3, 4, 5}));
  ASSERT_TRUE(encoded.success());

  auto decoded = FrameCodec::decode(encoded.data);
  ASSERT_FALSE(decoded.success());
  EXPECT_EQ(*decoded.error, DecodeError::EMPTY_IDENTITY);
}

TEST(FrameCodecTest, RejectsEmptyPayload)
{
  // Identity of 4 bytes fills the minimum size exactly, leaving no payload
  auto encoded = FrameCodec::encode("abcd", 1, 1, {});
  ASSERT_TRUE(encoded.success());
  ASSERT_EQ(encoded.data.size(), VideoFrameEnvelope::MIN_SIZE);

  auto decoded = FrameCodec::decode(encoded.data);
  ASSERT_FALSE(decoded.success());
  EXPECT_EQ(*decoded.error, DecodeError::EMPTY_PAYLOAD);
}

TEST(FrameCodecTest, DecodeErrorNames)
{
  EXPECT_STREQ(to_string(DecodeError::TRUNCATED), "truncated");
  EXPECT_STREQ(to_string(DecodeError::EMPTY_PAYLOAD), "empty payload");
}

}  // namespace
}  // namespace video
}  // namespace tankrtc
