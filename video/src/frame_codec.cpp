/**
 * @file frame_codec.cpp
 * @brief Video frame envelope implementation
 */

#include "tankrtc/video/frame_codec.h"

#include <algorithm>
#include <cctype>

#include "tankrtc/error.h"

namespace tankrtc
{
namespace video
{

namespace
{

// Network byte order helpers
inline uint32_t read_uint32_be(const uint8_t* data)
{
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

inline uint64_t read_uint64_be(const uint8_t* data)
{
  return (static_cast<uint64_t>(read_uint32_be(data)) << 32) | read_uint32_be(data + 4);
}

inline void write_uint32_be(uint8_t* data, uint32_t value)
{
  data[0] = static_cast<uint8_t>(value >> 24);
  data[1] = static_cast<uint8_t>(value >> 16);
  data[2] = static_cast<uint8_t>(value >> 8);
  data[3] = static_cast<uint8_t>(value);
}

inline void write_uint64_be(uint8_t* data, uint64_t value)
{
  write_uint32_be(data, static_cast<uint32_t>(value >> 32));
  write_uint32_be(data + 4, static_cast<uint32_t>(value));
}

bool is_blank(std::string_view text)
{
  return std::all_of(text.begin(), text.end(),
                     [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

const char* to_string(DecodeError error)
{
  switch (error)
  {
    case DecodeError::TRUNCATED:
      return "truncated";
    case DecodeError::INVALID_IDENTITY_LENGTH:
      return "invalid identity length";
    case DecodeError::EMPTY_IDENTITY:
      return "empty identity";
    case DecodeError::EMPTY_PAYLOAD:
      return "empty payload";
  }
  return "unknown";
}

EncodeResult FrameCodec::encode(std::string_view participant_id, uint64_t capture_timestamp_nanos,
                                uint32_t sequence_number, std::span<const uint8_t> payload)
{
  EncodeResult result;
  if (participant_id.size() > VideoFrameEnvelope::MAX_IDENTITY_LENGTH)
  {
    result.error = SessionErrc::IDENTITY_TOO_LONG;
    return result;
  }

  const size_t id_len = participant_id.size();
  result.data.resize(VideoFrameEnvelope::FIXED_HEADER_SIZE + id_len + payload.size());
  uint8_t* out = result.data.data();

  write_uint32_be(out, static_cast<uint32_t>(id_len));
  std::copy(participant_id.begin(), participant_id.end(), out + 4);
  write_uint64_be(out + 4 + id_len, capture_timestamp_nanos);
  write_uint32_be(out + 12 + id_len, sequence_number);
  std::copy(payload.begin(), payload.end(), out + 16 + id_len);

  return result;
}

EncodeResult FrameCodec::encode(const VideoFrameEnvelope& envelope)
{
  return encode(envelope.participant_id, envelope.capture_timestamp_nanos,
                envelope.sequence_number, envelope.payload);
}

DecodeResult FrameCodec::decode(std::span<const uint8_t> data)
{
  DecodeResult result;

  if (data.size() < VideoFrameEnvelope::MIN_SIZE)
  {
    result.error = DecodeError::TRUNCATED;
    return result;
  }

  // Identity length, checked against the limit and the fixed header behind it
  const uint32_t id_len = read_uint32_be(data.data());
  if (id_len == 0 || id_len > VideoFrameEnvelope::MAX_IDENTITY_LENGTH ||
      static_cast<size_t>(id_len) + VideoFrameEnvelope::FIXED_HEADER_SIZE > data.size())
  {
    result.error = DecodeError::INVALID_IDENTITY_LENGTH;
    return result;
  }

  auto& envelope = result.envelope;
  envelope.participant_id.assign(reinterpret_cast<const char*>(data.data() + 4), id_len);
  if (is_blank(envelope.participant_id))
  {
    result.error = DecodeError::EMPTY_IDENTITY;
    return result;
  }

  envelope.capture_timestamp_nanos = read_uint64_be(data.data() + 4 + id_len);
  envelope.sequence_number = read_uint32_be(data.data() + 12 + id_len);

  const size_t payload_offset = VideoFrameEnvelope::FIXED_HEADER_SIZE + id_len;
  if (payload_offset >= data.size())
  {
    result.error = DecodeError::EMPTY_PAYLOAD;
    return result;
  }

  envelope.payload.assign(data.begin() + payload_offset, data.end());
  return result;
}

}  // namespace video
}  // namespace tankrtc
