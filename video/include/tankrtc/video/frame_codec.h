#pragma once

/**
 * @file frame_codec.h
 * @brief Binary envelope for one video frame
 *
 * Format (network byte order):
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                     identity length (N)                       |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                  identity (N bytes, text)  ...                |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |               capture timestamp (ns, 64 bits)                 |
 * |                                                               |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                        sequence number                        |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                  payload (image container) ...                |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tankrtc
{
namespace video
{

/**
 * @brief Participant identifier
 */
using ParticipantId = std::string;

/**
 * @brief One decoded video frame
 */
struct VideoFrameEnvelope
{
  ParticipantId participant_id;
  uint64_t capture_timestamp_nanos = 0;
  uint32_t sequence_number = 0;
  std::vector<uint8_t> payload;

  static constexpr size_t MIN_SIZE = 20;               // Smallest buffer considered
  static constexpr size_t FIXED_HEADER_SIZE = 16;      // Length + timestamp + sequence
  static constexpr size_t MAX_IDENTITY_LENGTH = 1000;  // Bytes
};

/**
 * @brief Reasons a buffer fails to decode
 */
enum class DecodeError
{
  TRUNCATED,                // Fewer than MIN_SIZE bytes
  INVALID_IDENTITY_LENGTH,  // Zero, above the limit, or overruns the buffer
  EMPTY_IDENTITY,           // Empty or whitespace-only identity
  EMPTY_PAYLOAD,            // No bytes after the header
};

[[nodiscard]] const char* to_string(DecodeError error);

/**
 * @brief Result of FrameCodec::decode
 */
struct DecodeResult
{
  VideoFrameEnvelope envelope;
  std::optional<DecodeError> error;

  [[nodiscard]] bool success() const
  {
    return !error.has_value();
  }
};

/**
 * @brief Result of FrameCodec::encode
 */
struct EncodeResult
{
  std::vector<uint8_t> data;
  std::error_code error;  // SessionErrc::IDENTITY_TOO_LONG on failure

  [[nodiscard]] bool success() const
  {
    return !error;
  }
};

/**
 * @brief Envelope encoder/decoder
 *
 * Stateless; both directions are pure functions of their inputs.
 */
class FrameCodec
{
 public:
  /**
   * @brief Serialize one frame
   * @param participant_id Sender identity (at most 1000 bytes)
   * @param capture_timestamp_nanos Wall-clock capture time
   * @param sequence_number Sender frame counter
   * @param payload Image container bytes
   * @return Wire bytes, or IDENTITY_TOO_LONG
   */
  [[nodiscard]] static EncodeResult encode(std::string_view participant_id,
                                           uint64_t capture_timestamp_nanos,
                                           uint32_t sequence_number,
                                           std::span<const uint8_t> payload);

  [[nodiscard]] static EncodeResult encode(const VideoFrameEnvelope& envelope);

  /**
   * @brief Parse wire bytes; never throws
   */
  [[nodiscard]] static DecodeResult decode(std::span<const uint8_t> data);
};

}  // namespace video
}  // namespace tankrtc
