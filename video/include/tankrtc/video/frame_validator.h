#pragma once

/**
 * @file frame_validator.h
 * @brief Semantic checks on received frames
 */

#include <chrono>
#include <cstdint>
#include <optional>

#include "tankrtc/video/frame_codec.h"

namespace tankrtc
{

struct SessionConfig;

namespace video
{

/**
 * @brief Why a decoded frame was discarded
 */
enum class FrameRejection
{
  STALE,                  // Older than the staleness threshold
  NOT_AN_IMAGE,           // Missing the JPEG signature
  DIMENSION_MISMATCH,     // Declared size differs from the configured size
  UNPARSEABLE_CONTAINER,  // No frame header found
};

[[nodiscard]] const char* to_string(FrameRejection rejection);

/**
 * @brief Validator settings
 */
struct FrameValidatorConfig
{
  std::chrono::milliseconds stale_threshold{1000};
  int expected_width = 64;
  int expected_height = 64;

  static FrameValidatorConfig from_session(const SessionConfig& config);
};

/**
 * @brief Accepts or rejects decoded frames
 *
 * Checks run in order and the first failure wins:
 * 1. freshness against now
 * 2. JPEG signature
 * 3. declared dimensions
 *
 * A rejection only means the frame is dropped and the participant keeps its
 * last accepted frame.
 */
class FrameValidator
{
 public:
  explicit FrameValidator(FrameValidatorConfig config = {});

  /**
   * @brief Validate a frame
   * @param envelope Decoded frame
   * @param now_nanos Local wall-clock time
   * @return nullopt if accepted, otherwise the reason
   */
  [[nodiscard]] std::optional<FrameRejection> validate(const VideoFrameEnvelope& envelope,
                                                       uint64_t now_nanos) const;

  [[nodiscard]] const FrameValidatorConfig& config() const
  {
    return config_;
  }

 private:
  FrameValidatorConfig config_;
};

}  // namespace video
}  // namespace tankrtc
