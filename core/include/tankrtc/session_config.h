#pragma once

/**
 * @file session_config.h
 * @brief Session configuration snapshot and JSON loader
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tankrtc
{

/**
 * @brief ICE server entry handed to the peer link capability
 */
struct IceServer
{
  std::string urls;
  std::string username;
  std::string credential;
};

/**
 * @brief Immutable session configuration
 *
 * Copied into the SessionController at construction and never mutated
 * afterwards.
 */
struct SessionConfig
{
  std::string server_url = "ws://localhost:9090";
  int video_frame_rate = 30;
  int video_width = 64;
  int video_height = 64;
  float video_quality = 0.8f;     // JPEG quality (0.0-1.0]
  float audio_volume = 1.0f;      // Playback volume (0.0-1.0)
  float max_hearing_range = 50.0f;
  std::vector<IceServer> ice_servers = {{"stun:stun.l.google.com:19302", "", ""}};
  bool debug = true;

  std::chrono::milliseconds stale_frame_threshold{1000};   // Max age of an accepted frame
  std::chrono::milliseconds eviction_sweep_interval{1000};  // Cache sweep period
  std::chrono::milliseconds eviction_age{2000};             // Cache entry lifetime
  std::chrono::milliseconds data_channel_open_timeout{5000};
  std::chrono::milliseconds channel_poll_interval{100};

  /**
   * @brief Period of the outbound capture timer
   */
  [[nodiscard]] std::chrono::milliseconds frame_interval() const
  {
    return std::chrono::milliseconds(1000 / (video_frame_rate > 0 ? video_frame_rate : 1));
  }

  [[nodiscard]] std::string audio_signaling_url() const
  {
    return server_url + "/webrtc-audio";
  }

  [[nodiscard]] std::string video_signaling_url() const
  {
    return server_url + "/webrtc-video";
  }
};

/**
 * @brief Parse configuration from JSON text
 *
 * Keys are the camelCase names of the SDK configuration surface. Missing
 * keys keep their defaults, unknown keys are ignored.
 *
 * @param json JSON document (an object)
 * @param error Receives a description on failure (may be null)
 * @return Parsed configuration or nullopt
 */
[[nodiscard]] std::optional<SessionConfig> parse_session_config(std::string_view json,
                                                                std::string* error = nullptr);

/**
 * @brief Load configuration from a JSON file
 */
[[nodiscard]] std::optional<SessionConfig> load_session_config(const std::string& path,
                                                               std::string* error = nullptr);

/**
 * @brief Check a configuration for values the session cannot run with
 * @return One message per problem, empty when valid
 */
[[nodiscard]] std::vector<std::string> validate_config(const SessionConfig& config);

}  // namespace tankrtc
