#pragma once

/**
 * @file capabilities.h
 * @brief Narrow interfaces to the externally supplied services
 *
 * The session never implements media capture, peer-link negotiation or the
 * signaling transport. Hosts provide adapters for these interfaces. Completion
 * callbacks may be invoked from any thread; the controller marshals them onto
 * its event loop.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "tankrtc/session_config.h"
#include "tankrtc/video/capture_surface.h"
#include "tankrtc/video/frame_store.h"
#include "tankrtc/video/image_codec.h"

namespace tankrtc
{
namespace session
{

/**
 * @brief Completion with only a status
 */
using CompletionCallback = std::function<void(std::error_code error)>;

// ============================================================================
// Signaling
// ============================================================================

/**
 * @brief One JSON text socket to the signaling server
 */
class SignalingChannel
{
 public:
  using MessageHandler = std::function<void(const std::string& text)>;
  using CloseHandler = std::function<void()>;

  virtual ~SignalingChannel() = default;

  /**
   * @brief Connect to a signaling endpoint
   * @param on_open Invoked once, with an error if the socket failed to open
   */
  virtual void open(const std::string& url, CompletionCallback on_open) = 0;

  [[nodiscard]] virtual bool is_open() const = 0;

  virtual void send_text(const std::string& text) = 0;

  virtual void set_message_handler(MessageHandler handler) = 0;

  /**
   * @brief Invoked when the remote side closes the socket
   */
  virtual void set_close_handler(CloseHandler handler) = 0;

  virtual void close() = 0;

 protected:
  SignalingChannel() = default;
};

/**
 * @brief Factory for signaling sockets
 */
class SignalingTransport
{
 public:
  virtual ~SignalingTransport() = default;

  virtual std::unique_ptr<SignalingChannel> create_channel() = 0;

 protected:
  SignalingTransport() = default;
};

// ============================================================================
// Media
// ============================================================================

/**
 * @brief Local microphone stream
 */
class AudioSource
{
 public:
  virtual ~AudioSource() = default;

  /**
   * @brief Stop capturing and release the device
   */
  virtual void stop() = 0;

 protected:
  AudioSource() = default;
};

/**
 * @brief Mixed audio track received from the server
 */
class RemoteAudioTrack
{
 public:
  virtual ~RemoteAudioTrack() = default;

  [[nodiscard]] virtual std::string id() const = 0;

 protected:
  RemoteAudioTrack() = default;
};

/**
 * @brief Remote audio being played to the user
 */
class AudioPlayback
{
 public:
  virtual ~AudioPlayback() = default;

  virtual void set_volume(float volume) = 0;

  virtual void stop() = 0;

 protected:
  AudioPlayback() = default;
};

/**
 * @brief Device access and playback
 */
class MediaCapability
{
 public:
  using MicrophoneCallback =
      std::function<void(std::error_code error, std::shared_ptr<AudioSource> microphone)>;
  using CameraCallback =
      std::function<void(std::error_code error, std::shared_ptr<video::CaptureSurface> camera)>;

  virtual ~MediaCapability() = default;

  virtual void acquire_microphone(MicrophoneCallback callback) = 0;

  virtual void acquire_camera(const video::CaptureConstraints& constraints,
                              CameraCallback callback) = 0;

  /**
   * @brief Start playing a remote track
   * @return Playback handle, or nullptr if playback could not start
   */
  virtual std::unique_ptr<AudioPlayback> play_remote_audio(std::shared_ptr<RemoteAudioTrack> track,
                                                           float volume) = 0;

 protected:
  MediaCapability() = default;
};

// ============================================================================
// Peer link
// ============================================================================

/**
 * @brief Data channel parameters
 */
struct DataChannelOptions
{
  std::string label = "video";
  bool ordered = false;
  int max_retransmits = 0;
};

/**
 * @brief Data channel carried by a video peer link
 */
class DataChannel
{
 public:
  using EventHandler = std::function<void()>;
  using BinaryHandler = std::function<void(std::span<const uint8_t> data)>;
  using TextHandler = std::function<void(const std::string& text)>;

  virtual ~DataChannel() = default;

  [[nodiscard]] virtual bool is_open() const = 0;

  virtual void send_binary(std::span<const uint8_t> data) = 0;

  virtual void send_text(const std::string& text) = 0;

  virtual void set_open_handler(EventHandler handler) = 0;
  virtual void set_close_handler(EventHandler handler) = 0;
  virtual void set_binary_handler(BinaryHandler handler) = 0;
  virtual void set_text_handler(TextHandler handler) = 0;

  virtual void close() = 0;

 protected:
  DataChannel() = default;
};

/**
 * @brief Offer parameters
 */
struct OfferOptions
{
  bool receive_audio = false;
  bool receive_video = false;
};

/**
 * @brief Peer link parameters
 */
struct PeerLinkConfig
{
  std::vector<IceServer> ice_servers;
};

/**
 * @brief One negotiated peer connection
 */
class PeerLink
{
 public:
  using OfferCallback = std::function<void(std::error_code error, std::string sdp)>;
  using CandidateHandler = std::function<void(const std::string& candidate)>;
  using RemoteAudioHandler = std::function<void(std::shared_ptr<RemoteAudioTrack> track)>;

  virtual ~PeerLink() = default;

  /**
   * @brief Create an offer and apply it as the local description
   */
  virtual void create_offer(const OfferOptions& options, OfferCallback callback) = 0;

  virtual void set_remote_answer(const std::string& sdp) = 0;

  virtual void add_remote_candidate(const std::string& candidate) = 0;

  virtual void set_local_candidate_handler(CandidateHandler handler) = 0;

  virtual void add_local_audio(std::shared_ptr<AudioSource> source) = 0;

  virtual void remove_local_audio() = 0;

  virtual void set_remote_audio_handler(RemoteAudioHandler handler) = 0;

  virtual std::unique_ptr<DataChannel> create_data_channel(const DataChannelOptions& options) = 0;

  virtual void close() = 0;

 protected:
  PeerLink() = default;
};

/**
 * @brief Factory for peer links
 */
class PeerLinkFactory
{
 public:
  virtual ~PeerLinkFactory() = default;

  /**
   * @return Link, or nullptr if one could not be created
   */
  virtual std::unique_ptr<PeerLink> create(const PeerLinkConfig& config) = 0;

 protected:
  PeerLinkFactory() = default;
};

/**
 * @brief Everything the controller consumes; all must outlive it
 */
struct SessionCapabilities
{
  SignalingTransport& signaling;
  PeerLinkFactory& peer_links;
  MediaCapability& media;
  video::ImageEncoder& image_encoder;
  video::FrameStore& frame_store;
};

}  // namespace session
}  // namespace tankrtc
