#pragma once

/**
 * @file session_controller.h
 * @brief Lifecycle of the four session legs and their channel families
 *
 * The controller owns both channel families, the frame cache and all media
 * handed to it by the capabilities. Every method must be called from the
 * execution context of the EventLoop passed at construction, and the loop
 * and capabilities must outlive the controller.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "tankrtc/event_loop.h"
#include "tankrtc/session/capabilities.h"
#include "tankrtc/session/leg_state.h"
#include "tankrtc/session/session_events.h"
#include "tankrtc/session_config.h"
#include "tankrtc/video/participant_frame_cache.h"

namespace tankrtc
{
namespace session
{

/**
 * @brief Start completion: empty code once the leg is ACTIVE
 */
using StartCallback = std::function<void(std::error_code error)>;

/**
 * @brief Point-in-time view of the session
 */
struct SessionSnapshot
{
  bool connected = false;
  std::string client_id;
  LegState send_audio = LegState::IDLE;
  LegState listen_audio = LegState::IDLE;
  LegState send_video = LegState::IDLE;
  LegState view_video = LegState::IDLE;
  size_t video_sources = 0;
};

/**
 * @brief Session counters
 */
struct SessionStats
{
  uint64_t frames_sent = 0;
  uint64_t frames_received = 0;
  uint64_t frames_dropped = 0;  // Undecodable, rejected, or arrived while not viewing
  uint64_t audio_family_rebuilds = 0;
  uint64_t video_family_rebuilds = 0;
};

/**
 * @brief Session state machine
 *
 * Starting a leg always rebuilds its channel family, even if the sibling leg
 * has it open. A family is closed once both of its legs are IDLE.
 */
class SessionController
{
 public:
  SessionController(std::string client_id, SessionConfig config, EventLoop& loop,
                    SessionCapabilities capabilities);
  ~SessionController();

  // Disable copy
  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;

  /**
   * @brief Mark the session connected and emit Connected
   *
   * Families are opened by leg starts, not here.
   */
  void connect();

  /**
   * @brief Stop every leg, close both families and emit Disconnected
   *
   * Never fails; calling it again is a no-op.
   */
  void disconnect();

  /**
   * @brief Start a leg
   *
   * ACTIVE legs complete immediately. A leg already STARTING gains another
   * waiter on the same attempt. The callback is invoked exactly once, unless
   * the controller is destroyed first.
   */
  void start_leg(LegKind leg, StartCallback callback = {});

  /**
   * @brief Stop a leg; no-op when IDLE
   *
   * A pending start completes with SessionErrc::START_CANCELLED.
   */
  void stop_leg(LegKind leg);

  /**
   * @brief Set remote audio volume, clamped to [0, 1]
   */
  void set_audio_volume(float volume);

  [[nodiscard]] LegState leg_state(LegKind leg) const;

  [[nodiscard]] bool is_connected() const;

  [[nodiscard]] SessionSnapshot connection_state() const;

  /**
   * @brief True while the family holds any open resource
   */
  [[nodiscard]] bool family_open(ChannelFamily family) const;

  SubscriptionId subscribe(EventHandler handler);
  bool unsubscribe(SubscriptionId id);

  [[nodiscard]] const video::ParticipantFrameCache& frame_cache() const;

  [[nodiscard]] const SessionConfig& config() const;

  [[nodiscard]] SessionStats stats() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace session
}  // namespace tankrtc
