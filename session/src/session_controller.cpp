/**
 * @file session_controller.cpp
 * @brief Session state machine implementation
 */

#include "tankrtc/session/session_controller.h"

#include <algorithm>
#include <array>
#include <vector>

#include "tankrtc/error.h"
#include "tankrtc/logging.h"
#include "tankrtc/readiness_waiter.h"
#include "tankrtc/session/channel_family.h"
#include "tankrtc/signaling_message.h"
#include "tankrtc/video/frame_codec.h"
#include "tankrtc/video/frame_publisher.h"
#include "tankrtc/video/frame_validator.h"

namespace tankrtc
{
namespace session
{

namespace
{

// Posts capability completions onto the loop and drops them once the
// controller is gone. Safe to call from any thread.
struct Marshal
{
  EventLoop* loop;
  std::weak_ptr<int> alive;

  void operator()(Task task) const
  {
    if (alive.expired())
    {
      return;
    }
    loop->post([guard = alive, task = std::move(task)]() {
      if (!guard.expired())
      {
        task();
      }
    });
  }
};

const char* start_failure_message(LegKind leg)
{
  switch (leg)
  {
    case LegKind::SEND_AUDIO:
      return "Failed to start sending audio";
    case LegKind::LISTEN_AUDIO:
      return "Failed to start listening audio";
    case LegKind::SEND_VIDEO:
      return "Failed to start sending video";
    case LegKind::VIEW_VIDEO:
      return "Failed to start viewing video";
  }
  return "Failed to start leg";
}

size_t leg_index(LegKind leg)
{
  return static_cast<size_t>(leg);
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct SessionController::Impl
{
  struct LegSlot
  {
    LegState state = LegState::IDLE;
    uint64_t generation = 0;
    bool awaiting_family = false;
    std::vector<StartCallback> pending;
    std::unique_ptr<ReadinessWaiter> waiter;
  };

  Impl(std::string id, SessionConfig cfg, EventLoop& event_loop, SessionCapabilities capabilities)
      : client_id(std::move(id)),
        config(std::move(cfg)),
        loop(event_loop),
        caps(capabilities),
        validator(video::FrameValidatorConfig::from_session(config)),
        cache(config.eviction_age),
        publisher(client_id, caps.image_encoder,
                  video::FramePublisherConfig{config.video_width, config.video_height,
                                              config.video_quality}),
        audio_family(ChannelFamily::AUDIO),
        video_family(ChannelFamily::VIDEO),
        volume(std::clamp(config.audio_volume, 0.0f, 1.0f)),
        alive(std::make_shared<int>(0))
  {
    for (auto& slot : legs)
    {
      slot.waiter = std::make_unique<ReadinessWaiter>(loop);
    }
  }

  ~Impl()
  {
    alive.reset();
    cancel_timer(send_timer);
    cancel_timer(sweep_timer);
    for (auto& slot : legs)
    {
      slot.waiter->cancel();
    }
    if (microphone)
    {
      microphone->stop();
    }
    if (camera)
    {
      camera->stop();
    }
    if (playback)
    {
      playback->stop();
    }
  }

  Marshal marshal() const
  {
    return Marshal{&loop, alive};
  }

  LegSlot& slot(LegKind leg)
  {
    return legs[leg_index(leg)];
  }

  const LegSlot& slot(LegKind leg) const
  {
    return legs[leg_index(leg)];
  }

  FamilySlot& family(ChannelFamily kind)
  {
    return kind == ChannelFamily::AUDIO ? audio_family : video_family;
  }

  void cancel_timer(TimerId& timer)
  {
    if (timer != INVALID_TIMER)
    {
      loop.cancel(timer);
      timer = INVALID_TIMER;
    }
  }

  // --------------------------------------------------------------------------
  // Start
  // --------------------------------------------------------------------------

  void start_leg(LegKind leg, StartCallback callback)
  {
    LegSlot& s = slot(leg);
    switch (s.state)
    {
      case LegState::ACTIVE:
        if (callback)
        {
          callback({});
        }
        return;
      case LegState::STARTING:
        if (callback)
        {
          s.pending.push_back(std::move(callback));
        }
        return;
      case LegState::STOPPING:
        logger()->warn("cannot start {} while it is stopping", to_string(leg));
        if (callback)
        {
          callback(make_error_code(SessionErrc::START_CANCELLED));
        }
        return;
      case LegState::IDLE:
        break;
    }

    s.state = LegState::STARTING;
    uint64_t generation = ++s.generation;
    if (callback)
    {
      s.pending.push_back(std::move(callback));
    }
    logger()->info("starting {}", to_string(leg));

    if (leg == LegKind::SEND_VIDEO &&
        client_id.size() > video::VideoFrameEnvelope::MAX_IDENTITY_LENGTH)
    {
      fail_start(leg, SessionErrc::IDENTITY_TOO_LONG,
                 fmt::format("client id is {} bytes, limit is {}", client_id.size(),
                             video::VideoFrameEnvelope::MAX_IDENTITY_LENGTH));
      return;
    }

    Marshal post = marshal();
    switch (leg)
    {
      case LegKind::SEND_AUDIO:
        caps.media.acquire_microphone(
            [post, this, generation](std::error_code ec, std::shared_ptr<AudioSource> source) {
              post([this, generation, ec, source]() { on_microphone(generation, ec, source); });
            });
        break;
      case LegKind::SEND_VIDEO:
      {
        video::CaptureConstraints constraints{config.video_width, config.video_height,
                                              config.video_frame_rate};
        caps.media.acquire_camera(
            constraints, [post, this, generation](std::error_code ec,
                                                  std::shared_ptr<video::CaptureSurface> surface) {
              post([this, generation, ec, surface]() { on_camera(generation, ec, surface); });
            });
        break;
      }
      case LegKind::LISTEN_AUDIO:
      case LegKind::VIEW_VIDEO:
        join_family(leg);
        break;
    }
  }

  bool is_current_start(LegKind leg, uint64_t generation) const
  {
    const LegSlot& s = slot(leg);
    return s.generation == generation && s.state == LegState::STARTING;
  }

  void on_microphone(uint64_t generation, std::error_code ec, std::shared_ptr<AudioSource> source)
  {
    if (!is_current_start(LegKind::SEND_AUDIO, generation))
    {
      logger()->debug("discarding stale microphone acquisition");
      if (source)
      {
        source->stop();
      }
      return;
    }
    if (ec || !source)
    {
      fail_start(LegKind::SEND_AUDIO, SessionErrc::CAPABILITY_ACQUISITION_FAILED,
                 ec ? ec.message() : "no microphone returned");
      return;
    }
    microphone = std::move(source);
    join_family(LegKind::SEND_AUDIO);
  }

  void on_camera(uint64_t generation, std::error_code ec,
                 std::shared_ptr<video::CaptureSurface> surface)
  {
    if (!is_current_start(LegKind::SEND_VIDEO, generation))
    {
      logger()->debug("discarding stale camera acquisition");
      if (surface)
      {
        surface->stop();
      }
      return;
    }
    if (ec || !surface)
    {
      fail_start(LegKind::SEND_VIDEO, SessionErrc::CAPABILITY_ACQUISITION_FAILED,
                 ec ? ec.message() : "no camera returned");
      return;
    }
    camera = std::move(surface);
    join_family(LegKind::SEND_VIDEO);
  }

  // Media is in hand; rebuild the family and wait for it
  void join_family(LegKind leg)
  {
    LegSlot& s = slot(leg);
    s.awaiting_family = true;
    ChannelFamily kind = family_of(leg);
    rebuild_family(kind);

    if (kind == ChannelFamily::VIDEO)
    {
      uint64_t generation = s.generation;
      s.waiter->start(
          config.channel_poll_interval, config.data_channel_open_timeout,
          [this]() { return video_family.data_channel_open(); },
          [this, leg, generation](std::error_code ec) { on_channel_ready(leg, generation, ec); });
    }
  }

  void on_channel_ready(LegKind leg, uint64_t generation, std::error_code ec)
  {
    if (!is_current_start(leg, generation))
    {
      return;
    }
    if (ec)
    {
      fail_start(leg, SessionErrc::CHANNEL_OPEN_TIMEOUT,
                 fmt::format("video data channel not open after {} ms",
                             config.data_channel_open_timeout.count()));
      return;
    }
    activate(leg);
  }

  void activate(LegKind leg)
  {
    LegSlot& s = slot(leg);
    s.state = LegState::ACTIVE;
    s.awaiting_family = false;
    s.waiter->cancel();

    if (leg == LegKind::SEND_VIDEO)
    {
      cancel_timer(send_timer);
      send_timer = loop.schedule_repeating(config.frame_interval(), [this]() { on_send_tick(); });
    }
    else if (leg == LegKind::VIEW_VIDEO)
    {
      cancel_timer(sweep_timer);
      sweep_timer =
          loop.schedule_repeating(config.eviction_sweep_interval, [this]() { on_sweep_tick(); });
    }

    logger()->info("{} active", to_string(leg));
    auto callbacks = take_pending(leg);
    events.publish(LegStateChanged{leg, true});
    complete(callbacks, {});
  }

  void fail_start(LegKind leg, SessionErrc errc, const std::string& cause)
  {
    LegSlot& s = slot(leg);
    s.generation++;
    s.awaiting_family = false;
    s.waiter->cancel();
    release_media(leg);
    s.state = LegState::IDLE;
    close_family_if_unused(family_of(leg));

    const char* message = start_failure_message(leg);
    logger()->error("{}: {}", message, cause);
    auto callbacks = take_pending(leg);
    events.publish(SessionError{message, make_error_code(errc), cause});
    complete(callbacks, make_error_code(errc));
  }

  // Detached before the event is published: a handler may start the leg again
  std::vector<StartCallback> take_pending(LegKind leg)
  {
    std::vector<StartCallback> callbacks;
    callbacks.swap(slot(leg).pending);
    return callbacks;
  }

  static void complete(std::vector<StartCallback>& callbacks, std::error_code ec)
  {
    for (auto& callback : callbacks)
    {
      callback(ec);
    }
  }

  // --------------------------------------------------------------------------
  // Family lifecycle
  // --------------------------------------------------------------------------

  void rebuild_family(ChannelFamily kind)
  {
    FamilySlot& fam = family(kind);
    uint64_t epoch = fam.reset();
    logger()->info("rebuilding {} channel family epoch={}", to_string(kind), epoch);

    Marshal post = marshal();
    auto channel = caps.signaling.create_channel();
    if (!channel)
    {
      post([this, kind, epoch]() { on_family_failed(kind, epoch, "signaling unavailable"); });
      return;
    }

    SignalingChannel* raw = channel.get();
    fam.attach_signaling(std::move(channel));

    raw->set_message_handler([post, this, kind, epoch](const std::string& text) {
      post([this, kind, epoch, text]() { on_signaling_text(kind, epoch, text); });
    });
    raw->set_close_handler([post, this, kind, epoch]() {
      post([this, kind, epoch]() { on_signaling_closed(kind, epoch); });
    });

    std::string url =
        kind == ChannelFamily::AUDIO ? config.audio_signaling_url() : config.video_signaling_url();
    raw->open(url, [post, this, kind, epoch](std::error_code ec) {
      post([this, kind, epoch, ec]() { on_signaling_open(kind, epoch, ec); });
    });
  }

  void on_signaling_open(ChannelFamily kind, uint64_t epoch, std::error_code ec)
  {
    FamilySlot& fam = family(kind);
    if (!fam.is_current(epoch))
    {
      return;
    }
    if (ec)
    {
      on_family_failed(kind, epoch, "signaling failed to open: " + ec.message());
      return;
    }
    logger()->debug("{} signaling open", to_string(kind));

    auto link = caps.peer_links.create(PeerLinkConfig{config.ice_servers});
    if (!link)
    {
      on_family_failed(kind, epoch, "peer link unavailable");
      return;
    }
    PeerLink* raw = link.get();
    fam.attach_peer_link(std::move(link));

    Marshal post = marshal();
    raw->set_local_candidate_handler([post, this, kind, epoch](const std::string& candidate) {
      post([this, kind, epoch, candidate]() { on_local_candidate(kind, epoch, candidate); });
    });

    OfferOptions options;
    if (kind == ChannelFamily::AUDIO)
    {
      if (microphone && is_engaged(slot(LegKind::SEND_AUDIO).state))
      {
        raw->add_local_audio(microphone);
      }
      raw->set_remote_audio_handler(
          [post, this, epoch](std::shared_ptr<RemoteAudioTrack> track) {
            post([this, epoch, track]() { on_remote_audio(epoch, track); });
          });
      options.receive_audio = is_engaged(slot(LegKind::LISTEN_AUDIO).state);
    }
    else
    {
      // Created before the offer so it is negotiated in it
      auto channel = raw->create_data_channel(DataChannelOptions{});
      if (!channel)
      {
        on_family_failed(kind, epoch, "data channel unavailable");
        return;
      }
      wire_data_channel(*channel, epoch);
      fam.attach_data_channel(std::move(channel));
    }

    raw->create_offer(options,
                      [post, this, kind, epoch](std::error_code offer_ec, std::string sdp) {
                        post([this, kind, epoch, offer_ec, sdp]() {
                          on_offer(kind, epoch, offer_ec, sdp);
                        });
                      });
  }

  void wire_data_channel(DataChannel& channel, uint64_t epoch)
  {
    Marshal post = marshal();
    channel.set_open_handler([post, epoch]() {
      post([epoch]() { logger()->info("video data channel open epoch={}", epoch); });
    });
    channel.set_close_handler([post, epoch]() {
      post([epoch]() { logger()->info("video data channel closed epoch={}", epoch); });
    });
    channel.set_binary_handler([post, this, epoch](std::span<const uint8_t> data) {
      std::vector<uint8_t> bytes(data.begin(), data.end());
      post([this, epoch, bytes = std::move(bytes)]() { on_binary(epoch, bytes); });
    });
    channel.set_text_handler([post, this, epoch](const std::string& text) {
      post([this, epoch, text]() {
        if (video_family.is_current(epoch))
        {
          dispatch_text(ChannelFamily::VIDEO, text);
        }
      });
    });
  }

  void on_offer(ChannelFamily kind, uint64_t epoch, std::error_code ec, const std::string& sdp)
  {
    FamilySlot& fam = family(kind);
    if (!fam.is_current(epoch))
    {
      return;
    }
    if (ec)
    {
      on_family_failed(kind, epoch, "offer failed: " + ec.message());
      return;
    }
    if (!fam.send_signaling(SignalingMessage::offer(client_id, sdp)))
    {
      on_family_failed(kind, epoch, "signaling closed before offer");
      return;
    }
    fam.mark_negotiating();
    logger()->info("sent {} offer sdp_bytes={}", to_string(kind), sdp.size());

    // Audio legs are up once negotiation starts; video legs wait for the data channel
    if (kind == ChannelFamily::AUDIO)
    {
      for (LegKind leg : {LegKind::SEND_AUDIO, LegKind::LISTEN_AUDIO})
      {
        const LegSlot& s = slot(leg);
        if (s.state == LegState::STARTING && s.awaiting_family)
        {
          activate(leg);
        }
      }
    }
  }

  void on_family_failed(ChannelFamily kind, uint64_t epoch, const std::string& cause)
  {
    FamilySlot& fam = family(kind);
    if (!fam.is_current(epoch))
    {
      return;
    }
    logger()->warn("{} channel family failed: {}", to_string(kind), cause);
    fam.close();

    for (LegKind leg : ALL_LEGS)
    {
      if (family_of(leg) != kind)
      {
        continue;
      }
      const LegSlot& s = slot(leg);
      if (s.state == LegState::STARTING && s.awaiting_family)
      {
        fail_start(leg, SessionErrc::CAPABILITY_ACQUISITION_FAILED, cause);
      }
      else if (s.state == LegState::ACTIVE)
      {
        logger()->warn("{} stays active without its {} channel", to_string(leg), to_string(kind));
      }
    }
  }

  void on_signaling_closed(ChannelFamily kind, uint64_t epoch)
  {
    if (family(kind).is_current(epoch))
    {
      logger()->warn("{} signaling closed by server", to_string(kind));
    }
  }

  void close_family_if_unused(ChannelFamily kind)
  {
    for (LegKind leg : ALL_LEGS)
    {
      if (family_of(leg) == kind && slot(leg).state != LegState::IDLE)
      {
        return;
      }
    }
    family(kind).close();
  }

  // --------------------------------------------------------------------------
  // Inbound
  // --------------------------------------------------------------------------

  void on_signaling_text(ChannelFamily kind, uint64_t epoch, const std::string& text)
  {
    if (family(kind).is_current(epoch))
    {
      dispatch_text(kind, text);
    }
  }

  void dispatch_text(ChannelFamily kind, const std::string& text)
  {
    auto message = parse_signaling_message(text);
    if (!message)
    {
      logger()->debug("ignoring malformed {} message", to_string(kind));
      return;
    }

    PeerLink* link = family(kind).peer_link();
    switch (message->type)
    {
      case SignalingType::ANSWER:
        if (link)
        {
          link->set_remote_answer(message->sdp);
          logger()->debug("{} answer applied", to_string(kind));
        }
        break;
      case SignalingType::ICE_CANDIDATE:
        if (link && !message->candidate.empty())
        {
          link->add_remote_candidate(message->candidate);
        }
        break;
      case SignalingType::VIDEO_ADD:
        logger()->info("video source entered range clientId={}", message->client_id);
        break;
      case SignalingType::VIDEO_REMOVE:
        if (kind != ChannelFamily::VIDEO)
        {
          logger()->debug("ignoring video-remove on {} signaling", to_string(kind));
          break;
        }
        logger()->info("video source left range clientId={}", message->client_id);
        if (cache.remove(message->client_id))
        {
          events.publish(SourceRemoved{message->client_id});
        }
        break;
      case SignalingType::ERROR:
        logger()->error("{} connection error: {}", to_string(kind), message->message);
        break;
      default:
        logger()->debug("ignoring {} message type={}", to_string(kind), message->type_name);
        break;
    }
  }

  void on_local_candidate(ChannelFamily kind, uint64_t epoch, const std::string& candidate)
  {
    FamilySlot& fam = family(kind);
    if (fam.is_current(epoch))
    {
      fam.send_signaling(SignalingMessage::ice_candidate(client_id, candidate));
    }
  }

  void on_remote_audio(uint64_t epoch, const std::shared_ptr<RemoteAudioTrack>& track)
  {
    if (!audio_family.is_current(epoch) || !track)
    {
      return;
    }
    if (!is_engaged(slot(LegKind::LISTEN_AUDIO).state))
    {
      logger()->debug("ignoring remote audio track while not listening");
      return;
    }
    if (playback)
    {
      playback->stop();
    }
    playback = caps.media.play_remote_audio(track, volume);
    if (!playback)
    {
      logger()->warn("remote audio track {} could not be played", track->id());
      return;
    }
    logger()->info("playing remote audio track={} volume={}", track->id(), volume);
  }

  void on_binary(uint64_t epoch, const std::vector<uint8_t>& data)
  {
    if (!video_family.is_current(epoch))
    {
      return;
    }
    if (slot(LegKind::VIEW_VIDEO).state != LegState::ACTIVE)
    {
      stats.frames_dropped++;
      return;
    }

    auto decoded = video::FrameCodec::decode(data);
    if (!decoded.success())
    {
      stats.frames_dropped++;
      logger()->trace("dropping frame: {}", video::to_string(*decoded.error));
      return;
    }

    const auto& envelope = decoded.envelope;
    uint64_t now = loop.now_nanos();
    if (auto rejection = validator.validate(envelope, now))
    {
      stats.frames_dropped++;
      logger()->trace("dropping frame from {}: {}", envelope.participant_id,
                      video::to_string(*rejection));
      return;
    }

    video::FrameHandle handle = caps.frame_store.publish(envelope.participant_id, envelope.payload);
    uint64_t handle_id = handle.id();
    auto result = cache.upsert(envelope.participant_id, std::move(handle), envelope.sequence_number,
                               now, envelope.capture_timestamp_nanos);
    stats.frames_received++;

    if (result.is_new_participant)
    {
      logger()->info("new video source clientId={}", envelope.participant_id);
      events.publish(SourceAdded{envelope.participant_id, handle_id});
    }
    else
    {
      events.publish(FrameUpdated{envelope.participant_id, handle_id, envelope.sequence_number});
    }
  }

  // --------------------------------------------------------------------------
  // Timers
  // --------------------------------------------------------------------------

  void on_send_tick()
  {
    if (slot(LegKind::SEND_VIDEO).state != LegState::ACTIVE || !camera)
    {
      return;
    }
    if (!video_family.data_channel_open())
    {
      return;
    }
    auto bytes = publisher.produce(*camera, loop.now_nanos());
    if (!bytes)
    {
      return;
    }
    video_family.data_channel()->send_binary(*bytes);
    stats.frames_sent++;
  }

  void on_sweep_tick()
  {
    for (const auto& id : cache.sweep(loop.now_nanos()))
    {
      logger()->info("video source expired clientId={}", id);
      events.publish(SourceRemoved{id});
    }
  }

  // --------------------------------------------------------------------------
  // Stop
  // --------------------------------------------------------------------------

  void release_media(LegKind leg)
  {
    switch (leg)
    {
      case LegKind::SEND_AUDIO:
        if (microphone)
        {
          if (audio_family.peer_link())
          {
            audio_family.peer_link()->remove_local_audio();
          }
          microphone->stop();
          microphone.reset();
        }
        break;
      case LegKind::LISTEN_AUDIO:
        if (playback)
        {
          playback->stop();
          playback.reset();
        }
        break;
      case LegKind::SEND_VIDEO:
        cancel_timer(send_timer);
        if (camera)
        {
          camera->stop();
          camera.reset();
        }
        break;
      case LegKind::VIEW_VIDEO:
        cancel_timer(sweep_timer);
        for (const auto& id : cache.clear())
        {
          events.publish(SourceRemoved{id});
        }
        break;
    }
  }

  void stop_leg(LegKind leg)
  {
    LegSlot& s = slot(leg);
    if (s.state == LegState::IDLE || s.state == LegState::STOPPING)
    {
      return;
    }

    s.state = LegState::STOPPING;
    s.generation++;
    s.awaiting_family = false;
    s.waiter->cancel();

    // Best-effort notices
    if (leg == LegKind::SEND_AUDIO)
    {
      audio_family.send_signaling(SignalingMessage::stop_sending(client_id));
    }
    else if (leg == LegKind::SEND_VIDEO && video_family.data_channel_open())
    {
      video_family.data_channel()->send_text(
          serialize_signaling_message(SignalingMessage::stop_video()));
    }

    release_media(leg);
    s.state = LegState::IDLE;
    close_family_if_unused(family_of(leg));

    logger()->info("{} stopped", to_string(leg));
    auto callbacks = take_pending(leg);
    events.publish(LegStateChanged{leg, false});
    complete(callbacks, make_error_code(SessionErrc::START_CANCELLED));
  }

  void disconnect()
  {
    for (LegKind leg : ALL_LEGS)
    {
      stop_leg(leg);
    }
    audio_family.close();
    video_family.close();

    if (!connected)
    {
      return;
    }
    connected = false;
    logger()->info("disconnected clientId={}", client_id);
    events.publish(Disconnected{});
  }

  std::string client_id;
  SessionConfig config;
  EventLoop& loop;
  SessionCapabilities caps;

  EventBus events;
  video::FrameValidator validator;
  video::ParticipantFrameCache cache;
  video::FramePublisher publisher;
  FamilySlot audio_family;
  FamilySlot video_family;
  std::array<LegSlot, 4> legs;

  std::shared_ptr<AudioSource> microphone;
  std::shared_ptr<video::CaptureSurface> camera;
  std::unique_ptr<AudioPlayback> playback;
  float volume;

  TimerId send_timer = INVALID_TIMER;
  TimerId sweep_timer = INVALID_TIMER;
  bool connected = false;
  SessionStats stats;

  std::shared_ptr<int> alive;
};

// ============================================================================
// SessionController
// ============================================================================

SessionController::SessionController(std::string client_id, SessionConfig config, EventLoop& loop,
                                     SessionCapabilities capabilities)
    : impl_(std::make_unique<Impl>(std::move(client_id), std::move(config), loop, capabilities))
{
  configure_logging(impl_->config.debug);
}

SessionController::~SessionController() = default;

void SessionController::connect()
{
  if (impl_->connected)
  {
    return;
  }
  impl_->connected = true;
  logger()->info("connected clientId={} server={}", impl_->client_id, impl_->config.server_url);
  impl_->events.publish(Connected{});
}

void SessionController::disconnect()
{
  impl_->disconnect();
}

void SessionController::start_leg(LegKind leg, StartCallback callback)
{
  impl_->start_leg(leg, std::move(callback));
}

void SessionController::stop_leg(LegKind leg)
{
  impl_->stop_leg(leg);
}

void SessionController::set_audio_volume(float volume)
{
  impl_->volume = std::clamp(volume, 0.0f, 1.0f);
  if (impl_->playback)
  {
    impl_->playback->set_volume(impl_->volume);
  }
}

LegState SessionController::leg_state(LegKind leg) const
{
  return impl_->slot(leg).state;
}

bool SessionController::is_connected() const
{
  return impl_->connected;
}

SessionSnapshot SessionController::connection_state() const
{
  SessionSnapshot snapshot;
  snapshot.connected = impl_->connected;
  snapshot.client_id = impl_->client_id;
  snapshot.send_audio = leg_state(LegKind::SEND_AUDIO);
  snapshot.listen_audio = leg_state(LegKind::LISTEN_AUDIO);
  snapshot.send_video = leg_state(LegKind::SEND_VIDEO);
  snapshot.view_video = leg_state(LegKind::VIEW_VIDEO);
  snapshot.video_sources = impl_->cache.size();
  return snapshot;
}

bool SessionController::family_open(ChannelFamily family) const
{
  return impl_->family(family).has_resources();
}

SubscriptionId SessionController::subscribe(EventHandler handler)
{
  return impl_->events.subscribe(std::move(handler));
}

bool SessionController::unsubscribe(SubscriptionId id)
{
  return impl_->events.unsubscribe(id);
}

const video::ParticipantFrameCache& SessionController::frame_cache() const
{
  return impl_->cache;
}

const SessionConfig& SessionController::config() const
{
  return impl_->config;
}

SessionStats SessionController::stats() const
{
  SessionStats result = impl_->stats;
  result.audio_family_rebuilds = impl_->audio_family.rebuild_count();
  result.video_family_rebuilds = impl_->video_family.rebuild_count();
  return result;
}

}  // namespace session
}  // namespace tankrtc
