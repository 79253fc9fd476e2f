#pragma once

/**
 * @file channel_family.h
 * @brief Resource slot for one channel family
 */

#include <cstdint>
#include <memory>

#include "tankrtc/session/capabilities.h"
#include "tankrtc/session/leg_state.h"
#include "tankrtc/signaling_message.h"

namespace tankrtc
{
namespace session
{

/**
 * @brief Owns the signaling socket, peer link and (video) data channel of a family
 *
 * Every reset or close advances the epoch. Asynchronous work started for a
 * family captures the epoch and is discarded when it no longer matches.
 */
class FamilySlot
{
 public:
  explicit FamilySlot(ChannelFamily family);
  ~FamilySlot();

  // Disable copy
  FamilySlot(const FamilySlot&) = delete;
  FamilySlot& operator=(const FamilySlot&) = delete;

  /**
   * @brief Close current resources and begin a new generation
   * @return Epoch of the new generation
   */
  uint64_t reset();

  /**
   * @brief Close and release all resources
   * @return True if anything was open
   */
  bool close();

  void attach_signaling(std::unique_ptr<SignalingChannel> channel);
  void attach_peer_link(std::unique_ptr<PeerLink> link);
  void attach_data_channel(std::unique_ptr<DataChannel> channel);

  /**
   * @brief Send a message if the signaling socket is open
   * @return False if it was not sent
   */
  bool send_signaling(const SignalingMessage& message);

  void mark_negotiating()
  {
    negotiating_ = true;
  }

  [[nodiscard]] ChannelFamily family() const
  {
    return family_;
  }

  [[nodiscard]] uint64_t epoch() const
  {
    return epoch_;
  }

  [[nodiscard]] bool is_current(uint64_t epoch) const
  {
    return epoch == epoch_;
  }

  [[nodiscard]] bool has_resources() const
  {
    return signaling_ || peer_link_ || data_channel_;
  }

  /**
   * @brief Offer sent for the current generation
   */
  [[nodiscard]] bool is_negotiating() const
  {
    return negotiating_;
  }

  [[nodiscard]] bool signaling_open() const;
  [[nodiscard]] bool data_channel_open() const;

  [[nodiscard]] SignalingChannel* signaling() const
  {
    return signaling_.get();
  }

  [[nodiscard]] PeerLink* peer_link() const
  {
    return peer_link_.get();
  }

  [[nodiscard]] DataChannel* data_channel() const
  {
    return data_channel_.get();
  }

  /**
   * @brief Number of resets since construction
   */
  [[nodiscard]] uint64_t rebuild_count() const
  {
    return rebuilds_;
  }

 private:
  void release();

  ChannelFamily family_;
  uint64_t epoch_ = 0;
  uint64_t rebuilds_ = 0;
  bool negotiating_ = false;
  std::unique_ptr<SignalingChannel> signaling_;
  std::unique_ptr<PeerLink> peer_link_;
  std::unique_ptr<DataChannel> data_channel_;
};

}  // namespace session
}  // namespace tankrtc
