/**
 * @file channel_family.cpp
 * @brief Channel family resource slot
 */

#include "tankrtc/session/channel_family.h"

#include "tankrtc/logging.h"

namespace tankrtc
{
namespace session
{

FamilySlot::FamilySlot(ChannelFamily family) : family_(family) {}

FamilySlot::~FamilySlot()
{
  release();
}

uint64_t FamilySlot::reset()
{
  release();
  rebuilds_++;
  return ++epoch_;
}

bool FamilySlot::close()
{
  bool had_resources = has_resources();
  release();
  epoch_++;
  if (had_resources)
  {
    logger()->info("{} channel family closed", to_string(family_));
  }
  return had_resources;
}

void FamilySlot::attach_signaling(std::unique_ptr<SignalingChannel> channel)
{
  signaling_ = std::move(channel);
}

void FamilySlot::attach_peer_link(std::unique_ptr<PeerLink> link)
{
  peer_link_ = std::move(link);
}

void FamilySlot::attach_data_channel(std::unique_ptr<DataChannel> channel)
{
  data_channel_ = std::move(channel);
}

bool FamilySlot::send_signaling(const SignalingMessage& message)
{
  if (!signaling_open())
  {
    return false;
  }
  signaling_->send_text(serialize_signaling_message(message));
  return true;
}

bool FamilySlot::signaling_open() const
{
  return signaling_ && signaling_->is_open();
}

bool FamilySlot::data_channel_open() const
{
  return data_channel_ && data_channel_->is_open();
}

void FamilySlot::release()
{
  // Close in reverse order of creation
  if (data_channel_)
  {
    data_channel_->close();
    data_channel_.reset();
  }
  if (peer_link_)
  {
    peer_link_->close();
    peer_link_.reset();
  }
  if (signaling_)
  {
    signaling_->close();
    signaling_.reset();
  }
  negotiating_ = false;
}

}  // namespace session
}  // namespace tankrtc
