/**
 * @file participant_frame_cache.cpp
 * @brief Participant frame cache implementation
 */

#include "tankrtc/video/participant_frame_cache.h"

#include <unordered_map>

namespace tankrtc
{
namespace video
{

struct ParticipantFrameCache::Impl
{
  std::chrono::milliseconds eviction_age;
  std::unordered_map<ParticipantId, CachedFrame> entries;

  explicit Impl(std::chrono::milliseconds age) : eviction_age(age) {}

  bool expired(const CachedFrame& frame, uint64_t now_nanos) const
  {
    const int64_t age_nanos =
        static_cast<int64_t>(now_nanos) - static_cast<int64_t>(frame.received_at_nanos);
    return static_cast<double>(age_nanos) / 1e6 > static_cast<double>(eviction_age.count());
  }
};

ParticipantFrameCache::ParticipantFrameCache(std::chrono::milliseconds eviction_age)
    : impl_(std::make_unique<Impl>(eviction_age))
{
}

ParticipantFrameCache::~ParticipantFrameCache() = default;

UpsertResult ParticipantFrameCache::upsert(const ParticipantId& participant_id, FrameHandle handle,
                                           uint32_t sequence_number, uint64_t now_nanos,
                                           uint64_t capture_timestamp_nanos)
{
  UpsertResult result;

  auto it = impl_->entries.find(participant_id);
  if (it == impl_->entries.end())
  {
    result.is_new_participant = true;
    it = impl_->entries.emplace(participant_id, CachedFrame{}).first;
  }
  else
  {
    it->second.handle.release();
  }

  auto& entry = it->second;
  entry.handle = std::move(handle);
  entry.received_at_nanos = now_nanos;
  entry.capture_timestamp_nanos = capture_timestamp_nanos;
  entry.sequence_number = sequence_number;
  return result;
}

std::vector<ParticipantId> ParticipantFrameCache::sweep(uint64_t now_nanos)
{
  std::vector<ParticipantId> evicted;

  for (auto it = impl_->entries.begin(); it != impl_->entries.end();)
  {
    if (impl_->expired(it->second, now_nanos))
    {
      it->second.handle.release();
      evicted.push_back(it->first);
      it = impl_->entries.erase(it);
    }
    else
    {
      ++it;
    }
  }

  return evicted;
}

bool ParticipantFrameCache::remove(const ParticipantId& participant_id)
{
  auto it = impl_->entries.find(participant_id);
  if (it == impl_->entries.end())
  {
    return false;
  }
  it->second.handle.release();
  impl_->entries.erase(it);
  return true;
}

std::vector<ParticipantId> ParticipantFrameCache::clear()
{
  std::vector<ParticipantId> removed;
  removed.reserve(impl_->entries.size());
  for (auto& [id, entry] : impl_->entries)
  {
    entry.handle.release();
    removed.push_back(id);
  }
  impl_->entries.clear();
  return removed;
}

const CachedFrame* ParticipantFrameCache::find(const ParticipantId& participant_id) const
{
  auto it = impl_->entries.find(participant_id);
  return it == impl_->entries.end() ? nullptr : &it->second;
}

bool ParticipantFrameCache::contains(const ParticipantId& participant_id) const
{
  return impl_->entries.count(participant_id) > 0;
}

size_t ParticipantFrameCache::size() const
{
  return impl_->entries.size();
}

std::vector<ParticipantId> ParticipantFrameCache::participants() const
{
  std::vector<ParticipantId> ids;
  ids.reserve(impl_->entries.size());
  for (const auto& [id, _] : impl_->entries)
  {
    ids.push_back(id);
  }
  return ids;
}

std::chrono::milliseconds ParticipantFrameCache::eviction_age() const
{
  return impl_->eviction_age;
}

}  // namespace video
}  // namespace tankrtc
