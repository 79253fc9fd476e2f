#pragma once

/**
 * @file participant_frame_cache.h
 * @brief Latest accepted frame per remote participant with age-based eviction
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "tankrtc/video/frame_codec.h"
#include "tankrtc/video/frame_store.h"

namespace tankrtc
{
namespace video
{

/**
 * @brief Cache entry for one participant
 */
struct CachedFrame
{
  FrameHandle handle;
  uint64_t received_at_nanos = 0;
  uint64_t capture_timestamp_nanos = 0;
  uint32_t sequence_number = 0;
};

/**
 * @brief Outcome of an upsert
 */
struct UpsertResult
{
  bool is_new_participant = false;  // No entry existed before this frame
};

/**
 * @brief Frame cache keyed by participant
 *
 * Eviction is by time since the last accepted frame, not by access. A
 * participant that leaves range stops producing frames and disappears on the
 * first sweep after eviction_age. Not thread-safe; owned and driven by the
 * session's event loop.
 */
class ParticipantFrameCache
{
 public:
  explicit ParticipantFrameCache(
      std::chrono::milliseconds eviction_age = std::chrono::milliseconds(2000));
  ~ParticipantFrameCache();

  // Disable copy
  ParticipantFrameCache(const ParticipantFrameCache&) = delete;
  ParticipantFrameCache& operator=(const ParticipantFrameCache&) = delete;

  /**
   * @brief Insert or replace a participant's frame
   *
   * The previous handle, if any, is released before the new one is stored.
   */
  UpsertResult upsert(const ParticipantId& participant_id, FrameHandle handle,
                      uint32_t sequence_number, uint64_t now_nanos,
                      uint64_t capture_timestamp_nanos = 0);

  /**
   * @brief Evict entries older than the eviction age
   * @return Evicted participant ids
   */
  std::vector<ParticipantId> sweep(uint64_t now_nanos);

  /**
   * @brief Remove one participant
   * @return True if an entry existed
   */
  bool remove(const ParticipantId& participant_id);

  /**
   * @brief Remove every entry
   * @return Ids that were present
   */
  std::vector<ParticipantId> clear();

  [[nodiscard]] const CachedFrame* find(const ParticipantId& participant_id) const;

  [[nodiscard]] bool contains(const ParticipantId& participant_id) const;

  [[nodiscard]] size_t size() const;

  [[nodiscard]] std::vector<ParticipantId> participants() const;

  [[nodiscard]] std::chrono::milliseconds eviction_age() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace video
}  // namespace tankrtc
