/**
 * @file frame_store.cpp
 * @brief Frame handle and in-memory store
 */

#include "tankrtc/video/frame_store.h"

#include <mutex>
#include <unordered_map>

namespace tankrtc
{
namespace video
{

FrameHandle::FrameHandle(uint64_t id, Releaser releaser) : id_(id), releaser_(std::move(releaser))
{
}

FrameHandle::~FrameHandle()
{
  release();
}

FrameHandle::FrameHandle(FrameHandle&& other) noexcept
    : id_(other.id_), releaser_(std::move(other.releaser_))
{
  other.id_ = 0;
  other.releaser_ = nullptr;
}

FrameHandle& FrameHandle::operator=(FrameHandle&& other) noexcept
{
  if (this != &other)
  {
    release();
    id_ = other.id_;
    releaser_ = std::move(other.releaser_);
    other.id_ = 0;
    other.releaser_ = nullptr;
  }
  return *this;
}

void FrameHandle::release()
{
  if (id_ == 0) return;

  uint64_t id = id_;
  auto releaser = std::move(releaser_);
  id_ = 0;
  releaser_ = nullptr;

  if (releaser)
  {
    releaser(id);
  }
}

struct StoredFrame
{
  std::string participant_id;
  std::vector<uint8_t> image;
};

struct MemoryFrameStore::State
{
  mutable std::mutex mutex;
  std::unordered_map<uint64_t, StoredFrame> frames;
  uint64_t next_id = 1;
  size_t released = 0;
};

MemoryFrameStore::MemoryFrameStore() : state_(std::make_shared<State>()) {}

MemoryFrameStore::~MemoryFrameStore() = default;

FrameHandle MemoryFrameStore::publish(const std::string& participant_id,
                                      std::span<const uint8_t> image)
{
  uint64_t id;
  {
    std::lock_guard lock(state_->mutex);
    id = state_->next_id++;
    state_->frames.emplace(id, StoredFrame{participant_id, {image.begin(), image.end()}});
  }

  std::weak_ptr<State> weak = state_;
  return FrameHandle(id,
                     [weak](uint64_t released_id)
                     {
                       auto state = weak.lock();
                       if (!state) return;
                       std::lock_guard lock(state->mutex);
                       if (state->frames.erase(released_id) > 0)
                       {
                         state->released++;
                       }
                     });
}

std::optional<std::vector<uint8_t>> MemoryFrameStore::lookup(uint64_t id) const
{
  std::lock_guard lock(state_->mutex);
  auto it = state_->frames.find(id);
  if (it == state_->frames.end())
  {
    return std::nullopt;
  }
  return it->second.image;
}

size_t MemoryFrameStore::live_count() const
{
  std::lock_guard lock(state_->mutex);
  return state_->frames.size();
}

size_t MemoryFrameStore::released_count() const
{
  std::lock_guard lock(state_->mutex);
  return state_->released;
}

}  // namespace video
}  // namespace tankrtc
