#pragma once

/**
 * @file frame_store.h
 * @brief Published frame images and their release handles
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tankrtc
{
namespace video
{

/**
 * @brief Move-only token owning one published image
 *
 * Releasing the handle (explicitly or on destruction) withdraws the image
 * from its store exactly once.
 */
class FrameHandle
{
 public:
  using Releaser = std::function<void(uint64_t id)>;

  FrameHandle() = default;
  FrameHandle(uint64_t id, Releaser releaser);
  ~FrameHandle();

  FrameHandle(const FrameHandle&) = delete;
  FrameHandle& operator=(const FrameHandle&) = delete;

  FrameHandle(FrameHandle&& other) noexcept;
  FrameHandle& operator=(FrameHandle&& other) noexcept;

  /**
   * @brief Withdraw the image now; no-op on an empty handle
   */
  void release();

  [[nodiscard]] uint64_t id() const
  {
    return id_;
  }

  [[nodiscard]] bool valid() const
  {
    return id_ != 0;
  }

 private:
  uint64_t id_ = 0;
  Releaser releaser_;
};

/**
 * @brief Destination for accepted frame images
 *
 * The presentation layer resolves handle ids to image bytes through its
 * store implementation.
 */
class FrameStore
{
 public:
  virtual ~FrameStore() = default;

  /**
   * @brief Publish an image for a participant
   * @return Handle owning the published image
   */
  virtual FrameHandle publish(const std::string& participant_id,
                              std::span<const uint8_t> image) = 0;

 protected:
  FrameStore() = default;
};

/**
 * @brief In-process FrameStore keeping image bytes in memory
 *
 * Thread-safe: frames may be read from a render thread while the session
 * publishes and releases them. Handles stay safe to release after the store
 * is destroyed.
 */
class MemoryFrameStore : public FrameStore
{
 public:
  MemoryFrameStore();
  ~MemoryFrameStore() override;

  // Disable copy
  MemoryFrameStore(const MemoryFrameStore&) = delete;
  MemoryFrameStore& operator=(const MemoryFrameStore&) = delete;

  FrameHandle publish(const std::string& participant_id,
                      std::span<const uint8_t> image) override;

  /**
   * @brief Copy of the image behind a handle id
   */
  [[nodiscard]] std::optional<std::vector<uint8_t>> lookup(uint64_t id) const;

  /**
   * @brief Number of images currently published
   */
  [[nodiscard]] size_t live_count() const;

  /**
   * @brief Total images released since construction
   */
  [[nodiscard]] size_t released_count() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

}  // namespace video
}  // namespace tankrtc
