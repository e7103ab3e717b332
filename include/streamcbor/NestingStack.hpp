// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>

#include "streamcbor/Error.hpp"
#include "streamcbor/Event.hpp"

#ifndef CONFIG_STREAMCBOR_MAX_NESTING
#define CONFIG_STREAMCBOR_MAX_NESTING 16
#endif

namespace streamcbor {

enum class FrameKind : uint8_t {
  kArray,
  kMap,
  kByteStringChunks,
  kTextStringChunks,
};

/**
 * @brief Bookkeeping for one open container.
 */
struct Frame {
  FrameKind kind;
  bool definite;
  bool oddItems;       //< an odd number of items was seen (maps only)
  uint64_t remaining;  //< items still expected, definite frames only

  bool isChunks() const noexcept {
    return kind == FrameKind::kByteStringChunks ||
           kind == FrameKind::kTextStringChunks;
  }
  bool exhausted() const noexcept { return definite && remaining == 0; }
};

/**
 * @brief A fixed capacity stack of open containers.
 *
 * A container counts as one item of its parent when it is opened, so closing
 * a frame never touches the parent.  A tag sets a pending flag instead of
 * pushing a frame; the item that follows the tag clears it and is the one
 * that gets counted.
 *
 * @tparam Capacity Maximum nesting depth
 */
template <size_t Capacity>
class NestingStack {
  static_assert(Capacity > 0, "NestingStack needs room for one frame");

 private:
  Frame mFrames[Capacity];
  size_t mDepth = 0;
  bool mTagPending = false;

 public:
  inline size_t depth() const noexcept { return mDepth; }
  inline bool empty() const noexcept { return mDepth == 0; }
  inline bool full() const noexcept { return mDepth == Capacity; }
  static constexpr size_t capacity() noexcept { return Capacity; }

  /**
   * @brief Get the innermost frame.  Only valid when not empty().
   */
  inline const Frame &top() const noexcept { return mFrames[mDepth - 1]; }

  /**
   * @brief True when the innermost frame is definite and has received all of
   * its items, i.e. it must be closed next.
   */
  inline bool topExhausted() const noexcept {
    return mDepth != 0 && top().exhausted();
  }

  /**
   * @brief True when every open frame is definite with nothing remaining, so
   * all of them can close without further input.
   */
  bool allExhausted() const noexcept {
    for (size_t i = 0; i < mDepth; i++) {
      if (!mFrames[i].exhausted()) {
        return false;
      }
    }
    return true;
  }

  inline bool tagPending() const noexcept { return mTagPending; }

  /**
   * @brief True between top level items: nothing open, no tag waiting for
   * its item.
   */
  inline bool atItemBoundary() const noexcept {
    return mDepth == 0 && !mTagPending;
  }

  /**
   * @brief Open a frame.
   *
   * @param kind
   * @param definite
   * @param count Number of child items for definite frames (2n for maps)
   * @return Error kDepthExceeded if the stack is full
   */
  Error push(const FrameKind kind, const bool definite,
             const uint64_t count = 0) noexcept {
    if (full()) {
      return Error::kDepthExceeded;
    }
    Frame &frame = mFrames[mDepth++];
    frame.kind = kind;
    frame.definite = definite;
    frame.oddItems = false;
    frame.remaining = definite ? count : 0;
    return Error::kNone;
  }

  /**
   * @brief Close the innermost frame.  Only valid when not empty().
   */
  inline void pop() noexcept { mDepth--; }

  /**
   * @brief Account for one complete item (or container opening) in the
   * innermost frame and consume a pending tag.
   */
  void countItem() noexcept {
    mTagPending = false;
    if (mDepth == 0) {
      return;
    }
    Frame &frame = mFrames[mDepth - 1];
    frame.oddItems = !frame.oddItems;
    if (frame.definite) {
      frame.remaining--;
    }
  }

  /**
   * @brief Account for any event other than End.
   *
   * A tag marks its item as pending.  Anything else is counted in the
   * innermost frame, and arrays, maps and indefinite strings then open a
   * frame of their own.
   *
   * @param event
   * @return Error kDepthExceeded, with nothing changed, if the stack is full
   */
  Error enter(const Event &event) noexcept {
    if (event.type() == EventType::kTag) {
      mTagPending = true;
      return Error::kNone;
    }
    if (event.isContainerStart() && full()) {
      return Error::kDepthExceeded;
    }
    countItem();
    switch (event.type()) {
      case EventType::kArray:
        return push(FrameKind::kArray, true, event.value());
      case EventType::kArrayIndefinite:
        return push(FrameKind::kArray, false);
      case EventType::kMap:
        return push(FrameKind::kMap, true, event.value() * 2);
      case EventType::kMapIndefinite:
        return push(FrameKind::kMap, false);
      case EventType::kByteStringIndefinite:
        return push(FrameKind::kByteStringChunks, false);
      case EventType::kTextStringIndefinite:
        return push(FrameKind::kTextStringChunks, false);
      default:
        return Error::kNone;
    }
  }

  inline void clear() noexcept {
    mDepth = 0;
    mTagPending = false;
  }
};

}  // namespace streamcbor
