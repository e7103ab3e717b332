// SPDX-License-Identifier: MIT
/*********************************************************************************
 * @brief Push encoder writing one Event per call.
 *
 * Basic usage:
 *
 *  uint8_t    buf[64];
 *  BufferSink sink(buf, sizeof(buf));
 *  Encoder<BufferSink> encoder(sink);
 *  encoder.encodeEvent(Event::map(1));
 *  encoder.encodeEvent(Event::unsignedInteger(42));
 *  encoder.encodeEvent(Event::textString("hello"));
 *  encoder.encodeEvent(Event::end());  // optional for definite containers
 *
 *  // buf now holds a1 18 2a 65 68 65 6c 6c 6f
 *
 * Heads always use the shortest form.  End writes a break byte for
 * indefinite containers and nothing for definite ones.  Once a definite
 * container has all of its items, End must be sent before anything else is
 * encoded; a further item fails with kFrameOverflow rather than being moved
 * to the parent.
 ********************************************************************************/
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include "streamcbor/Error.hpp"
#include "streamcbor/Event.hpp"
#include "streamcbor/Head.hpp"
#include "streamcbor/NestingStack.hpp"

namespace streamcbor {

/**
 * @brief Encode a sequence of events into a sink.
 *
 * @tparam Sink Output sink, see Sink.hpp
 * @tparam MaxDepth Maximum container nesting accepted before kDepthExceeded
 */
template <typename Sink, size_t MaxDepth = CONFIG_STREAMCBOR_MAX_NESTING>
class Encoder {
 private:
  Sink &mSink;
  NestingStack<MaxDepth> mStack;

  /**
   * @brief Check that an event may appear inside an open indefinite string.
   */
  Error checkChunk(const Event &event) const noexcept {
    if (mStack.empty() || !mStack.top().isChunks()) {
      return Error::kNone;
    }
    const EventType expected =
        mStack.top().kind == FrameKind::kByteStringChunks
            ? EventType::kByteString
            : EventType::kTextString;
    return event.type() == expected ? Error::kNone : Error::kInvalidChunk;
  }

  Error encodeEnd() noexcept {
    if (mStack.empty()) {
      return Error::kUnbalancedEnd;
    }
    if (mStack.tagPending()) {
      return Error::kPrematureEnd;
    }
    const Frame &frame = mStack.top();
    if (frame.definite) {
      if (frame.remaining != 0) {
        return Error::kPrematureEnd;
      }
      mStack.pop();
      return Error::kNone;
    }
    if (frame.kind == FrameKind::kMap && frame.oddItems) {
      return Error::kOddMapLength;
    }
    const Error result = mSink.reserve(1);
    if (result != Error::kNone) {
      return result;
    }
    const uint8_t brk = kCborBreak;
    mSink.append(&brk, 1);
    mStack.pop();
    return Error::kNone;
  }

  /**
   * @brief Reserve and write a head followed by optional content.
   */
  Error write(const uint8_t *head, const uint8_t headLen,
              const uint8_t *content, const size_t contentLen) noexcept {
    if (contentLen > std::numeric_limits<size_t>::max() - headLen) {
      return Error::kOutOfSpace;
    }
    const Error result = mSink.reserve(headLen + contentLen);
    if (result != Error::kNone) {
      return result;
    }
    mSink.append(head, headLen);
    if (contentLen != 0) {
      mSink.append(content, contentLen);
    }
    return Error::kNone;
  }

 public:
  /**
   * @brief Construct a new Encoder writing to sink.
   *
   * @param sink Must outlive the encoder
   */
  explicit Encoder(Sink &sink) noexcept : mSink(sink) {}

  /**
   * @brief Forget all open containers.  The sink is not touched.
   */
  inline void restart() noexcept { mStack.clear(); }

  inline Sink &sink() noexcept { return mSink; }
  inline size_t depth() const noexcept { return mStack.depth(); }

  /**
   * @brief True when the events so far form complete items: no indefinite
   * container open, every definite container full, no tag without its item.
   */
  inline bool isComplete() const noexcept {
    return !mStack.tagPending() && mStack.allExhausted();
  }

  /**
   * @brief Close the definite containers whose End was left implicit.
   *
   * @return Error kPrematureEnd if any container still needs items or an
   * indefinite container is open
   */
  Error finish() noexcept {
    if (!isComplete()) {
      return Error::kPrematureEnd;
    }
    mStack.clear();
    return Error::kNone;
  }

  /**
   * @brief Encode one event.
   *
   * @param event
   * @return Error Nothing is written and no state changes on failure
   */
  Error encodeEvent(const Event &event) noexcept {
    if (event.type() == EventType::kEnd) {
      return encodeEnd();
    }
    if (mStack.topExhausted()) {
      return Error::kFrameOverflow;
    }
    Error result = checkChunk(event);
    if (result != Error::kNone) {
      return result;
    }
    if (event.isContainerStart() && mStack.full()) {
      return Error::kDepthExceeded;
    }

    uint8_t head[kCborMaxHeadBytes];
    uint8_t headLen = 0;
    const uint8_t *content = nullptr;
    size_t contentLen = 0;

    switch (event.type()) {
      case EventType::kUnsignedInteger:
        headLen = encodeHead(head, kCborPosInt, event.value());
        break;
      case EventType::kNegativeInteger:
        headLen = encodeHead(head, kCborNegInt, event.value());
        break;
      case EventType::kByteString:
      case EventType::kTextString: {
        const ByteView bytes = event.bytes();
        if (bytes.p == nullptr && bytes.length != 0) {
          return Error::kInvalidEvent;
        }
        headLen = encodeHead(head,
                             event.type() == EventType::kTextString
                                 ? kCborUTF8String
                                 : kCborByteString,
                             bytes.length);
        content = bytes.p;
        contentLen = bytes.length;
        break;
      }
      case EventType::kByteStringIndefinite:
        headLen = encodeIndefiniteHead(head, kCborByteString);
        break;
      case EventType::kTextStringIndefinite:
        headLen = encodeIndefiniteHead(head, kCborUTF8String);
        break;
      case EventType::kArray:
        headLen = encodeHead(head, kCborArray, event.value());
        break;
      case EventType::kArrayIndefinite:
        headLen = encodeIndefiniteHead(head, kCborArray);
        break;
      case EventType::kMap:
        if (event.value() > std::numeric_limits<uint64_t>::max() / 2) {
          return Error::kOddMapLength;
        }
        headLen = encodeHead(head, kCborMap, event.value());
        break;
      case EventType::kMapIndefinite:
        headLen = encodeIndefiniteHead(head, kCborMap);
        break;
      case EventType::kTag:
        headLen = encodeHead(head, kCborTag, event.value());
        break;
      case EventType::kSimple:
        // 20..23 have their own events, 24..31 are reserved
        if (event.simple() >= kCborSimpleFalse &&
            event.simple() < kCborSimpleMin2Byte) {
          return Error::kInvalidSimple;
        }
        headLen = encodeHead(head, kCborSimple, event.simple());
        break;
      case EventType::kBool:
        head[0] = event.boolean() ? kCborTrue : kCborFalse;
        headLen = 1;
        break;
      case EventType::kNull:
        head[0] = kCborNull;
        headLen = 1;
        break;
      case EventType::kUndefined:
        head[0] = kCborUndefined;
        headLen = 1;
        break;
      case EventType::kFloat16:
        headLen = encodeFixedHead(head, kCborFloat16, event.float16Bits(), 2);
        break;
      case EventType::kFloat32:
        headLen = encodeFixedHead(head, kCborFloat32, event.float32Bits(), 4);
        break;
      case EventType::kFloat64:
        headLen = encodeFixedHead(head, kCborFloat64, event.float64Bits(), 8);
        break;
      default:
        return Error::kInvalidEvent;
    }

    result = write(head, headLen, content, contentLen);
    if (result != Error::kNone) {
      return result;
    }

    return mStack.enter(event);
  }
};

}  // namespace streamcbor
