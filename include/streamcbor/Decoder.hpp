// SPDX-License-Identifier: MIT
/*********************************************************************************
 * @brief Pull decoder producing one Event per call.
 *
 * Basic usage:
 *
 *  const uint8_t buf[] = {0xa1, 0x18, 0x2a, 0x65, 'h', 'e', 'l', 'l', 'o'};
 *  Decoder<> decoder(buf, sizeof(buf));
 *  Event event;
 *  do {
 *    if (decoder.decodeEvent(event) != Error::kNone) {
 *      break;  // malformed
 *    }
 *    handle(event);  // Map(1), UnsignedInteger(42), TextString("hello"), End
 *  } while (!decoder.atItemBoundary());
 *
 * Every container (array, map, indefinite string) is closed by an End event,
 * whether the input used a count or a break byte.  String content is returned
 * as a view into buf; nothing is copied and nothing is allocated.
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
 * @brief Decode a CBOR byte buffer into a sequence of events.
 *
 * @tparam MaxDepth Maximum container nesting accepted before kDepthExceeded
 */
template <size_t MaxDepth = CONFIG_STREAMCBOR_MAX_NESTING>
class Decoder {
 private:
  const uint8_t *mBuf;
  size_t mBufLen;
  size_t mDataOffset;
  NestingStack<MaxDepth> mStack;

  /**
   * @brief Check that an item may appear inside an open indefinite string.
   *
   * Only definite strings of the same major type and the break are allowed.
   */
  Error checkChunk(const Head &head) const noexcept {
    if (mStack.empty() || !mStack.top().isChunks() || head.isBreak()) {
      return Error::kNone;
    }
    const uint8_t expected = mStack.top().kind == FrameKind::kByteStringChunks
                                 ? kCborByteString
                                 : kCborUTF8String;
    if (head.majorType != expected || head.isIndefinite()) {
      return Error::kInvalidChunk;
    }
    return Error::kNone;
  }

  /**
   * @brief Close the innermost indefinite frame on a break byte.
   */
  Error decodeBreak(const Head &head, Event &event) noexcept {
    if (mStack.empty() || mStack.tagPending() || mStack.top().definite) {
      return Error::kUnexpectedBreak;
    }
    if (mStack.top().kind == FrameKind::kMap && mStack.top().oddItems) {
      return Error::kOddMapLength;
    }
    mStack.pop();
    mDataOffset += head.headerBytes;
    event = Event::end();
    return Error::kNone;
  }

  /**
   * @brief Decode a major type 7 item other than the break.
   */
  Error decodeSimple(const Head &head, Event &event) const noexcept {
    switch (head.additionalInfo) {
      case kCborSimpleFalse:
      case kCborSimpleTrue:
        event = Event::boolean(head.additionalInfo == kCborSimpleTrue);
        return Error::kNone;
      case kCborSimpleNull:
        event = Event::null();
        return Error::kNone;
      case kCborSimpleUndefined:
        event = Event::undefined();
        return Error::kNone;
      case kCborArg8:
        // Values below 32 must use the one byte form
        if (head.argument < kCborSimpleMin2Byte) {
          return Error::kInvalidSimple;
        }
        event = Event::simple(uint8_t(head.argument));
        return Error::kNone;
      case kCborArg16:
        event = Event::float16Bits(uint16_t(head.argument));
        return Error::kNone;
      case kCborArg32:
        event = Event::float32Bits(uint32_t(head.argument));
        return Error::kNone;
      case kCborArg64:
        event = Event::float64Bits(head.argument);
        return Error::kNone;
      default:
        event = Event::simple(head.additionalInfo);
        return Error::kNone;
    }
  }

  /**
   * @brief Commit a decoded item: update the nesting stack and advance past
   * it.  Nothing is changed if the item's frame cannot be opened.
   */
  Error commit(const Event &decoded, const size_t nextOffset,
               Event &event) noexcept {
    const Error result = mStack.enter(decoded);
    if (result != Error::kNone) {
      return result;
    }
    mDataOffset = nextOffset;
    event = decoded;
    return Error::kNone;
  }

 public:
  Decoder() noexcept { initBuffer(nullptr, 0); }

  /**
   * @brief Construct a decoder over a caller owned buffer.
   *
   * The buffer must outlive every event whose string content is used.
   *
   * @param buf A pointer to the encoded data
   * @param bufLen The length in bytes of the data
   */
  Decoder(const void *buf, const size_t bufLen) noexcept {
    initBuffer(buf, bufLen);
  }
  explicit Decoder(const ByteView data) noexcept {
    initBuffer(data.p, data.length);
  }

  /**
   * @brief Start a new session on another buffer.
   *
   * @param buf A pointer to the encoded data
   * @param bufLen The length in bytes of the data
   */
  inline void initBuffer(const void *buf, const size_t bufLen) noexcept {
    mBuf = static_cast<const uint8_t *>(buf);
    mBufLen = bufLen;
    restart();
  }

  /**
   * @brief Rewind to the start of the buffer and forget all open containers.
   */
  inline void restart() noexcept {
    mDataOffset = 0;
    mStack.clear();
  }

  /**
   * @brief Get the number of bytes consumed so far.
   */
  inline size_t position() const noexcept { return mDataOffset; }
  inline size_t remainingBytes() const noexcept {
    return mBufLen - mDataOffset;
  }
  inline size_t depth() const noexcept { return mStack.depth(); }

  /**
   * @brief True when every byte has been consumed.  Containers may still be
   * open; see atItemBoundary().
   */
  inline bool atEnd() const noexcept { return mDataOffset == mBufLen; }

  /**
   * @brief True when no container is open and no tag waits for its item.
   * Another top level item may follow.
   */
  inline bool atItemBoundary() const noexcept {
    return mStack.atItemBoundary();
  }

  /**
   * @brief Decode the next event.
   *
   * A definite container whose count is used up yields End without
   * consuming input.  A break byte closing an indefinite item yields End.
   *
   * @param event Receives the event on success, untouched otherwise
   * @return Error
   */
  Error decodeEvent(Event &event) noexcept {
    if (mStack.topExhausted()) {
      mStack.pop();
      event = Event::end();
      return Error::kNone;
    }

    Head head;
    Error result = readHead(mBuf + mDataOffset, mBufLen - mDataOffset, head);
    if (result != Error::kNone) {
      return result;
    }
    result = checkChunk(head);
    if (result != Error::kNone) {
      return result;
    }

    const size_t nextOffset = mDataOffset + head.headerBytes;
    switch (head.majorType) {
      case kCborPosInt:
        return commit(Event::unsignedInteger(head.argument), nextOffset,
                      event);
      case kCborNegInt:
        return commit(Event::negativeInteger(head.argument), nextOffset,
                      event);
      case kCborByteString:
      case kCborUTF8String: {
        const bool text = head.majorType == kCborUTF8String;
        if (head.isIndefinite()) {
          return commit(text ? Event::textStringIndefinite()
                             : Event::byteStringIndefinite(),
                        nextOffset, event);
        }
        if (head.argument > mBufLen - nextOffset) {
          return Error::kUnexpectedEof;
        }
        const size_t len = size_t(head.argument);
        const uint8_t *content = mBuf + nextOffset;
        return commit(text ? Event::textString(content, len)
                           : Event::byteString(content, len),
                      nextOffset + len, event);
      }
      case kCborArray:
        return commit(head.isIndefinite() ? Event::arrayIndefinite()
                                          : Event::array(head.argument),
                      nextOffset, event);
      case kCborMap:
        if (head.isIndefinite()) {
          return commit(Event::mapIndefinite(), nextOffset, event);
        }
        if (head.argument > std::numeric_limits<uint64_t>::max() / 2) {
          return Error::kOddMapLength;
        }
        return commit(Event::map(head.argument), nextOffset, event);
      case kCborTag:
        return commit(Event::tag(head.argument), nextOffset, event);
      default: {
        if (head.isBreak()) {
          return decodeBreak(head, event);
        }
        Event simple;
        result = decodeSimple(head, simple);
        if (result != Error::kNone) {
          return result;
        }
        return commit(simple, nextOffset, event);
      }
    }
  }

  /**
   * @brief Skip over one complete item, including any tags in front of it and
   * everything nested inside it.
   *
   * Returns kPrematureEnd without consuming anything when the enclosing
   * container ends here instead.  Other errors leave the decoder part way
   * through the item.
   *
   * @return Error
   */
  Error skipItem() noexcept {
    if (mStack.topExhausted() ||
        (mDataOffset < mBufLen && mBuf[mDataOffset] == kCborBreak &&
         !mStack.empty() && !mStack.top().definite)) {
      return Error::kPrematureEnd;
    }
    const size_t startDepth = mStack.depth();
    Event event;
    do {
      const Error result = decodeEvent(event);
      if (result != Error::kNone) {
        return result;
      }
    } while (event.type() == EventType::kTag || mStack.depth() > startDepth);
    return Error::kNone;
  }
};

}  // namespace streamcbor
