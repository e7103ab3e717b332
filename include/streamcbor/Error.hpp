// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>

namespace streamcbor {

/**
 * @brief Result of every fallible decoder, encoder and sink operation.
 *
 * kNone (0) means success.  A call that returns anything else made no
 * progress: cursor, nesting stack and sink are left as they were.
 */
enum class Error : int8_t {
  kNone = 0,
  kUnexpectedEof,      //< buffer exhausted mid-item
  kReservedEncoding,   //< additional info 28..30
  kInvalidIndefinite,  //< additional info 31 on major type 0, 1 or 6
  kUnexpectedBreak,    //< break with no open indefinite frame
  kOddMapLength,       //< map with a key but no value
  kDepthExceeded,      //< nesting stack is full
  kInvalidSimple,      //< simple value in the reserved range
  kInvalidChunk,       //< bad item inside an indefinite string
  kPrematureEnd,       //< end before the frame received all of its items
  kUnbalancedEnd,      //< end with no open frame
  kFrameOverflow,      //< item sent to a definite frame that is already full
  kOutOfSpace,         //< sink cannot take more bytes
  kInvalidEvent,       //< malformed event value
};

/**
 * @brief Get a short static description of an error code.
 *
 * @param error
 * @return const char* Never null
 */
inline const char *errorString(const Error error) noexcept {
  switch (error) {
    case Error::kNone:
      return "no error";
    case Error::kUnexpectedEof:
      return "unexpected end of input";
    case Error::kReservedEncoding:
      return "reserved additional information value";
    case Error::kInvalidIndefinite:
      return "indefinite length not allowed for major type";
    case Error::kUnexpectedBreak:
      return "break outside an indefinite item";
    case Error::kOddMapLength:
      return "map has a key without a value";
    case Error::kDepthExceeded:
      return "nesting depth exceeded";
    case Error::kInvalidSimple:
      return "invalid simple value";
    case Error::kInvalidChunk:
      return "invalid chunk in indefinite string";
    case Error::kPrematureEnd:
      return "end before all items were supplied";
    case Error::kUnbalancedEnd:
      return "end with no open container";
    case Error::kFrameOverflow:
      return "too many items for container";
    case Error::kOutOfSpace:
      return "output buffer full";
    case Error::kInvalidEvent:
      return "invalid event";
  }
  return "unknown error";
}

}  // namespace streamcbor
