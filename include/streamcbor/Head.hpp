// SPDX-License-Identifier: MIT
/*********************************************************************************
 * @brief CBOR item head codec (RFC 8949 section 3).
 *
 * Every CBOR item starts with an initial byte holding a 3 bit major type and a
 * 5 bit additional info field, optionally followed by a 1, 2, 4 or 8 byte big
 * endian argument:
 *
 *   additional info 0..23   argument is the additional info itself
 *   additional info 24..27  argument follows in 1/2/4/8 bytes
 *   additional info 28..30  reserved, never well formed
 *   additional info 31      indefinite length (major types 2..5) or break (7)
 ********************************************************************************/
#pragma once

#include <cstddef>
#include <cstdint>

#include "streamcbor/Error.hpp"

namespace streamcbor {

// Major types
constexpr uint8_t kCborPosInt = 0;
constexpr uint8_t kCborNegInt = 1;
constexpr uint8_t kCborByteString = 2;
constexpr uint8_t kCborUTF8String = 3;
constexpr uint8_t kCborArray = 4;
constexpr uint8_t kCborMap = 5;
constexpr uint8_t kCborTag = 6;
constexpr uint8_t kCborSimple = 7;

// Additional info values
constexpr uint8_t kCborInlineMax = 23;
constexpr uint8_t kCborArg8 = 24;
constexpr uint8_t kCborArg16 = 25;
constexpr uint8_t kCborArg32 = 26;
constexpr uint8_t kCborArg64 = 27;
constexpr uint8_t kCborIndefinite = 31;

// Simple values
constexpr uint8_t kCborSimpleFalse = 20;
constexpr uint8_t kCborSimpleTrue = 21;
constexpr uint8_t kCborSimpleNull = 22;
constexpr uint8_t kCborSimpleUndefined = 23;
constexpr uint8_t kCborSimpleMin2Byte = 32;

// Complete initial bytes
constexpr uint8_t kCborFalse = kCborSimple << 5 | kCborSimpleFalse;
constexpr uint8_t kCborTrue = kCborSimple << 5 | kCborSimpleTrue;
constexpr uint8_t kCborNull = kCborSimple << 5 | kCborSimpleNull;
constexpr uint8_t kCborUndefined = kCborSimple << 5 | kCborSimpleUndefined;
constexpr uint8_t kCborFloat16 = kCborSimple << 5 | kCborArg16;
constexpr uint8_t kCborFloat32 = kCborSimple << 5 | kCborArg32;
constexpr uint8_t kCborFloat64 = kCborSimple << 5 | kCborArg64;
constexpr uint8_t kCborBreak = kCborSimple << 5 | kCborIndefinite;

/// Largest possible head: initial byte plus an 8 byte argument.
constexpr size_t kCborMaxHeadBytes = 9;

/**
 * @brief A decoded item head.
 */
struct Head {
  uint8_t majorType = 0;
  uint8_t additionalInfo = 0;
  uint8_t headerBytes = 0;  //< bytes consumed by the head, 1..9
  uint64_t argument = 0;    //< undefined when isIndefinite()

  bool isIndefinite() const noexcept {
    return additionalInfo == kCborIndefinite;
  }
  bool isBreak() const noexcept {
    return majorType == kCborSimple && additionalInfo == kCborIndefinite;
  }
};

/**
 * @brief Read the big endian unsigned value of the given width.
 *
 * @param p Points at the first byte of the value
 * @param width 1, 2, 4 or 8
 * @return uint64_t
 */
inline uint64_t loadBigEndian(const uint8_t *p, const uint8_t width) noexcept {
  uint64_t value = 0;
  for (uint8_t i = 0; i < width; i++) {
    value = value << 8 | p[i];
  }
  return value;
}

/**
 * @brief Store an unsigned value as big endian bytes of the given width.
 *
 * @param p Destination, must hold width bytes
 * @param value
 * @param width 1, 2, 4 or 8
 */
inline void storeBigEndian(uint8_t *p, const uint64_t value,
                           const uint8_t width) noexcept {
  for (uint8_t i = 0; i < width; i++) {
    p[i] = uint8_t(value >> (8 * (width - 1 - i)));
  }
}

/**
 * @brief Decode one head from the start of a buffer.
 *
 * Nothing is written to head unless the head is well formed.
 *
 * @param p Start of the head
 * @param available Number of readable bytes at p
 * @param head Receives the decoded head
 * @return Error kUnexpectedEof, kReservedEncoding or kInvalidIndefinite on
 * failure
 */
inline Error readHead(const uint8_t *p, const size_t available,
                      Head &head) noexcept {
  static const uint8_t kCborheaderBytes[32]{1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
                                            1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
                                            1, 1, 2, 3, 5, 9, 0, 0, 0, 1};
  if (available == 0) {
    return Error::kUnexpectedEof;
  }
  const uint8_t majorType = p[0] >> 5;
  const uint8_t additionalInfo = p[0] & 0x1f;
  const uint8_t headerBytes = kCborheaderBytes[additionalInfo];

  if (headerBytes == 0) {
    return Error::kReservedEncoding;
  }
  if (additionalInfo == kCborIndefinite &&
      (majorType == kCborPosInt || majorType == kCborNegInt ||
       majorType == kCborTag)) {
    return Error::kInvalidIndefinite;
  }
  if (headerBytes > available) {
    return Error::kUnexpectedEof;
  }

  head.majorType = majorType;
  head.additionalInfo = additionalInfo;
  head.headerBytes = headerBytes;
  if (additionalInfo <= kCborInlineMax) {
    head.argument = additionalInfo;
  } else if (additionalInfo == kCborIndefinite) {
    head.argument = 0;
  } else {
    head.argument = loadBigEndian(p + 1, uint8_t(headerBytes - 1));
  }
  return Error::kNone;
}

/**
 * @brief Compute the number of bytes the shortest head for an argument needs.
 *
 * @param argument
 * @return uint8_t 1, 2, 3, 5 or 9
 */
inline uint8_t headerBytesFor(const uint64_t argument) noexcept {
  return (argument <= kCborInlineMax) ? 1
         : (argument <= 0xff)         ? 2
         : (argument <= 0xffff)       ? 3
         : (argument <= 0xffffffff)   ? 5
                                      : 9;
}

/**
 * @brief Encode a head using the shortest form that holds the argument.
 *
 * @param out Destination, must hold kCborMaxHeadBytes
 * @param majorType 0..7
 * @param argument
 * @return uint8_t The number of bytes written
 */
inline uint8_t encodeHead(uint8_t *out, const uint8_t majorType,
                          const uint64_t argument) noexcept {
  const uint8_t headerBytes = headerBytesFor(argument);
  switch (headerBytes) {
    case 1:
      out[0] = uint8_t(majorType << 5 | argument);
      return 1;
    case 2:
      out[0] = uint8_t(majorType << 5 | kCborArg8);
      break;
    case 3:
      out[0] = uint8_t(majorType << 5 | kCborArg16);
      break;
    case 5:
      out[0] = uint8_t(majorType << 5 | kCborArg32);
      break;
    default:
      out[0] = uint8_t(majorType << 5 | kCborArg64);
      break;
  }
  storeBigEndian(out + 1, argument, uint8_t(headerBytes - 1));
  return headerBytes;
}

/**
 * @brief Encode the head that opens an indefinite length item.
 *
 * @param out Destination, at least one byte
 * @param majorType kCborByteString, kCborUTF8String, kCborArray or kCborMap
 * @return uint8_t Always 1
 */
inline uint8_t encodeIndefiniteHead(uint8_t *out,
                                    const uint8_t majorType) noexcept {
  out[0] = uint8_t(majorType << 5 | kCborIndefinite);
  return 1;
}

/**
 * @brief Encode a head with an argument of a fixed width.
 *
 * Used for floats, whose width is part of the value.
 *
 * @param out Destination, must hold width + 1 bytes
 * @param initialByte Complete initial byte, e.g. kCborFloat32
 * @param value
 * @param width 2, 4 or 8
 * @return uint8_t The number of bytes written
 */
inline uint8_t encodeFixedHead(uint8_t *out, const uint8_t initialByte,
                               const uint64_t value,
                               const uint8_t width) noexcept {
  out[0] = initialByte;
  storeBigEndian(out + 1, value, width);
  return uint8_t(width + 1);
}

}  // namespace streamcbor
