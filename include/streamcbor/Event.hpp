// SPDX-License-Identifier: MIT
#pragma once

#include <string.h>  // memcmp, memcpy, strlen

#include <cmath>  // ldexp
#include <cstddef>
#include <cstdint>
#include <limits>

namespace streamcbor {

/**
 * @brief The closed set of items produced by the decoder and accepted by the
 * encoder.
 */
enum class EventType : uint8_t {
  kUnsignedInteger,
  kNegativeInteger,
  kByteString,
  kByteStringIndefinite,
  kTextString,
  kTextStringIndefinite,
  kArray,
  kArrayIndefinite,
  kMap,
  kMapIndefinite,
  kTag,
  kSimple,
  kBool,
  kNull,
  kUndefined,
  kFloat16,
  kFloat32,
  kFloat64,
  kEnd,
};

/**
 * @brief Get the name of an event type, e.g. "Array".
 *
 * @param type
 * @return const char*
 */
inline const char *eventTypeName(const EventType type) noexcept {
  switch (type) {
    case EventType::kUnsignedInteger:
      return "UnsignedInteger";
    case EventType::kNegativeInteger:
      return "NegativeInteger";
    case EventType::kByteString:
      return "ByteString";
    case EventType::kByteStringIndefinite:
      return "ByteStringIndefinite";
    case EventType::kTextString:
      return "TextString";
    case EventType::kTextStringIndefinite:
      return "TextStringIndefinite";
    case EventType::kArray:
      return "Array";
    case EventType::kArrayIndefinite:
      return "ArrayIndefinite";
    case EventType::kMap:
      return "Map";
    case EventType::kMapIndefinite:
      return "MapIndefinite";
    case EventType::kTag:
      return "Tag";
    case EventType::kSimple:
      return "Simple";
    case EventType::kBool:
      return "Bool";
    case EventType::kNull:
      return "Null";
    case EventType::kUndefined:
      return "Undefined";
    case EventType::kFloat16:
      return "Float16";
    case EventType::kFloat32:
      return "Float32";
    case EventType::kFloat64:
      return "Float64";
    case EventType::kEnd:
      return "End";
  }
  return "Unknown";
}

/**
 * @brief A borrowed view of string content.
 *
 * The bytes belong to the buffer the decoder was given (or to the caller when
 * encoding) and are only valid while that buffer is alive and unchanged.
 */
struct ByteView {
  const uint8_t *p;
  size_t length;
};

/**
 * @brief Convert IEEE 754 half precision bits to a double.
 *
 * @param bits
 * @return double
 */
inline double halfToDouble(const uint16_t bits) noexcept {
  const int exponent = (bits >> 10) & 0x1f;
  const int mantissa = bits & 0x3ff;
  double value;
  if (exponent == 0) {
    value = std::ldexp(double(mantissa), -24);
  } else if (exponent == 0x1f) {
    value = mantissa == 0 ? std::numeric_limits<double>::infinity()
                          : std::numeric_limits<double>::quiet_NaN();
  } else {
    value = std::ldexp(double(mantissa + 1024), exponent - 25);
  }
  return (bits & 0x8000) ? -value : value;
}

/**
 * @brief One CBOR item: a type plus a 64 bit payload and, for definite
 * strings, a pointer to the content.
 *
 * The payload holds the integer value, container count, tag number, simple
 * value, boolean, raw float bits or string length depending on the type.
 *
 * Events are cheap to copy and never own the string content they refer to.
 */
class Event {
 public:
  Event() noexcept : Event(EventType::kEnd, 0) {}

  static Event unsignedInteger(const uint64_t value) noexcept {
    return Event(EventType::kUnsignedInteger, value);
  }
  /**
   * @brief A major type 1 integer.  The value represented is -1 - n.
   */
  static Event negativeInteger(const uint64_t n) noexcept {
    return Event(EventType::kNegativeInteger, n);
  }
  /**
   * @brief An integer event for a signed value, choosing the major type.
   *
   * @param value
   * @return Event UnsignedInteger for value >= 0, NegativeInteger otherwise
   */
  static Event integer(const int64_t value) noexcept {
    if (value >= 0) {
      return unsignedInteger(uint64_t(value));
    }
    // -1 - value, computed without signed overflow
    return negativeInteger(~uint64_t(value));
  }
  static Event byteString(const void *p, const size_t length) noexcept {
    return Event(EventType::kByteString, length, p);
  }
  static Event byteString(const ByteView bytes) noexcept {
    return byteString(bytes.p, bytes.length);
  }
  static Event byteStringIndefinite() noexcept {
    return Event(EventType::kByteStringIndefinite, 0);
  }
  /**
   * @brief A text string.  The content is not checked for valid UTF-8.
   */
  static Event textString(const void *p, const size_t length) noexcept {
    return Event(EventType::kTextString, length, p);
  }
  static Event textString(const char *s) noexcept {
    return textString(s, strlen(s));
  }
  static Event textString(const ByteView bytes) noexcept {
    return textString(bytes.p, bytes.length);
  }
  static Event textStringIndefinite() noexcept {
    return Event(EventType::kTextStringIndefinite, 0);
  }
  static Event array(const uint64_t numElements) noexcept {
    return Event(EventType::kArray, numElements);
  }
  static Event arrayIndefinite() noexcept {
    return Event(EventType::kArrayIndefinite, 0);
  }
  /**
   * @brief A definite map of numPairs key/value pairs.
   */
  static Event map(const uint64_t numPairs) noexcept {
    return Event(EventType::kMap, numPairs);
  }
  static Event mapIndefinite() noexcept {
    return Event(EventType::kMapIndefinite, 0);
  }
  static Event tag(const uint64_t tag) noexcept {
    return Event(EventType::kTag, tag);
  }
  static Event simple(const uint8_t value) noexcept {
    return Event(EventType::kSimple, value);
  }
  static Event boolean(const bool value) noexcept {
    return Event(EventType::kBool, value ? 1 : 0);
  }
  static Event null() noexcept { return Event(EventType::kNull, 0); }
  static Event undefined() noexcept { return Event(EventType::kUndefined, 0); }
  static Event float16Bits(const uint16_t bits) noexcept {
    return Event(EventType::kFloat16, bits);
  }
  static Event float32Bits(const uint32_t bits) noexcept {
    return Event(EventType::kFloat32, bits);
  }
  static Event float64Bits(const uint64_t bits) noexcept {
    return Event(EventType::kFloat64, bits);
  }
  static Event float32(const float value) noexcept {
    uint32_t bits;
    memcpy(&bits, &value, sizeof(bits));
    return float32Bits(bits);
  }
  static Event float64(const double value) noexcept {
    uint64_t bits;
    memcpy(&bits, &value, sizeof(bits));
    return float64Bits(bits);
  }
  static Event end() noexcept { return Event(EventType::kEnd, 0); }

  EventType type() const noexcept { return mType; }

  /**
   * @brief The raw payload: integer magnitude, count, tag, simple value or
   * float bits.  For strings it is the content length.
   */
  uint64_t value() const noexcept { return mValue; }

  ByteView bytes() const noexcept { return ByteView{mData, size_t(mValue)}; }
  bool boolean() const noexcept { return mValue != 0; }
  uint8_t simple() const noexcept { return uint8_t(mValue); }
  uint16_t float16Bits() const noexcept { return uint16_t(mValue); }
  uint32_t float32Bits() const noexcept { return uint32_t(mValue); }
  uint64_t float64Bits() const noexcept { return mValue; }

  /**
   * @brief True for events that push a frame: arrays, maps and indefinite
   * strings.
   */
  bool isContainerStart() const noexcept {
    switch (mType) {
      case EventType::kByteStringIndefinite:
      case EventType::kTextStringIndefinite:
      case EventType::kArray:
      case EventType::kArrayIndefinite:
      case EventType::kMap:
      case EventType::kMapIndefinite:
        return true;
      default:
        return false;
    }
  }
  bool isIndefinite() const noexcept {
    return mType == EventType::kByteStringIndefinite ||
           mType == EventType::kTextStringIndefinite ||
           mType == EventType::kArrayIndefinite ||
           mType == EventType::kMapIndefinite;
  }
  /**
   * @brief True for complete items that open nothing: everything except
   * containers, tags and End.
   */
  bool isLeaf() const noexcept {
    return !isContainerStart() && mType != EventType::kTag &&
           mType != EventType::kEnd;
  }

  /**
   * @brief Get the signed value of an integer event.
   *
   * @param out Receives the value on success
   * @return bool false if this is not an integer or it does not fit int64_t
   */
  bool toInt64(int64_t &out) const noexcept {
    const uint64_t kMax = uint64_t(std::numeric_limits<int64_t>::max());
    if (mType == EventType::kUnsignedInteger && mValue <= kMax) {
      out = int64_t(mValue);
      return true;
    }
    if (mType == EventType::kNegativeInteger && mValue <= kMax) {
      out = -1 - int64_t(mValue);
      return true;
    }
    return false;
  }

  /**
   * @brief Get the value of a float event of any width.
   *
   * @param out Receives the value on success
   * @return bool false if this is not a float
   */
  bool toDouble(double &out) const noexcept {
    switch (mType) {
      case EventType::kFloat16:
        out = halfToDouble(float16Bits());
        return true;
      case EventType::kFloat32: {
        const uint32_t bits = float32Bits();
        float f;
        memcpy(&f, &bits, sizeof(f));
        out = f;
        return true;
      }
      case EventType::kFloat64: {
        const uint64_t bits = mValue;
        memcpy(&out, &bits, sizeof(out));
        return true;
      }
      default:
        return false;
    }
  }

  /**
   * @brief Events are equal when type, payload and string content match.
   * String content is compared by value, not by address.
   */
  bool operator==(const Event &other) const noexcept {
    if (mType != other.mType || mValue != other.mValue) {
      return false;
    }
    if (mType == EventType::kByteString || mType == EventType::kTextString) {
      if (mValue == 0 || mData == other.mData) {
        return true;
      }
      if (mData == nullptr || other.mData == nullptr) {
        return false;
      }
      return memcmp(mData, other.mData, size_t(mValue)) == 0;
    }
    return true;
  }
  bool operator!=(const Event &other) const noexcept {
    return !(*this == other);
  }

 private:
  Event(const EventType type, const uint64_t value,
        const void *data = nullptr) noexcept
      : mType(type),
        mValue(value),
        mData(static_cast<const uint8_t *>(data)) {}

  EventType mType;
  uint64_t mValue;
  const uint8_t *mData;
};

static_assert(sizeof(double) == 8, "Unexpected `double` size");
static_assert(sizeof(float) == 4, "Unexpected `float` size");

}  // namespace streamcbor
