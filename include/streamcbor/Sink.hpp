// SPDX-License-Identifier: MIT
/*********************************************************************************
 * @brief Output sinks for the Encoder.
 *
 * A sink is any type with these two members:
 *
 *   Error reserve(size_t n) noexcept;
 *     Guarantee that n more bytes can be appended, or return
 *     Error::kOutOfSpace and change nothing.
 *
 *   void append(const uint8_t *p, size_t n) noexcept;
 *     Append bytes.  Only called for space obtained from reserve().
 *
 * The encoder reserves the whole item (head and content) before writing any
 * of it, so a failed encode leaves the sink untouched.
 ********************************************************************************/
#pragma once

#include <string.h>  // memcpy

#include <cstddef>
#include <cstdint>

#ifdef CONFIG_STREAMCBOR_STD_VECTOR
#include <new>  // std::bad_alloc
#include <vector>
#endif

#include "streamcbor/Error.hpp"

namespace streamcbor {

/**
 * @brief Sink writing into a fixed, caller owned buffer.
 */
class BufferSink {
 private:
  uint8_t *mBuf;
  size_t mMaxBufLen;
  size_t mDataOffset;
  size_t mReserved;

 public:
  BufferSink() noexcept { initBuffer(nullptr, 0); }

  /**
   * @brief Construct a new Buffer Sink object
   *
   * @param buf A pointer to the output buffer
   * @param maxBufLen The length in bytes of the buffer
   */
  BufferSink(void *buf, const size_t maxBufLen) noexcept {
    initBuffer(buf, maxBufLen);
  }

  /**
   * @brief Reinitialize the output buffer.
   *
   * @param buf A pointer to a buffer
   * @param maxBufLen The length in bytes of the buffer
   */
  inline void initBuffer(void *buf, const size_t maxBufLen) noexcept {
    mBuf = static_cast<uint8_t *>(buf);
    mMaxBufLen = maxBufLen;
    restart();
  }

  /**
   * @brief Discard everything written so far.
   */
  inline void restart() noexcept {
    mDataOffset = 0;
    mReserved = 0;
  }

  /**
   * @brief Make room for the next n bytes.  Replaces any earlier reservation.
   */
  inline Error reserve(const size_t n) noexcept {
    if (n > mMaxBufLen - mDataOffset) {
      return Error::kOutOfSpace;
    }
    mReserved = n;
    return Error::kNone;
  }

  /**
   * @brief Copy bytes into the buffer.
   *
   * The bytes must fit in the space obtained from the last reserve(); each
   * append uses up part of it.  Bytes beyond that space are not written and
   * bytesSerialized() does not change.
   */
  inline void append(const uint8_t *p, const size_t n) noexcept {
    if (n == 0 || n > mReserved) {
      return;
    }
    memcpy(mBuf + mDataOffset, p, n);
    mDataOffset += n;
    mReserved -= n;
  }

  /**
   * @brief Get a pointer to the output buffer.
   *
   * @return const uint8_t*
   */
  inline const uint8_t *getBuffer() const noexcept { return mBuf; }

  /**
   * @brief Get the total number of bytes serialized.
   *
   * @return size_t
   */
  inline size_t bytesSerialized() const noexcept { return mDataOffset; }

  inline size_t bytesAvailable() const noexcept {
    return mMaxBufLen - mDataOffset;
  }
};

/**
 * @brief Sink that stores nothing and counts the bytes an encoding needs.
 *
 * Encode once into a CountingSink to size the buffer, then again into a
 * BufferSink of bytesNeeded() bytes.
 */
class CountingSink {
 private:
  size_t mBytesNeeded = 0;

 public:
  inline Error reserve(const size_t) noexcept { return Error::kNone; }
  inline void append(const uint8_t *, const size_t n) noexcept {
    mBytesNeeded += n;
  }

  /**
   * @brief Get the total number of bytes needed to encode the supplied
   * events.
   *
   * @return size_t
   */
  inline size_t bytesNeeded() const noexcept { return mBytesNeeded; }
  inline void restart() noexcept { mBytesNeeded = 0; }
};

#ifdef CONFIG_STREAMCBOR_STD_VECTOR
/**
 * @brief Sink appending to a caller owned std::vector.
 *
 * Allocation failure is reported as kOutOfSpace.
 */
class VectorSink {
 private:
  std::vector<uint8_t> &mOut;

 public:
  explicit VectorSink(std::vector<uint8_t> &out) noexcept : mOut(out) {}

  Error reserve(const size_t n) noexcept {
    if (n > mOut.max_size() - mOut.size()) {
      return Error::kOutOfSpace;
    }
    const size_t needed = mOut.size() + n;
    if (needed <= mOut.capacity()) {
      return Error::kNone;
    }
    const size_t doubled = mOut.capacity() > mOut.max_size() / 2
                               ? mOut.max_size()
                               : 2 * mOut.capacity();
    try {
      mOut.reserve(needed > doubled ? needed : doubled);
    } catch (const std::bad_alloc &) {
      return Error::kOutOfSpace;
    }
    return Error::kNone;
  }

  /**
   * @brief Append bytes to the vector.
   *
   * Only called for space obtained from reserve(), so the capacity is
   * already there and insert() does not allocate.
   */
  inline void append(const uint8_t *p, const size_t n) noexcept {
    mOut.insert(mOut.end(), p, p + n);
  }

  inline const std::vector<uint8_t> &data() const noexcept { return mOut; }
};
#endif

}  // namespace streamcbor
