// SPDX-License-Identifier: MIT
/*********************************************************************************
 * @brief Event based CBOR (RFC 8949) decoding and encoding for embedded use.
 *
 * Basic usage:
 *
 *  // decode: one event per call, string content points into buf
 *  Decoder<> decoder(buf, len);
 *  Event event;
 *  while (decoder.decodeEvent(event) == Error::kNone) {
 *    ...
 *    if (decoder.atItemBoundary()) break;
 *  }
 *
 *  // encode: events in, shortest form bytes out
 *  uint8_t    out[200];
 *  BufferSink sink(out, sizeof(out));
 *  Encoder<BufferSink> encoder(sink);
 *  encoder.encodeEvent(Event::arrayIndefinite());
 *  encoder.encodeEvent(Event::integer(-5));
 *  encoder.encodeEvent(Event::end());
 *
 * std::cout << "Bytes serialized " << sink.bytesSerialized() << std::endl;
 *
 * Configuration:
 *   CONFIG_STREAMCBOR_MAX_NESTING  default nesting capacity (16)
 *   CONFIG_STREAMCBOR_STD_VECTOR   enable VectorSink
 ********************************************************************************/
#pragma once

#include "streamcbor/Decoder.hpp"
#include "streamcbor/Encoder.hpp"
#include "streamcbor/Error.hpp"
#include "streamcbor/Event.hpp"
#include "streamcbor/Head.hpp"
#include "streamcbor/NestingStack.hpp"
#include "streamcbor/Sink.hpp"
