// SPDX-License-Identifier: MIT
#include <streamcbor/Decoder.hpp>

#include <vector>

#include "TestHelpers.hpp"
#include "gtest/gtest.h"
using namespace streamcbor;
using testutil::decodeAll;
using testutil::fromHex;

namespace {
const uint8_t kEmpty[] = {0};
}

TEST(decoder, map_with_text) {
  const auto bytes = fromHex("a1 18 2a 65 68 65 6c 6c 6f");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::map(1), Event::unsignedInteger(42), Event::textString("hello"),
      Event::end()};
  ASSERT_EQ(expected, events);

  // Content is a view into the input, not a copy
  ASSERT_EQ(bytes.data() + 4, events[2].bytes().p);
  ASSERT_EQ(5u, events[2].bytes().length);
}

TEST(decoder, indefinite_array) {
  const auto bytes = fromHex("9f 01 02 ff");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::arrayIndefinite(), Event::unsignedInteger(1),
      Event::unsignedInteger(2), Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, truncated_head) {
  const uint8_t buf[] = {0x18};
  Decoder<> decoder(buf, sizeof(buf));
  Event event = Event::null();
  ASSERT_EQ(Error::kUnexpectedEof, decoder.decodeEvent(event));
  ASSERT_EQ(0u, decoder.position());
  ASSERT_EQ(Event::null(), event);
}

TEST(decoder, integers) {
  const auto bytes = fromHex("0b 18 8c 39 b9 37 3b ff ff ff ff ff ff ff ff");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;

  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::unsignedInteger(0x0b), event);
  ASSERT_TRUE(decoder.atItemBoundary());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::unsignedInteger(0x8c), event);
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::negativeInteger(0xb937), event);
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::negativeInteger(0xffffffffffffffff), event);

  ASSERT_TRUE(decoder.atEnd());
  ASSERT_EQ(Error::kUnexpectedEof, decoder.decodeEvent(event));
}

TEST(decoder, strings) {
  const auto bytes = fromHex("43 9d 1b 22 78 01 4e 40 60");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const uint8_t content[] = {0x9d, 0x1b, 0x22};
  const std::vector<Event> expected = {
      Event::byteString(content, 3), Event::textString("N"),
      Event::byteString(kEmpty, 0), Event::textString("")};
  ASSERT_EQ(expected, events);
}

TEST(decoder, indefinite_strings) {
  const auto bytes = fromHex("5f 42 01 02 41 03 ff 7f 62 61 62 61 63 ff");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const uint8_t first[] = {0x01, 0x02};
  const uint8_t second[] = {0x03};
  const std::vector<Event> expected = {
      Event::byteStringIndefinite(), Event::byteString(first, 2),
      Event::byteString(second, 1),  Event::end(),
      Event::textStringIndefinite(), Event::textString("ab"),
      Event::textString("c"),        Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, invalid_chunks) {
  const char *inputs[] = {
      "7f 41 00 ff",  // byte string inside text string
      "5f 5f ff ff",  // nested indefinite string
      "5f 01 ff",     // integer chunk
      "7f c1 61 61 ff",  // tagged chunk
  };
  for (const char *hex : inputs) {
    std::vector<Event> events;
    ASSERT_EQ(Error::kInvalidChunk, decodeAll(fromHex(hex), events)) << hex;
  }
}

TEST(decoder, nested_mixed) {
  // [1, [_ 2, {"a": 3}], 4]
  const auto bytes = fromHex("83 01 9f 02 a1 61 61 03 ff 04");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::array(3),           Event::unsignedInteger(1),
      Event::arrayIndefinite(),  Event::unsignedInteger(2),
      Event::map(1),             Event::textString("a"),
      Event::unsignedInteger(3), Event::end(),
      Event::end(),              Event::unsignedInteger(4),
      Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, empty_containers) {
  const auto bytes = fromHex("80 a0 82 80 a0");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::array(0), Event::end(), Event::map(0),   Event::end(),
      Event::array(2), Event::array(0), Event::end(), Event::map(0),
      Event::end(),    Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, tags) {
  // 1(1363896240), [2(h'0102'), 3], [32([1, 2])]
  const auto bytes =
      fromHex("c1 1a 51 4b 67 b0 82 c2 42 01 02 03 81 d8 20 82 01 02");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const uint8_t content[] = {0x01, 0x02};
  const std::vector<Event> expected = {
      Event::tag(1),
      Event::unsignedInteger(1363896240),
      Event::array(2),
      Event::tag(2),
      Event::byteString(content, 2),
      Event::unsignedInteger(3),
      Event::end(),
      Event::array(1),
      Event::tag(32),
      Event::array(2),
      Event::unsignedInteger(1),
      Event::unsignedInteger(2),
      Event::end(),
      Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, tag_without_item) {
  const auto bytes = fromHex("d9 5e d2");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::tag(0x5ed2), event);
  ASSERT_FALSE(decoder.atItemBoundary());
  ASSERT_TRUE(decoder.atEnd());
  ASSERT_EQ(Error::kUnexpectedEof, decoder.decodeEvent(event));
}

TEST(decoder, simple_values) {
  const auto bytes = fromHex("e7 f8 5e f4 f5 f6 f7 f3 f8 ff");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::simple(7),      Event::simple(0x5e), Event::boolean(false),
      Event::boolean(true),  Event::null(),       Event::undefined(),
      Event::simple(19),     Event::simple(0xff)};
  ASSERT_EQ(expected, events);
}

TEST(decoder, invalid_simple) {
  for (const char *hex : {"f8 14", "f8 1f", "f8 00"}) {
    std::vector<Event> events;
    ASSERT_EQ(Error::kInvalidSimple, decodeAll(fromHex(hex), events)) << hex;
  }
}

TEST(decoder, floats) {
  const auto bytes = fromHex(
      "f9 7c 00 fa 7f 80 00 00 fb 7f f0 00 00 00 00 00 00 f9 80 00 "
      "fb 7f f8 00 00 00 00 00 01");
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll(bytes, events));

  const std::vector<Event> expected = {
      Event::float16Bits(0x7c00), Event::float32Bits(0x7f800000),
      Event::float64Bits(0x7ff0000000000000),
      Event::float16Bits(0x8000),
      Event::float64Bits(0x7ff8000000000001)};
  ASSERT_EQ(expected, events);
}

TEST(decoder, unexpected_break) {
  const char *inputs[] = {
      "ff",           // top level
      "81 ff",        // definite array
      "9f c1 ff",     // tag with no item
      "9f 81 ff ff",  // innermost frame is definite
  };
  for (const char *hex : inputs) {
    std::vector<Event> events;
    ASSERT_EQ(Error::kUnexpectedBreak, decodeAll(fromHex(hex), events)) << hex;
  }
}

TEST(decoder, reserved_encodings) {
  std::vector<Event> events;
  ASSERT_EQ(Error::kReservedEncoding, decodeAll(fromHex("1c"), events));
  ASSERT_EQ(Error::kReservedEncoding, decodeAll(fromHex("82 01 7d"), events));
  ASSERT_EQ(Error::kInvalidIndefinite, decodeAll(fromHex("1f"), events));
  ASSERT_EQ(Error::kInvalidIndefinite, decodeAll(fromHex("3f"), events));
  ASSERT_EQ(Error::kInvalidIndefinite, decodeAll(fromHex("df"), events));
}

TEST(decoder, odd_map) {
  std::vector<Event> events;
  ASSERT_EQ(Error::kOddMapLength, decodeAll(fromHex("bf 01 ff"), events));

  // Pair count cannot be doubled into an item count
  events.clear();
  ASSERT_EQ(Error::kOddMapLength,
            decodeAll(fromHex("bb 80 00 00 00 00 00 00 00"), events));

  events.clear();
  ASSERT_EQ(Error::kNone, decodeAll(fromHex("bf 01 02 ff"), events));
  const std::vector<Event> expected = {
      Event::mapIndefinite(), Event::unsignedInteger(1),
      Event::unsignedInteger(2), Event::end()};
  ASSERT_EQ(expected, events);
}

TEST(decoder, depth_exceeded) {
  const auto bytes = fromHex("81 81 81 81 81 00");
  Decoder<4> decoder(bytes.data(), bytes.size());
  Event event;
  for (int i = 0; i < 4; i++) {
    ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
    ASSERT_EQ(Event::array(1), event);
  }
  ASSERT_EQ(Error::kDepthExceeded, decoder.decodeEvent(event));
  ASSERT_EQ(4u, decoder.depth());
  ASSERT_EQ(4u, decoder.position());

  // Same input within the limit
  std::vector<Event> events;
  ASSERT_EQ(Error::kNone, decodeAll<5>(bytes, events));
  ASSERT_EQ(11u, events.size());
}

TEST(decoder, depth_exceeded_default) {
  std::vector<uint8_t> bytes(CONFIG_STREAMCBOR_MAX_NESTING + 1, 0x9f);
  std::vector<Event> events;
  ASSERT_EQ(Error::kDepthExceeded, decodeAll(bytes, events));
  ASSERT_EQ(size_t(CONFIG_STREAMCBOR_MAX_NESTING), events.size());
}

TEST(decoder, truncated_content) {
  const char *inputs[] = {
      "65 68 65",                    // 5 byte text, 2 present
      "5b ff ff ff ff ff ff ff ff",  // length beyond any buffer
      "82 01",                       // array missing an item
      "fa 00 00",                    // short float
  };
  for (const char *hex : inputs) {
    std::vector<Event> events;
    ASSERT_EQ(Error::kUnexpectedEof, decodeAll(fromHex(hex), events)) << hex;
  }

  const auto bytes = fromHex("65 68 65");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kUnexpectedEof, decoder.decodeEvent(event));
  ASSERT_EQ(0u, decoder.position());
  ASSERT_EQ(3u, decoder.remainingBytes());
}

TEST(decoder, sequence_of_items) {
  const auto bytes = fromHex("01 81 02 03");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_TRUE(decoder.atItemBoundary());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_FALSE(decoder.atItemBoundary());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::end(), event);
  ASSERT_TRUE(decoder.atItemBoundary());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::unsignedInteger(3), event);
  ASSERT_TRUE(decoder.atEnd());
}

TEST(decoder, empty_input) {
  Decoder<> decoder;
  Event event;
  ASSERT_TRUE(decoder.atEnd());
  ASSERT_TRUE(decoder.atItemBoundary());
  ASSERT_EQ(Error::kUnexpectedEof, decoder.decodeEvent(event));
}

TEST(decoder, skip_item) {
  // [{1: 2}, 1([_ 1]), 5]
  const auto bytes = fromHex("83 a1 01 02 c1 9f 01 ff 05");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::array(3), event);

  ASSERT_EQ(Error::kNone, decoder.skipItem());
  ASSERT_EQ(1u, decoder.depth());
  ASSERT_EQ(4u, decoder.position());
  ASSERT_EQ(Error::kNone, decoder.skipItem());
  ASSERT_EQ(8u, decoder.position());

  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::unsignedInteger(5), event);

  // Nothing left in the array
  ASSERT_EQ(Error::kPrematureEnd, decoder.skipItem());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::end(), event);

  ASSERT_EQ(Error::kUnexpectedEof, decoder.skipItem());
}

TEST(decoder, skip_item_at_break) {
  const auto bytes = fromHex("9f ff");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Error::kPrematureEnd, decoder.skipItem());
  ASSERT_EQ(1u, decoder.position());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::end(), event);
}

TEST(decoder, restart) {
  const auto bytes = fromHex("82 01 02");
  Decoder<> decoder(bytes.data(), bytes.size());
  Event event;
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  decoder.restart();
  ASSERT_EQ(0u, decoder.depth());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::array(2), event);

  const auto other = fromHex("f6");
  decoder.initBuffer(other.data(), other.size());
  ASSERT_EQ(Error::kNone, decoder.decodeEvent(event));
  ASSERT_EQ(Event::null(), event);
  ASSERT_TRUE(decoder.atItemBoundary());
}
