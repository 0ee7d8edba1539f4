/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>
#include <system_error>

#include <gtest/gtest.h>

#include "common/byte_span_source.hpp"
#include "common/istream_byte_source.hpp"
#include "common/ostream_byte_sink.hpp"
#include "testutil/literals.hpp"

using sss::common::ByteSpanSource;
using sss::common::IstreamByteSource;
using sss::common::OstreamByteSink;

/**
 * @given byte array of 3 items: 0, 1, 2
 * @when create ByteSpanSource wrapping this array and take bytes one by one
 * @then bytes 0, 1, 2 are obtained sequentially @and next nextByte call
 * returns nullopt
 */
TEST(ByteSpanSourceTest, NextByte) {
  std::vector<uint8_t> bytes{0, 1, 2};
  ByteSpanSource source{bytes};

  for (size_t i = 0; i < bytes.size(); i++) {
    ASSERT_EQ(source.remaining(), bytes.size() - i);
    ASSERT_EQ(source.nextByte(), bytes.at(i)) << "Fail in " << i;
    ASSERT_EQ(source.consumed(), i + 1);
  }

  ASSERT_EQ(source.nextByte(), std::nullopt);
  ASSERT_EQ(source.remaining(), 0);
}

/**
 * @given span source of 3 bytes
 * @when reading 2 bytes and then 2 more
 * @then first read is full, second one stops at the end of the span
 */
TEST(ByteSpanSourceTest, Read) {
  auto bytes = "0a0b0c"_unhex;
  ByteSpanSource source{bytes};

  std::vector<uint8_t> out(2);
  ASSERT_EQ(source.read(out), 2);
  ASSERT_EQ(out, "0a0b"_unhex);

  ASSERT_EQ(source.read(out), 1);
  ASSERT_EQ(out[0], 0x0c);
  ASSERT_EQ(source.consumed(), 3);
  ASSERT_EQ(source.read(out), 0);
}

/**
 * @given istream holding 3 bytes
 * @when they are read through IstreamByteSource
 * @then source doesn't know its size @and reports end of data once the stream
 * runs dry
 */
TEST(IstreamByteSourceTest, ReadsUntilEof) {
  std::istringstream stream{std::string{"\x01\x02\x03", 3}};
  IstreamByteSource source{stream};

  ASSERT_EQ(source.remaining(), std::nullopt);
  ASSERT_EQ(source.nextByte(), 0x01);

  std::vector<uint8_t> out(4);
  ASSERT_EQ(source.read(out), 2);
  ASSERT_EQ(out[0], 0x02);
  ASSERT_EQ(out[1], 0x03);
  ASSERT_EQ(source.consumed(), 3);
  ASSERT_EQ(source.nextByte(), std::nullopt);
}

/**
 * @given ostream sink
 * @when bytes are put into it in two parts
 * @then stream holds them in order
 */
TEST(OstreamByteSinkTest, Put) {
  std::ostringstream stream;
  OstreamByteSink sink{stream};

  sink.put("0102"_unhex);
  sink.put("ff"_unhex);

  ASSERT_EQ(stream.str(), std::string("\x01\x02\xff", 3));
}

/**
 * @given ostream that has already failed
 * @when bytes are put into the sink over it
 * @then WRITE_FAILED is raised
 */
TEST(OstreamByteSinkTest, FailedStream) {
  std::ostringstream stream;
  stream.setstate(std::ios::badbit);
  OstreamByteSink sink{stream};

  try {
    sink.put("0102"_unhex);
    FAIL() << "write into a failed stream succeeded";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code(), sss::common::SinkError::WRITE_FAILED);
  }
}
