/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/sss_encoder_stream.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "codec/sss_error.hpp"
#include "testutil/literals.hpp"

using sss::codec::ByteArray;
using sss::codec::EncodeError;
using sss::codec::Integer;
using sss::codec::SssEncoderStream;
using sss::codec::TypeDescriptor;
using sss::codec::Value;
using sss::codec::ValueList;

namespace {
  std::error_code encodeError(const TypeDescriptor &type, const Value &value) {
    SssEncoderStream s;
    try {
      s.encode(type, value);
    } catch (const std::system_error &e) {
      return e.code();
    }
    return {};
  }

  class ByteSinkMock : public sss::common::ByteSink {
   public:
    MOCK_METHOD(void, put, (std::span<const uint8_t>), (override));
  };
}  // namespace

/**
 * @given bit descriptor
 * @when true and false are encoded
 * @then they become 01 and 00
 */
TEST(SssEncoderStreamTest, EncodeBit) {
  SssEncoderStream s;
  s.encode(TypeDescriptor::bit(), Value::bit(true))
      .encode(TypeDescriptor::bit(), Value::bit(false));
  ASSERT_EQ(s.data(), "0100"_unhex);
}

/**
 * @given uint descriptors of several widths
 * @when values are encoded
 * @then each takes N / 8 little-endian bytes
 */
TEST(SssEncoderStreamTest, EncodeUint) {
  SssEncoderStream s;
  s.encode(TypeDescriptor::uint(64), Value::integer(300));
  ASSERT_EQ(s.data(), "2c01000000000000"_unhex);

  SssEncoderStream s16;
  s16.encode(TypeDescriptor::uint(16), Value::integer(0xABCD));
  ASSERT_EQ(s16.data(), "cdab"_unhex);

  SssEncoderStream s24;
  s24.encode(TypeDescriptor::uint(24), Value::integer(0xFFFFFF));
  ASSERT_EQ(s24.data(), "ffffff"_unhex);
}

/**
 * @given uint2048 descriptor
 * @when 2^2048 - 1 is encoded
 * @then 256 bytes of 0xff are produced
 */
TEST(SssEncoderStreamTest, EncodeWideUint) {
  SssEncoderStream s;
  Integer max = (Integer{1} << 2048) - 1;
  s.encode(TypeDescriptor::uint(2048), Value::integer(max));
  ASSERT_EQ(s.data(), ByteArray(256, 0xFF));
}

/**
 * @given uint8 and scalar8 descriptors
 * @when 256 or a negative value is encoded
 * @then VALUE_OUT_OF_RANGE is raised
 */
TEST(SssEncoderStreamTest, IntegerOutOfRange) {
  EXPECT_EQ(encodeError(TypeDescriptor::uint(8), Value::integer(256)),
            EncodeError::VALUE_OUT_OF_RANGE);
  EXPECT_EQ(encodeError(TypeDescriptor::scalar(8), Value::integer(256)),
            EncodeError::VALUE_OUT_OF_RANGE);
  EXPECT_EQ(encodeError(TypeDescriptor::uint(8), Value::integer(-1)),
            EncodeError::VALUE_OUT_OF_RANGE);
}

/**
 * @given values that don't match their descriptors
 * @when they are encoded
 * @then SHAPE_MISMATCH is raised
 */
TEST(SssEncoderStreamTest, ShapeMismatch) {
  auto uint8 = TypeDescriptor::uint(8);
  // wrong kind
  EXPECT_EQ(encodeError(uint8, Value::bit(true)), EncodeError::SHAPE_MISMATCH);
  EXPECT_EQ(encodeError(TypeDescriptor::bit(), Value::integer(1)),
            EncodeError::SHAPE_MISMATCH);
  // wrong tuple length
  EXPECT_EQ(encodeError(TypeDescriptor::tuple(uint8, 2),
                        Value::list({Value::integer(1)})),
            EncodeError::SHAPE_MISMATCH);
  // wrong container arity
  EXPECT_EQ(encodeError(TypeDescriptor::container({uint8, uint8}),
                        Value::list({Value::integer(1)})),
            EncodeError::SHAPE_MISMATCH);
  // wrong fixed bytes length
  EXPECT_EQ(encodeError(TypeDescriptor::fixedBytes(4), Value::bytes({1, 2})),
            EncodeError::SHAPE_MISMATCH);
  // optional given a plain value
  EXPECT_EQ(encodeError(TypeDescriptor::optional(uint8), Value::integer(1)),
            EncodeError::SHAPE_MISMATCH);
}

/**
 * @given container of uint8 and dynamic uint8 array
 * @when (0xab, [1, 2]) is encoded
 * @then fields are concatenated with only the array carrying a length
 */
TEST(SssEncoderStreamTest, EncodeContainer) {
  auto uint8 = TypeDescriptor::uint(8);
  auto type =
      TypeDescriptor::container({uint8, TypeDescriptor::array(uint8)});
  SssEncoderStream s;
  s.encode(type,
           Value::list({Value::integer(0xab),
                        Value::list({Value::integer(1), Value::integer(2)})}));
  ASSERT_EQ(s.data(), "ab020102"_unhex);
}

/**
 * @given optional uint16
 * @when absent and present values are encoded
 * @then presence byte precedes the inner encoding
 */
TEST(SssEncoderStreamTest, EncodeOptional) {
  auto type = TypeDescriptor::optional(TypeDescriptor::uint(16));
  SssEncoderStream s;
  s.encode(type, Value::none()).encode(type, Value::some(Value::integer(5)));
  ASSERT_EQ(s.data(), "00010500"_unhex);
}

/**
 * @given stream that drops data
 * @when value is encoded
 * @then only the size is counted
 */
TEST(SssEncoderStreamTest, DropData) {
  SssEncoderStream s{true};
  s.encode(TypeDescriptor::bytes(), Value::bytes(ByteArray(300, 7)));
  ASSERT_TRUE(s.data().empty());
  // two bytes of length and 300 bytes of data
  ASSERT_EQ(s.size(), 302);
}

/**
 * @given stream writing into a sink
 * @when a value larger than the sink chunk is encoded and the stream is
 * flushed
 * @then sink receives all the bytes in order
 */
TEST(SssEncoderStreamTest, EncodeToSink) {
  ByteSinkMock sink;
  ByteArray received;
  EXPECT_CALL(sink, put(testing::_))
      .WillRepeatedly([&](std::span<const uint8_t> bytes) {
        received.insert(received.end(), bytes.begin(), bytes.end());
      });

  ByteArray payload(SssEncoderStream::kSinkChunkSize + 10, 0x5A);
  auto type = TypeDescriptor::container(
      {TypeDescriptor::uint(8), TypeDescriptor::bytes()});

  SssEncoderStream s{sink};
  s.encode(type, Value::list({Value::integer(1), Value::bytes(payload)}));
  s.flush();

  ASSERT_EQ(received.size(), s.size());
  ASSERT_EQ(received[0], 0x01);
  // 4106 as scalar32
  ASSERT_EQ(received[1], 0x8A);
  ASSERT_EQ(received[2], 0x20);
  ASSERT_TRUE(s.data().empty());
}
