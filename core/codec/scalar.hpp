/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/types.hpp"
#include "common/byte_source.hpp"
#include "outcome/outcome.hpp"

/**
 * scalar<N>: minimal unsigned LEB128, seven bits per byte, least significant
 * group first, 0x80 set on every byte but the last
 */
namespace sss::codec::scalar {

  constexpr uint8_t kPayloadMask = 0x7Fu;
  constexpr uint8_t kContinuationBit = 0x80u;
  constexpr size_t kBitsPerByte = 7;

  /**
   * @return the most bytes a canonical scalar<bit_size> can take,
   * ceil(bit_size / 7); decode() reads at most one byte more
   */
  constexpr size_t maxEncodedLength(size_t bit_size) {
    return (bit_size + kBitsPerByte - 1) / kBitsPerByte;
  }

  /**
   * @return canonical encoded length of a non-negative value,
   * max(1, ceil(bits(value) / 7))
   */
  size_t encodedLength(const Integer &value);

  /**
   * @brief appends canonical encoding of a non-negative value to out,
   * range against N is the caller's business
   */
  void encode(const Integer &value, ByteArray &out);

  /**
   * @brief reads one scalar<bit_size> from the source
   * @return decoded value, or DecodeError::TRUNCATED_INPUT,
   * DecodeError::NON_CANONICAL_ENCODING, DecodeError::VALUE_OUT_OF_RANGE
   */
  outcome::result<Integer> decode(size_t bit_size, common::ByteSource &source);

}  // namespace sss::codec::scalar
