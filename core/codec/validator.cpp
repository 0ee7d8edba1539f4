/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/validator.hpp"

#include <boost/multiprecision/integer.hpp>

namespace sss::codec::validator {

  bool isValidBitSize(size_t bit_size) {
    return bit_size % 8 == 0 and bit_size >= kMinBitSize
       and bit_size <= kMaxBitSize;
  }

  outcome::result<void> validateBitSize(size_t bit_size) {
    if (not isValidBitSize(bit_size)) {
      return TypeError::INVALID_BIT_SIZE;
    }
    return outcome::success();
  }

  bool fitsBitSize(const Integer &value, size_t bit_size) {
    if (value < 0) {
      return false;
    }
    if (value == 0) {
      return true;
    }
    // msb() is the index of the highest set bit
    return boost::multiprecision::msb(value) < bit_size;
  }

  outcome::result<void> validateEncodable(const Integer &value,
                                          size_t bit_size) {
    if (not fitsBitSize(value, bit_size)) {
      return EncodeError::VALUE_OUT_OF_RANGE;
    }
    return outcome::success();
  }

  outcome::result<void> validateDecoded(const Integer &value, size_t bit_size) {
    if (not fitsBitSize(value, bit_size)) {
      return DecodeError::VALUE_OUT_OF_RANGE;
    }
    return outcome::success();
  }

  outcome::result<void> validateArity(size_t expected, size_t actual) {
    if (expected != actual) {
      return EncodeError::SHAPE_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> validateEncodableLength(uint64_t length) {
    if (length > kMaxCollectionLength) {
      return EncodeError::VALUE_OUT_OF_RANGE;
    }
    return outcome::success();
  }

  outcome::result<void> validateDecodedLength(const Integer &length,
                                              const CodecConfig &config) {
    if (length < 0 or length > kMaxCollectionLength) {
      return DecodeError::VALUE_OUT_OF_RANGE;
    }
    if (length > config.max_collection_length) {
      return DecodeError::LENGTH_EXCEEDS_LIMIT;
    }
    return outcome::success();
  }

  outcome::result<void> validateScalarTerminator(uint8_t byte, size_t index) {
    if (byte == 0 and index != 0) {
      return DecodeError::NON_CANONICAL_ENCODING;
    }
    return outcome::success();
  }

  outcome::result<void> validateBitByte(uint8_t byte) {
    if (byte != 0x00 and byte != 0x01) {
      return DecodeError::INVALID_BIT_VALUE;
    }
    return outcome::success();
  }

}  // namespace sss::codec::validator
