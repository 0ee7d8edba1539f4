/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/scalar.hpp"

#include <boost/multiprecision/integer.hpp>

#include "codec/sss_error.hpp"
#include "codec/validator.hpp"

namespace sss::codec::scalar {

  size_t encodedLength(const Integer &value) {
    if (value <= 0) {
      return 1;
    }
    size_t bits = boost::multiprecision::msb(value) + 1;
    return (bits + kBitsPerByte - 1) / kBitsPerByte;
  }

  void encode(const Integer &value, ByteArray &out) {
    Integer v{value};
    do {
      auto byte = static_cast<uint8_t>(v & kPayloadMask);
      v >>= kBitsPerByte;
      if (v != 0) {
        byte |= kContinuationBit;
      }
      out.push_back(byte);
    } while (v != 0);
  }

  outcome::result<Integer> decode(size_t bit_size, common::ByteSource &source) {
    const size_t max_length = maxEncodedLength(bit_size);

    Integer value = 0;
    for (size_t index = 0;; ++index) {
      auto byte = source.nextByte();
      if (not byte.has_value()) {
        return DecodeError::TRUNCATED_INPUT;
      }

      Integer group{*byte & kPayloadMask};
      value |= group << (index * kBitsPerByte);

      if ((*byte & kContinuationBit) == 0) {
        OUTCOME_TRY(validator::validateScalarTerminator(*byte, index));
        break;
      }
      // past the last admissible byte only a zero padding group can follow
      // a value that fits, anything else overflows N bits
      if (index + 1 == max_length) {
        auto extra = source.nextByte();
        if (not extra.has_value()) {
          return DecodeError::TRUNCATED_INPUT;
        }
        if (*extra == 0x00) {
          return DecodeError::NON_CANONICAL_ENCODING;
        }
        return DecodeError::VALUE_OUT_OF_RANGE;
      }
    }

    OUTCOME_TRY(validator::validateDecoded(value, bit_size));
    return value;
  }

}  // namespace sss::codec::scalar
