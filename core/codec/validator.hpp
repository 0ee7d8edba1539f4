/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/codec_config.hpp"
#include "codec/sss_error.hpp"
#include "codec/types.hpp"

/**
 * Bounds and canonicality checks shared by the encoder and the decoder.
 * Every check is called inline while a value is walked, there is no
 * separate validation pass.
 */
namespace sss::codec::validator {

  /**
   * @return true if bit_size is a multiple of 8 in [kMinBitSize, kMaxBitSize]
   */
  bool isValidBitSize(size_t bit_size);

  /**
   * @return TypeError::INVALID_BIT_SIZE unless isValidBitSize(bit_size)
   */
  outcome::result<void> validateBitSize(size_t bit_size);

  /**
   * @return true if 0 <= value < 2^bit_size
   */
  bool fitsBitSize(const Integer &value, size_t bit_size);

  /**
   * @brief encoder precondition of uint<N> and scalar<N>
   * @return EncodeError::VALUE_OUT_OF_RANGE unless fitsBitSize()
   */
  outcome::result<void> validateEncodable(const Integer &value,
                                          size_t bit_size);

  /**
   * @return DecodeError::VALUE_OUT_OF_RANGE unless fitsBitSize()
   */
  outcome::result<void> validateDecoded(const Integer &value, size_t bit_size);

  /**
   * @brief checks the number of elements of a value against the number the
   * descriptor declares (tuple length, container arity, bytesN length)
   * @return EncodeError::SHAPE_MISMATCH if they differ
   */
  outcome::result<void> validateArity(size_t expected, size_t actual);

  /**
   * @brief encoder check of an Array or dynamic bytes length
   * @return EncodeError::VALUE_OUT_OF_RANGE if it can't be a scalar<32>
   */
  outcome::result<void> validateEncodableLength(uint64_t length);

  /**
   * @brief decoder check of an Array or dynamic bytes length
   * @return DecodeError::VALUE_OUT_OF_RANGE above the format bound,
   * DecodeError::LENGTH_EXCEEDS_LIMIT above the configured ceiling
   */
  outcome::result<void> validateDecodedLength(const Integer &length,
                                              const CodecConfig &config);

  /**
   * @brief canonicality of the byte terminating a scalar
   * @param byte terminating byte (high bit clear)
   * @param index position of that byte within the scalar encoding
   * @return DecodeError::NON_CANONICAL_ENCODING for a zero group that is not
   * the only byte
   */
  outcome::result<void> validateScalarTerminator(uint8_t byte, size_t index);

  /**
   * @return DecodeError::INVALID_BIT_VALUE unless byte is 0x00 or 0x01
   */
  outcome::result<void> validateBitByte(uint8_t byte);

}  // namespace sss::codec::validator
