/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sss::codec {
  /**
   * @brief EncodeError enum provides error codes for Encode methods,
   * all of them are violations of the caller contract
   */
  enum class EncodeError {  // 0 is reserved for success
    VALUE_OUT_OF_RANGE = 1,  ///< integer or length doesn't fit its domain
    SHAPE_MISMATCH,          ///< value doesn't match the type descriptor
  };

  /**
   * @brief DecodeError enum provides codes of errors for Decoder methods
   */
  enum class DecodeError {     // 0 is reserved for success
    TRUNCATED_INPUT = 1,       ///< source ended before the value did
    NON_CANONICAL_ENCODING,    ///< scalar is longer than its minimal form
    INVALID_BIT_VALUE,         ///< bit byte is neither 0x00 nor 0x01
    VALUE_OUT_OF_RANGE,        ///< integer or length doesn't fit its domain
    LENGTH_MISMATCH,           ///< fixed-length bytes came up short
    LENGTH_EXCEEDS_LIMIT,      ///< collection is longer than allowed
    TRAILING_DATA,             ///< bytes left after a whole-input decode
  };

  /**
   * @brief TypeError enum provides codes of errors of type descriptor
   * construction
   */
  enum class TypeError {
    INVALID_BIT_SIZE = 1,  ///< not a multiple of 8 or out of [8, 2048]
  };

}  // namespace sss::codec

OUTCOME_HPP_DECLARE_ERROR(sss::codec, EncodeError)
OUTCOME_HPP_DECLARE_ERROR(sss::codec, DecodeError)
OUTCOME_HPP_DECLARE_ERROR(sss::codec, TypeError)
