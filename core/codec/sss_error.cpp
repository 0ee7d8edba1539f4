/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/sss_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sss::codec, EncodeError, e) {
  using sss::codec::EncodeError;
  switch (e) {
    case EncodeError::VALUE_OUT_OF_RANGE:
      return "SSS encode: value does not fit the declared bit size or domain";
    case EncodeError::SHAPE_MISMATCH:
      return "SSS encode: value does not match the type descriptor";
  }
  return "unknown SSS EncodeError";
}

OUTCOME_CPP_DEFINE_CATEGORY(sss::codec, DecodeError, e) {
  using sss::codec::DecodeError;
  switch (e) {
    case DecodeError::TRUNCATED_INPUT:
      return "SSS decode: input ended before the value was complete";
    case DecodeError::NON_CANONICAL_ENCODING:
      return "SSS decode: scalar is not encoded in its minimal form";
    case DecodeError::INVALID_BIT_VALUE:
      return "SSS decode: bit value must be 0x00 or 0x01";
    case DecodeError::VALUE_OUT_OF_RANGE:
      return "SSS decode: value does not fit the declared bit size or domain";
    case DecodeError::LENGTH_MISMATCH:
      return "SSS decode: fixed-length data is shorter than declared";
    case DecodeError::LENGTH_EXCEEDS_LIMIT:
      return "SSS decode: collection length exceeds the configured limit";
    case DecodeError::TRAILING_DATA:
      return "SSS decode: unconsumed bytes after the value";
  }
  return "unknown SSS DecodeError";
}

OUTCOME_CPP_DEFINE_CATEGORY(sss::codec, TypeError, e) {
  using sss::codec::TypeError;
  switch (e) {
    case TypeError::INVALID_BIT_SIZE:
      return "SSS type: bit size must be a multiple of 8 within [8, 2048]";
  }
  return "unknown SSS TypeError";
}
