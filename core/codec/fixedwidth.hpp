/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "codec/types.hpp"

namespace sss::codec::fixedwidth {

  /**
   * @brief appends bit_size / 8 little-endian bytes of value to out
   * @param value non-negative, already checked to fit bit_size
   */
  void encodeUint(const Integer &value, size_t bit_size, ByteArray &out);

  /**
   * @brief decodes little-endian unsigned integer from all of the bytes
   */
  Integer decodeUint(std::span<const uint8_t> bytes);

}  // namespace sss::codec::fixedwidth
