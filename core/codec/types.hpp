/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace sss::codec {
  /**
   * @brief convenience alias for arrays of bytes
   */
  using ByteArray = std::vector<uint8_t>;

  /**
   * @brief holds values of uint<N> and scalar<N> for any supported N
   */
  using Integer = boost::multiprecision::cpp_int;

  /// width limits of uint<N> and scalar<N>
  constexpr size_t kMinBitSize = 8;
  constexpr size_t kMaxBitSize = 2048;

  /// Array and dynamic bytes lengths are scalar<32>
  constexpr size_t kLengthPrefixBitSize = 32;
  constexpr uint64_t kMaxCollectionLength =
      std::numeric_limits<uint32_t>::max();

  /// presence markers of optional values, same bytes as bit
  constexpr uint8_t kAbsent = 0x00;
  constexpr uint8_t kPresent = 0x01;
}  // namespace sss::codec
