/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace sss::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace sss::common

OUTCOME_HPP_DECLARE_ERROR(sss::common, UnhexError)

namespace sss::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace sss::common
