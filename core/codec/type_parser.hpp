/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/type_descriptor.hpp"
#include "outcome/outcome.hpp"

namespace sss::codec {

  enum class ParseError {
    UNEXPECTED_END = 1,    ///< type string ended in the middle of a type
    UNEXPECTED_CHARACTER,  ///< character can't start or continue a type here
    UNKNOWN_TYPE,          ///< name is not a base type or alias
    INVALID_NUMBER,        ///< size has a leading zero or doesn't fit size_t
    INVALID_BIT_SIZE,      ///< uintN / scalarN with an illegal N
    TRAILING_CHARACTERS,   ///< complete type followed by more characters
  };

  /**
   * @brief builds a type descriptor from its string notation
   *
   * @code
   * type   := base suffix*
   * base   := "bit" | "bool" | "byte" | "bytes" [number]
   *         | ("uint" | "scalar") number
   *         | "{" [type ("," type)*] "}"
   * suffix := "[" number "]" | "[]" | "?"
   * @endcode
   *
   * A run of [..] suffixes reads left to right from the outermost
   * collection inwards, so "uint8[10][5]" is 10 tuples of 5 uint8 each.
   * "?" makes optional everything to its left
   */
  outcome::result<TypeDescriptor> parseType(std::string_view type_string);

}  // namespace sss::codec

OUTCOME_HPP_DECLARE_ERROR(sss::codec, ParseError)
