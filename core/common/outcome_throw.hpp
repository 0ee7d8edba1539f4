/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>

#include <boost/throw_exception.hpp>

#include "outcome/outcome.hpp"

namespace sss::common {
  /**
   * @brief throws outcome::result error as boost exception, keeping a
   * description of where and why it happened
   * @param t error value
   * @param context human-readable details (offsets, expected vs actual)
   */
  template <typename T>
    requires std::is_enum_v<T>
  [[noreturn]] void raise(T t, const std::string &context) {
    std::error_code ec = make_error_code(t);
    boost::throw_exception(std::system_error(ec, context));
  }

  /**
   * @brief throws outcome::result error made of error as boost exception
   * @tparam T outcome error type
   * @param t outcome error value
   * @param context human-readable details
   */
  template <typename T>
    requires(not std::is_enum_v<T>)
  [[noreturn]] void raise(const T &t, const std::string &context) {
    boost::throw_exception(
        std::system_error(t.value(), t.category(), context));
  }
}  // namespace sss::common
