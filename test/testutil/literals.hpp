/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string_view>
#include <vector>

#include "common/hexutil.hpp"

/// "0102ff"_unhex is {0x01, 0x02, 0xff}, throws on a malformed string
inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  auto res = sss::common::unhex(std::string_view(c, s));
  if (res.has_error()) {
    throw std::invalid_argument(res.error().message());
  }
  return std::move(res.value());
}
