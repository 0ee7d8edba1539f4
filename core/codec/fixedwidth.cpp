/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/fixedwidth.hpp"

namespace sss::codec::fixedwidth {

  void encodeUint(const Integer &value, size_t bit_size, ByteArray &out) {
    out.reserve(out.size() + bit_size / 8);
    for (size_t i = 0; i < bit_size; i += 8) {
      out.push_back(static_cast<uint8_t>((value >> i) & 0xFFu));
    }
  }

  Integer decodeUint(std::span<const uint8_t> bytes) {
    Integer decoded = 0;
    for (size_t i = 0; i < bytes.size(); ++i) {
      decoded |= Integer{bytes[i]} << (i * 8);
    }
    return decoded;
  }

}  // namespace sss::codec::fixedwidth
