/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace sss::codec {

  /**
   * Decoder limits protecting against hostile input
   */
  struct CodecConfig {
    static constexpr uint64_t kDefaultMaxCollectionLength = 1ull << 24u;

    /// ceiling on Array and dynamic bytes lengths, checked before anything
    /// is allocated; independent of the 2^32-1 bound of the format
    uint64_t max_collection_length = kDefaultMaxCollectionLength;
  };

}  // namespace sss::codec
