/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>

namespace sss::common {
  /**
   * @brief pull-based source of bytes for decoders.
   * Bytes are consumed strictly forward, a source is never rewound
   */
  class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /**
     * @brief takes next byte and returns it. If it does not exist, return
     * nullopt
     * @return Current byte
     */
    [[nodiscard]] virtual std::optional<uint8_t> nextByte() = 0;

    /**
     * @brief Takes up to out.size() next bytes
     * @param out destination of the bytes
     * @return number of bytes actually written to out; less than out.size()
     * only if the source got exhausted
     */
    [[nodiscard]] virtual size_t read(std::span<uint8_t> out) = 0;

    /**
     * @return number of bytes left if the source is bounded, nullopt if the
     * source does not know where it ends
     */
    virtual std::optional<uint64_t> remaining() const = 0;

    /**
     * @return number of bytes taken from the source so far
     */
    virtual uint64_t consumed() const = 0;
  };
}  // namespace sss::common
