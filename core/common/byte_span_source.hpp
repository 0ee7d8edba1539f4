/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/byte_source.hpp"

namespace sss::common {
  /**
   * @class ByteSpanSource implements ByteSource interface
   * It wraps a span of bytes and allows getting bytes
   * from it sequentially.
   */
  class ByteSpanSource : public ByteSource {
   public:
    explicit ByteSpanSource(std::span<const uint8_t> source);

    explicit ByteSpanSource(const std::vector<uint8_t> &source);

    ~ByteSpanSource() override = default;

    std::optional<uint8_t> nextByte() override;

    size_t read(std::span<uint8_t> out) override;

    std::optional<uint64_t> remaining() const override;

    uint64_t consumed() const override;

   private:
    std::span<const uint8_t> span_;
    size_t current_index_;  ///< index of the next byte
  };
}  // namespace sss::common
