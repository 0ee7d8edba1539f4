/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include "common/byte_source.hpp"

namespace sss::common {
  /**
   * @class IstreamByteSource reads bytes incrementally from std::istream.
   * The source is unbounded: it learns about the end of data only when a
   * read comes up short, which is how a closed or cancelled stream shows up
   * to the decoder.
   */
  class IstreamByteSource : public ByteSource {
   public:
    explicit IstreamByteSource(std::istream &stream);

    ~IstreamByteSource() override = default;

    std::optional<uint8_t> nextByte() override;

    size_t read(std::span<uint8_t> out) override;

    std::optional<uint64_t> remaining() const override;

    uint64_t consumed() const override;

   private:
    std::istream &stream_;
    uint64_t consumed_;
  };
}  // namespace sss::common
