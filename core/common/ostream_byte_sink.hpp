/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include "common/byte_sink.hpp"

namespace sss::common {
  /**
   * @class OstreamByteSink writes bytes to std::ostream as they come
   */
  class OstreamByteSink : public ByteSink {
   public:
    explicit OstreamByteSink(std::ostream &stream);

    ~OstreamByteSink() override = default;

    void put(std::span<const uint8_t> bytes) override;

   private:
    std::ostream &stream_;
  };
}  // namespace sss::common
