/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>

#include "outcome/outcome.hpp"

namespace sss::common {
  enum class SinkError : uint8_t {
    WRITE_FAILED = 1,  ///< destination refused the bytes
  };

  /**
   * @brief push-based destination of encoded bytes
   */
  class ByteSink {
   public:
    virtual ~ByteSink() = default;

    /**
     * @brief appends bytes to the sink, raises SinkError::WRITE_FAILED if
     * the destination doesn't take them
     * @param bytes data to append
     */
    virtual void put(std::span<const uint8_t> bytes) = 0;
  };
}  // namespace sss::common

OUTCOME_HPP_DECLARE_ERROR(sss::common, SinkError)
