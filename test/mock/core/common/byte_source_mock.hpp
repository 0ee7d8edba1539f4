/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "common/byte_source.hpp"

namespace sss::common {
  class ByteSourceMock : public ByteSource {
   public:
    ~ByteSourceMock() override = default;

    MOCK_METHOD(std::optional<uint8_t>, nextByte, (), (override));

    MOCK_METHOD(size_t, read, (std::span<uint8_t>), (override));

    MOCK_METHOD(std::optional<uint64_t>, remaining, (), (const, override));

    MOCK_METHOD(uint64_t, consumed, (), (const, override));
  };
}  // namespace sss::common
