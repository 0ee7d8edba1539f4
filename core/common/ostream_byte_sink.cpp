/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/ostream_byte_sink.hpp"

#include <fmt/format.h>

#include "common/outcome_throw.hpp"

namespace sss::common {

  OstreamByteSink::OstreamByteSink(std::ostream &stream) : stream_{stream} {}

  void OstreamByteSink::put(std::span<const uint8_t> bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    stream_.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    if (not stream_) {
      raise(SinkError::WRITE_FAILED,
            fmt::format("ostream rejected {} bytes", bytes.size()));
    }
  }
}  // namespace sss::common
