/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/istream_byte_source.hpp"

namespace sss::common {

  IstreamByteSource::IstreamByteSource(std::istream &stream)
      : stream_{stream}, consumed_{0} {}

  std::optional<uint8_t> IstreamByteSource::nextByte() {
    auto c = stream_.get();
    if (c == std::istream::traits_type::eof()) {
      return std::nullopt;
    }
    ++consumed_;
    return static_cast<uint8_t>(c);
  }

  size_t IstreamByteSource::read(std::span<uint8_t> out) {
    if (out.empty()) {
      return 0;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    stream_.read(reinterpret_cast<char *>(out.data()),
                 static_cast<std::streamsize>(out.size()));
    auto n = static_cast<size_t>(stream_.gcount());
    consumed_ += n;
    return n;
  }

  std::optional<uint64_t> IstreamByteSource::remaining() const {
    return std::nullopt;
  }

  uint64_t IstreamByteSource::consumed() const {
    return consumed_;
  }
}  // namespace sss::common
