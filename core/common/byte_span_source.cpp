/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/byte_span_source.hpp"

#include <algorithm>

namespace sss::common {

  ByteSpanSource::ByteSpanSource(std::span<const uint8_t> source)
      : span_{source}, current_index_{0} {}

  ByteSpanSource::ByteSpanSource(const std::vector<uint8_t> &source)
      : span_{source}, current_index_{0} {}

  std::optional<uint8_t> ByteSpanSource::nextByte() {
    if (current_index_ >= span_.size()) {
      return std::nullopt;
    }
    return span_[current_index_++];
  }

  size_t ByteSpanSource::read(std::span<uint8_t> out) {
    auto n = std::min(out.size(), span_.size() - current_index_);
    std::copy_n(span_.begin() + current_index_, n, out.begin());
    current_index_ += n;
    return n;
  }

  std::optional<uint64_t> ByteSpanSource::remaining() const {
    return span_.size() - current_index_;
  }

  uint64_t ByteSpanSource::consumed() const {
    return current_index_;
  }
}  // namespace sss::common
