/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/sss_decoder_stream.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "codec/fixedwidth.hpp"
#include "codec/scalar.hpp"
#include "codec/validator.hpp"
#include "common/byte_span_source.hpp"
#include "common/outcome_throw.hpp"
#include "common/visitor.hpp"

namespace sss::codec {

  SssDecoderStream::SssDecoderStream(std::span<const uint8_t> span,
                                     CodecConfig config)
      : owned_source_{std::make_unique<common::ByteSpanSource>(span)},
        source_{owned_source_.get()},
        config_{config} {}

  SssDecoderStream::SssDecoderStream(common::ByteSource &source,
                                     CodecConfig config)
      : source_{&source}, config_{config} {}

  size_t SssDecoderStream::currentIndex() const {
    return source_->consumed();
  }

  bool SssDecoderStream::hasMore(uint64_t n) const {
    auto remaining = source_->remaining();
    return not remaining.has_value() or *remaining >= n;
  }

  uint8_t SssDecoderStream::nextByte() {
    auto byte = source_->nextByte();
    if (not byte.has_value()) {
      common::raise(DecodeError::TRUNCATED_INPUT,
                    fmt::format("input ended at offset {}", currentIndex()));
    }
    return *byte;
  }

  Value SssDecoderStream::decode(const TypeDescriptor &type) {
    using T = TypeDescriptor;
    return visit_in_place(
        type.variant(),
        [&](const T::Bit &) { return Value::bit(decodeBit(type)); },
        [&](const T::Uint &u) {
          auto raw =
              decodeRaw(type, u.bit_size / 8, DecodeError::TRUNCATED_INPUT);
          return Value::integer(fixedwidth::decodeUint(raw));
        },
        [&](const T::Scalar &s) {
          return Value::integer(decodeScalar(type, s.bit_size));
        },
        [&](const T::Bytes &b) {
          if (b.fixed_length) {
            return Value::bytes(decodeRaw(
                type, *b.fixed_length, DecodeError::LENGTH_MISMATCH));
          }
          auto length = decodeLength(type).convert_to<size_t>();
          return Value::bytes(
              decodeRaw(type, length, DecodeError::TRUNCATED_INPUT));
        },
        [&](const T::Tuple &t) {
          // a tuple of fixed-size elements is refused before anything is read
          if (auto size = type.fixedEncodedSize();
              size and not hasMore(*size)) {
            common::raise(DecodeError::TRUNCATED_INPUT,
                          fmt::format("{} needs {} bytes, {} left at offset {}",
                                      type.toString(),
                                      *size,
                                      *source_->remaining(),
                                      currentIndex()));
          }
          return Value::list(decodeElements(t.element, t.length));
        },
        [&](const T::Array &a) {
          auto length = decodeLength(type).convert_to<size_t>();
          const auto min_size = a.element.minEncodedSize();
          auto remaining = source_->remaining();
          if (remaining and min_size != 0 and length > *remaining / min_size) {
            common::raise(
                DecodeError::TRUNCATED_INPUT,
                fmt::format("{} of {} elements needs at least {} bytes, "
                            "{} left at offset {}",
                            type.toString(),
                            length,
                            min_size,
                            *remaining,
                            currentIndex()));
          }
          return Value::list(decodeElements(a.element, length));
        },
        [&](const T::Container &c) {
          ValueList fields;
          fields.reserve(c.fields.size());
          for (const auto &field : c.fields) {
            fields.push_back(decode(field));
          }
          return Value::list(std::move(fields));
        },
        [&](const T::Optional &o) {
          if (not decodeBit(type)) {
            return Value::none();
          }
          return Value::some(decode(o.inner));
        });
  }

  bool SssDecoderStream::decodeBit(const TypeDescriptor &type) {
    const auto offset = currentIndex();
    auto byte = nextByte();
    if (auto res = validator::validateBitByte(byte); res.has_error()) {
      common::raise(res.error(),
                    fmt::format("{} at offset {}: got byte 0x{:02x}",
                                type.toString(),
                                offset,
                                byte));
    }
    return byte == 0x01;
  }

  Integer SssDecoderStream::decodeScalar(const TypeDescriptor &type,
                                         size_t bit_size) {
    const auto offset = currentIndex();
    auto res = scalar::decode(bit_size, *source_);
    if (res.has_error()) {
      common::raise(res.error(),
                    fmt::format("{} at offset {}, failed at offset {}",
                                type.toString(),
                                offset,
                                currentIndex()));
    }
    return std::move(res.value());
  }

  Integer SssDecoderStream::decodeLength(const TypeDescriptor &type) {
    const auto offset = currentIndex();
    auto length = decodeScalar(type, kLengthPrefixBitSize);
    if (auto res = validator::validateDecodedLength(length, config_);
        res.has_error()) {
      common::raise(res.error(),
                    fmt::format("{} at offset {}: length {}, limit {}",
                                type.toString(),
                                offset,
                                length.str(),
                                config_.max_collection_length));
    }
    return length;
  }

  ByteArray SssDecoderStream::decodeRaw(const TypeDescriptor &type,
                                        size_t length,
                                        DecodeError on_short) {
    const auto offset = currentIndex();
    auto raiseShort = [&](uint64_t available) {
      common::raise(on_short,
                    fmt::format("{} at offset {}: needs {} bytes, {} available",
                                type.toString(),
                                offset,
                                length,
                                available));
    };

    if (not hasMore(length)) {
      raiseShort(*source_->remaining());
    }

    // unbounded sources are read chunk by chunk, memory grows with the data
    // actually received rather than with the declared length
    const size_t chunk =
        source_->remaining().has_value() ? length : kReadChunkSize;

    ByteArray out;
    size_t filled = 0;
    while (filled < length) {
      const size_t step = std::min(chunk, length - filled);
      out.resize(filled + step);
      auto n = source_->read(std::span<uint8_t>(out).subspan(filled, step));
      filled += n;
      if (n < step) {
        raiseShort(filled);
      }
    }
    return out;
  }

  ValueList SssDecoderStream::decodeElements(const TypeDescriptor &element,
                                             size_t length) {
    ValueList list;
    list.reserve(std::min(length, kMaxReserve));
    for (size_t i = 0; i < length; ++i) {
      list.push_back(decode(element));
    }
    return list;
  }

}  // namespace sss::codec
