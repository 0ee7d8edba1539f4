/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/sss_encoder_stream.hpp"

#include <fmt/format.h>

#include "codec/fixedwidth.hpp"
#include "codec/scalar.hpp"
#include "codec/sss_error.hpp"
#include "codec/validator.hpp"
#include "common/outcome_throw.hpp"
#include "common/visitor.hpp"

namespace sss::codec {
  namespace {
    template <typename T>
    const T &expectKind(const TypeDescriptor &type,
                        const Value &value,
                        std::string_view expected) {
      const auto *v = value.get<T>();
      if (v == nullptr) {
        common::raise(EncodeError::SHAPE_MISMATCH,
                      fmt::format("{} expects {} value, got {}",
                                  type.toString(),
                                  expected,
                                  value.kindName()));
      }
      return *v;
    }

    void checkArity(const TypeDescriptor &type,
                    size_t expected,
                    size_t actual) {
      if (auto res = validator::validateArity(expected, actual);
          res.has_error()) {
        common::raise(res.error(),
                      fmt::format("{} expects {} elements, got {}",
                                  type.toString(),
                                  expected,
                                  actual));
      }
    }
  }  // namespace

  SssEncoderStream::SssEncoderStream()
      : drop_data_{false}, bytes_written_{0}, sink_{nullptr} {}

  SssEncoderStream::SssEncoderStream(bool drop_data)
      : drop_data_{drop_data}, bytes_written_{0}, sink_{nullptr} {}

  SssEncoderStream::SssEncoderStream(common::ByteSink &sink)
      : drop_data_{false}, bytes_written_{0}, sink_{&sink} {}

  ByteArray SssEncoderStream::data() const {
    return stream_;
  }

  size_t SssEncoderStream::size() const {
    return bytes_written_;
  }

  SssEncoderStream &SssEncoderStream::putByte(uint8_t v) {
    ++bytes_written_;
    if (not drop_data_) {
      stream_.push_back(v);
      if (sink_ != nullptr and stream_.size() >= kSinkChunkSize) {
        flush();
      }
    }
    return *this;
  }

  SssEncoderStream &SssEncoderStream::putBytes(std::span<const uint8_t> v) {
    bytes_written_ += v.size();
    if (drop_data_) {
      return *this;
    }
    if (sink_ != nullptr and stream_.size() + v.size() >= kSinkChunkSize) {
      flush();
      sink_->put(v);
      return *this;
    }
    stream_.insert(stream_.end(), v.begin(), v.end());
    return *this;
  }

  void SssEncoderStream::flush() {
    if (sink_ == nullptr or stream_.empty()) {
      return;
    }
    sink_->put(stream_);
    stream_.clear();
  }

  SssEncoderStream &SssEncoderStream::encode(const TypeDescriptor &type,
                                             const Value &value) {
    using T = TypeDescriptor;
    visit_in_place(
        type.variant(),
        [&](const T::Bit &) {
          auto bit = expectKind<bool>(type, value, "bit");
          putByte(bit ? 0x01 : 0x00);
        },
        [&](const T::Uint &u) {
          encodeInteger(type, value, u.bit_size, false);
        },
        [&](const T::Scalar &s) {
          encodeInteger(type, value, s.bit_size, true);
        },
        [&](const T::Bytes &b) { encodeBytes(type, b, value); },
        [&](const T::Tuple &t) {
          const auto &list = expectKind<ValueList>(type, value, "list");
          checkArity(type, t.length, list.size());
          encodeElements(t.element, list);
        },
        [&](const T::Array &a) {
          const auto &list = expectKind<ValueList>(type, value, "list");
          encodeLength(list.size(), type);
          encodeElements(a.element, list);
        },
        [&](const T::Container &c) {
          const auto &list = expectKind<ValueList>(type, value, "list");
          checkArity(type, c.fields.size(), list.size());
          for (size_t i = 0; i < list.size(); ++i) {
            encode(c.fields[i], list[i]);
          }
        },
        [&](const T::Optional &o) {
          expectKind<OptionalValue>(type, value, "optional");
          if (value.isNone()) {
            putByte(kAbsent);
            return;
          }
          putByte(kPresent);
          encode(o.inner, *value.optionalInner());
        });
    return *this;
  }

  void SssEncoderStream::encodeInteger(const TypeDescriptor &type,
                                       const Value &value,
                                       size_t bit_size,
                                       bool as_scalar) {
    const auto &integer = expectKind<Integer>(type, value, "integer");
    if (auto res = validator::validateEncodable(integer, bit_size);
        res.has_error()) {
      common::raise(
          res.error(),
          fmt::format("{} can't hold {}", type.toString(), integer.str()));
    }

    ByteArray out;
    if (as_scalar) {
      scalar::encode(integer, out);
    } else {
      fixedwidth::encodeUint(integer, bit_size, out);
    }
    putBytes(out);
  }

  void SssEncoderStream::encodeBytes(const TypeDescriptor &type,
                                     const TypeDescriptor::Bytes &bytes,
                                     const Value &value) {
    const auto &data = expectKind<ByteArray>(type, value, "bytes");
    if (bytes.fixed_length) {
      checkArity(type, *bytes.fixed_length, data.size());
    } else {
      encodeLength(data.size(), type);
    }
    putBytes(data);
  }

  void SssEncoderStream::encodeLength(size_t length,
                                      const TypeDescriptor &type) {
    if (auto res = validator::validateEncodableLength(length);
        res.has_error()) {
      common::raise(res.error(),
                    fmt::format("{} length {} exceeds {}",
                                type.toString(),
                                length,
                                kMaxCollectionLength));
    }
    ByteArray out;
    scalar::encode(Integer{length}, out);
    putBytes(out);
  }

  void SssEncoderStream::encodeElements(const TypeDescriptor &element,
                                        const ValueList &list) {
    for (const auto &item : list) {
      encode(element, item);
    }
  }

}  // namespace sss::codec
