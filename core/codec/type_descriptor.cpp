/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/type_descriptor.hpp"

#include <limits>

#include <fmt/format.h>

#include "common/outcome_throw.hpp"
#include "common/visitor.hpp"
#include "codec/validator.hpp"

namespace sss::codec {
  namespace {
    constexpr size_t kSizeMax = std::numeric_limits<size_t>::max();

    size_t saturatingMul(size_t a, size_t b) {
      if (a != 0 and b > kSizeMax / a) {
        return kSizeMax;
      }
      return a * b;
    }

    size_t saturatingAdd(size_t a, size_t b) {
      return b > kSizeMax - a ? kSizeMax : a + b;
    }

    void checkBitSize(size_t bit_size) {
      if (auto res = validator::validateBitSize(bit_size); res.has_error()) {
        common::raise(res.error(),
                      fmt::format("bit size {} is not a multiple of 8 "
                                  "within [{}, {}]",
                                  bit_size,
                                  kMinBitSize,
                                  kMaxBitSize));
      }
    }
  }  // namespace

  TypeDescriptor::TypeDescriptor(Variant variant)
      : node_{std::make_shared<const Node>(Node{std::move(variant)})} {}

  TypeDescriptor TypeDescriptor::bit() {
    return TypeDescriptor{Bit{}};
  }

  TypeDescriptor TypeDescriptor::uint(size_t bit_size) {
    checkBitSize(bit_size);
    return TypeDescriptor{Uint{bit_size}};
  }

  TypeDescriptor TypeDescriptor::scalar(size_t bit_size) {
    checkBitSize(bit_size);
    return TypeDescriptor{Scalar{bit_size}};
  }

  TypeDescriptor TypeDescriptor::bytes() {
    return TypeDescriptor{Bytes{std::nullopt}};
  }

  TypeDescriptor TypeDescriptor::fixedBytes(size_t length) {
    return TypeDescriptor{Bytes{length}};
  }

  TypeDescriptor TypeDescriptor::tuple(TypeDescriptor element, size_t length) {
    return TypeDescriptor{Tuple{std::move(element), length}};
  }

  TypeDescriptor TypeDescriptor::array(TypeDescriptor element) {
    return TypeDescriptor{Array{std::move(element)}};
  }

  TypeDescriptor TypeDescriptor::container(std::vector<TypeDescriptor> fields) {
    return TypeDescriptor{Container{std::move(fields)}};
  }

  TypeDescriptor TypeDescriptor::optional(TypeDescriptor inner) {
    return TypeDescriptor{Optional{std::move(inner)}};
  }

  bool TypeDescriptor::operator==(const TypeDescriptor &other) const {
    if (node_ == other.node_) {
      return true;
    }
    return variant() == other.variant();
  }

  std::string TypeDescriptor::toString() const {
    // a run of array suffixes is printed outermost first, after the
    // innermost element type
    std::string dims;
    const TypeDescriptor *base = this;
    while (true) {
      if (const auto *t = base->get<Tuple>()) {
        dims += fmt::format("[{}]", t->length);
        base = &t->element;
      } else if (const auto *a = base->get<Array>()) {
        dims += "[]";
        base = &a->element;
      } else {
        break;
      }
    }

    auto head = visit_in_place(
        base->variant(),
        [](const Bit &) -> std::string { return "bit"; },
        [](const Uint &u) -> std::string {
          return fmt::format("uint{}", u.bit_size);
        },
        [](const Scalar &s) -> std::string {
          return fmt::format("scalar{}", s.bit_size);
        },
        [](const Bytes &b) -> std::string {
          return b.fixed_length ? fmt::format("bytes{}", *b.fixed_length)
                                : std::string{"bytes"};
        },
        [](const Container &c) -> std::string {
          std::string res = "{";
          for (size_t i = 0; i < c.fields.size(); ++i) {
            if (i != 0) {
              res += ',';
            }
            res += c.fields[i].toString();
          }
          return res + "}";
        },
        [](const Optional &o) -> std::string {
          return o.inner.toString() + "?";
        },
        [](const auto &) -> std::string { return {}; });
    return head + dims;
  }

  size_t TypeDescriptor::minEncodedSize() const {
    return visit_in_place(
        variant(),
        [](const Bit &) -> size_t { return 1; },
        [](const Uint &u) -> size_t { return u.bit_size / 8; },
        [](const Scalar &) -> size_t { return 1; },
        [](const Bytes &b) -> size_t {
          // dynamic bytes carry at least the one-byte length prefix
          return b.fixed_length.value_or(1);
        },
        [](const Tuple &t) -> size_t {
          return saturatingMul(t.length, t.element.minEncodedSize());
        },
        [](const Array &) -> size_t { return 1; },
        [](const Container &c) -> size_t {
          size_t total = 0;
          for (const auto &field : c.fields) {
            total = saturatingAdd(total, field.minEncodedSize());
          }
          return total;
        },
        [](const Optional &) -> size_t { return 1; });
  }

  std::optional<size_t> TypeDescriptor::fixedEncodedSize() const {
    return visit_in_place(
        variant(),
        [](const Bit &) -> std::optional<size_t> { return 1; },
        [](const Uint &u) -> std::optional<size_t> { return u.bit_size / 8; },
        [](const Scalar &) -> std::optional<size_t> { return std::nullopt; },
        [](const Bytes &b) -> std::optional<size_t> { return b.fixed_length; },
        [](const Tuple &t) -> std::optional<size_t> {
          auto element = t.element.fixedEncodedSize();
          if (not element) {
            // an empty tuple is fixed whatever its element is
            return t.length == 0 ? std::optional<size_t>{0} : std::nullopt;
          }
          return saturatingMul(t.length, *element);
        },
        [](const Array &) -> std::optional<size_t> { return std::nullopt; },
        [](const Container &c) -> std::optional<size_t> {
          size_t total = 0;
          for (const auto &field : c.fields) {
            auto size = field.fixedEncodedSize();
            if (not size) {
              return std::nullopt;
            }
            total = saturatingAdd(total, *size);
          }
          return total;
        },
        [](const Optional &) -> std::optional<size_t> {
          return std::nullopt;
        });
  }

}  // namespace sss::codec
