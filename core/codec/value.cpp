/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/value.hpp"

#include "common/visitor.hpp"

namespace sss::codec {

  bool OptionalValue::operator==(const OptionalValue &other) const {
    if (inner == nullptr or other.inner == nullptr) {
      return inner == other.inner;
    }
    return *inner == *other.inner;
  }

  Value::Value() : variant_{OptionalValue{}} {}

  Value::Value(Variant variant) : variant_{std::move(variant)} {}

  Value Value::bit(bool v) {
    return Value{Variant{v}};
  }

  Value Value::integer(Integer v) {
    return Value{Variant{std::move(v)}};
  }

  Value Value::bytes(ByteArray v) {
    return Value{Variant{std::move(v)}};
  }

  Value Value::list(ValueList v) {
    return Value{Variant{std::move(v)}};
  }

  Value Value::none() {
    return Value{Variant{OptionalValue{}}};
  }

  Value Value::some(Value inner) {
    return Value{
        Variant{OptionalValue{std::make_shared<const Value>(std::move(inner))}}};
  }

  const Value *Value::optionalInner() const {
    const auto *opt = get<OptionalValue>();
    return opt == nullptr ? nullptr : opt->inner.get();
  }

  bool Value::isNone() const {
    const auto *opt = get<OptionalValue>();
    return opt != nullptr and opt->inner == nullptr;
  }

  std::string_view Value::kindName() const {
    return visit_in_place(
        variant_,
        [](bool) -> std::string_view { return "bit"; },
        [](const Integer &) -> std::string_view { return "integer"; },
        [](const ByteArray &) -> std::string_view { return "bytes"; },
        [](const ValueList &) -> std::string_view { return "list"; },
        [](const OptionalValue &o) -> std::string_view {
          return o.inner ? "some" : "none";
        });
  }

}  // namespace sss::codec
