/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "codec/types.hpp"

namespace sss::codec {

  class Value;

  /// elements of a tuple, an array or a container, in order
  using ValueList = std::vector<Value>;

  /// slot of an optional value, empty when absent
  struct OptionalValue {
    std::shared_ptr<const Value> inner;

    bool operator==(const OptionalValue &other) const;
  };

  /**
   * @class Value is a runtime value carried through the codec. It has no
   * type tag of its own and is interpreted against a TypeDescriptor:
   * bool for bit, Integer for uint<N> and scalar<N>, ByteArray for bytes,
   * ValueList for tuple, array and container, OptionalValue for optional
   */
  class Value {
   public:
    using Variant =
        std::variant<bool, Integer, ByteArray, ValueList, OptionalValue>;

    Value();

    // NOLINTNEXTLINE(google-explicit-constructor)
    Value(Variant variant);

    static Value bit(bool v);
    static Value integer(Integer v);
    static Value bytes(ByteArray v);
    static Value list(ValueList v);
    static Value none();
    static Value some(Value inner);

    const Variant &variant() const {
      return variant_;
    }

    template <typename T>
    const T *get() const {
      return std::get_if<T>(&variant_);
    }

    /**
     * @return inner value of a present optional, nullptr if the optional is
     * absent or this is not an optional
     */
    const Value *optionalInner() const;

    bool isNone() const;

    /**
     * @return name of the held alternative, for error messages
     */
    std::string_view kindName() const;

    bool operator==(const Value &other) const = default;

   private:
    Variant variant_;
  };

}  // namespace sss::codec
