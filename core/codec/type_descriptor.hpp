/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sss::codec {

  /**
   * @class TypeDescriptor is the out-of-band schema of a value: a closed sum
   * type of bit, uint<N>, scalar<N>, bytes, tuple, array, container and
   * optional nodes. Descriptors are immutable, so copies share the same node
   * and can be used from any number of threads at once.
   */
  class TypeDescriptor {
   public:
    struct Bit;
    struct Uint;
    struct Scalar;
    struct Bytes;
    struct Tuple;
    struct Array;
    struct Container;
    struct Optional;

    using Variant =
        std::variant<Bit, Uint, Scalar, Bytes, Tuple, Array, Container, Optional>;

    /// @name factories
    /// uint() and scalar() raise TypeError::INVALID_BIT_SIZE on illegal width
    /// @{
    static TypeDescriptor bit();
    static TypeDescriptor uint(size_t bit_size);
    static TypeDescriptor scalar(size_t bit_size);
    static TypeDescriptor bytes();
    static TypeDescriptor fixedBytes(size_t length);
    static TypeDescriptor tuple(TypeDescriptor element, size_t length);
    static TypeDescriptor array(TypeDescriptor element);
    static TypeDescriptor container(std::vector<TypeDescriptor> fields);
    static TypeDescriptor optional(TypeDescriptor inner);
    /// @}

    const Variant &variant() const;

    template <typename T>
    const T *get() const;

    template <typename T>
    bool is() const;

    /**
     * @return type string notation, e.g. "{uint8,scalar16[]}?"
     */
    std::string toString() const;

    /**
     * @return the least number of bytes a value of this type encodes to
     */
    size_t minEncodedSize() const;

    /**
     * @return encoded size shared by all values of this type, nullopt if the
     * size depends on the value
     */
    std::optional<size_t> fixedEncodedSize() const;

    bool operator==(const TypeDescriptor &other) const;

   private:
    struct Node;

    explicit TypeDescriptor(Variant variant);

    std::shared_ptr<const Node> node_;
  };

  struct TypeDescriptor::Bit {
    bool operator==(const Bit &) const = default;
  };

  /// fixed-width little-endian integer of bit_size bits
  struct TypeDescriptor::Uint {
    size_t bit_size;
    bool operator==(const Uint &) const = default;
  };

  /// LEB128 integer of at most bit_size bits
  struct TypeDescriptor::Scalar {
    size_t bit_size;
    bool operator==(const Scalar &) const = default;
  };

  /// byte string, fixed-length if fixed_length is set
  struct TypeDescriptor::Bytes {
    std::optional<size_t> fixed_length;
    bool operator==(const Bytes &) const = default;
  };

  struct TypeDescriptor::Tuple {
    TypeDescriptor element;
    size_t length;
    bool operator==(const Tuple &) const = default;
  };

  struct TypeDescriptor::Array {
    TypeDescriptor element;
    bool operator==(const Array &) const = default;
  };

  struct TypeDescriptor::Container {
    std::vector<TypeDescriptor> fields;
    bool operator==(const Container &) const = default;
  };

  struct TypeDescriptor::Optional {
    TypeDescriptor inner;
    bool operator==(const Optional &) const = default;
  };

  struct TypeDescriptor::Node {
    Variant variant;
  };

  inline const TypeDescriptor::Variant &TypeDescriptor::variant() const {
    return node_->variant;
  }

  template <typename T>
  const T *TypeDescriptor::get() const {
    return std::get_if<T>(&variant());
  }

  template <typename T>
  bool TypeDescriptor::is() const {
    return std::holds_alternative<T>(variant());
  }

}  // namespace sss::codec
