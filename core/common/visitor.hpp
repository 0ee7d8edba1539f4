/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>
#include <variant>

namespace sss {

  /**
   * Overload set made of lambdas, each alternative of a variant is handled by
   * the best matching one
   */
  template <typename... Lambdas>
  struct lambda_visitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  lambda_visitor(Lambdas...) -> lambda_visitor<Lambdas...>;

  template <typename... Lambdas>
  constexpr auto make_visitor(Lambdas &&...lambdas) {
    return lambda_visitor{std::forward<Lambdas>(lambdas)...};
  }

  /**
   * @brief visits variant with an overload set of lambdas
   * @code
   *   visit_in_place(descriptor.variant(),
   *                  [](const TypeDescriptor::Bit &) { ... },
   *                  [](const auto &) { ... });
   * @endcode
   */
  template <typename Variant, typename... Lambdas>
  constexpr decltype(auto) visit_in_place(Variant &&variant,
                                          Lambdas &&...lambdas) {
    return std::visit(make_visitor(std::forward<Lambdas>(lambdas)...),
                      std::forward<Variant>(variant));
  }

}  // namespace sss
