/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/type_parser.hpp"

#include <charconv>
#include <optional>
#include <vector>

#include "codec/validator.hpp"
#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sss::codec, ParseError, e) {
  using sss::codec::ParseError;
  switch (e) {
    case ParseError::UNEXPECTED_END:
      return "Type string ended unexpectedly";
    case ParseError::UNEXPECTED_CHARACTER:
      return "Unexpected character in type string";
    case ParseError::UNKNOWN_TYPE:
      return "Unknown type name";
    case ParseError::INVALID_NUMBER:
      return "Invalid number in type string";
    case ParseError::INVALID_BIT_SIZE:
      return "Bit size must be a multiple of 8 within [8, 2048]";
    case ParseError::TRAILING_CHARACTERS:
      return "Unexpected characters after the type";
  }
  return "Unknown ParseError";
}

namespace sss::codec {
  namespace {
    bool isDigit(char c) {
      return c >= '0' and c <= '9';
    }

    bool isLower(char c) {
      return c >= 'a' and c <= 'z';
    }

    /**
     * Recursive descent over a type string, one character of lookahead
     */
    class TypeParser {
     public:
      static constexpr char kEof = '\0';

      explicit TypeParser(std::string_view input) : input_{input} {}

      outcome::result<TypeDescriptor> parseType() {
        OUTCOME_TRY(base, parseBase());
        TypeDescriptor result = std::move(base);

        while (true) {
          if (peek() == '[') {
            OUTCOME_TRY(dims, parseDimensions());
            // the leftmost dimension is the outermost collection
            for (auto it = dims.rbegin(); it != dims.rend(); ++it) {
              result = it->has_value() ? TypeDescriptor::tuple(result, **it)
                                       : TypeDescriptor::array(result);
            }
          } else if (peek() == '?') {
            bump();
            result = TypeDescriptor::optional(result);
          } else {
            return result;
          }
        }
      }

      bool isEof() const {
        return pos_ >= input_.size();
      }

      size_t pos() const {
        return pos_;
      }

     private:
      char peek() const {
        return isEof() ? kEof : input_[pos_];
      }

      void bump() {
        if (not isEof()) {
          ++pos_;
        }
      }

      template <typename Predicate>
      std::string_view eatWhile(Predicate predicate) {
        auto begin = pos_;
        while (not isEof() and predicate(peek())) {
          bump();
        }
        return input_.substr(begin, pos_ - begin);
      }

      ParseError unexpected() const {
        return isEof() ? ParseError::UNEXPECTED_END
                       : ParseError::UNEXPECTED_CHARACTER;
      }

      outcome::result<size_t> parseNumber(std::string_view digits) const {
        if (digits.empty()) {
          return unexpected();
        }
        if (digits.size() > 1 and digits.front() == '0') {
          return ParseError::INVALID_NUMBER;
        }
        size_t number = 0;
        auto [ptr, ec] = std::from_chars(
            digits.data(), digits.data() + digits.size(), number);
        if (ec != std::errc{} or ptr != digits.data() + digits.size()) {
          return ParseError::INVALID_NUMBER;
        }
        return number;
      }

      /// run of "[N]" and "[]" suffixes, nullopt stands for "[]"
      outcome::result<std::vector<std::optional<size_t>>> parseDimensions() {
        std::vector<std::optional<size_t>> dims;
        while (peek() == '[') {
          bump();
          if (peek() == ']') {
            bump();
            dims.emplace_back(std::nullopt);
            continue;
          }
          OUTCOME_TRY(length, parseNumber(eatWhile(isDigit)));
          if (peek() != ']') {
            return unexpected();
          }
          bump();
          dims.emplace_back(length);
        }
        return dims;
      }

      outcome::result<TypeDescriptor> parseContainer() {
        bump();  // '{'
        std::vector<TypeDescriptor> fields;
        if (peek() == '}') {
          bump();
          return TypeDescriptor::container(std::move(fields));
        }
        while (true) {
          OUTCOME_TRY(field, parseType());
          fields.push_back(std::move(field));
          if (peek() == ',') {
            bump();
          } else if (peek() == '}') {
            bump();
            return TypeDescriptor::container(std::move(fields));
          } else {
            return unexpected();
          }
        }
      }

      outcome::result<TypeDescriptor> parseSized(bool as_scalar,
                                                 std::string_view digits) {
        if (digits.empty()) {
          return ParseError::UNKNOWN_TYPE;
        }
        OUTCOME_TRY(bit_size, parseNumber(digits));
        if (not validator::isValidBitSize(bit_size)) {
          return ParseError::INVALID_BIT_SIZE;
        }
        return as_scalar ? TypeDescriptor::scalar(bit_size)
                         : TypeDescriptor::uint(bit_size);
      }

      outcome::result<TypeDescriptor> parseBase() {
        if (peek() == '{') {
          return parseContainer();
        }
        if (not isLower(peek())) {
          return unexpected();
        }

        auto name = eatWhile(isLower);
        auto digits = eatWhile(isDigit);

        if (name == "uint") {
          return parseSized(false, digits);
        }
        if (name == "scalar") {
          return parseSized(true, digits);
        }
        if (name == "bytes") {
          if (digits.empty()) {
            return TypeDescriptor::bytes();
          }
          OUTCOME_TRY(length, parseNumber(digits));
          return TypeDescriptor::fixedBytes(length);
        }
        if (not digits.empty()) {
          return ParseError::UNKNOWN_TYPE;
        }
        if (name == "bit" or name == "bool") {
          return TypeDescriptor::bit();
        }
        if (name == "byte") {
          return TypeDescriptor::uint(8);
        }
        return ParseError::UNKNOWN_TYPE;
      }

      std::string_view input_;
      size_t pos_ = 0;
    };
  }  // namespace

  outcome::result<TypeDescriptor> parseType(std::string_view type_string) {
    static auto logger = log::createLogger("TypeParser", "parser");

    TypeParser parser{type_string};
    auto res = parser.parseType();
    if (res.has_value() and not parser.isEof()) {
      res = ParseError::TRAILING_CHARACTERS;
    }
    if (res.has_error()) {
      SL_DEBUG(logger,
               "Can't parse type '{}' at position {}: {}",
               type_string,
               parser.pos(),
               res.error().message());
      return res;
    }
    SL_TRACE(logger, "Parsed type '{}'", type_string);
    return res;
  }

}  // namespace sss::codec
