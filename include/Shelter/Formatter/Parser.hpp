/**
 * @file Parser.hpp
 * @brief Token model and parser for Shelter format strings.
 *
 * Grammar:
 *   format      := item*
 *   item        := escape | variable | style-group | conditional | literal
 *   escape      := '\' any-char
 *   variable    := '$' name | '${' name '}'
 *   style-group := '[' format ']' '(' style-string ')'
 *   conditional := '(' format ')'
 *   name        := [A-Za-z0-9_]+
 *
 * A style string is a whitespace-separated list of style words ("red",
 * "bold", "fg:#ffffff") and style variables ("$style").
 */

#pragma once

#include <variant> // std::variant

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::formatter {
  namespace types = ::shelter::utils::types;

  struct Token;

  /**
   * @brief Text copied verbatim into the output.
   */
  struct LiteralToken {
    types::String text;

    auto operator==(const LiteralToken&) const -> bool = default;
  };

  /**
   * @brief A `$name` reference resolved through the variable resolver.
   */
  struct VariableToken {
    types::String name;

    auto operator==(const VariableToken&) const -> bool = default;
  };

  /**
   * @brief A `$name` reference claimed by the meta resolver; renders as a plain string.
   */
  struct MetaVariableToken {
    types::String name;

    auto operator==(const MetaVariableToken&) const -> bool = default;
  };

  /**
   * @brief One word of a style string: either a literal style word or a style variable.
   */
  struct StyleWord {
    types::String text;
    bool          isVariable = false;

    auto operator==(const StyleWord&) const -> bool = default;
  };

  /**
   * @brief `[children](style)`: every child segment without its own style inherits this one.
   */
  struct StyleGroupToken {
    types::Vec<Token>     children;
    types::Vec<StyleWord> style;

    auto operator==(const StyleGroupToken&) const -> bool;
  };

  /**
   * @brief `(children)`: rendered only when a variable inside it produces non-empty text.
   */
  struct ConditionalToken {
    types::Vec<Token> children;

    auto operator==(const ConditionalToken&) const -> bool;
  };

  struct Token {
    std::variant<LiteralToken, VariableToken, MetaVariableToken, StyleGroupToken, ConditionalToken> node;

    auto operator==(const Token&) const -> bool = default;
  };

  inline auto StyleGroupToken::operator==(const StyleGroupToken& other) const -> bool {
    return children == other.children && style == other.style;
  }

  inline auto ConditionalToken::operator==(const ConditionalToken& other) const -> bool {
    return children == other.children;
  }

  /**
   * @brief Parses a format string into a token tree.
   * @param format The format string.
   * @return The tokens, or a ParseError describing the first syntax problem and its offset.
   */
  auto ParseFormat(types::StringView format) -> types::Result<types::Vec<Token>>;

  /**
   * @brief Splits a style string into style words and `$variables`.
   */
  auto ParseStyleString(types::StringView styleString) -> types::Result<types::Vec<StyleWord>>;
} // namespace shelter::formatter
