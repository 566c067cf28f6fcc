#pragma once

#include "Shelter/Core/Module.hpp"
#include "Shelter/Core/Style.hpp"
#include "Shelter/Formatter/Parser.hpp"
#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::formatter {
  namespace types = ::shelter::utils::types;

  /**
   * @brief Maps a variable name to its display text.
   *
   * Returns None for names the caller does not know, or a Result carrying
   * either the text or the error that prevented computing it.
   */
  using VariableResolver = types::Fn<types::Option<types::Result<types::String>>(types::StringView)>;

  /**
   * @brief Maps a meta-variable name to a plain string (e.g. a symbol), or None.
   */
  using MetaResolver = types::Fn<types::Option<types::String>(types::StringView)>;

  /**
   * @brief Maps a style-variable name to a style, or None.
   */
  using StyleResolver = types::Fn<types::Option<types::Result<core::Style>>(types::StringView)>;

  /**
   * @brief Format string compiled into tokens plus the resolvers bound to it.
   *
   * @example
   * @code
   * Result<Vec<Segment>> segments =
   *   StringFormatter::Create("[$symbol $name]($style)")
   *     .and_then([&](StringFormatter formatter) {
   *       return formatter
   *         .mapMeta([&](StringView var) -> Option<String> { ... })
   *         .mapStyle([&](StringView var) -> Option<Result<Style>> { ... })
   *         .map([&](StringView var) -> Option<Result<String>> { ... })
   *         .parse();
   *     });
   * @endcode
   */
  class StringFormatter {
   public:
    /**
     * @brief Parses @p format.
     * @return The formatter, or a ParseError for malformed format strings.
     */
    static auto Create(types::StringView format) -> types::Result<StringFormatter>;

    /**
     * @brief Binds meta variables.
     *
     * Every `$name` the resolver recognizes becomes a meta variable and is
     * rendered as the returned plain string. The resolver is invoked once per
     * distinct variable name.
     */
    auto mapMeta(const MetaResolver& resolver) -> StringFormatter&;

    /**
     * @brief Binds the resolver for regular `$name` variables. Invoked lazily at parse().
     */
    auto map(VariableResolver resolver) -> StringFormatter&;

    /**
     * @brief Binds the resolver for `$name` words inside style strings. Invoked lazily at parse().
     */
    auto mapStyle(StyleResolver resolver) -> StringFormatter&;

    /**
     * @brief Renders the tokens into segments.
     * @param defaultStyle Style applied to text outside any style group.
     * @return The segments, or the first UnknownVariable / UnknownStyle / resolver error encountered.
     */
    [[nodiscard]] auto parse(types::Option<core::Style> defaultStyle = types::None) const -> types::Result<types::Vec<core::Segment>>;

    [[nodiscard]] auto tokens() const -> const types::Vec<Token>& {
      return m_tokens;
    }

   private:
    explicit StringFormatter(types::Vec<Token> tokens)
      : m_tokens(std::move(tokens)) {}

    types::Vec<Token>                                 m_tokens;
    types::UnorderedMap<types::String, types::String> m_metaValues;
    VariableResolver                                  m_variables;
    StyleResolver                                     m_styles;
  };
} // namespace shelter::formatter
