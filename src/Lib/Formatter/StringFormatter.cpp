#include "Shelter/Formatter/StringFormatter.hpp"

#include "Shelter/Core/Module.hpp"
#include "Shelter/Core/Style.hpp"
#include "Shelter/Formatter/Parser.hpp"
#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Logging.hpp"
#include "Shelter/Utils/Types.hpp"

using enum shelter::utils::error::ShelterErrorCode;
using namespace shelter::utils::types;
using shelter::core::Segment;
using shelter::core::Style;

namespace {
  using namespace shelter::formatter;

  auto ClaimMetaVariables(
    Vec<Token>&                           tokens,
    const MetaResolver&                   resolver,
    UnorderedMap<String, Option<String>>& seen
  ) -> Unit {
    for (Token& token : tokens) {
      if (auto* group = std::get_if<StyleGroupToken>(&token.node)) {
        ClaimMetaVariables(group->children, resolver, seen);
        continue;
      }

      if (auto* conditional = std::get_if<ConditionalToken>(&token.node)) {
        ClaimMetaVariables(conditional->children, resolver, seen);
        continue;
      }

      const auto* variable = std::get_if<VariableToken>(&token.node);

      if (!variable)
        continue;

      auto iter = seen.find(variable->name);

      if (iter == seen.end())
        iter = seen.emplace(variable->name, resolver(variable->name)).first;

      if (iter->second)
        token.node = MetaVariableToken { variable->name };
    }
  }

  class SegmentRenderer {
   public:
    SegmentRenderer(
      const UnorderedMap<String, String>& metaValues,
      const VariableResolver&             variables,
      const StyleResolver&                styles
    )
      : m_metaValues(metaValues), m_variables(variables), m_styles(styles) {}

    // Appends the segments for `tokens` to `out`. Returns whether any variable produced non-empty text.
    auto render(const Vec<Token>& tokens, const Option<Style>& style, Vec<Segment>& out) -> Result<bool> {
      bool anyVariable = false;

      for (const Token& token : tokens) {
        if (const auto* literal = std::get_if<LiteralToken>(&token.node)) {
          out.push_back({ .text = literal->text, .style = style });
        } else if (const auto* variable = std::get_if<VariableToken>(&token.node)) {
          const String text = TRY(resolveVariable(variable->name));

          if (!text.empty()) {
            anyVariable = true;
            out.push_back({ .text = text, .style = style });
          }
        } else if (const auto* meta = std::get_if<MetaVariableToken>(&token.node)) {
          const auto iter = m_metaValues.find(meta->name);

          if (iter == m_metaValues.end())
            ERR_FMT(InternalError, "Meta variable '${}' has no bound value", meta->name);

          if (!iter->second.empty()) {
            anyVariable = true;
            out.push_back({ .text = iter->second, .style = style });
          }
        } else if (const auto* group = std::get_if<StyleGroupToken>(&token.node)) {
          const Style groupStyle = TRY(resolveStyle(group->style));

          anyVariable |= TRY(render(group->children, groupStyle, out));
        } else if (const auto* conditional = std::get_if<ConditionalToken>(&token.node)) {
          Vec<Segment> inner;

          if (TRY(render(conditional->children, style, inner))) {
            anyVariable = true;
            out.insert(out.end(), std::make_move_iterator(inner.begin()), std::make_move_iterator(inner.end()));
          }
        }
      }

      return anyVariable;
    }

   private:
    const UnorderedMap<String, String>& m_metaValues;
    const VariableResolver&             m_variables;
    const StyleResolver&                m_styles;
    UnorderedMap<String, String>        m_cache;

    auto resolveVariable(const String& name) -> Result<String> {
      if (const auto iter = m_cache.find(name); iter != m_cache.end())
        return iter->second;

      Option<Result<String>> value = m_variables ? m_variables(name) : None;

      if (!value)
        ERR_FMT(UnknownVariable, "Unknown variable '${}'", name);

      String text = TRY(std::move(*value));

      m_cache.emplace(name, text);
      return text;
    }

    auto resolveStyle(const Vec<StyleWord>& words) -> Result<Style> {
      Style style;

      for (const StyleWord& word : words) {
        if (!word.isVariable) {
          TRY_VOID(style.apply(word.text));
          continue;
        }

        Option<Result<Style>> value = m_styles ? m_styles(word.text) : None;

        if (!value)
          ERR_FMT(UnknownStyle, "Unknown style variable '${}'", word.text);

        style = style.mergedWith(TRY(std::move(*value)));
      }

      return style;
    }
  };
} // namespace

namespace shelter::formatter {
  auto StringFormatter::Create(const StringView format) -> Result<StringFormatter> {
    return ParseFormat(format).transform([](Vec<Token> tokens) -> StringFormatter {
      return StringFormatter(std::move(tokens));
    });
  }

  auto StringFormatter::mapMeta(const MetaResolver& resolver) -> StringFormatter& {
    UnorderedMap<String, Option<String>> seen;

    ClaimMetaVariables(m_tokens, resolver, seen);

    for (auto& [name, value] : seen)
      if (value)
        m_metaValues.insert_or_assign(name, std::move(*value));

    return *this;
  }

  auto StringFormatter::map(VariableResolver resolver) -> StringFormatter& {
    m_variables = std::move(resolver);
    return *this;
  }

  auto StringFormatter::mapStyle(StyleResolver resolver) -> StringFormatter& {
    m_styles = std::move(resolver);
    return *this;
  }

  auto StringFormatter::parse(const Option<Style> defaultStyle) const -> Result<Vec<Segment>> {
    SegmentRenderer renderer(m_metaValues, m_variables, m_styles);
    Vec<Segment>    segments;

    TRY_VOID(renderer.render(m_tokens, defaultStyle, segments));

    trace_log("Rendered {} segment(s) from {} top-level token(s)", segments.size(), m_tokens.size());

    return segments;
  }
} // namespace shelter::formatter
