#include "Shelter/Formatter/Parser.hpp"

#include <algorithm> // std::ranges::all_of
#include <cctype>    // std::{isalnum, isspace}
#include <utility>   // std::exchange

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

using enum shelter::utils::error::ShelterErrorCode;
using namespace shelter::utils::types;

namespace {
  using namespace shelter::formatter;

  auto IsNameChar(const char chr) -> bool {
    return std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '_';
  }

  class FormatParser {
   public:
    explicit FormatParser(const StringView input)
      : m_input(input) {}

    // Parses items until `terminator`, or to the end of input when there is none.
    auto parseSequence(const Option<char> terminator) -> Result<Vec<Token>> {
      Vec<Token> tokens;
      String     literal;

      auto flushLiteral = [&]() {
        if (!literal.empty())
          tokens.push_back(Token { LiteralToken { std::exchange(literal, {}) } });
      };

      while (m_pos < m_input.size()) {
        const char chr = m_input[m_pos];

        if (chr == terminator) {
          flushLiteral();
          return tokens;
        }

        switch (chr) {
          case '\\': {
            if (m_pos + 1 >= m_input.size())
              ERR_FMT(ParseError, "Dangling escape at end of format string (offset {})", m_pos);

            literal += m_input[m_pos + 1];
            m_pos += 2;
            break;
          }
          case '$': {
            flushLiteral();
            tokens.push_back(Token { VariableToken { TRY(parseVariableName()) } });
            break;
          }
          case '[': {
            flushLiteral();
            tokens.push_back(Token { TRY(parseStyleGroup()) });
            break;
          }
          case '(': {
            flushLiteral();
            const usize start = m_pos++;

            Vec<Token> children = TRY(parseSequence(')'));

            if (m_pos >= m_input.size())
              ERR_FMT(ParseError, "Unclosed '(' at offset {}", start);

            ++m_pos;
            tokens.push_back(Token { ConditionalToken { std::move(children) } });
            break;
          }
          case ']':
          case ')':
            ERR_FMT(ParseError, "Unexpected '{}' at offset {}", chr, m_pos);
          default:
            literal += chr;
            ++m_pos;
        }
      }

      if (terminator)
        return tokens; // caller reports the unclosed group

      flushLiteral();
      return tokens;
    }

   private:
    StringView m_input;
    usize      m_pos = 0;

    // Positioned on '$'.
    auto parseVariableName() -> Result<String> {
      const usize start = m_pos++;

      if (m_pos < m_input.size() && m_input[m_pos] == '{') {
        const usize close = m_input.find('}', m_pos);

        if (close == StringView::npos)
          ERR_FMT(ParseError, "Unclosed '${{' at offset {}", start);

        const StringView name = m_input.substr(m_pos + 1, close - m_pos - 1);

        if (name.empty() || !std::ranges::all_of(name, IsNameChar))
          ERR_FMT(ParseError, "Invalid variable name '{}' at offset {}", name, start);

        m_pos = close + 1;
        return String(name);
      }

      const usize nameStart = m_pos;

      while (m_pos < m_input.size() && IsNameChar(m_input[m_pos]))
        ++m_pos;

      if (m_pos == nameStart)
        ERR_FMT(ParseError, "Expected a variable name after '$' at offset {}", start);

      return String(m_input.substr(nameStart, m_pos - nameStart));
    }

    // Positioned on '['.
    auto parseStyleGroup() -> Result<StyleGroupToken> {
      const usize start = m_pos++;

      Vec<Token> children = TRY(parseSequence(']'));

      if (m_pos >= m_input.size())
        ERR_FMT(ParseError, "Unclosed '[' at offset {}", start);

      ++m_pos; // ']'

      if (m_pos >= m_input.size() || m_input[m_pos] != '(')
        ERR_FMT(ParseError, "Expected '(style)' after text group at offset {}", m_pos);

      const usize close = m_input.find(')', m_pos);

      if (close == StringView::npos)
        ERR_FMT(ParseError, "Unclosed style string at offset {}", m_pos);

      Vec<StyleWord> style = TRY(ParseStyleString(m_input.substr(m_pos + 1, close - m_pos - 1)));

      m_pos = close + 1;
      return StyleGroupToken { .children = std::move(children), .style = std::move(style) };
    }
  };
} // namespace

namespace shelter::formatter {
  auto ParseFormat(const StringView format) -> Result<Vec<Token>> {
    FormatParser parser(format);
    return parser.parseSequence(None);
  }

  auto ParseStyleString(const StringView styleString) -> Result<Vec<StyleWord>> {
    Vec<StyleWord> words;

    usize pos = 0;

    while (pos < styleString.size()) {
      if (std::isspace(static_cast<unsigned char>(styleString[pos])) != 0) {
        ++pos;
        continue;
      }

      usize end = pos;
      while (end < styleString.size() && std::isspace(static_cast<unsigned char>(styleString[end])) == 0)
        ++end;

      StringView word = styleString.substr(pos, end - pos);
      pos             = end;

      if (!word.starts_with('$')) {
        words.push_back({ .text = String(word), .isVariable = false });
        continue;
      }

      word.remove_prefix(1);

      if (word.starts_with('{') && word.ends_with('}') && word.size() >= 2)
        word = word.substr(1, word.size() - 2);

      if (word.empty() || !std::ranges::all_of(word, IsNameChar))
        ERR_FMT(ParseError, "Invalid style variable '${}'", word);

      words.push_back({ .text = String(word), .isVariable = true });
    }

    return words;
  }
} // namespace shelter::formatter
