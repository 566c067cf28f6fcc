#include <boost/ut.hpp>

#include <Shelter/Core/Module.hpp>
#include <Shelter/Core/Style.hpp>
#include <Shelter/Formatter/Parser.hpp>
#include <Shelter/Formatter/StringFormatter.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Types.hpp>

using namespace boost::ut;
using namespace shelter::utils::types;
using namespace shelter::formatter;
using shelter::core::Segment;
using shelter::core::Style;
using shelter::utils::error::ShelterErrorCode;

namespace {
  auto Text(const Vec<Segment>& segments) -> String {
    String text;

    for (const Segment& segment : segments)
      text += segment.text;

    return text;
  }

  auto Render(const StringView format, const StringView name) -> Result<Vec<Segment>> {
    StringFormatter formatter = TRY(StringFormatter::Create(format));

    return formatter
      .mapMeta([](const StringView variable) -> Option<String> {
        if (variable == "symbol")
          return "⬢";
        return None;
      })
      .mapStyle([](const StringView variable) -> Option<Result<Style>> {
        if (variable == "style")
          return Style::Parse("red bold dimmed");
        return None;
      })
      .map([&](const StringView variable) -> Option<Result<String>> {
        if (variable == "name")
          return Result<String>(String(name));
        return None;
      })
      .parse();
  }
} // namespace

auto main() -> int {
  "ParseFormat literal only"_test = [] -> void {
    Result<Vec<Token>> tokens = ParseFormat("via container ");

    expect(tokens.has_value());
    expect(tokens->size() == 1_ul);
    expect(tokens->front() == Token { LiteralToken { "via container " } });
  };

  "ParseFormat variables and escapes"_test = [] -> void {
    Result<Vec<Token>> tokens = ParseFormat("\\[$name\\] ${symbol}x");

    expect(tokens.has_value());
    expect(*tokens == Vec<Token> {
      Token { LiteralToken { "[" } },
      Token { VariableToken { "name" } },
      Token { LiteralToken { "] " } },
      Token { VariableToken { "symbol" } },
      Token { LiteralToken { "x" } },
    });
  };

  "ParseFormat style group"_test = [] -> void {
    Result<Vec<Token>> tokens = ParseFormat("[$symbol](bold $style)");

    expect(tokens.has_value());
    expect(tokens->size() == 1_ul);

    const auto* group = std::get_if<StyleGroupToken>(&tokens->front().node);

    expect(group != nullptr);
    expect(group->children == Vec<Token> { Token { VariableToken { "symbol" } } });
    expect(group->style == Vec<StyleWord> {
      StyleWord { .text = "bold", .isVariable = false },
      StyleWord { .text = "style", .isVariable = true },
    });
  };

  "ParseFormat keeps text after a NUL byte"_test = [] -> void {
    const StringView withNul("a\0b$name", 8);

    Result<Vec<Token>> tokens = ParseFormat(withNul);

    expect(tokens.has_value());
    expect(*tokens == Vec<Token> {
      Token { LiteralToken { String("a\0b", 3) } },
      Token { VariableToken { "name" } },
    });
  };

  "ParseFormat rejects malformed formats"_test = [] -> void {
    for (const StringView bad : { "[$name", "[$name]", "$", "${name", "(open", "oops]", "trailing\\", "[x](bold" }) {
      Result<Vec<Token>> tokens = ParseFormat(bad);

      expect(!tokens.has_value());
      if (!tokens)
        expect(tokens.error().code == ShelterErrorCode::ParseError);
    }
  };

  "Literal-only template renders verbatim and unstyled"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("in a box", "podman");

    expect(segments.has_value());
    expect(segments->size() == 1_ul);
    expect(segments->front() == Segment { .text = "in a box", .style = None });
  };

  "Default container format"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("[$symbol \\[$name\\]]($style) ", "podman");

    expect(segments.has_value());
    expect(Text(*segments) == String("⬢ [podman] "));

    const Style expected = *Style::Parse("red bold dimmed");

    for (usize i = 0; i + 1 < segments->size(); ++i)
      expect((*segments)[i].style == Option<Style>(expected));

    expect(segments->back() == Segment { .text = " ", .style = None });
  };

  "mapMeta turns known variables into meta variables"_test = [] -> void {
    Result<StringFormatter> formatter = StringFormatter::Create("$symbol $name");

    expect(formatter.has_value());

    formatter->mapMeta([](const StringView variable) -> Option<String> {
      if (variable == "symbol")
        return "*";
      return None;
    });

    expect(formatter->tokens().front() == Token { MetaVariableToken { "symbol" } });
    expect(formatter->tokens().back() == Token { VariableToken { "name" } });
  };

  "Meta resolver is asked once per distinct name"_test = [] -> void {
    Result<StringFormatter> formatter = StringFormatter::Create("$symbol[$symbol](bold)");
    i32                     calls     = 0;

    expect(formatter.has_value());

    formatter->mapMeta([&calls](const StringView variable) -> Option<String> {
      ++calls;
      if (variable == "symbol")
        return "*";
      return None;
    });

    Result<Vec<Segment>> segments = formatter->parse();

    expect(calls == 1);
    expect(segments.has_value());
    expect(Text(*segments) == String("**"));
  };

  "Unknown variable is an error"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("$symbol $version", "podman");

    expect(!segments.has_value());
    expect(segments.error().code == ShelterErrorCode::UnknownVariable);
  };

  "Unknown style variable is an error"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("[$name]($colour)", "podman");

    expect(!segments.has_value());
    expect(segments.error().code == ShelterErrorCode::UnknownStyle);
  };

  "Invalid literal style word is an error"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("[$name](sparkly)", "podman");

    expect(!segments.has_value());
    expect(segments.error().code == ShelterErrorCode::ParseError);
  };

  "Resolver errors propagate"_test = [] -> void {
    Result<StringFormatter> formatter = StringFormatter::Create("$name");

    expect(formatter.has_value());

    Result<Vec<Segment>> segments =
      formatter
        ->map([](StringView) -> Option<Result<String>> {
          return Result<String>(Err(shelter::utils::error::ShelterError(ShelterErrorCode::IoError, "unreadable")));
        })
        .parse();

    expect(!segments.has_value());
    expect(segments.error().code == ShelterErrorCode::IoError);
  };

  "Conditional group hides when its variables are empty"_test = [] -> void {
    expect(Text(*Render("box( on $name)", "")) == String("box"));
    expect(Text(*Render("box( on $name)", "podman")) == String("box on podman"));
  };

  "Inner style group replaces the outer style"_test = [] -> void {
    Result<Vec<Segment>> segments = Render("[a[b](blue)](red)", "podman");

    expect(segments.has_value());
    expect(segments->size() == 2_ul);
    expect((*segments)[0].style == Option<Style>(*Style::Parse("red")));
    expect((*segments)[1].style == Option<Style>(*Style::Parse("blue")));
  };

  "Rendering twice gives the same result"_test = [] -> void {
    expect(*Render("[$symbol $name]($style)", "docker") == *Render("[$symbol $name]($style)", "docker"));
  };

  return 0;
}
