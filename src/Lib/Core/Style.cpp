#include "Shelter/Core/Style.hpp"

#include <algorithm>                 // std::ranges::{transform, remove}
#include <cctype>                    // std::{tolower, isxdigit, isspace}
#include <charconv>                  // std::from_chars
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_cast
#include <matchit.hpp>               // matchit::{match, is, _}

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

using enum shelter::utils::error::ShelterErrorCode;
using namespace shelter::utils::types;

namespace {
  using shelter::core::Color;
  using shelter::core::NamedColor;
  using shelter::core::RgbColor;

  template <std::integral T>
  constexpr auto TryParse(StringView sview, const i32 base = 10) -> Option<T> {
    T value;

    auto [ptr, ec] = std::from_chars(sview.data(), sview.data() + sview.size(), value, base);

    if (ec == std::errc() && ptr == sview.data() + sview.size())
      return value;

    return None;
  }

  auto IsSpace(const char chr) -> bool {
    return std::isspace(static_cast<unsigned char>(chr)) != 0;
  }

  auto ToLower(StringView text) -> String {
    String lower(text);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char chr) -> char { return static_cast<char>(std::tolower(chr)); });
    return lower;
  }

  auto ParseHexColor(const StringView hex) -> Option<RgbColor> {
    if (hex.size() != 6 || !std::ranges::all_of(hex, [](const unsigned char chr) { return std::isxdigit(chr) != 0; }))
      return None;

    const Option<u8> red   = TryParse<u8>(hex.substr(0, 2), 16);
    const Option<u8> green = TryParse<u8>(hex.substr(2, 2), 16);
    const Option<u8> blue  = TryParse<u8>(hex.substr(4, 2), 16);

    if (!red || !green || !blue)
      return None;

    return RgbColor { .red = *red, .green = *green, .blue = *blue };
  }

  // SGR parameter for a color; background codes are the foreground ones shifted by 10.
  auto ColorCode(const Color& color, const bool background) -> String {
    const u32 shift = background ? 10 : 0;

    if (const auto* named = std::get_if<NamedColor>(&color)) {
      const auto index = static_cast<u32>(*named);
      return std::to_string((index < 8 ? 30 + index : 90 + (index - 8)) + shift);
    }

    if (const auto* fixed = std::get_if<u8>(&color))
      return std::format("{};5;{}", 38 + shift, *fixed);

    const auto& rgb = std::get<RgbColor>(color);
    return std::format("{};2;{};{};{}", 38 + shift, rgb.red, rgb.green, rgb.blue);
  }
} // namespace

namespace shelter::core {
  auto ParseColor(const StringView word) -> Result<Color> {
    if (word.empty())
      ERR(ParseError, "Empty color");

    if (word.front() == '#') {
      if (const Option<RgbColor> rgb = ParseHexColor(word.substr(1)))
        return *rgb;

      ERR_FMT(ParseError, "Invalid hex color '{}'", word);
    }

    if (const Option<u8> fixed = TryParse<u8>(word))
      return *fixed;

    String normalized = ToLower(word);
    std::erase_if(normalized, [](const char chr) { return chr == '-' || chr == '_'; });

    // nu-ansi-term style alias
    if (normalized.ends_with("magenta"))
      normalized.replace(normalized.size() - 7, 7, "purple");

    if (const auto named = magic_enum::enum_cast<NamedColor>(normalized, magic_enum::case_insensitive))
      return *named;

    ERR_FMT(ParseError, "Unknown color '{}'", word);
  }

  auto Style::Parse(const StringView styleString) -> Result<Style> {
    Style style;
    usize pos = 0;

    while (pos < styleString.size()) {
      if (IsSpace(styleString[pos])) {
        ++pos;
        continue;
      }

      usize end = pos;
      while (end < styleString.size() && !IsSpace(styleString[end]))
        ++end;

      TRY_VOID(style.apply(styleString.substr(pos, end - pos)));
      pos = end;
    }

    return style;
  }

  auto Style::apply(const StringView word) -> Result<> {
    using matchit::match, matchit::is, matchit::_;

    const String lower = ToLower(word);

    if (lower == "none") {
      *this = Style {};
      return {};
    }

    if (lower.starts_with("fg:")) {
      foreground = TRY(ParseColor(lower.substr(3)));
      return {};
    }

    if (lower.starts_with("bg:")) {
      background = TRY(ParseColor(lower.substr(3)));
      return {};
    }

    bool* attribute = match(StringView(lower))(
      is | "bold"          = &bold,
      is | "dimmed"        = &dimmed,
      is | "italic"        = &italic,
      is | "underline"     = &underline,
      is | "blink"         = &blink,
      is | "inverted"      = &inverted,
      is | "hidden"        = &hidden,
      is | "strikethrough" = &strikethrough,
      is | _               = static_cast<bool*>(nullptr)
    );

    if (attribute) {
      *attribute = true;
      return {};
    }

    // A bare color word sets the foreground.
    Result<Color> color = ParseColor(lower);

    if (!color)
      ERR_FMT(ParseError, "Invalid style word '{}'", word);

    foreground = *color;
    return {};
  }

  auto Style::mergedWith(const Style& over) const -> Style {
    Style merged = *this;

    if (over.foreground)
      merged.foreground = over.foreground;
    if (over.background)
      merged.background = over.background;

    merged.bold          = bold || over.bold;
    merged.dimmed        = dimmed || over.dimmed;
    merged.italic        = italic || over.italic;
    merged.underline     = underline || over.underline;
    merged.blink         = blink || over.blink;
    merged.inverted      = inverted || over.inverted;
    merged.hidden        = hidden || over.hidden;
    merged.strikethrough = strikethrough || over.strikethrough;

    return merged;
  }

  auto Style::isPlain() const -> bool {
    return *this == Style {};
  }

  auto Style::prefix() const -> String {
    if (isPlain())
      return {};

    Vec<String> codes;

    if (bold)
      codes.emplace_back("1");
    if (dimmed)
      codes.emplace_back("2");
    if (italic)
      codes.emplace_back("3");
    if (underline)
      codes.emplace_back("4");
    if (blink)
      codes.emplace_back("5");
    if (inverted)
      codes.emplace_back("7");
    if (hidden)
      codes.emplace_back("8");
    if (strikethrough)
      codes.emplace_back("9");
    if (foreground)
      codes.push_back(ColorCode(*foreground, false));
    if (background)
      codes.push_back(ColorCode(*background, true));

    String sequence = "\033[";

    for (usize i = 0; i < codes.size(); ++i) {
      if (i > 0)
        sequence += ';';
      sequence += codes[i];
    }

    sequence += 'm';
    return sequence;
  }

  auto Style::paint(const StringView text) const -> String {
    if (isPlain() || text.empty())
      return String(text);

    return std::format("{}{}\033[0m", prefix(), text);
  }
} // namespace shelter::core
