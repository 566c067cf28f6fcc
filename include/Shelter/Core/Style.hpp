#pragma once

#include <variant> // std::variant

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::core {
  namespace types = ::shelter::utils::types;

  /**
   * @enum NamedColor
   * @brief The sixteen standard terminal colors.
   */
  enum class NamedColor : types::u8 {
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Purple,
    Cyan,
    White,
    BrightBlack,
    BrightRed,
    BrightGreen,
    BrightYellow,
    BrightBlue,
    BrightPurple,
    BrightCyan,
    BrightWhite,
  };

  struct RgbColor {
    types::u8 red;
    types::u8 green;
    types::u8 blue;

    auto operator==(const RgbColor&) const -> bool = default;
  };

  /**
   * @brief A terminal color: one of the named colors, a 256-color palette index, or 24-bit RGB.
   */
  using Color = std::variant<NamedColor, types::u8, RgbColor>;

  /**
   * @brief Parses a single color word ("red", "bright-blue", "208", "#ff8700").
   */
  auto ParseColor(types::StringView word) -> types::Result<Color>;

  /**
   * @struct Style
   * @brief Foreground/background colors plus text attributes for one run of output.
   */
  struct Style {
    types::Option<Color> foreground;
    types::Option<Color> background;

    bool bold          = false;
    bool dimmed        = false;
    bool italic        = false;
    bool underline     = false;
    bool blink         = false;
    bool inverted      = false;
    bool hidden        = false;
    bool strikethrough = false;

    /**
     * @brief Parses a whitespace-separated style string such as "red bold dimmed" or "fg:#ffffff bg:blue".
     * @param styleString The style string. "none" clears everything parsed so far.
     * @return The parsed style, or a ParseError naming the first unrecognized word.
     */
    static auto Parse(types::StringView styleString) -> types::Result<Style>;

    /**
     * @brief Applies one style word to this style.
     */
    auto apply(types::StringView word) -> types::Result<>;

    /**
     * @brief Returns a copy of this style with every attribute set in @p over layered on top.
     */
    [[nodiscard]] auto mergedWith(const Style& over) const -> Style;

    /**
     * @brief True when painting with this style emits no escape codes.
     */
    [[nodiscard]] auto isPlain() const -> bool;

    /**
     * @brief The SGR escape sequence that switches the terminal into this style.
     */
    [[nodiscard]] auto prefix() const -> types::String;

    /**
     * @brief Wraps @p text in this style's escape sequence and a reset.
     */
    [[nodiscard]] auto paint(types::StringView text) const -> types::String;

    auto operator==(const Style&) const -> bool = default;
  };
} // namespace shelter::core
