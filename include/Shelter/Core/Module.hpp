#pragma once

#include "Shelter/Core/Style.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::core {
  namespace types = ::shelter::utils::types;

  /**
   * @struct Segment
   * @brief A contiguous run of output text sharing one style.
   */
  struct Segment {
    types::String        text;
    types::Option<Style> style = types::None; ///< Unset for unstyled text.

    auto operator==(const Segment&) const -> bool = default;
  };

  /**
   * @struct Module
   * @brief A named, fully rendered piece of the status line.
   */
  struct Module {
    types::String       name;
    types::Vec<Segment> segments;

    /**
     * @brief Concatenates the segments, painting each with its style.
     */
    [[nodiscard]] auto toString() const -> types::String;

    /**
     * @brief Concatenates the segment texts without any escape codes.
     */
    [[nodiscard]] auto plainText() const -> types::String;
  };
} // namespace shelter::core
