#include "Shelter/Core/Module.hpp"

using namespace shelter::utils::types;

namespace shelter::core {
  auto Module::toString() const -> String {
    String output;

    // Adjacent segments sharing a style are painted as one run so the escape
    // sequence is emitted once per run rather than once per segment.
    for (usize start = 0; start < segments.size();) {
      const Option<Style>& style = segments[start].style;

      String run;
      usize  end = start;

      for (; end < segments.size() && segments[end].style == style; ++end)
        run += segments[end].text;

      output += style ? style->paint(run) : run;
      start = end;
    }

    return output;
  }

  auto Module::plainText() const -> String {
    String output;

    for (const Segment& segment : segments)
      output += segment.text;

    return output;
  }
} // namespace shelter::core
