/**
 * @file Container.hpp
 * @brief The "container" status-line module.
 *
 * Detects whether the process runs inside a container-like sandbox by probing
 * well-known marker files, then renders the sandbox name through the
 * configured format string.
 */

#pragma once

#include "Shelter/Core/Context.hpp"
#include "Shelter/Core/Module.hpp"
#include "Shelter/Core/Style.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::modules {
  namespace types = ::shelter::utils::types;

  /**
   * @struct ContainerConfig
   * @brief User-facing settings for the container module.
   */
  struct ContainerConfig {
    static constexpr types::StringView DEFAULT_FORMAT = "[$symbol \\[$name\\]]($style) ";
    static constexpr types::StringView DEFAULT_SYMBOL = "⬢";
    static constexpr types::StringView DEFAULT_STYLE  = "red bold dimmed";

    bool          disabled = false;                         ///< Skip detection and never render.
    types::String format   = types::String(DEFAULT_FORMAT); ///< Variables: $symbol, $name; style variable: $style.
    types::String symbol   = types::String(DEFAULT_SYMBOL); ///< Text substituted for $symbol.
    core::Style   style    = DefaultStyle();                ///< Style substituted for $style.

    /// Show the container's own name instead of its image name (only affects /run/.containerenv).
    bool useContainerName = false;

    /**
     * @brief The style DEFAULT_STYLE describes: bold, dimmed red.
     */
    static auto DefaultStyle() -> core::Style {
      return core::Style { .foreground = core::NamedColor::Red, .bold = true, .dimmed = true };
    }
  };

  /**
   * @enum ProbeVerdict
   * @brief What a single probe concluded.
   */
  enum class ProbeVerdict : types::u8 {
    NoMatch,  ///< The marker is absent or unreadable; try the next probe.
    Match,    ///< The marker identifies a sandbox; stop and use the name.
    Suppress, ///< The marker exists but explicitly does not denote a container; try the next probe.
  };

  struct ProbeOutcome {
    ProbeVerdict  verdict = ProbeVerdict::NoMatch;
    types::String name;

    static auto Match(types::String name) -> ProbeOutcome {
      return { .verdict = ProbeVerdict::Match, .name = std::move(name) };
    }

    static auto NoMatch() -> ProbeOutcome {
      return { .verdict = ProbeVerdict::NoMatch, .name = {} };
    }

    static auto Suppress() -> ProbeOutcome {
      return { .verdict = ProbeVerdict::Suppress, .name = {} };
    }
  };

  /**
   * @brief A single filesystem test for one sandbox technology.
   */
  struct Probe {
    types::StringView name;
    auto (*run)(const core::Context& context, const ContainerConfig& config) -> ProbeOutcome;
  };

  /**
   * @brief The probes in priority order. The first probe that matches wins.
   *
   *   1. OpenVZ        /proc/vz present and /proc/bc absent
   *   2. OCI           /run/host/container-manager present
   *   3. containerenv  /run/.containerenv (podman, toolbox, distrobox); authoritative once read
   *   4. systemd       /run/systemd/container ("docker", "wsl" is suppressed, anything else)
   *   5. Docker        /.dockerenv present
   */
  auto GetProbeChain() -> types::Span<const Probe>;

  /**
   * @brief Extracts the display name from the contents of /run/.containerenv.
   * @param contents The file contents.
   * @param useContainerName Look for `name=` instead of `image=`.
   * @return The quoted value of the first matching line ("podman" when no line matches).
   *         In image mode only the part after the last '/' is kept.
   */
  auto ParseContainerEnv(types::StringView contents, bool useContainerName) -> types::String;

  /**
   * @brief Runs the probe chain.
   * @return The sandbox display name, or None outside any recognized sandbox.
   *         Always None, without probing, when @p config is disabled.
   */
  auto DetectContainer(const core::Context& context, const ContainerConfig& config) -> types::Option<types::String>;

  /**
   * @brief Detects the sandbox and renders it with the configured format.
   * @return The rendered module, or None when disabled, not in a sandbox, or the format string fails to render.
   */
  auto BuildContainerModule(const core::Context& context, const ContainerConfig& config) -> types::Option<core::Module>;
} // namespace shelter::modules
