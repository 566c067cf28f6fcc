#include "Shelter/Modules/Container.hpp"

#include <matchit.hpp> // matchit::{match, is, _}
#include <ranges>      // std::views::split

#include "Shelter/Core/Context.hpp"
#include "Shelter/Core/Module.hpp"
#include "Shelter/Core/Style.hpp"
#include "Shelter/Formatter/StringFormatter.hpp"
#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Logging.hpp"
#include "Shelter/Utils/Types.hpp"

using namespace shelter::utils::types;
using shelter::core::Context;
using shelter::core::Module;
using shelter::core::Segment;
using shelter::core::Style;
using shelter::formatter::StringFormatter;

namespace {
  using shelter::modules::ContainerConfig;
  using shelter::modules::Probe;
  using shelter::modules::ProbeOutcome;

  auto TrimWhitespace(StringView text) -> StringView {
    constexpr StringView WHITESPACE = " \t\n\r\f\v";

    const usize first = text.find_first_not_of(WHITESPACE);

    if (first == StringView::npos)
      return {};

    const usize last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
  }

  auto ProbeOpenVz(const Context& context, const ContainerConfig& /*config*/) -> ProbeOutcome {
    if (context.exists("/proc/vz") && !context.exists("/proc/bc"))
      return ProbeOutcome::Match("OpenVZ");

    return ProbeOutcome::NoMatch();
  }

  auto ProbeOci(const Context& context, const ContainerConfig& /*config*/) -> ProbeOutcome {
    if (context.exists("/run/host/container-manager"))
      return ProbeOutcome::Match("OCI");

    return ProbeOutcome::NoMatch();
  }

  // podman, toolbox, distrobox and friends.
  auto ProbeContainerEnv(const Context& context, const ContainerConfig& config) -> ProbeOutcome {
    if (!context.exists("/run/.containerenv"))
      return ProbeOutcome::NoMatch();

    Result<String> contents = context.readText("/run/.containerenv");

    if (!contents) {
      debug_log("/run/.containerenv exists but could not be read: {}", contents.error().message);
      return ProbeOutcome::NoMatch();
    }

    return ProbeOutcome::Match(shelter::modules::ParseContainerEnv(*contents, config.useContainerName));
  }

  // systemd writes the container manager's name here. WSL with systemd writes "wsl",
  // which is not a container. Any other value, even an empty one, still marks a container.
  auto ProbeSystemd(const Context& context, const ContainerConfig& /*config*/) -> ProbeOutcome {
    using matchit::match, matchit::is, matchit::_;

    Result<String> contents = context.readText("/run/systemd/container");

    if (!contents)
      return ProbeOutcome::NoMatch();

    return match(TrimWhitespace(*contents))(
      is | "docker" = [] { return ProbeOutcome::Match("Docker"); },
      is | "wsl"    = [] { return ProbeOutcome::Suppress(); },
      is | _        = [] { return ProbeOutcome::Match("Systemd"); }
    );
  }

  auto ProbeDockerEnv(const Context& context, const ContainerConfig& /*config*/) -> ProbeOutcome {
    if (context.exists("/.dockerenv"))
      return ProbeOutcome::Match("Docker");

    return ProbeOutcome::NoMatch();
  }

  constexpr Array<Probe, 5> PROBE_CHAIN = {
    Probe { .name = "openvz", .run = &ProbeOpenVz },
    Probe { .name = "oci", .run = &ProbeOci },
    Probe { .name = "containerenv", .run = &ProbeContainerEnv },
    Probe { .name = "systemd", .run = &ProbeSystemd },
    Probe { .name = "dockerenv", .run = &ProbeDockerEnv },
  };
} // namespace

namespace shelter::modules {
  auto GetProbeChain() -> Span<const Probe> {
    return PROBE_CHAIN;
  }

  auto ParseContainerEnv(const StringView contents, const bool useContainerName) -> String {
    const StringView prefix = useContainerName ? "name=" : "image=";

    for (auto lineRange : contents | std::views::split('\n')) {
      StringView line(lineRange.begin(), lineRange.end());

      if (line.ends_with('\r'))
        line.remove_suffix(1);

      if (!line.starts_with(prefix))
        continue;

      StringView value = line.substr(prefix.size());

      while (value.starts_with('"'))
        value.remove_prefix(1);
      while (value.ends_with('"'))
        value.remove_suffix(1);

      // Image references carry a registry/repository path; keep only the last component.
      if (!useContainerName)
        if (const usize slash = value.rfind('/'); slash != StringView::npos)
          value = value.substr(slash + 1);

      return String(value);
    }

    return "podman";
  }

  auto DetectContainer(const Context& context, const ContainerConfig& config) -> Option<String> {
    if (config.disabled) {
      debug_log("Container module is disabled, skipping detection");
      return None;
    }

#ifdef __linux__
    for (const Probe& probe : GetProbeChain()) {
      ProbeOutcome outcome = probe.run(context, config);

      switch (outcome.verdict) {
        case ProbeVerdict::Match:
          debug_log("Probe '{}' matched: {}", probe.name, outcome.name);
          return std::move(outcome.name);
        case ProbeVerdict::Suppress:
          debug_log("Probe '{}' suppressed", probe.name);
          break;
        case ProbeVerdict::NoMatch:
          trace_log("Probe '{}' did not match", probe.name);
          break;
      }
    }

    return None;
#else
    (void)context;
    (void)config;
    return None;
#endif
  }

  auto BuildContainerModule(const Context& context, const ContainerConfig& config) -> Option<Module> {
    if (config.disabled)
      return None;

    const Option<String> containerName = DetectContainer(context, config);

    if (!containerName)
      return None;

    Result<Vec<Segment>> segments =
      StringFormatter::Create(config.format)
        .and_then([&](StringFormatter formatter) -> Result<Vec<Segment>> {
          return formatter
            .mapMeta([&](const StringView variable) -> Option<String> {
              if (variable == "symbol")
                return config.symbol;
              return None;
            })
            .mapStyle([&](const StringView variable) -> Option<Result<Style>> {
              if (variable == "style")
                return Result<Style>(config.style);
              return None;
            })
            .map([&](const StringView variable) -> Option<Result<String>> {
              if (variable == "name")
                return Result<String>(*containerName);
              return None;
            })
            .parse();
        });

    if (!segments) {
      warn_log("Error in module `container`: \n{}", segments.error().message);
      return None;
    }

    return Module { .name = "container", .segments = std::move(*segments) };
  }
} // namespace shelter::modules
