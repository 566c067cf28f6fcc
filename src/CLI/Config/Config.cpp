#include "Config.hpp"

#include <filesystem> // std::filesystem::{path, operator/, exists}
#include <glaze/toml.hpp>
#include <system_error> // std::error_code

#include <Shelter/Core/Style.hpp>
#include <Shelter/Modules/Container.hpp>
#include <Shelter/Utils/Env.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Logging.hpp>
#include <Shelter/Utils/Types.hpp>

using namespace shelter::utils::types;
using enum shelter::utils::error::ShelterErrorCode;
using shelter::utils::env::GetEnv;
using shelter::modules::ContainerConfig;

namespace fs = std::filesystem;

// Intermediate structs for TOML parsing with glaze. Fields start at the
// module defaults so that keys missing from the file keep their default value.
namespace {
  struct TomlContainer {
    bool   disabled         = false;
    String format           = String(ContainerConfig::DEFAULT_FORMAT);
    String symbol           = String(ContainerConfig::DEFAULT_SYMBOL);
    String style            = String(ContainerConfig::DEFAULT_STYLE);
    bool   useContainerName = false;
  };

  struct TomlConfig {
    TomlContainer container;
  };
} // namespace

// The 'value' members are used by glaze's compile-time reflection, not directly referenced
#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlContainer> {
  using T                     = TomlContainer;
  static constexpr auto value = object(
    "disabled",
    &T::disabled,
    "format",
    &T::format,
    "symbol",
    &T::symbol,
    "style",
    &T::style,
    "use_container_name",
    &T::useContainerName
  );
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("container", &T::container);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace shelter::config {
  auto Config::getConfigPath(const Option<fs::path>& override) -> fs::path {
    if (override)
      return *override;

    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("SHELTER_CONFIG"))
      possiblePaths.emplace_back(*result);

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "shelter.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "shelter.toml");

    possiblePaths.emplace_back(fs::path(".") / "shelter.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  auto Config::fromToml(const StringView toml) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer(toml);

    // Lenient parsing: other status-line modules may have tables of their own.
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer))
      ERR_FMT(ConfigurationError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    Config cfg;

    cfg.container.disabled         = tomlCfg.container.disabled;
    cfg.container.format           = std::move(tomlCfg.container.format);
    cfg.container.symbol           = std::move(tomlCfg.container.symbol);
    cfg.container.useContainerName = tomlCfg.container.useContainerName;

    if (Result<core::Style> style = core::Style::Parse(tomlCfg.container.style))
      cfg.container.style = *style;
    else
      warn_log("Invalid style '{}' in [container]: {}. Using the default style.", tomlCfg.container.style, style.error().message);

    return cfg;
  }

  auto Config::fromFile(const fs::path& path) -> Result<Config> {
    String buffer;

    if (const auto fileError = glz::file_to_buffer(buffer, path.string()); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file: {}", path.string());

    return fromToml(buffer).transform_error([&path](utils::error::ShelterError err) -> utils::error::ShelterError {
      err.message = std::format("{} ({})", err.message, path.string());
      return err;
    });
  }

  auto Config::getInstance(const Option<fs::path>& override) -> Config {
    const fs::path configPath = getConfigPath(override);

    if (std::error_code errc; !fs::exists(configPath, errc) || errc) {
      if (override)
        warn_log("Config file {} does not exist, using defaults.", configPath.string());
      else
        debug_log("No config file found at {}, using defaults.", configPath.string());

      return {};
    }

    Result<Config> cfg = fromFile(configPath);

    if (!cfg) {
      error_at(cfg.error());
      return {};
    }

    debug_log("Config loaded from {}", configPath.string());
    return std::move(*cfg);
  }
} // namespace shelter::config
