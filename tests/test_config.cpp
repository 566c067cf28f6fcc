#include <boost/ut.hpp>

#include <Shelter/Core/Style.hpp>
#include <Shelter/Modules/Container.hpp>
#include <Shelter/Utils/Env.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Logging.hpp>
#include <Shelter/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "TestRoot.hpp"

auto main() -> int {
  using namespace boost::ut;
  using namespace shelter::utils::types;
  using shelter::config::Config;
  using shelter::core::Style;
  using shelter::modules::ContainerConfig;
  using shelter::test::TestRoot;
  using shelter::utils::error::ShelterErrorCode;

  namespace fs  = std::filesystem;
  namespace env = shelter::utils::env;

  "Empty TOML yields defaults"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("");

    expect(cfg.has_value());
    expect(!cfg->container.disabled);
    expect(cfg->container.format == String(ContainerConfig::DEFAULT_FORMAT));
    expect(cfg->container.symbol == String(ContainerConfig::DEFAULT_SYMBOL));
    expect(cfg->container.style == ContainerConfig::DefaultStyle());
    expect(!cfg->container.useContainerName);
  };

  "Default style string matches the default style"_test = [] -> void {
    expect(*Style::Parse(ContainerConfig::DEFAULT_STYLE) == ContainerConfig::DefaultStyle());
  };

  "Container table overrides"_test = [] -> void {
    Result<Config> cfg = Config::fromToml(R"(
[container]
disabled = true
format = "[$name]($style)"
symbol = "box "
style = "blue italic"
use_container_name = true
)");

    expect(cfg.has_value());
    expect(cfg->container.disabled);
    expect(cfg->container.format == String("[$name]($style)"));
    expect(cfg->container.symbol == String("box "));
    expect(cfg->container.style == *Style::Parse("blue italic"));
    expect(cfg->container.useContainerName);
  };

  "Missing keys keep their defaults"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[container]\nsymbol = \"C\"\n");

    expect(cfg.has_value());
    expect(cfg->container.symbol == String("C"));
    expect(cfg->container.format == String(ContainerConfig::DEFAULT_FORMAT));
  };

  "Unknown tables and keys are ignored"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[character]\nsymbol = \">\"\n\n[container]\nsymbol = \"C\"\nshape = \"hex\"\n");

    expect(cfg.has_value());
    expect(cfg->container.symbol == String("C"));
  };

  "Tab-separated style words are accepted"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[container]\nstyle = \"blue\\tunderline\"\n");

    expect(cfg.has_value());
    expect(cfg->container.style == *Style::Parse("blue underline"));
  };

  "Invalid style keeps the default and warns"_test = [] -> void {
    using namespace shelter::utils::logging;

    Vec<String>   warnings;
    const LogSink previous = SetLogSink([&warnings](const LogLevel level, StringView, const StringView message) {
      if (level == LogLevel::Warn)
        warnings.emplace_back(message);
    });

    Result<Config> cfg = Config::fromToml("[container]\nstyle = \"red sparkly\"\n");

    SetLogSink(previous);

    expect(cfg.has_value());
    expect(cfg->container.style == ContainerConfig::DefaultStyle());
    expect(warnings.size() == 1_ul);
  };

  "Malformed TOML is a configuration error"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[container\nsymbol = ");

    expect(!cfg.has_value());
    expect(cfg.error().code == ShelterErrorCode::ConfigurationError);
  };

  "fromFile reads the file and reports missing ones"_test = [] -> void {
    const TestRoot root;
    root.file("/shelter.toml", "[container]\nsymbol = \"F\"\n");

    Result<Config> cfg = Config::fromFile(root.path() / "shelter.toml");

    expect(cfg.has_value());
    expect(cfg->container.symbol == String("F"));

    expect(!Config::fromFile(root.path() / "missing.toml").has_value());
  };

  "getInstance falls back to defaults"_test = [] -> void {
    const TestRoot root;
    root.file("/broken.toml", "[container\n");

    const Config missing = Config::getInstance(root.path() / "missing.toml");
    const Config broken  = Config::getInstance(root.path() / "broken.toml");

    expect(missing.container.format == String(ContainerConfig::DEFAULT_FORMAT));
    expect(broken.container.symbol == String(ContainerConfig::DEFAULT_SYMBOL));
  };

  "getConfigPath lookup order"_test = [] -> void {
    const TestRoot root;
    root.file("/xdg/shelter.toml");

    const fs::path explicitPath = root.path() / "explicit.toml";

    expect(Config::getConfigPath(explicitPath) == explicitPath);

    env::SetEnv("SHELTER_CONFIG", (root.path() / "env.toml").c_str());
    env::SetEnv("XDG_CONFIG_HOME", (root.path() / "xdg").c_str());

    // $SHELTER_CONFIG does not exist on disk, so the XDG file is chosen.
    expect(Config::getConfigPath() == root.path() / "xdg" / "shelter.toml");

    root.file("/env.toml");

    expect(Config::getConfigPath() == root.path() / "env.toml");

    env::UnsetEnv("SHELTER_CONFIG");
    env::UnsetEnv("XDG_CONFIG_HOME");
  };

  return 0;
}
