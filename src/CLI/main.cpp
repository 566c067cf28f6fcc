#include <cstdlib>    // EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem> // std::filesystem::path
#include <format>     // std::format

#include <Shelter/Core/Context.hpp>
#include <Shelter/Core/Module.hpp>
#include <Shelter/Modules/Container.hpp>
#include <Shelter/Utils/ArgumentParser.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Logging.hpp>
#include <Shelter/Utils/Types.hpp>

#include "Config/Config.hpp"

#ifndef SHELTER_VERSION
  #define SHELTER_VERSION "0.0.0"
#endif

using namespace shelter::utils::types;
using namespace shelter::utils::logging;
using shelter::config::Config;
using shelter::core::Context;
using shelter::core::Module;

struct CliOptions {
  // Modes
  bool detectOnly     = false;
  bool plainOutput    = false;
  bool showConfigPath = false;

  // Overrides
  String configPath;
  String rootPath;
  String format;
  bool   useContainerName = false;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  {
    using shelter::utils::argparse::ArgumentParser;

    ArgumentParser parser(std::format("shelter {}", SHELTER_VERSION));

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Warn);

    parser
      .addArguments("-c", "--config")
      .help("Read the configuration from this file instead of the default location.")
      .defaultValue(String(""))
      .bindTo(opts.configPath);

    parser
      .addArguments("-r", "--root")
      .help("Filesystem root the container probes look under.")
      .defaultValue(String("/"))
      .bindTo(opts.rootPath);

    parser
      .addArguments("-f", "--format")
      .help("Override the configured format string (e.g., '[$symbol $name]($style) ').")
      .defaultValue(String(""))
      .bindTo(opts.format);

    parser
      .addArguments("-n", "--use-container-name")
      .help("Show the container's name instead of its image name.")
      .flag()
      .bindTo(opts.useContainerName);

    parser
      .addArguments("--detect")
      .help("Print only the detected container name, without formatting. Prints nothing when the module is disabled.")
      .flag()
      .bindTo(opts.detectOnly);

    parser
      .addArguments("--plain")
      .help("Print the rendered module without ANSI styling.")
      .flag()
      .bindTo(opts.plainOutput);

    parser
      .addArguments("--show-config-path")
      .help("Display the active configuration file location.")
      .flag()
      .bindTo(opts.showConfigPath);

    const Vec<String> args(argv, argv + argc);

    if (Result<> result = parser.parseInto(args); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (parser.isUsed("--help")) {
      parser.printHelp();
      return EXIT_SUCCESS;
    }

    if (parser.isUsed("--version")) {
      Println(parser.getVersion());
      return EXIT_SUCCESS;
    }

    SetRuntimeLogLevel(
      parser.get<bool>("--verbose")
        ? LogLevel::Debug
        : parser.getEnum<LogLevel>("--log-level")
    );
  }

  const Option<std::filesystem::path> configOverride =
    opts.configPath.empty() ? None : Some(std::filesystem::path(opts.configPath));

  if (opts.showConfigPath) {
    Println(Config::getConfigPath(configOverride).string());
    return EXIT_SUCCESS;
  }

  Config config = Config::getInstance(configOverride);

  if (!opts.format.empty())
    config.container.format = opts.format;

  if (opts.useContainerName)
    config.container.useContainerName = true;

  const Context context(opts.rootPath);

  if (opts.detectOnly) {
    if (const Option<String> name = shelter::modules::DetectContainer(context, config.container))
      Println(*name);

    return EXIT_SUCCESS;
  }

  if (const Option<Module> module = shelter::modules::BuildContainerModule(context, config.container))
    Print(opts.plainOutput ? module->plainText() : module->toString());

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
