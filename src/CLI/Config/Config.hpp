#pragma once

#include <filesystem> // std::filesystem::path

#include <Shelter/Modules/Container.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Types.hpp>

namespace shelter::config {
  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    modules::ContainerConfig container; ///< Settings for the [container] table.

    /**
     * @brief Default constructor for Config. All modules use their built-in defaults.
     */
    Config() = default;

    /**
     * @brief Resolves the configuration file path.
     * @param override Path given on the command line, if any.
     * @return The first candidate that exists, otherwise the preferred candidate.
     *
     * Candidates, in order: @p override, $SHELTER_CONFIG, $XDG_CONFIG_HOME/shelter.toml,
     * $HOME/.config/shelter.toml, ./shelter.toml.
     */
    static auto getConfigPath(const utils::types::Option<std::filesystem::path>& override = utils::types::None) -> std::filesystem::path;

    /**
     * @brief Parses TOML text into a Config. Unknown tables and keys are ignored.
     * @return The config, or a ConfigurationError describing the parse failure.
     */
    static auto fromToml(utils::types::StringView toml) -> utils::types::Result<Config>;

    /**
     * @brief Reads and parses a TOML configuration file.
     */
    static auto fromFile(const std::filesystem::path& path) -> utils::types::Result<Config>;

    /**
     * @brief Loads the configuration, falling back to defaults on any problem.
     * @param override Path given on the command line, if any.
     *
     * A missing file silently yields defaults. A malformed file is logged as
     * an error and also yields defaults.
     */
    static auto getInstance(const utils::types::Option<std::filesystem::path>& override = utils::types::None) -> Config;
  };
} // namespace shelter::config
