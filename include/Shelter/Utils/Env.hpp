#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv

#include "Error.hpp"
#include "Types.hpp"

namespace shelter::utils::env {
  namespace types = ::shelter::utils::types;
  namespace error = ::shelter::utils::error;

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing the value, or NotFound if it is unset or empty.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      ERR_FMT(error::ShelterErrorCode::NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    setenv(name, value, 1);
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
    unsetenv(name);
  }
} // namespace shelter::utils::env
