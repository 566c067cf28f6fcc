#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location
#include <system_error>    // std::{error_code, errc}

#include "Types.hpp"

namespace shelter::utils::error {
  /**
   * @enum ShelterErrorCode
   * @brief Error categories produced by the context, formatter and config layers.
   */
  enum class ShelterErrorCode : types::u8 {
    ConfigurationError, ///< Configuration file is malformed or holds an invalid value.
    InternalError,      ///< An invariant inside Shelter itself was broken.
    InvalidArgument,    ///< An invalid argument was passed to a function or on the command line.
    IoError,            ///< General I/O error (read failure, short read, etc.).
    NotFound,           ///< A file or resource does not exist.
    Other,              ///< A generic or unclassified error.
    ParseError,         ///< Malformed input (format string, style string, file content).
    PermissionDenied,   ///< Insufficient permissions to perform the operation.
    UnknownStyle,       ///< A format string references a style variable nobody provides.
    UnknownVariable,    ///< A format string references a variable nobody provides.
  };

  /**
   * @struct ShelterError
   * @brief Holds structured information about an error.
   *
   * Used as the error type in Result throughout the library.
   */
  struct ShelterError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    ShelterErrorCode     code;     ///< The general category of the error.

    ShelterError(const ShelterErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    /**
     * @brief Builds an error from a std::error_code, mapping the common errno values.
     */
    explicit ShelterError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
      : message(errc.message()), location(loc), code(FromErrorCode(errc)) {}

   private:
    static auto FromErrorCode(const std::error_code& errc) -> ShelterErrorCode {
      if (errc == std::errc::no_such_file_or_directory || errc == std::errc::not_a_directory)
        return ShelterErrorCode::NotFound;

      if (errc == std::errc::permission_denied || errc == std::errc::operation_not_permitted)
        return ShelterErrorCode::PermissionDenied;

      return ShelterErrorCode::IoError;
    }
  };
} // namespace shelter::utils::error

#define ERR(errc, msg)          return ::shelter::utils::types::Err(::shelter::utils::error::ShelterError(errc, msg))
#define ERR_FROM(err)           return ::shelter::utils::types::Err(::shelter::utils::error::ShelterError(err))
#define ERR_FMT(errc, fmt, ...) return ::shelter::utils::types::Err(::shelter::utils::error::ShelterError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Macro for Rust-style error propagation.
 *
 * Evaluates the given expression (which must return a Result<T, E>).
 * If the result contains an error, it immediately returns from the enclosing
 * function with that error wrapped in Err(). Otherwise, it yields the success value.
 *
 * @note Uses GNU statement expressions (GCC/Clang).
 *
 * @example
 * @code
 * auto render() -> Result<Vec<Segment>> {
 *   StringFormatter formatter = TRY(StringFormatter::Create(format));
 *   return formatter.parse();
 * }
 * @endcode
 */
#ifdef __clang__
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _shelter_try_result = (expr);                                                    \
        if (!_shelter_try_result)                                                               \
          return ::shelter::utils::types::Err(_shelter_try_result.error());                     \
        std::move(*_shelter_try_result);                                                        \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#else
  #define TRY(expr)                                                         \
    ({                                                                      \
      auto&& _shelter_try_result = (expr);                                  \
      if (!_shelter_try_result)                                             \
        return ::shelter::utils::types::Err(_shelter_try_result.error());   \
      std::move(*_shelter_try_result);                                      \
    })
#endif

/**
 * @brief Macro for Rust-style error propagation with Result<void> types.
 *
 * Use this variant when the Result has no success value (Result<void> or Result<>).
 */
#define TRY_VOID(expr)                                                    \
  do {                                                                    \
    auto&& _shelter_try_result = (expr);                                  \
    if (!_shelter_try_result)                                             \
      return ::shelter::utils::types::Err(_shelter_try_result.error());   \
  } while (0)
