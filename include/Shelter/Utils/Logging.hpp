#pragma once

#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <print>      // std::print
#include <utility>    // std::forward

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace shelter::utils::logging {
  namespace types = ::shelter::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @enum LogLevel
   * @brief Represents different log levels (tracing-style).
   */
  enum class LogLevel : types::u8 {
    Trace, // Most verbose - for tracing program flow
    Debug, // Debug information
    Info,  // General information
    Warn,  // Warnings
    Error, // Errors
  };

  struct LogLevelConst {
    static constexpr types::PCStr RESET_CODE = "\033[0m";
    static constexpr types::PCStr BOLD_START = "\033[1m";
    static constexpr types::PCStr GRAY_DIM   = "\033[2m\033[38;5;8m";

    // Tracing-style colors: TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @brief Receives every log record that passes the runtime level filter.
   *
   * The default sink writes to stderr. Hosts embedding the library (and tests)
   * can install their own sink to capture or redirect records.
   */
  using LogSink = types::Fn<void(LogLevel level, types::StringView target, types::StringView message)>;

  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> types::Unit {
    GetRuntimeLogLevel() = level;
  }

  inline auto GetLogSinkStorage() -> LogSink& {
    static LogSink Sink;
    return Sink;
  }

  /**
   * @brief Installs a custom sink. Passing an empty function restores the console sink.
   * @return The previously installed sink.
   */
  inline auto SetLogSink(LogSink sink) -> LogSink {
    const types::LockGuard lock(GetLogMutex());
    return std::exchange(GetLogSinkStorage(), std::move(sink));
  }

  constexpr auto GetLevelLabel(const LogLevel level) -> types::StringView {
    constexpr types::Array<types::StringView, 5> LEVEL_INFO = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };

    return LEVEL_INFO.at(static_cast<types::usize>(level));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers (user-facing, stdout)
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    std::print(stdout, fmt, std::forward<Args>(args)...);
  }

  inline auto Print(const types::StringView text) {
    std::print(stdout, "{}", text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    std::println(stdout, fmt, std::forward<Args>(args)...);
  }

  inline auto Println(const types::StringView text) {
    std::println(stdout, "{}", text);
  }

  inline auto Println() {
    std::println(stdout, "");
  }

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto FormatTimestamp(const std::time_t timeT) -> types::String {
    std::tm localTm {};

    types::Array<char, 20> buffer = { '\0' };

    if (localtime_r(&timeT, &localTm) == nullptr || std::strftime(buffer.data(), buffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
      return "????-??-??T??:??:??";

    return { buffer.data() };
  }

  /**
   * @brief Extracts a target string from a function name (converts to module-like path).
   * @details Converts "auto shelter::modules::DetectContainer(...)" to "shelter::modules"
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const auto         spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  inline auto WriteToConsole(const LogLevel level, const types::StringView target, const types::StringView message, const std::source_location& loc) {
    using std::chrono::system_clock;

    const types::String timestamp = FormatTimestamp(system_clock::to_time_t(system_clock::now()));

#ifndef NDEBUG
    const types::String fileLine = std::format(
      " {}{}:{}{}",
      LogLevelConst::GRAY_DIM,
      std::filesystem::path(loc.file_name()).filename().string(),
      loc.line(),
      LogLevelConst::RESET_CODE
    );
#else
    const types::String fileLine;
    (void)loc;
#endif

    std::println(
      stderr,
      "{}{}{} {}{} {}{}{}: {}",
      LogLevelConst::GRAY_DIM,
      timestamp,
      LogLevelConst::RESET_CODE,
      GetLevelLabel(level),
      fileLine,
      LogLevelConst::BOLD_START,
      target,
      LogLevelConst::RESET_CODE,
      message
    );
  }

  /**
   * @brief Core logging implementation.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    if (level < GetRuntimeLogLevel())
      return;

    const types::String message = std::format(fmt, std::forward<Args>(args)...);

    LogSink sink;

    {
      const types::LockGuard lock(GetLogMutex());

      if (!GetLogSinkStorage()) {
        WriteToConsole(level, target, message, loc);
        return;
      }

      sink = GetLogSinkStorage();
    }

    // Called unlocked so the sink may log itself.
    sink(level, target, message);
  }

  /**
   * @brief Log an error object at the specified level.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        errorObj
  ) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::ShelterError>)
      LogImpl(level, errorObj.location, target, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), target, "{}", "Unknown error type logged");
  }
} // namespace shelter::utils::logging

// Helper to extract target from current function
#define SHELTER_LOG_TARGET ::shelter::utils::logging::ExtractTarget(__PRETTY_FUNCTION__)

#define trace_log(fmt, ...) \
  ::shelter::utils::logging::LogImpl(::shelter::utils::logging::LogLevel::Trace, std::source_location::current(), SHELTER_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) \
  ::shelter::utils::logging::LogImpl(::shelter::utils::logging::LogLevel::Debug, std::source_location::current(), SHELTER_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define info_log(fmt, ...) \
  ::shelter::utils::logging::LogImpl(::shelter::utils::logging::LogLevel::Info, std::source_location::current(), SHELTER_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log(fmt, ...) \
  ::shelter::utils::logging::LogImpl(::shelter::utils::logging::LogLevel::Warn, std::source_location::current(), SHELTER_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_log(fmt, ...) \
  ::shelter::utils::logging::LogImpl(::shelter::utils::logging::LogLevel::Error, std::source_location::current(), SHELTER_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

// Error object logging macros
#define debug_at(error_obj) ::shelter::utils::logging::LogError(::shelter::utils::logging::LogLevel::Debug, SHELTER_LOG_TARGET, error_obj)
#define warn_at(error_obj)  ::shelter::utils::logging::LogError(::shelter::utils::logging::LogLevel::Warn, SHELTER_LOG_TARGET, error_obj)
#define error_at(error_obj) ::shelter::utils::logging::LogError(::shelter::utils::logging::LogLevel::Error, SHELTER_LOG_TARGET, error_obj)
