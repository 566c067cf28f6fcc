/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser.
 *
 * Supports flags, string-valued options, enum-valued options (via magic_enum)
 * and binding parsed values directly onto struct members with bindTo().
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace shelter::utils::argparse {
  namespace error   = ::shelter::utils::error;
  namespace logging = ::shelter::utils::logging;
  namespace types   = ::shelter::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;

  inline auto ToLower(types::StringView text) -> types::String {
    types::String lower(text);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char chr) -> char { return static_cast<char>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief Lists the lower-cased names of a scoped enum's values.
   */
  template <typename EnumType>
    requires magic_enum::is_scoped_enum_v<EnumType>
  auto EnumChoices() -> types::Vec<types::String> {
    types::Vec<types::String> choices;

    for (const EnumType value : magic_enum::enum_values<EnumType>())
      choices.push_back(ToLower(magic_enum::enum_name(value)));

    return choices;
  }

  /**
   * @brief Represents a command-line argument with its metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    /**
     * @brief Configure this argument as a flag (takes no value).
     */
    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    auto defaultValue(types::String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Set an enum default; the enum's value names become the allowed choices.
     */
    template <typename EnumType>
      requires magic_enum::is_scoped_enum_v<EnumType>
    auto defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = ToLower(magic_enum::enum_name(value));
      m_choices      = EnumChoices<EnumType>();
      return *this;
    }

    template <typename T>
    auto get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires magic_enum::is_scoped_enum_v<EnumType>
    auto getEnum() const -> EnumType {
      return magic_enum::enum_cast<EnumType>(get<types::String>(), magic_enum::case_insensitive)
        .value_or(magic_enum::enum_values<EnumType>().front());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> const types::Vec<types::String>& {
      return m_choices;
    }

    /**
     * @brief Record a value supplied on the command line, validating it against the choices if any.
     */
    auto setValue(types::String value) -> types::Result<> {
      if (!m_choices.empty() && !std::ranges::contains(m_choices, ToLower(value)))
        ERR_FMT(error::ShelterErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'", value, m_names.front());

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;
      m_value  = true;
    }

    /**
     * @brief Bind this argument to a bool or String member.
     *
     * @example
     *   parser.addArguments("-r", "--root").defaultValue(String("/")).bindTo(opts.root);
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    template <typename EnumType>
      requires magic_enum::is_scoped_enum_v<EnumType>
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;
    types::String             m_helpText;
    types::Option<ArgValue>   m_value;
    types::Option<ArgValue>   m_defaultValue;
    types::Vec<types::String> m_choices;
    ArgBinding                m_binding;
    bool                      m_isFlag {};
    bool                      m_isUsed {};
  };

  /**
   * @brief Main argument parser class.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(types::String version)
      : m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parse command-line arguments. args[0] is the program name.
     */
    auto parseArgs(const types::Span<const types::String> args) -> types::Result<> {
      if (args.empty())
        return {};

      if (m_programName.empty())
        m_programName = args[0];

      for (types::usize i = 1; i < args.size(); ++i) {
        const types::String& arg = args[i];

        const auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          ERR_FMT(error::ShelterErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(error::ShelterErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return {};
    }

    /**
     * @brief Parse arguments and apply bindings in one call.
     */
    auto parseInto(const types::Span<const types::String> args) -> types::Result<> {
      TRY_VOID(parseArgs(args));

      for (const auto& arg : m_arguments)
        arg->applyBinding();

      return {};
    }

    template <typename T = types::String>
    auto get(const types::StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    auto getEnum(const types::StringView name) const -> EnumType {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return magic_enum::enum_values<EnumType>().front();
    }

    [[nodiscard]] auto isUsed(const types::StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    auto printHelp() const -> types::Unit {
      logging::Println("Usage: {} [OPTIONS]", m_programName);
      logging::Println();
      logging::Println("Arguments:");

      for (const auto& arg : m_arguments) {
        types::String names;

        for (const types::String& name : arg->getNames())
          names += names.empty() ? name : ", " + name;

        logging::Println("  {}{}", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          logging::Println("    {}", arg->getHelpText());

        if (!arg->getChoices().empty()) {
          types::String choices;

          for (const types::String& choice : arg->getChoices())
            choices += choices.empty() ? choice : ", " + choice;

          logging::Println("    Available values: {}", choices);
        }
      }
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace shelter::utils::argparse
