/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for pacfetch.
 *
 * Supports flags, valued options, enum-style choices (through magic_enum)
 * and binding parsed values straight into an options struct.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <concepts>                  // std::convertible_to, std::same_as
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, enum_values}
#include <unordered_set>             // std::unordered_set
#include <utility>                   // std::forward
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace pacfetch::utils::argparse {
  namespace error   = ::pacfetch::utils::error;
  namespace logging = ::pacfetch::utils::logging;
  namespace types   = ::pacfetch::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::String str) -> types::String {
    std::ranges::transform(str, str.begin(), [](const types::u8 chr) { return static_cast<types::CStr>(std::tolower(chr)); });
    return str;
  }

  /**
   * @brief String conversions for scoped enums used as option values.
   * @tparam EnumType The enum type
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const EnumType value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(magic_enum::enum_name(value));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    static auto stringToEnum(const types::StringView str) -> EnumType {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (types::Option<EnumType> value = magic_enum::enum_cast<EnumType>(str, magic_enum::case_insensitive))
        return *value;

      return magic_enum::enum_values<EnumType>()[0];
    }

    static auto enumToString(const EnumType value) -> types::String {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");
      return types::String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief A single command-line option with its aliases, metadata and parsed value.
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

    auto defaultValue(types::String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Sets an enum default; this also restricts the accepted values to the enum's names.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      return choices(EnumTraits<EnumType>::getChoices());
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    auto choices(const ArgChoices& choices) -> Argument& {
      m_choices = choices;
      m_lowerChoices.clear();

      for (const types::String& choice : choices)
        m_lowerChoices.emplace(ToLower(choice));

      return *this;
    }

    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    [[nodiscard]] auto get() const -> T {
      if (m_isUsed && m_value)
        return std::get<T>(*m_value);

      if (m_defaultValue)
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.front();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> const ArgChoices& {
      return m_choices;
    }

    /**
     * @brief Lowercased default for help output; empty when there is none or it is a flag.
     */
    [[nodiscard]] auto getDefaultAsString() const -> types::String {
      if (!m_defaultValue || std::holds_alternative<bool>(*m_defaultValue))
        return {};

      return ToLower(std::get<types::String>(*m_defaultValue));
    }

    /**
     * @brief Stores a value given on the command line, validating it against the choices if any.
     */
    auto setValue(types::String value) -> types::Result<> {
      if (!m_choices.empty() && !m_lowerChoices.contains(ToLower(value))) {
        types::String allowed;
        for (const types::String& choice : m_choices) {
          if (!allowed.empty())
            allowed += ", ";
          allowed += ToLower(choice);
        }

        ERR_FMT(
          error::PfErrorCode::InvalidArgument,
          "Invalid value '{}' for argument '{}'. Allowed values: {}",
          value,
          getPrimaryName(),
          allowed
        );
      }

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Copies the parsed (or default) value into @p member when bindings are applied.
     *
     * @code
     *   struct Options { bool json; String ascii; };
     *   Options opts;
     *   parser.addArguments("--json").flag().bindTo(opts.json);
     *   parser.addArguments("--ascii").bindTo(opts.ascii);
     * @endcode
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    /**
     * @brief Binds only when the option was given, wrapping the value in an Option.
     */
    auto bindTo(types::Option<types::String>& member) -> Argument& {
      m_binding = [&member](const Argument& arg) {
        if (arg.isUsed())
          member = arg.get<types::String>();
      };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String>         m_names;
    types::String                     m_helpText;
    types::Option<ArgValue>           m_value;
    types::Option<ArgValue>           m_defaultValue;
    ArgChoices                        m_choices;
    std::unordered_set<types::String> m_lowerChoices;
    ArgBinding                        m_binding;
    bool                              m_isFlag {};
    bool                              m_isUsed {};
  };

  /**
   * @brief Owns the declared arguments and parses argv into them.
   *
   * "-h/--help" and "-v/--version" are always registered; callers check
   * them with isUsed() after parsing and decide what to print.
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

    auto parseArgs(const types::Span<const char* const> args) -> types::Result<> {
      return parseTokens(args);
    }

    auto parseArgs(const types::Vec<types::String>& args) -> types::Result<> {
      return parseTokens(args);
    }

    auto parseInto(const types::Span<const char* const> args) -> types::Result<> {
      TRY_VOID(parseTokens(args));
      applyBindings();
      return {};
    }

    auto parseInto(const types::Vec<types::String>& args) -> types::Result<> {
      TRY_VOID(parseTokens(args));
      applyBindings();
      return {};
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(const types::StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    [[nodiscard]] auto getEnum(const types::StringView name) const -> EnumType {
      static_assert(EnumTraits<EnumType>::has_string_conversion, "Enum type must be a scoped enum");

      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    [[nodiscard]] auto isUsed(const types::StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    [[nodiscard]] auto helpText() const -> types::String {
      types::String out = std::format("Usage: {}", m_programName.empty() ? "pacfetch" : m_programName);

      for (const auto& arg : m_arguments)
        out += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      out += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;
        for (const types::String& name : arg->getNames())
          names += names.empty() ? name : ", " + name;

        out += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          out += std::format("    {}\n", arg->getHelpText());

        if (!arg->getChoices().empty()) {
          types::String choices;
          for (const types::String& choice : arg->getChoices())
            choices += choices.empty() ? ToLower(choice) : ", " + ToLower(choice);

          out += std::format("    Available values: {}\n", choices);
        }

        if (const types::String def = arg->getDefaultAsString(); !def.empty())
          out += std::format("    Default: {}\n", def);
      }

      return out;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

   private:
    template <typename Range>
    auto parseTokens(const Range& args) -> types::Result<> {
      if (args.empty())
        return {};

      if (m_programName.empty())
        m_programName = types::String(args[0]);

      for (types::usize i = 1; i < args.size(); ++i) {
        const types::StringView token = args[i];

        // Both "--opt value" and "--opt=value" are accepted.
        types::StringView             name = token;
        types::Option<types::String>  inlineValue;

        if (token.starts_with("--"))
          if (const types::usize eq = token.find('='); eq != types::StringView::npos) {
            name        = token.substr(0, eq);
            inlineValue = types::String(token.substr(eq + 1));
          }

        const auto iter = m_argumentMap.find(name);
        if (iter == m_argumentMap.end())
          ERR_FMT(error::PfErrorCode::InvalidArgument, "Unknown argument: {}", token);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            ERR_FMT(error::PfErrorCode::InvalidArgument, "Flag {} does not take a value", name);

          argument->markUsed();
          continue;
        }

        if (!inlineValue) {
          if (i + 1 >= args.size())
            ERR_FMT(error::PfErrorCode::InvalidArgument, "Argument {} requires a value", name);

          inlineValue = types::String(args[++i]);
        }

        TRY_VOID(argument->setValue(std::move(*inlineValue)));
      }

      return {};
    }

    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace pacfetch::utils::argparse
