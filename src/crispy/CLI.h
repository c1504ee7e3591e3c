// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace crispy::cli
{

using value = std::variant<int, std::string, bool>;
using name = std::string;

struct option_name
{
    char shortName {};
    std::string_view longName {};

    option_name(char shortName, std::string_view longName): shortName { shortName }, longName { longName } {}
    option_name(std::string_view longName): longName { longName } {}
    option_name(char const* longName): longName { longName } {}
};

struct option
{
    option_name name;
    value v;
    std::string_view helpText = {};
    std::string_view placeholder = {};
};

using option_list = std::vector<option>;

enum class command_select : uint8_t
{
    Explicit,
    Implicit, // only one command at a scope level can be implicit
};

struct command
{
    using command_list = std::vector<command>;
    std::string_view name;
    std::string_view helpText = {};
    option_list options = {};
    command_list children = {};
    command_select select = command_select::Explicit;
};

using command_list = command::command_list;

class parser_error: public std::runtime_error
{
  public:
    explicit parser_error(std::string const& msg): std::runtime_error(msg) {}
};

/// Result of a successful parse.
///
/// Keys are fully qualified: "<root>.<sub>" for commands (boolean, true when selected)
/// and "<root>.<sub>.<option>" for options.
struct flag_store
{
    std::map<name, value> values;

    /// Keys of options given on the command line, as opposed to prefilled defaults.
    std::set<name> explicitKeys;

    [[nodiscard]] bool boolean(std::string const& key) const { return std::get<bool>(values.at(key)); }
    [[nodiscard]] int integer(std::string const& key) const { return std::get<int>(values.at(key)); }
    [[nodiscard]] std::string const& str(std::string const& key) const
    {
        return std::get<std::string>(values.at(key));
    }

    [[nodiscard]] bool contains(std::string const& key) const { return values.count(key) != 0; }
    [[nodiscard]] bool isExplicit(std::string const& key) const { return explicitKeys.count(key) != 0; }

    template <typename T>
    [[nodiscard]] T get(std::string const& key) const
    {
        return std::get<T>(values.at(key));
    }
};

using string_view_list = std::vector<std::string_view>;

/**
 * Parses the command line arguments with respect to @p command as passed via @p args.
 *
 * The first element of @p args is the program name and is not interpreted.
 *
 * @throws parser_error on unknown tokens, missing or malformed option values,
 *         and missing required options.
 */
flag_store parse(command const& command, string_view_list const& args);

/**
 * Parses the command line arguments with respect to @p command as passed via (argc, argv) suitable
 * for a general main() functions's argc and argv.
 */
flag_store parse(command const& command, int argc, char const* const* argv);

/**
 * Constructs a help text suitable for printing out the command usage syntax in terminals.
 *
 * @param command      The command to construct the help text for.
 * @param margin       Number of characters to write at most per line.
 */
std::string helpText(command const& command, unsigned margin);

} // namespace crispy::cli

template <>
struct fmt::formatter<crispy::cli::value>: fmt::formatter<std::string_view>
{
    auto format(crispy::cli::value const& value, format_context& ctx) const -> format_context::iterator
    {
        if (std::holds_alternative<bool>(value))
            return fmt::format_to(ctx.out(), "{}", std::get<bool>(value));
        if (std::holds_alternative<int>(value))
            return fmt::format_to(ctx.out(), "{}", std::get<int>(value));
        return fmt::format_to(ctx.out(), "{}", std::get<std::string>(value));
    }
};
