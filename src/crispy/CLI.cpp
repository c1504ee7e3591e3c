// SPDX-License-Identifier: Apache-2.0
#include <crispy/CLI.h>
#include <crispy/utils.h>

#include <algorithm>
#include <deque>

/*
    Grammar
    =======

        CLI     := Command
        Command := NAME Option* SubCommand?
        Option  := NAME [Value]
        SubCommand := Command

        Value   := STR | BOOL | INT
        NAME    := <name without = or leading -'s>

    Examples
    ========

        # POSIX style
        vtdump dump --mode=decode --input capture.json
        vtdump -m decode --stdin

        # NATURAL STYLE
        vtdump dump mode decode input capture.json
*/

using std::deque;
using std::holds_alternative;
using std::optional;
using std::pair;
using std::string;
using std::string_view;

using namespace std::string_view_literals;

namespace crispy::cli
{

namespace // {{{ helper
{
    struct parse_context
    {
        string_view_list const& args;
        size_t pos = 1;

        deque<command const*> currentCommand = {};
        option const* currentOption = nullptr;

        flag_store output = {};
    };

    string namePrefix(parse_context const& context)
    {
        string output;
        for (command const* cmd: context.currentCommand)
        {
            if (!output.empty())
                output += '.';
            output += cmd->name;
        }
        return output;
    }

    bool hasTokensAvailable(parse_context const& context)
    {
        return context.pos < context.args.size();
    }

    string_view currentToken(parse_context const& context)
    {
        if (!hasTokensAvailable(context))
            return {};
        return context.args.at(context.pos);
    }

    string_view consumeToken(parse_context& context)
    {
        if (!hasTokensAvailable(context))
            throw parser_error("Not enough arguments specified.");
        return context.args.at(context.pos++);
    }

    bool isTrue(string_view token)
    {
        return token == "true" || token == "yes";
    }

    bool isFalse(string_view token)
    {
        return token == "false" || token == "no";
    }

    option const* findOption(parse_context const& context, string_view name)
    {
        for (auto const& option: context.currentCommand.back()->options)
            if (name == option.name.longName || (name.size() == 1 && name[0] == option.name.shortName))
                return &option;
        return nullptr;
    }

    /// Parses the given parameter value @p text with respect to the current option.
    value parseValue(parse_context& context, string_view text)
    {
        auto const& opt = *context.currentOption;

        if (holds_alternative<bool>(opt.v))
        {
            if (isTrue(text))
                return value { true };
            if (isFalse(text))
                return value { false };
            throw parser_error(
                fmt::format("Option {}: boolean value expected but \"{}\" specified.", opt.name.longName, text));
        }

        if (holds_alternative<int>(opt.v))
        {
            if (auto const number = to_integer<int>(text); number.has_value())
                return value { number.value() };
            throw parser_error(
                fmt::format("Option {}: integer value expected but \"{}\" specified.", opt.name.longName, text));
        }

        return value { string(text) };
    }

    value parseValue(parse_context& context)
    {
        if (holds_alternative<bool>(context.currentOption->v))
        {
            // Booleans can be specified just by `--flag` or `flag` without any value
            // and are considered to be true (implicit).
            auto const text = currentToken(context);
            if (isTrue(text) || isFalse(text))
                return parseValue(context, consumeToken(context));
            return value { true };
        }

        if (!hasTokensAvailable(context))
            throw parser_error(fmt::format("Option {} requires a value.", context.currentOption->name.longName));

        return parseValue(context, consumeToken(context));
    }

    struct scoped_option
    {
        parse_context& context;
        scoped_option(parse_context& context, option const& option): context { context }
        {
            context.currentOption = &option;
        }
        ~scoped_option() { context.currentOption = nullptr; }
    };

    struct scoped_command
    {
        parse_context& context;
        scoped_command(parse_context& context, command const& command): context { context }
        {
            context.currentCommand.emplace_back(&command);
        }
        ~scoped_command() { context.currentCommand.pop_back(); }
    };

    /// Tries parsing an option name and, if matching, also its value.
    ///
    /// @returns std::nullopt if the current token is no option name of the current command.
    optional<pair<option const*, value>> tryParseOption(parse_context& context)
    {
        // NAME [VALUE]
        // -NAME [VALUE]
        // --NAME[=VALUE]
        auto const current = currentToken(context);
        if (current.empty())
            return std::nullopt;

        if (startsWith(current, "--"sv))
        {
            auto const assignment = current.find('=');
            auto const name = current.substr(2, assignment == string_view::npos ? string_view::npos : assignment - 2);
            option const* opt = findOption(context, name);
            if (!opt)
                return std::nullopt;

            consumeToken(context);
            auto const optionScope = scoped_option { context, *opt };
            if (assignment != string_view::npos)
                return pair { opt, parseValue(context, current.substr(assignment + 1)) };
            return pair { opt, parseValue(context) };
        }

        auto const name = startsWith(current, "-"sv) ? current.substr(1) : current;
        if (option const* opt = findOption(context, name))
        {
            consumeToken(context);
            auto const optionScope = scoped_option { context, *opt };
            return pair { opt, parseValue(context) };
        }

        return std::nullopt;
    }

    void parseOptionList(parse_context& context)
    {
        auto const optionPrefix = namePrefix(context);

        while (auto parsed = tryParseOption(context))
        {
            auto& [option, value] = parsed.value();
            auto const fqdn = optionPrefix + "." + string(option->name.longName);
            context.output.values[fqdn] = std::move(value);
            context.output.explicitKeys.insert(fqdn);
        }
    }

    command const* tryLookupCommand(parse_context const& context)
    {
        auto token = currentToken(context);
        if (startsWith(token, "--"sv))
            token.remove_prefix(2);

        for (command const& child: context.currentCommand.back()->children)
            if (token == child.name)
                return &child;

        return nullptr;
    }

    command const* tryImplicitCommand(parse_context const& context)
    {
        for (command const& child: context.currentCommand.back()->children)
            if (child.select == command_select::Implicit)
                return &child;
        return nullptr;
    }

    void prefillDefaults(parse_context& context, command const& com)
    {
        auto const commandScope = scoped_command { context, com };
        auto const prefix = namePrefix(context) + ".";

        for (option const& opt: com.options)
            context.output.values[prefix + string(opt.name.longName)] = opt.v;

        for (command const& child: com.children)
        {
            context.output.values[prefix + string(child.name)] = value { false };
            prefillDefaults(context, child);
        }
    }

    void parseCommand(command const& com, parse_context& context)
    {
        // Command := NAME Option* SubCommand?
        auto const commandScope = scoped_command { context, com };
        context.output.values[namePrefix(context)] = value { true };

        parseOptionList(context);

        if (command const* child = tryLookupCommand(context))
        {
            consumeToken(context);
            parseCommand(*child, context);
        }
        else if (command const* implicit = tryImplicitCommand(context))
        {
            parseCommand(*implicit, context);
        }
    }

    void appendWrapped(string& output, string_view text, size_t indent, size_t margin)
    {
        auto column = indent;
        auto first = true;
        split(text, ' ', [&](string_view word) {
            if (word.empty())
                return true;
            if (!first && column + 1 + word.size() > margin)
            {
                output += '\n';
                output += string(indent, ' ');
                column = indent;
                first = true;
            }
            if (!first)
            {
                output += ' ';
                ++column;
            }
            output += word;
            column += word.size();
            first = false;
            return true;
        });
        output += '\n';
    }

    void appendCommandHelp(string& output, command const& com, size_t depth, unsigned margin)
    {
        constexpr auto HelpColumn = size_t { 32 };
        auto const indent = string(depth * 2, ' ');

        auto head = indent + string(com.name);
        if (com.select == command_select::Implicit)
            head += " (default)";
        output += head;
        output += head.size() < HelpColumn ? string(HelpColumn - head.size(), ' ') : string("\n") + string(HelpColumn, ' ');
        appendWrapped(output, com.helpText, HelpColumn, margin);

        for (option const& opt: com.options)
        {
            auto optionHead = indent + "    --" + string(opt.name.longName);
            if (opt.name.shortName)
                optionHead = indent + "    -" + string(1, opt.name.shortName) + ", --" + string(opt.name.longName);
            if (!holds_alternative<bool>(opt.v))
                optionHead += fmt::format("={}", opt.placeholder.empty() ? "VALUE"sv : opt.placeholder);
            output += optionHead;
            output += optionHead.size() < HelpColumn ? string(HelpColumn - optionHead.size(), ' ')
                                                     : string("\n") + string(HelpColumn, ' ');

            auto text = string(opt.helpText);
            if (!holds_alternative<bool>(opt.v))
                text += fmt::format(" [default: {}]", opt.v);
            appendWrapped(output, text, HelpColumn, margin);
        }

        for (command const& child: com.children)
            appendCommandHelp(output, child, depth + 1, margin);
    }

} // namespace
// }}}

flag_store parse(command const& command, string_view_list const& args)
{
    auto context = parse_context { args };

    prefillDefaults(context, command);
    parseCommand(command, context);

    if (hasTokensAvailable(context))
        throw parser_error(fmt::format("Unexpected token: \"{}\"", currentToken(context)));

    return std::move(context.output);
}

flag_store parse(command const& command, int argc, char const* const* argv)
{
    string_view_list args;
    args.resize(static_cast<size_t>(argc));
    for (size_t i = 0; i < static_cast<size_t>(argc); ++i)
        args[i] = argv[i];
    return parse(command, args);
}

std::string helpText(command const& command, unsigned margin)
{
    auto output = string {};
    output += fmt::format("{} - {}\n\nUsage:\n\n", command.name, command.helpText);
    for (auto const& child: command.children)
        appendCommandHelp(output, child, 1, margin);
    return output;
}

} // namespace crispy::cli
