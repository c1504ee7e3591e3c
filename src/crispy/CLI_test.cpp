// SPDX-License-Identifier: Apache-2.0
#include <crispy/CLI.h>

#include <fmt/format.h>

#include <catch2/catch.hpp>

using std::optional;
using std::string;

namespace cli = crispy::cli;

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace
{
cli::command dumpSyntax()
{
    return cli::command {
        "vtdump",
        "help here",
        cli::option_list {},
        cli::command_list {
            cli::command { "version", "Shows the version." },
            cli::command { "dump",
                           "some dump help text",
                           cli::option_list {
                               cli::option { { 'm', "mode" }, cli::value { "hex"s }, "help there" },
                               cli::option { "size", cli::value { 1000 }, "help here" },
                               cli::option { "stdin", cli::value { false } },
                               cli::option { "input", cli::value { ""s } },
                           },
                           cli::command_list {},
                           cli::command_select::Implicit } }
    };
}
} // namespace

TEST_CASE("CLI.option.type.bool")
{
    auto const cmd = cli::command {
        "vtdump",
        "help here",
        cli::option_list { cli::option { "verbose"sv, cli::value { false }, "Help text here"sv } },
    };

    SECTION("set")
    {
        auto const args = cli::string_view_list { "vtdump", "verbose" };
        optional<cli::flag_store> const flagsOpt = cli::parse(cmd, args);
        REQUIRE(flagsOpt.has_value());
        CHECK(flagsOpt.value().values.at("vtdump.verbose") == cli::value { true });
        CHECK(flagsOpt.value().isExplicit("vtdump.verbose"));
    }

    SECTION("set true")
    {
        auto const args = cli::string_view_list { "vtdump", "verbose", "true" };
        auto const flags = cli::parse(cmd, args);
        CHECK(flags.values.at("vtdump.verbose") == cli::value { true });
    }

    SECTION("set false")
    {
        auto const args = cli::string_view_list { "vtdump", "--verbose=no" };
        auto const flags = cli::parse(cmd, args);
        CHECK(flags.values.at("vtdump.verbose") == cli::value { false });
    }

    SECTION("unset")
    {
        auto const args = cli::string_view_list { "vtdump" };
        auto const flags = cli::parse(cmd, args);
        CHECK(flags.values.at("vtdump.verbose") == cli::value { false });
        CHECK_FALSE(flags.isExplicit("vtdump.verbose"));
    }
}

TEST_CASE("CLI.option.type.int")
{
    auto const cmd = dumpSyntax();

    SECTION("natural")
    {
        auto const flags = cli::parse(cmd, cli::string_view_list { "vtdump", "dump", "size", "42" });
        CHECK(flags.integer("vtdump.dump.size") == 42);
    }

    SECTION("posix")
    {
        auto const flags = cli::parse(cmd, cli::string_view_list { "vtdump", "--size=-7" });
        CHECK(flags.integer("vtdump.dump.size") == -7);
    }

    SECTION("malformed")
    {
        auto const args = cli::string_view_list { "vtdump", "--size", "many" };
        CHECK_THROWS_AS(cli::parse(cmd, args), cli::parser_error);
    }

    SECTION("missing value")
    {
        auto const args = cli::string_view_list { "vtdump", "--size" };
        CHECK_THROWS_AS(cli::parse(cmd, args), cli::parser_error);
    }
}

TEST_CASE("CLI.implicit_command")
{
    auto const cmd = dumpSyntax();
    auto const args = cli::string_view_list { "vtdump", "-m", "decode", "--stdin" };
    auto const flags = cli::parse(cmd, args);

    CHECK(flags.values.at("vtdump") == cli::value { true });
    CHECK(flags.values.at("vtdump.dump") == cli::value { true });
    CHECK(flags.values.at("vtdump.version") == cli::value { false });
    CHECK(flags.str("vtdump.dump.mode") == "decode");
    CHECK(flags.boolean("vtdump.dump.stdin"));
    CHECK(flags.integer("vtdump.dump.size") == 1000);
    CHECK(flags.str("vtdump.dump.input").empty());
}

TEST_CASE("CLI.explicit_command")
{
    auto const cmd = dumpSyntax();
    auto const flags = cli::parse(cmd, cli::string_view_list { "vtdump", "version" });

    CHECK(flags.boolean("vtdump.version"));
    CHECK_FALSE(flags.boolean("vtdump.dump"));
}

TEST_CASE("CLI.unexpected_token")
{
    auto const cmd = dumpSyntax();
    auto const args = cli::string_view_list { "vtdump", "dump", "--bogus" };
    CHECK_THROWS_AS(cli::parse(cmd, args), cli::parser_error);
}

TEST_CASE("CLI.helpText")
{
    auto const text = cli::helpText(dumpSyntax(), 80);
    INFO(text);
    CHECK(text.find("dump (default)") != string::npos);
    CHECK(text.find("-m, --mode=VALUE") != string::npos);
    CHECK(text.find("[default: 1000]") != string::npos);
    CHECK(text.find("--stdin") != string::npos);
}

TEST_CASE("CLI.defaults_without_options")
{
    auto const cmd = dumpSyntax();
    auto const flags = cli::parse(cmd, cli::string_view_list { "vtdump", "version" });

    // Options of a command that was not selected still carry their defaults.
    CHECK(flags.str("vtdump.dump.mode") == "hex");
    CHECK(flags.integer("vtdump.dump.size") == 1000);
    CHECK_FALSE(flags.boolean("vtdump.dump.stdin"));
    CHECK(flags.str("vtdump.dump.input").empty());
}
