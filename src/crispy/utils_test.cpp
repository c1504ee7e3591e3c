// SPDX-License-Identifier: Apache-2.0
#include <crispy/escape.h>
#include <crispy/utf8.h>
#include <crispy/utils.h>

#include <catch2/catch.hpp>

using std::string;
using std::string_view;
using namespace std::string_view_literals;

TEST_CASE("utils.split.empty_fields")
{
    auto const result = crispy::split("38;;5"sv, ';');
    REQUIRE(result.size() == 3);
    CHECK(result[0] == "38");
    CHECK(result[1].empty());
    CHECK(result[2] == "5");

    auto const empty = crispy::split(""sv, ';');
    REQUIRE(empty.size() == 1);
    CHECK(empty[0].empty());
}

TEST_CASE("utils.trimmed")
{
    CHECK(crispy::trimmed("  \t[1]\r\n"sv) == "[1]");
    CHECK(crispy::trimmed(" \n "sv).empty());
    CHECK(crispy::trimmed("abc"sv) == "abc");
}

TEST_CASE("utils.to_integer")
{
    CHECK(crispy::to_integer<int>("0"sv) == 0);
    CHECK(crispy::to_integer<int>("42"sv) == 42);
    CHECK(crispy::to_integer<int>("+3"sv) == 3);
    CHECK(crispy::to_integer<int>("-3"sv) == -3);
    CHECK(crispy::to_integer<int>("2147483647"sv) == 2147483647);
    CHECK(crispy::to_integer<int>("-2147483648"sv) == std::numeric_limits<int>::min());

    CHECK_FALSE(crispy::to_integer<int>(""sv).has_value());
    CHECK_FALSE(crispy::to_integer<int>("-"sv).has_value());
    CHECK_FALSE(crispy::to_integer<int>("1a"sv).has_value());
    CHECK_FALSE(crispy::to_integer<int>(" 1"sv).has_value());
    CHECK_FALSE(crispy::to_integer<int>("2147483648"sv).has_value());
    CHECK_FALSE(crispy::to_integer<int>("99999999999999999999999"sv).has_value());
}

TEST_CASE("utils.toLower")
{
    CHECK(crispy::toLower("DeCoDe"sv) == "decode");
}

TEST_CASE("utf8.decode")
{
    auto const e = crispy::decodeUtf8("\xC3\xA9x"sv);
    REQUIRE(e.has_value());
    CHECK(e->value == U'\u00E9');
    CHECK(e->length == 2);

    auto const smiley = crispy::decodeUtf8("\xF0\x9F\x98\x80"sv);
    REQUIRE(smiley.has_value());
    CHECK(smiley->value == U'\U0001F600');
    CHECK(smiley->length == 4);

    CHECK_FALSE(crispy::decodeUtf8("\xFF"sv).has_value());      // invalid lead byte
    CHECK_FALSE(crispy::decodeUtf8("\xC3"sv).has_value());      // truncated
    CHECK_FALSE(crispy::decodeUtf8("\xC3("sv).has_value());     // bad continuation
    CHECK_FALSE(crispy::decodeUtf8("\xC0\xAF"sv).has_value());  // overlong
    CHECK_FALSE(crispy::decodeUtf8("\xED\xA0\x80"sv).has_value()); // surrogate
    CHECK_FALSE(crispy::decodeUtf8("\xF4\x90\x80\x80"sv).has_value()); // above U+10FFFF
}

TEST_CASE("escape.quote")
{
    CHECK(crispy::quote("abc"sv) == "\"abc\"");
    CHECK(crispy::quote("a\"b\\c"sv) == "\"a\\\"b\\\\c\"");
    CHECK(crispy::quote("\r\n\t\x07\x1b"sv) == "\"\\r\\n\\t\\a\\x1b\"");
    CHECK(crispy::quote("\x7f"sv) == "\"\\x7f\"");
    CHECK(crispy::quote("caf\xC3\xA9"sv) == "\"caf\xC3\xA9\"");
    CHECK(crispy::quote("\xE2\x80\x8B"sv) == "\"\\u200b\""); // zero width space
    CHECK(crispy::quote("ab\xFF"sv) == "\"ab\\xff\"");
}

TEST_CASE("escape.quoteAscii")
{
    CHECK(crispy::quoteAscii("title"sv) == "\"title\"");
    CHECK(crispy::quoteAscii("caf\xC3\xA9"sv) == "\"caf\\u00e9\"");
    CHECK(crispy::quoteAscii("\xF0\x9F\x98\x80"sv) == "\"\\U0001f600\"");
    CHECK(crispy::quoteAscii("\x1b\\"sv) == "\"\\x1b\\\\\"");
}
