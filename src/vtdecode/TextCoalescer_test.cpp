// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/TextCoalescer.h>

#include <catch2/catch.hpp>

using namespace std::string_view_literals;
using std::string_view;
using std::vector;

using namespace vtdecode;

TEST_CASE("TextCoalescer.splitOnLineBreakRuns", "[TextCoalescer]")
{
    CHECK(splitOnLineBreakRuns(""sv).empty());
    CHECK(splitOnLineBreakRuns("abc"sv) == vector<string_view> { "abc" });
    CHECK(splitOnLineBreakRuns("a\r\nb"sv) == vector<string_view> { "a\r\n", "b" });
    CHECK(splitOnLineBreakRuns("a\n\n\rb\n"sv) == vector<string_view> { "a\n\n\r", "b\n" });
    CHECK(splitOnLineBreakRuns("\r\n"sv) == vector<string_view> { "\r\n" });
    CHECK(splitOnLineBreakRuns("\nx"sv) == vector<string_view> { "\n", "x" });
}

TEST_CASE("TextCoalescer.flush_empty", "[TextCoalescer]")
{
    auto lines = vector<Line> {};
    auto coalescer = TextCoalescer {};
    coalescer.flush(lines);
    CHECK(lines.empty());
    CHECK(coalescer.empty());
}

TEST_CASE("TextCoalescer.spaces_only", "[TextCoalescer]")
{
    auto lines = vector<Line> {};
    auto coalescer = TextCoalescer {};
    coalescer.appendSpaces(SpaceCount(2));
    coalescer.flush(lines);

    REQUIRE(lines.size() == 1);
    CHECK(lines[0].str() == "TXT \"  \" // 2C");
    CHECK(coalescer.empty());
}

TEST_CASE("TextCoalescer.annotation_on_last_segment", "[TextCoalescer]")
{
    auto lines = vector<Line> {};
    auto coalescer = TextCoalescer {};
    coalescer.appendText("hi");
    coalescer.appendSpaces(SpaceCount(1));
    coalescer.appendText("world");
    coalescer.appendSpaces(SpaceCount(3));
    coalescer.appendText("foo\r\nbar");
    coalescer.flush(lines);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].str() == "TXT \"hi world   foo\\r\\n\"");
    CHECK(lines[1].str() == "TXT \"bar\" // 4C");
}

TEST_CASE("TextCoalescer.resets_after_flush", "[TextCoalescer]")
{
    auto lines = vector<Line> {};
    auto coalescer = TextCoalescer {};
    coalescer.appendText("one");
    coalescer.appendSpaces(SpaceCount(5));
    coalescer.flush(lines);
    coalescer.appendText("two\n");
    coalescer.flush(lines);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].str() == "TXT \"one     \" // 5C");
    CHECK(lines[1].str() == "TXT \"two\\n\"");
}
