// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/Report.h>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace std::string_view_literals;
using std::string;
using std::string_view;
using std::vector;

using namespace vtdecode;

namespace
{
vector<string> reportLines(string_view input)
{
    auto result = vector<string> {};
    for (auto const& line: decodeLines(input))
        result.emplace_back(line.str());
    return result;
}
} // namespace

TEST_CASE("Report.parseReportMode", "[Report]")
{
    CHECK(parseReportMode("hex") == ReportMode::Hex);
    CHECK(parseReportMode("HEX") == ReportMode::Hex);
    CHECK(parseReportMode("Decode") == ReportMode::Decode);
    CHECK_FALSE(parseReportMode("").has_value());
    CHECK_FALSE(parseReportMode("text").has_value());
}

TEST_CASE("Report.decode.mixed_stream", "[Report]")
{
    auto const report = formatDecode("abc\x1b[31mred\x1b[0m\x07\x1b]0;title\x07\x00"sv);
    CHECK(report
          == "TXT \"abc\"\n"
             "CSI m 31 // fg ansi color 1\n"
             "TXT \"red\"\n"
             "CSI m 0 // reset all\n"
             "BEL\n"
             "OSC 0 \"title\"\n"
             "CTL 0x00\n");
}

TEST_CASE("Report.decode.empty", "[Report]")
{
    CHECK(formatDecode(""sv).empty());
    CHECK(decodeLines(""sv).empty());
}

TEST_CASE("Report.decode.cursor_forward_collapsing", "[Report]")
{
    CHECK(reportLines("hi\x1b[1Cworld\x1b[3Cfoo\r\nbar"sv)
          == vector<string> { "TXT \"hi world   foo\\r\\n\"", "TXT \"bar\" // 4C" });
}

TEST_CASE("Report.decode.cursor_forward_without_parameter", "[Report]")
{
    CHECK(reportLines("a\x1b[Cb"sv) == vector<string> { "TXT \"a b\" // 1C" });
}

TEST_CASE("Report.decode.invalid_cursor_forward_flushes_text", "[Report]")
{
    CHECK(reportLines("a\x1b[0Cb"sv)
          == vector<string> { "TXT \"a\"", "CSI C 0 // cursor forward", "TXT \"b\"" });
}

TEST_CASE("Report.decode.other_tokens_flush_pending_spaces", "[Report]")
{
    CHECK(reportLines("\x1b[2C\x07x"sv) == vector<string> { "TXT \"  \" // 2C", "BEL", "TXT \"x\"" });
}

TEST_CASE("Report.decode.text_keeps_printable_unicode", "[Report]")
{
    CHECK(reportLines("gr\xc3\xbc\xc3\x9f"
                      "e\t!"sv)
          == vector<string> { "TXT \"gr\xc3\xbc\xc3\x9f"
                              "e\\t!\"" });
}

TEST_CASE("Report.decode.invalid_utf8", "[Report]")
{
    CHECK(reportLines("abc\xff"sv) == vector<string> { "TXT \"abc\"", "CTL 0xff" });
}

TEST_CASE("Report.decode.truncated_input", "[Report]")
{
    SECTION("CSI")
    {
        CHECK(reportLines("ok\x1b[38;5"sv) == vector<string> { "TXT \"ok\"", "CSI \"\\x1b[38;5\"" });
    }
    SECTION("OSC")
    {
        CHECK(reportLines("\x1b]2;ti"sv) == vector<string> { "OSC 2 \"ti\"" });
    }
    SECTION("DCS")
    {
        CHECK(reportLines("\x1bP1$r"sv) == vector<string> { "DCS \"\\x1bP1$r\"" });
    }
    SECTION("ESC")
    {
        CHECK(reportLines("x\x1b"sv) == vector<string> { "TXT \"x\"", "ESC" });
    }
}

TEST_CASE("Report.decode.deterministic", "[Report]")
{
    auto const input = "\x1b[?1049h\x1b[H\x1b[2J\x1b[1;1Hhello\x1b[K\r\n\x1b[?1049l"sv;
    CHECK(formatDecode(input) == formatDecode(input));
}

TEST_CASE("Report.formatReport", "[Report]")
{
    CHECK(formatReport(ReportMode::Hex, "abc"sv).find("61 62 63") != string::npos);
    CHECK(formatReport(ReportMode::Decode, "abc"sv) == "TXT \"abc\"\n");
    CHECK(fmt::format("{}", ReportMode::Decode) == "decode");
}
