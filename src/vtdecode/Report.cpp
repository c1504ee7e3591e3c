// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/Describer.h>
#include <vtdecode/HexDump.h>
#include <vtdecode/Report.h>
#include <vtdecode/Scanner.h>
#include <vtdecode/TextCoalescer.h>

#include <crispy/utils.h>

namespace vtdecode
{

std::optional<ReportMode> parseReportMode(std::string_view name)
{
    auto const lowered = crispy::toLower(name);
    if (lowered == "hex")
        return ReportMode::Hex;
    if (lowered == "decode")
        return ReportMode::Decode;
    return std::nullopt;
}

std::vector<Line> decodeLines(gsl::span<Token const> tokens)
{
    auto lines = std::vector<Line> {};
    auto text = TextCoalescer {};

    for (auto const& token: tokens)
    {
        if (auto const* t = std::get_if<Text>(&token))
        {
            text.appendText(t->raw);
            continue;
        }

        if (auto const* csi = std::get_if<CSI>(&token))
        {
            if (auto const spaces = cursorForwardCount(*csi))
            {
                text.appendSpaces(*spaces);
                continue;
            }
        }

        text.flush(lines);
        lines.emplace_back(describe(token));
    }

    text.flush(lines);
    return lines;
}

std::vector<Line> decodeLines(std::string_view data)
{
    auto const tokens = scan(data);
    return decodeLines(gsl::span<Token const>(tokens.data(), tokens.size()));
}

std::string formatDecode(std::string_view data)
{
    return join(decodeLines(data));
}

std::string formatReport(ReportMode mode, std::string_view data)
{
    switch (mode)
    {
        case ReportMode::Hex: return formatHex(data);
        case ReportMode::Decode: return formatDecode(data);
    }
    return formatHex(data);
}

} // namespace vtdecode
