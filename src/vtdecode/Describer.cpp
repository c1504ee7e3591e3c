// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/Describer.h>
#include <vtdecode/Tables.h>

#include <crispy/escape.h>
#include <crispy/overloaded.h>
#include <crispy/utils.h>

#include <fmt/format.h>

using namespace std::string_view_literals;

namespace vtdecode
{

namespace
{
    constexpr auto StringTerminator = "\x1b\\"sv;

    Line describeCSI(CSI const& csi)
    {
        if (!csi.finalByte)
            return Line { "CSI", crispy::quoteAscii(csi.raw) };

        auto const finalByte = *csi.finalByte;
        auto const params = csi.params;

        if (crispy::startsWith(params, "?"sv) && (finalByte == 'h' || finalByte == 'l'))
        {
            // The mode always follows a space, even when it is empty ("DEC SET ").
            auto const mode = params.substr(1);
            auto line = Line { fmt::format("DEC {} {}", finalByte == 'h' ? "SET" : "RST", mode) };
            if (auto const name = decModeName(mode))
                line.annotation = std::string(*name);
            return line;
        }

        auto line = Line { "CSI", std::string(1, finalByte) };
        if (!params.empty())
            line.payload += fmt::format(" {}", params);

        if (finalByte == 'm')
            line.annotation = describeSGR(params);
        else if (auto const name = csiCommandName(finalByte))
            line.annotation = std::string(*name);

        return line;
    }

    Line describeOSC(OSC const& osc)
    {
        if (osc.raw.size() < 3)
            return Line { "OSC", crispy::quoteAscii(osc.raw) };

        auto inner = osc.raw.substr(2);
        if (crispy::endsWith(inner, "\x07"sv))
            inner.remove_suffix(1);
        else if (crispy::endsWith(inner, StringTerminator))
            inner.remove_suffix(StringTerminator.size());

        auto const separator = inner.find(';');
        if (separator == std::string_view::npos)
            return Line { "OSC", crispy::quoteAscii(inner) };

        auto const code = inner.substr(0, separator);
        auto const data = inner.substr(separator + 1);
        return Line { "OSC", fmt::format("{} {}", code, crispy::quoteAscii(data)) };
    }

    std::string describeColor(std::string_view layer, std::string_view kind, int n)
    {
        return fmt::format("{} {} color {}", layer, kind, n);
    }
} // namespace

std::optional<SpaceCount> cursorForwardCount(CSI const& csi) noexcept
{
    if (csi.finalByte != 'C')
        return std::nullopt;

    if (csi.params.empty())
        return SpaceCount(1);

    auto const n = crispy::to_integer<int>(csi.params);
    if (!n || *n <= 0)
        return std::nullopt;

    return SpaceCount(static_cast<unsigned>(*n));
}

std::optional<std::string> describeSGR(std::string_view params)
{
    if (params.empty())
        return "reset all";

    auto const parts = crispy::split(params, ';');

    if (parts.size() >= 5 && parts[1] == "2"sv)
    {
        if (parts[0] == "38"sv)
            return fmt::format("fg rgb({},{},{})", parts[2], parts[3], parts[4]);
        if (parts[0] == "48"sv)
            return fmt::format("bg rgb({},{},{})", parts[2], parts[3], parts[4]);
    }

    if (parts.size() == 3 && parts[1] == "5"sv)
    {
        if (parts[0] == "38"sv)
            return fmt::format("fg color256({})", parts[2]);
        if (parts[0] == "48"sv)
            return fmt::format("bg color256({})", parts[2]);
    }

    if (parts.size() != 1)
        return std::nullopt;

    auto const code = crispy::to_integer<int>(parts[0]);
    if (!code)
        return std::nullopt;

    if (auto const name = sgrCodeName(*code))
        return std::string(*name);

    auto const n = *code;
    // clang-format off
    if (30 <= n && n <= 37)   return describeColor("fg", "ansi", n - 30);
    if (40 <= n && n <= 47)   return describeColor("bg", "ansi", n - 40);
    if (90 <= n && n <= 97)   return describeColor("fg", "bright", n - 90);
    if (100 <= n && n <= 107) return describeColor("bg", "bright", n - 100);
    // clang-format on

    return std::nullopt;
}

Line describe(Token const& token)
{
    // clang-format off
    return std::visit(crispy::overloaded {
        [](Text const& text) { return Line { "TXT", crispy::quote(text.raw) }; },
        [](ControlByte const& ctl) { return Line { "CTL", fmt::format("0x{:02x}", ctl.value()) }; },
        [](Bell const&) { return Line { "BEL" }; },
        [](BareEscape const& esc) {
            if (esc.raw.size() < 2)
                return Line { "ESC" };
            return Line { "ESC", crispy::quoteAscii(esc.raw) };
        },
        [](CSI const& csi) { return describeCSI(csi); },
        [](OSC const& osc) { return describeOSC(osc); },
        [](DCS const& dcs) { return Line { "DCS", crispy::quoteAscii(dcs.raw) }; },
        [](PM const& pm) { return Line { "PM", crispy::quoteAscii(pm.raw) }; },
        [](APC const& apc) { return Line { "APC", crispy::quoteAscii(apc.raw) }; },
    }, token);
    // clang-format on
}

} // namespace vtdecode
