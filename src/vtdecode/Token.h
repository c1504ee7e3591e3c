// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/escape.h>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace vtdecode
{

// Every token refers into the scanned buffer. The raw span is exactly the bytes the
// scanner consumed for it, so concatenating all raw spans reproduces the input.

/// Printable text, possibly containing CR, LF and TAB.
struct Text
{
    std::string_view raw;
};

/// A single C0 control byte (other than BEL, ESC, CR, LF, TAB) or a byte that
/// does not start a valid UTF-8 sequence.
struct ControlByte
{
    std::string_view raw;

    [[nodiscard]] uint8_t value() const noexcept { return static_cast<uint8_t>(raw.front()); }
};

struct Bell
{
    std::string_view raw;
};

/// ESC followed by a byte that does not introduce a control sequence or string,
/// or a lone ESC at the very end of the buffer.
struct BareEscape
{
    std::string_view raw;
};

/// Control Sequence Introducer: ESC [ params final.
struct CSI
{
    std::string_view raw;
    std::string_view params;

    /// Final byte in the range 0x40..0x7E, absent if the buffer ended before it.
    std::optional<char> finalByte;
};

/// Operating System Command, terminated by BEL or ST (or the end of the buffer).
struct OSC
{
    std::string_view raw;
};

/// Device Control String, terminated by ST (or the end of the buffer).
struct DCS
{
    std::string_view raw;
};

/// Privacy Message, terminated by ST (or the end of the buffer).
struct PM
{
    std::string_view raw;
};

/// Application Program Command, terminated by ST (or the end of the buffer).
struct APC
{
    std::string_view raw;
};

using Token = std::variant<Text, ControlByte, Bell, BareEscape, CSI, OSC, DCS, PM, APC>;

[[nodiscard]] inline std::string_view rawSpan(Token const& token) noexcept
{
    return std::visit([](auto const& t) { return t.raw; }, token);
}

[[nodiscard]] std::string_view tokenKind(Token const& token) noexcept;

} // namespace vtdecode

// {{{ fmt formatter
template <>
struct fmt::formatter<vtdecode::Token>: fmt::formatter<std::string_view>
{
    auto format(vtdecode::Token const& token, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(
            ctx.out(), "{} {}", vtdecode::tokenKind(token), crispy::quoteAscii(vtdecode::rawSpan(token)));
    }
};
// }}}
