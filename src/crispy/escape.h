// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/utf8.h>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace crispy
{

enum class quote_style : uint8_t
{
    /// Printable non-ASCII code points are kept as they are.
    Unicode,

    /// Every non-ASCII code point is written as \uXXXX or \UXXXXXXXX.
    Ascii,
};

/// Escapes a single byte the way a C string literal would.
inline std::string escape(uint8_t ch)
{
    switch (ch)
    {
        case '\a': return "\\a";
        case '\b': return "\\b";
        case '\f': return "\\f";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        case '\v': return "\\v";
        case '\\': return "\\\\";
        case '"': return "\\\"";
        default:
            if (0x20 <= ch && ch < 0x7F)
                return std::string(1, static_cast<char>(ch));
            return fmt::format("\\x{:02x}", ch);
    }
}

/// Tests whether a non-ASCII code point renders as visible text.
///
/// C1 controls, format characters (zero-width, bidi controls, BOM), line/paragraph
/// separators, private use areas and noncharacters are treated as non-printable.
constexpr bool isPrintable(char32_t codepoint) noexcept
{
    if (codepoint < 0xA0)
        return codepoint >= 0x20 && codepoint != 0x7F;
    if (codepoint == 0xAD)
        return false;
    if (codepoint >= 0x200B && codepoint <= 0x200F)
        return false;
    if (codepoint >= 0x2028 && codepoint <= 0x202E)
        return false;
    if (codepoint >= 0x2060 && codepoint <= 0x206F)
        return false;
    if (codepoint >= 0xE000 && codepoint <= 0xF8FF)
        return false;
    if (codepoint == 0xFEFF || (codepoint >= 0xFFF9 && codepoint <= 0xFFFB))
        return false;
    if ((codepoint & 0xFFFE) == 0xFFFE)
        return false;
    if (codepoint >= 0xF0000)
        return false;
    return true;
}

/// Renders @p text as a double-quoted, debug-safe string literal.
///
/// Quotes and backslashes are escaped, control bytes use their C escape or \xhh,
/// bytes that are not part of a valid UTF-8 sequence become \xhh, and non-ASCII
/// code points are either kept or escaped depending on @p style.
/// The original bytes can always be recovered from the result.
inline std::string quote(std::string_view text, quote_style style = quote_style::Unicode)
{
    auto result = std::string {};
    result.reserve(text.size() + 2);
    result += '"';

    while (!text.empty())
    {
        auto const lead = static_cast<uint8_t>(text.front());
        if (lead < 0x80)
        {
            result += escape(lead);
            text.remove_prefix(1);
            continue;
        }

        auto const decoded = decodeUtf8(text);
        if (!decoded)
        {
            result += fmt::format("\\x{:02x}", lead);
            text.remove_prefix(1);
            continue;
        }

        if (style == quote_style::Unicode && isPrintable(decoded->value))
            result += text.substr(0, decoded->length);
        else if (decoded->value <= 0xFFFF)
            result += fmt::format("\\u{:04x}", static_cast<uint32_t>(decoded->value));
        else
            result += fmt::format("\\U{:08x}", static_cast<uint32_t>(decoded->value));

        text.remove_prefix(decoded->length);
    }

    result += '"';
    return result;
}

inline std::string quoteAscii(std::string_view text)
{
    return quote(text, quote_style::Ascii);
}

} // namespace crispy
