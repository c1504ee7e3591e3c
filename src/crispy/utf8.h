// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <libunicode/utf8.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace crispy
{

struct utf8_codepoint
{
    char32_t value;
    size_t length;
};

/// Decodes exactly one UTF-8 encoded code point from the front of @p text.
///
/// Stricter than the incremental decoder it builds upon: continuation bytes must be
/// well-formed, and overlong encodings, UTF-16 surrogates and values above U+10FFFF
/// are rejected.
///
/// @returns the code point and its encoded length, or std::nullopt if @p text does not
///          start with a complete and valid UTF-8 sequence.
inline std::optional<utf8_codepoint> decodeUtf8(std::string_view text) noexcept
{
    auto state = unicode::utf8_decoder_state {};
    for (size_t i = 0; i < text.size() && i < 4; ++i)
    {
        auto const byte = static_cast<uint8_t>(text[i]);
        if (i != 0 && (byte & 0xC0) != 0x80)
            return std::nullopt;

        unicode::ConvertResult const r = unicode::from_utf8(state, byte);
        if (std::holds_alternative<unicode::Incomplete>(r))
            continue;
        if (!std::holds_alternative<unicode::Success>(r))
            return std::nullopt;

        auto const value = std::get<unicode::Success>(r).value;
        auto const length = i + 1;
        auto constexpr MinimumForLength = std::array<char32_t, 5> { 0, 0, 0x80, 0x800, 0x10000 };
        if (value < MinimumForLength[length])
            return std::nullopt;
        if (value >= 0xD800 && value <= 0xDFFF)
            return std::nullopt;
        if (value > 0x10FFFF)
            return std::nullopt;
        return utf8_codepoint { value, length };
    }
    return std::nullopt;
}

} // namespace crispy
