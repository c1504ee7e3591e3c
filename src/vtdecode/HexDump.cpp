// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/HexDump.h>
#include <vtdecode/primitives.h>

#include <fmt/format.h>

#include <range/v3/view/chunk.hpp>
#include <range/v3/view/enumerate.hpp>

#include <iterator>

namespace vtdecode
{

namespace
{
    constexpr size_t BytesPerRow = 16;

    constexpr char printableOrDot(uint8_t byte) noexcept
    {
        return (0x20 <= byte && byte <= 0x7E) ? static_cast<char>(byte) : '.';
    }

    template <typename Bytes>
    void formatRow(std::string& output, ByteOffset offset, Bytes bytes)
    {
        auto out = std::back_inserter(output);
        fmt::format_to(out, "{:08x}  ", unbox<size_t>(offset));

        auto column = size_t { 0 };
        for (auto const ch: bytes)
        {
            fmt::format_to(out, "{:02x} ", static_cast<uint8_t>(ch));
            if (column++ == 7)
                output += ' ';
        }

        // Pad a short last row so the ASCII gutter stays aligned.
        for (; column < BytesPerRow; ++column)
        {
            output += "   ";
            if (column == 7)
                output += ' ';
        }

        output += " |";
        for (auto const ch: bytes)
            output += printableOrDot(static_cast<uint8_t>(ch));
        output += "|\n";
    }
} // namespace

std::string formatHex(std::string_view data)
{
    auto output = std::string {};
    for (auto const&& [row, bytes]: ranges::views::enumerate(data | ranges::views::chunk(BytesPerRow)))
    {
        auto const offset = ByteOffset(row * BytesPerRow);
        formatRow(output, offset, bytes);
    }
    return output;
}

} // namespace vtdecode
