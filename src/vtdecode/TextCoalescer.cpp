// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/TextCoalescer.h>

#include <crispy/escape.h>

#include <fmt/format.h>

#include <range/v3/view/enumerate.hpp>

namespace vtdecode
{

namespace
{
    constexpr bool isLineBreak(char ch) noexcept
    {
        return ch == '\r' || ch == '\n';
    }
} // namespace

std::vector<std::string_view> splitOnLineBreakRuns(std::string_view text)
{
    auto segments = std::vector<std::string_view> {};
    auto start = size_t { 0 };
    auto i = size_t { 0 };
    while (i < text.size())
    {
        if (!isLineBreak(text[i]))
        {
            ++i;
            continue;
        }

        while (i < text.size() && isLineBreak(text[i]))
            ++i;

        segments.emplace_back(text.substr(start, i - start));
        start = i;
    }

    if (start < text.size())
        segments.emplace_back(text.substr(start));

    return segments;
}

void TextCoalescer::appendText(std::string_view text)
{
    _pendingText += text;
}

void TextCoalescer::appendSpaces(SpaceCount count)
{
    _pendingText.append(unbox<size_t>(count), ' ');
    _pendingSpaceCount += unbox<unsigned>(count);
}

void TextCoalescer::flush(std::vector<Line>& output)
{
    if (empty())
        return;

    auto const segments = splitOnLineBreakRuns(_pendingText);
    for (auto const&& [index, segment]: ranges::views::enumerate(segments))
    {
        auto line = Line { "TXT", crispy::quote(segment) };
        if (index + 1 == segments.size() && _pendingSpaceCount > 0)
            line.annotation = fmt::format("{}C", _pendingSpaceCount);
        output.emplace_back(std::move(line));
    }

    _pendingText.clear();
    _pendingSpaceCount = 0;
}

} // namespace vtdecode
