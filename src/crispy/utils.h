// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace crispy
{

template <typename T, typename Callback>
constexpr inline bool split(std::basic_string_view<T> text, T delimiter, Callback const& callback)
{
    size_t a = 0;
    size_t b = 0;
    while ((b = text.find(delimiter, a)) != std::basic_string_view<T>::npos)
    {
        if (!(callback(text.substr(a, b - a))))
            return false;

        a = b + 1;
    }

    return callback(text.substr(a));
}

/// Splits @p text at every @p delimiter.
///
/// Empty fields are preserved, so splitting "a;;b" yields three elements and
/// splitting an empty string yields a single empty element.
template <typename T>
inline auto split(std::basic_string_view<T> text, T delimiter) -> std::vector<std::basic_string_view<T>>
{
    std::vector<std::basic_string_view<T>> output {};
    split(text, delimiter, [&](auto value) {
        output.emplace_back(value);
        return true;
    });
    return output;
}

template <typename T>
inline auto split(std::basic_string<T> const& text, T delimiter) -> std::vector<std::basic_string_view<T>>
{
    return split(std::basic_string_view<T>(text), delimiter);
}

template <typename Ch>
constexpr bool startsWith(std::basic_string_view<Ch> text, std::basic_string_view<Ch> prefix) noexcept
{
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

template <typename Ch>
constexpr bool endsWith(std::basic_string_view<Ch> text, std::basic_string_view<Ch> suffix) noexcept
{
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

constexpr bool isSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

/// Returns @p text without leading and trailing ASCII whitespace.
constexpr std::string_view trimmed(std::string_view text) noexcept
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// Parses a base-10 integer with an optional leading sign.
///
/// @returns the parsed value or std::nullopt if @p text is empty, contains anything
///          but digits after the sign, or does not fit into @p T.
template <typename T = int>
constexpr std::optional<T> to_integer(std::string_view text) noexcept
{
    static_assert(std::is_integral_v<T> && std::is_signed_v<T>, "T must be a signed integral type.");
    static_assert(sizeof(T) < sizeof(long long), "T must be narrower than long long.");

    auto negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    if (text.empty())
        return std::nullopt;

    using Wide = long long;
    auto value = Wide { 0 };
    for (auto const ch: text)
    {
        if (ch < '0' || ch > '9')
            return std::nullopt;
        value = value * 10 + (ch - '0');
        if (value > static_cast<Wide>(std::numeric_limits<T>::max()) + 1)
            return std::nullopt;
    }

    if (negative)
        value = -value;

    if (value < static_cast<Wide>(std::numeric_limits<T>::min())
        || value > static_cast<Wide>(std::numeric_limits<T>::max()))
        return std::nullopt;

    return static_cast<T>(value);
}

template <typename T>
inline std::basic_string<T> toLower(std::basic_string_view<T> value)
{
    std::basic_string<T> result;
    result.reserve(value.size());
    std::transform(begin(value), end(value), back_inserter(result), [](auto ch) {
        return static_cast<T>(std::tolower(static_cast<unsigned char>(ch)));
    });
    return result;
}

template <typename T>
inline std::basic_string<T> toLower(std::basic_string<T> const& value)
{
    return toLower<T>(std::basic_string_view<T>(value));
}

} // namespace crispy
