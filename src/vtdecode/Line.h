// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vtdecode
{

/// One line of the decode report, such as `CSI m 31 // fg ansi color 1`.
struct Line
{
    std::string tag;
    std::string payload {};
    std::optional<std::string> annotation {};

    [[nodiscard]] std::string str() const
    {
        auto result = tag;
        if (!payload.empty())
        {
            result += ' ';
            result += payload;
        }
        if (annotation)
        {
            result += " // ";
            result += *annotation;
        }
        return result;
    }

    bool operator==(Line const&) const = default;
};

/// Joins @p lines with newlines. The result ends with a newline unless @p lines is empty.
inline std::string join(std::vector<Line> const& lines)
{
    auto result = std::string {};
    for (auto const& line: lines)
    {
        result += line.str();
        result += '\n';
    }
    return result;
}

} // namespace vtdecode
