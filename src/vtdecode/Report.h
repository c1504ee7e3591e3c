// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdecode/Line.h>
#include <vtdecode/Token.h>

#include <fmt/format.h>

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vtdecode
{

enum class ReportMode : uint8_t
{
    Hex,
    Decode,
};

/// Parses a report mode name case-insensitively ("hex" or "decode").
[[nodiscard]] std::optional<ReportMode> parseReportMode(std::string_view name);

/// Turns a token stream into report lines, coalescing text and cursor-forward shorthands.
[[nodiscard]] std::vector<Line> decodeLines(gsl::span<Token const> tokens);

/// Scans @p data and turns it into report lines.
[[nodiscard]] std::vector<Line> decodeLines(std::string_view data);

/// Renders the decode report of @p data: one line per token or text run,
/// newline-terminated, or an empty string for empty input.
[[nodiscard]] std::string formatDecode(std::string_view data);

[[nodiscard]] std::string formatReport(ReportMode mode, std::string_view data);

} // namespace vtdecode

template <>
struct fmt::formatter<vtdecode::ReportMode>: fmt::formatter<std::string_view>
{
    auto format(vtdecode::ReportMode mode, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (mode)
        {
            case vtdecode::ReportMode::Hex: name = "hex"; break;
            case vtdecode::ReportMode::Decode: name = "decode"; break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
