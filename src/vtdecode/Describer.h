// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdecode/Line.h>
#include <vtdecode/Token.h>
#include <vtdecode/primitives.h>

#include <optional>
#include <string>
#include <string_view>

namespace vtdecode
{

/// Recognizes `CSI <n> C` used as a shorthand for @c n blank columns.
///
/// Empty parameters count as one column. Parameters that are not a single
/// base-10 integer, or that are not positive, do not form a shorthand.
[[nodiscard]] std::optional<SpaceCount> cursorForwardCount(CSI const& csi) noexcept;

/// Describes an SGR parameter string, e.g. "38;5;208" becomes "fg color256(208)".
///
/// @returns std::nullopt for parameter combinations without a description.
[[nodiscard]] std::optional<std::string> describeSGR(std::string_view params);

/// Renders a single token as a report line.
///
/// Text tokens are rendered as one unsplit TXT line; the report coalesces
/// text through the TextCoalescer instead.
[[nodiscard]] Line describe(Token const& token);

} // namespace vtdecode
