// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdecode/Line.h>
#include <vtdecode/primitives.h>

#include <string>
#include <string_view>
#include <vector>

namespace vtdecode
{

/// Splits @p text right after every maximal run of CR and LF characters.
///
/// Each segment keeps its trailing CR/LF run; the last segment may have none.
/// An empty input yields no segments.
std::vector<std::string_view> splitOnLineBreakRuns(std::string_view text);

/// Accumulates text and cursor-forward shorthands into one logical text run.
///
/// A run such as `hi CSI 1 C world` reads as "hi world" with one collapsed
/// column; flushing turns it into TXT lines split at line breaks, the last one
/// annotated with the total number of collapsed columns (e.g. `// 4C`).
class TextCoalescer
{
  public:
    void appendText(std::string_view text);
    void appendSpaces(SpaceCount count);

    [[nodiscard]] bool empty() const noexcept { return _pendingText.empty() && _pendingSpaceCount == 0; }

    /// Appends the pending run to @p output and resets the accumulator.
    /// Does nothing if nothing is pending.
    void flush(std::vector<Line>& output);

  private:
    std::string _pendingText;
    unsigned _pendingSpaceCount = 0;
};

} // namespace vtdecode
