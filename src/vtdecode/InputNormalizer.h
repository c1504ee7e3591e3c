// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gsl/span>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vtdecode
{

/// One way of turning captured input into the canonical byte buffer.
struct NormalizationStrategy
{
    std::string_view name;

    /// Returns the canonical bytes, or std::nullopt if the input does not have this shape.
    std::function<std::optional<std::string>(std::string_view)> apply;
};

/// The ordered strategies used by normalizeInput():
///
/// 1. a JSON array of objects, concatenating their "data" strings,
/// 2. a JSON array of strings, concatenating them,
/// 3. the input unchanged.
std::vector<NormalizationStrategy> const& defaultNormalizationStrategies();

/// Applies the first matching strategy to @p data.
///
/// Input that is blank or does not start with '[' (after trimming whitespace)
/// is returned as is. If no strategy matches, the input is returned unchanged.
std::string normalizeInput(std::string_view data, gsl::span<NormalizationStrategy const> strategies);

std::string normalizeInput(std::string_view data);

} // namespace vtdecode
