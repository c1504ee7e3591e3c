// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace crispy
{

/// Overload set built from lambdas, for use with std::visit.
template <class... Ts>
struct overloaded: Ts... // NOLINT(readability-identifier-naming)
{
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace crispy
