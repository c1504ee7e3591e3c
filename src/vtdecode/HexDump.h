// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace vtdecode
{

/// Renders @p data in the canonical hex+ASCII layout, 16 bytes per row:
///
/// @code
/// 00000000  61 62 63 0a                                       |abc.|
/// @endcode
///
/// Every row ends with a newline. An empty buffer renders as an empty string.
std::string formatHex(std::string_view data);

} // namespace vtdecode
