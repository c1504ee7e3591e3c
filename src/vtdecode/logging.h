// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/logstore.h>

namespace vtdecode
{

// clang-format off
inline auto scannerLog = logstore::category("vtdecode.scanner", "Logs every token emitted by the sequence scanner.");
inline auto inputLog = logstore::category("vtdecode.input", "Logs which input normalization strategy was applied.");
// clang-format on

} // namespace vtdecode
