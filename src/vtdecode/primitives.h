// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boxed-cpp/boxed.hpp>

#include <cstddef>

namespace vtdecode
{

// {{{ type tags
namespace detail::tags
{
    // clang-format off
    struct SpaceCount {};
    struct ByteOffset {};
    // clang-format on
} // namespace detail::tags
// }}}

/// Number of blank columns a cursor-forward sequence moves over.
using SpaceCount = boxed::boxed<unsigned, detail::tags::SpaceCount>;

/// Offset of a byte relative to the start of the decoded buffer.
using ByteOffset = boxed::boxed<size_t, detail::tags::ByteOffset>;

} // namespace vtdecode
