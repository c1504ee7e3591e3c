// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/Tables.h>

#include <algorithm>

namespace vtdecode
{

namespace
{
    template <typename Table, typename Predicate>
    std::optional<std::string_view> lookup(Table const& table, Predicate const& predicate) noexcept
    {
        auto const i = std::find_if(table.begin(), table.end(), predicate);
        if (i == table.end())
            return std::nullopt;
        return i->name;
    }
} // namespace

std::optional<std::string_view> csiCommandName(char finalByte) noexcept
{
    return lookup(tables::CSICommands, [=](auto const& def) { return def.finalByte == finalByte; });
}

std::optional<std::string_view> decModeName(std::string_view mode) noexcept
{
    return lookup(tables::DECModes, [=](auto const& def) { return def.mode == mode; });
}

std::optional<std::string_view> sgrCodeName(int code) noexcept
{
    return lookup(tables::SGRCodes, [=](auto const& def) { return def.code == code; });
}

} // namespace vtdecode
