// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace vtdecode
{

struct CSICommandDef
{
    char finalByte;
    std::string_view name;
};

struct DECModeDef
{
    std::string_view mode;
    std::string_view name;
};

struct SGRCodeDef
{
    int code;
    std::string_view name;
};

// {{{ tables
// clang-format off
namespace tables
{

constexpr inline auto CSICommands = std::array {
    CSICommandDef { .finalByte = '@', .name = "insert character" },
    CSICommandDef { .finalByte = 'A', .name = "cursor up" },
    CSICommandDef { .finalByte = 'B', .name = "cursor down" },
    CSICommandDef { .finalByte = 'C', .name = "cursor forward" },
    CSICommandDef { .finalByte = 'D', .name = "cursor back" },
    CSICommandDef { .finalByte = 'E', .name = "cursor next line" },
    CSICommandDef { .finalByte = 'F', .name = "cursor prev line" },
    CSICommandDef { .finalByte = 'G', .name = "cursor horizontal absolute" },
    CSICommandDef { .finalByte = 'H', .name = "cursor position" },
    CSICommandDef { .finalByte = 'I', .name = "cursor horizontal tab" },
    CSICommandDef { .finalByte = 'J', .name = "erase display" },
    CSICommandDef { .finalByte = 'K', .name = "erase line" },
    CSICommandDef { .finalByte = 'L', .name = "insert line" },
    CSICommandDef { .finalByte = 'M', .name = "delete line" },
    CSICommandDef { .finalByte = 'P', .name = "delete character" },
    CSICommandDef { .finalByte = 'S', .name = "scroll up" },
    CSICommandDef { .finalByte = 'T', .name = "scroll down" },
    CSICommandDef { .finalByte = 'X', .name = "erase character" },
    CSICommandDef { .finalByte = 'Z', .name = "cursor backward tab" },
    CSICommandDef { .finalByte = 'a', .name = "cursor horizontal relative" },
    CSICommandDef { .finalByte = 'b', .name = "repeat character" },
    CSICommandDef { .finalByte = 'c', .name = "device attributes" },
    CSICommandDef { .finalByte = 'd', .name = "cursor vertical absolute" },
    CSICommandDef { .finalByte = 'e', .name = "cursor vertical relative" },
    CSICommandDef { .finalByte = 'f', .name = "horizontal vertical position" },
    CSICommandDef { .finalByte = 'g', .name = "tab clear" },
    CSICommandDef { .finalByte = 'h', .name = "set mode" },
    CSICommandDef { .finalByte = 'l', .name = "reset mode" },
    CSICommandDef { .finalByte = 'm', .name = "SGR" },
    CSICommandDef { .finalByte = 'n', .name = "device status report" },
    CSICommandDef { .finalByte = 'r', .name = "set scrolling region" },
    CSICommandDef { .finalByte = 's', .name = "save cursor" },
    CSICommandDef { .finalByte = 'u', .name = "restore cursor" },
};

constexpr inline auto DECModes = std::array {
    DECModeDef { .mode = "1",    .name = "application cursor keys" },
    DECModeDef { .mode = "3",    .name = "132 column mode" },
    DECModeDef { .mode = "6",    .name = "origin mode" },
    DECModeDef { .mode = "7",    .name = "auto wrap" },
    DECModeDef { .mode = "12",   .name = "blinking cursor" },
    DECModeDef { .mode = "25",   .name = "show cursor" },
    DECModeDef { .mode = "47",   .name = "alternate screen" },
    DECModeDef { .mode = "1000", .name = "mouse X10 tracking" },
    DECModeDef { .mode = "1002", .name = "mouse button events" },
    DECModeDef { .mode = "1003", .name = "mouse all events" },
    DECModeDef { .mode = "1004", .name = "focus events" },
    DECModeDef { .mode = "1006", .name = "SGR mouse mode" },
    DECModeDef { .mode = "1049", .name = "alt screen + save cursor" },
    DECModeDef { .mode = "2004", .name = "bracketed paste" },
    DECModeDef { .mode = "2026", .name = "synchronized output" },
};

constexpr inline auto SGRCodes = std::array {
    SGRCodeDef { .code = 0,  .name = "reset all" },
    SGRCodeDef { .code = 1,  .name = "bold" },
    SGRCodeDef { .code = 2,  .name = "dim" },
    SGRCodeDef { .code = 3,  .name = "italic" },
    SGRCodeDef { .code = 4,  .name = "underline" },
    SGRCodeDef { .code = 5,  .name = "blink" },
    SGRCodeDef { .code = 7,  .name = "reverse" },
    SGRCodeDef { .code = 8,  .name = "hidden" },
    SGRCodeDef { .code = 9,  .name = "strikethrough" },
    SGRCodeDef { .code = 21, .name = "doubly underlined" },
    SGRCodeDef { .code = 22, .name = "normal intensity" },
    SGRCodeDef { .code = 23, .name = "not italic" },
    SGRCodeDef { .code = 24, .name = "not underlined" },
    SGRCodeDef { .code = 25, .name = "not blinking" },
    SGRCodeDef { .code = 27, .name = "not reversed" },
    SGRCodeDef { .code = 28, .name = "not hidden" },
    SGRCodeDef { .code = 29, .name = "not strikethrough" },
    SGRCodeDef { .code = 39, .name = "default fg" },
    SGRCodeDef { .code = 49, .name = "default bg" },
};

} // namespace tables
// clang-format on
// }}}

/// Returns the command name for the CSI final byte @p finalByte, if known.
std::optional<std::string_view> csiCommandName(char finalByte) noexcept;

/// Returns the name of the DEC private mode @p mode (without the leading '?'), if known.
std::optional<std::string_view> decModeName(std::string_view mode) noexcept;

/// Returns the name of the single SGR code @p code, if it has one.
std::optional<std::string_view> sgrCodeName(int code) noexcept;

} // namespace vtdecode
