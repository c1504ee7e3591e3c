// SPDX-License-Identifier: Apache-2.0
#include <vtdecode/Scanner.h>
#include <vtdecode/logging.h>

#include <crispy/overloaded.h>
#include <crispy/utf8.h>

namespace vtdecode
{

namespace
{
    constexpr bool isC0Control(uint8_t ch) noexcept
    {
        return ch < 0x20 || ch == 0x7F;
    }

    constexpr bool isFinalByte(uint8_t ch) noexcept
    {
        return ch >= 0x40 && ch <= 0x7E;
    }
} // namespace

std::string_view tokenKind(Token const& token) noexcept
{
    // clang-format off
    return std::visit(crispy::overloaded {
        [](Text const&) { return std::string_view("Text"); },
        [](ControlByte const&) { return std::string_view("ControlByte"); },
        [](Bell const&) { return std::string_view("Bell"); },
        [](BareEscape const&) { return std::string_view("Escape"); },
        [](CSI const&) { return std::string_view("CSI"); },
        [](OSC const&) { return std::string_view("OSC"); },
        [](DCS const&) { return std::string_view("DCS"); },
        [](PM const&) { return std::string_view("PM"); },
        [](APC const&) { return std::string_view("APC"); },
    }, token);
    // clang-format on
}

std::string_view Scanner::consume(size_t count) noexcept
{
    auto const span = _data.substr(_offset, count);
    _offset += span.size();
    return span;
}

std::optional<Token> Scanner::next()
{
    if (atEnd())
        return std::nullopt;

    auto token = [this]() -> Token {
        auto const ch = _data[_offset];

        if (ch == ESC)
            return scanEscape();

        if (ch == BEL)
            return Bell { consume(1) };

        if (auto const length = scanTextRun(); length != 0)
            return Text { consume(length) };

        return ControlByte { consume(1) };
    }();

    if (scannerLog)
        scannerLog()("{}", token);

    return token;
}

Token Scanner::scanEscape()
{
    if (_offset + 1 >= _data.size())
        return BareEscape { consume(1) };

    switch (_data[_offset + 1])
    {
        case '[': return scanCSI();
        case ']': return scanOSC();
        case 'P': return DCS { scanUntilStringTerminator() };
        case '^': return PM { scanUntilStringTerminator() };
        case '_': return APC { scanUntilStringTerminator() };
        default: return BareEscape { consume(2) };
    }
}

Token Scanner::scanCSI()
{
    auto const paramsStart = _offset + 2;
    for (auto i = paramsStart; i < _data.size(); ++i)
    {
        if (isFinalByte(static_cast<uint8_t>(_data[i])))
        {
            auto const params = _data.substr(paramsStart, i - paramsStart);
            auto const finalByte = _data[i];
            return CSI { consume(i + 1 - _offset), params, finalByte };
        }
    }

    // Unterminated: the rest of the buffer is one opaque sequence without a final byte.
    auto const params = _data.substr(paramsStart);
    return CSI { consume(_data.size() - _offset), params, std::nullopt };
}

Token Scanner::scanOSC()
{
    for (auto i = _offset + 2; i < _data.size(); ++i)
    {
        if (_data[i] == BEL)
            return OSC { consume(i + 1 - _offset) };

        if (_data[i] == ESC && i + 1 < _data.size() && _data[i + 1] == '\\')
            return OSC { consume(i + 2 - _offset) };
    }

    return OSC { consume(_data.size() - _offset) };
}

std::string_view Scanner::scanUntilStringTerminator()
{
    for (auto i = _offset + 2; i + 1 < _data.size(); ++i)
        if (_data[i] == ESC && _data[i + 1] == '\\')
            return consume(i + 2 - _offset);

    return consume(_data.size() - _offset);
}

size_t Scanner::scanTextRun() const noexcept
{
    auto i = _offset;
    while (i < _data.size())
    {
        auto const ch = static_cast<uint8_t>(_data[i]);

        if (ch == ESC || ch == BEL)
            break;

        if (ch == '\n' || ch == '\r' || ch == '\t')
        {
            ++i;
            continue;
        }

        if (isC0Control(ch))
            break;

        if (ch < 0x80)
        {
            ++i;
            continue;
        }

        auto const codepoint = crispy::decodeUtf8(_data.substr(i));
        if (!codepoint)
            break;

        i += codepoint->length;
    }
    return i - _offset;
}

std::vector<Token> scan(std::string_view data)
{
    auto tokens = std::vector<Token> {};
    auto scanner = Scanner { data };
    while (auto token = scanner.next())
        tokens.emplace_back(std::move(*token));
    return tokens;
}

} // namespace vtdecode
