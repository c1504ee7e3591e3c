// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdecode/Token.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace vtdecode
{

/// Splits a captured terminal byte stream into tokens.
///
/// The scanner recognizes text runs, C0 controls, BEL, bare escapes and the
/// CSI, OSC, DCS, PM and APC grammars. It never fails: truncated sequences
/// extend to the end of the buffer and bytes that fit no grammar become
/// ControlByte tokens. The scanned buffer must outlive the emitted tokens.
class Scanner
{
  public:
    static constexpr char ESC = '\x1b';
    static constexpr char BEL = '\x07';

    explicit Scanner(std::string_view data) noexcept: _data { data } {}

    [[nodiscard]] bool atEnd() const noexcept { return _offset >= _data.size(); }

    /// Consumes and returns the next token, or std::nullopt once the buffer is exhausted.
    std::optional<Token> next();

  private:
    Token scanEscape();
    Token scanCSI();
    Token scanOSC();
    std::string_view scanUntilStringTerminator();
    size_t scanTextRun() const noexcept;

    std::string_view consume(size_t count) noexcept;

    std::string_view _data;
    size_t _offset = 0;
};

/// Scans the whole of @p data into a token list.
std::vector<Token> scan(std::string_view data);

} // namespace vtdecode
