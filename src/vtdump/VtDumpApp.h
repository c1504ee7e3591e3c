// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdump/Config.h>

#include <crispy/App.h>

#include <iosfwd>

namespace vtdump
{

/// Reads the configured capture, normalizes it and writes the report to @p output.
///
/// The report mode is validated before any input is read.
///
/// @throws ConfigError, InputError
void dump(Config const& config, std::istream& standardInput, std::ostream& output);

/// vtdump command line application.
class VtDumpApp: public crispy::app
{
  public:
    VtDumpApp();

    [[nodiscard]] crispy::cli::command parameterDefinition() const override;

  private:
    int dumpAction();
};

} // namespace vtdump
