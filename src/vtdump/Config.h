// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdecode/Report.h>

#include <crispy/CLI.h>
#include <crispy/logstore.h>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vtdump
{

namespace fs = std::filesystem;

/// Raised for invalid settings, malformed configuration files or a missing capture target.
class ConfigError: public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

inline auto configLog = logstore::category("vtdump.config", "Logs configuration file loading.");

struct Config
{
    /// Report mode as given by the user. Validated by reportMode().
    std::string mode = "hex";

    /// Number of trailing bytes to read from the capture target.
    int size = 1000;

    bool fromStdin = false;
    std::string inputFile {};
    std::string target {};

    /// Logging filter, e.g. "vtdecode.*".
    std::string log {};

    /// Configuration file the settings were loaded from, if any.
    std::optional<fs::path> configFile {};
};

fs::path configHome(std::string const& programName);
fs::path defaultConfigFilePath();

/// Applies the entries of a parsed YAML document to @p config.
///
/// @throws ConfigError if an entry has the wrong type.
void loadConfigFromYAML(Config& config, YAML::Node const& document);

/// Loads the YAML configuration file @p fileName into @p config.
///
/// @throws ConfigError if the file cannot be read or is malformed.
void loadConfigFromFile(Config& config, fs::path const& fileName);

/// Builds the effective configuration of the "dump" command.
///
/// Built-in defaults are overridden by the configuration file, which in turn is
/// overridden by every option explicitly given on the command line. A missing
/// default configuration file is skipped; a missing file given via --config is an error.
///
/// @param flags   parsed command line
/// @param prefix  fully qualified name of the dump command, e.g. "vtdump.dump"
Config loadConfig(crispy::cli::flag_store const& flags, std::string const& prefix);

/// Returns the validated report mode.
///
/// @throws ConfigError if the mode is neither "hex" nor "decode" (case-insensitive).
vtdecode::ReportMode reportMode(Config const& config);

} // namespace vtdump
