// SPDX-License-Identifier: Apache-2.0
#include <vtdump/Config.h>

#include <fmt/format.h>

#include <cstdlib>
#include <system_error>

#if !defined(_WIN32)
    #include <pwd.h>
    #include <unistd.h>
#endif

using std::string;

namespace vtdump
{

namespace
{
    fs::path homeDirectory()
    {
        if (auto const* home = getenv("HOME"); home && *home)
            return fs::path { home };

#if !defined(_WIN32)
        if (passwd const* pw = getpwuid(getuid()); pw && pw->pw_dir)
            return fs::path { pw->pw_dir };
#endif

        return fs::current_path();
    }

    struct YAMLConfigReader
    {
        YAML::Node const& doc;
        logstore::category const& logger;

        template <typename T>
        void loadFromEntry(std::string const& entry, T& where)
        {
            auto const child = doc[entry];
            if (!child)
                return;

            try
            {
                where = child.as<T>();
            }
            catch (YAML::Exception const& e)
            {
                throw ConfigError(fmt::format("Invalid value for configuration entry \"{}\". {}", entry, e.what()));
            }
            logger()("Loading entry: {}, value {}", entry, where);
        }
    };
} // namespace

fs::path configHome(string const& programName)
{
    if (auto const* value = getenv("XDG_CONFIG_HOME"); value && *value)
        return fs::path { value } / programName;

    return homeDirectory() / ".config" / programName;
}

fs::path defaultConfigFilePath()
{
    return configHome("vtdump") / "vtdump.yml";
}

void loadConfigFromYAML(Config& config, YAML::Node const& document)
{
    if (!document || document.IsNull())
        return;

    if (!document.IsMap())
        throw ConfigError("Configuration document must be a mapping.");

    auto reader = YAMLConfigReader { document, configLog };
    reader.loadFromEntry("mode", config.mode);
    reader.loadFromEntry("size", config.size);
    reader.loadFromEntry("target", config.target);
    reader.loadFromEntry("log", config.log);
}

void loadConfigFromFile(Config& config, fs::path const& fileName)
{
    configLog()("Loading configuration from file: {}", fileName.string());

    auto document = YAML::Node {};
    try
    {
        document = YAML::LoadFile(fileName.string());
    }
    catch (YAML::BadFile const&)
    {
        throw ConfigError(fmt::format("Could not read configuration file: {}", fileName.string()));
    }
    catch (YAML::Exception const& e)
    {
        throw ConfigError(fmt::format("Configuration file {} is malformed. {}", fileName.string(), e.what()));
    }

    loadConfigFromYAML(config, document);
    config.configFile = fileName;
}

Config loadConfig(crispy::cli::flag_store const& flags, string const& prefix)
{
    auto const key = [&](std::string_view name) {
        return fmt::format("{}.{}", prefix, name);
    };

    auto config = Config {};

    if (flags.isExplicit(key("config")))
    {
        loadConfigFromFile(config, fs::path { flags.str(key("config")) });
    }
    else
    {
        auto const defaultPath = defaultConfigFilePath();
        auto ec = std::error_code {};
        if (fs::exists(defaultPath, ec))
            loadConfigFromFile(config, defaultPath);
        else
            configLog()("No configuration file at {}, using defaults.", defaultPath.string());
    }

    if (flags.isExplicit(key("mode")))
        config.mode = flags.str(key("mode"));
    if (flags.isExplicit(key("size")))
        config.size = flags.integer(key("size"));
    if (flags.isExplicit(key("target")))
        config.target = flags.str(key("target"));
    if (flags.isExplicit(key("log")))
        config.log = flags.str(key("log"));
    if (flags.isExplicit(key("input")))
        config.inputFile = flags.str(key("input"));
    if (flags.contains(key("stdin")))
        config.fromStdin = flags.boolean(key("stdin"));

    configLog()("Effective configuration: mode={}, size={}, stdin={}, input=\"{}\", target=\"{}\"",
                config.mode,
                config.size,
                config.fromStdin,
                config.inputFile,
                config.target);

    return config;
}

vtdecode::ReportMode reportMode(Config const& config)
{
    if (auto const mode = vtdecode::parseReportMode(config.mode))
        return *mode;

    throw ConfigError(fmt::format("Invalid mode \"{}\" (expected \"hex\" or \"decode\").", config.mode));
}

} // namespace vtdump
