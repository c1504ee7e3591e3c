// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/CLI.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crispy
{

/// General purpose Application main with CLI parameter handling and stuff.
///
/// Subclasses provide the command syntax and link a handler to each command's
/// fully qualified name (e.g. "vtdump.dump"). The built-in commands "help",
/// "version", "license" and "list-debug-tags" are linked automatically when
/// the syntax declares them.
class app
{
  public:
    struct project
    {
        std::string_view title;
        std::string_view license;
        std::string_view url;
    };

    app(std::string appName, std::string appTitle, std::string appVersion, std::string appLicense);
    virtual ~app();

    app(app const&) = delete;
    app& operator=(app const&) = delete;

    [[nodiscard]] virtual cli::command parameterDefinition() const = 0;
    [[nodiscard]] cli::flag_store const& parameters() const { return _flags.value(); }

    void link(std::string command, std::function<int()> handler);

    /// Registers a third party project to be listed by the "license" command.
    void registerProject(project p) { _projects.emplace_back(p); }

    virtual int run(int argc, char const* argv[]);

    /// Applies the LOG environment variable to the logging categories.
    static void basicSetup();

  private:
    int versionAction();
    int licenseAction();
    int helpAction();
    int listDebugTagsAction();

    std::string _appName;
    std::string _appTitle;
    std::string _appVersion;
    std::string _appLicense;
    std::optional<cli::command> _syntax;
    std::optional<cli::flag_store> _flags;
    std::map<std::string, std::function<int()>> _handlers;
    std::vector<project> _projects;
};

} // namespace crispy
