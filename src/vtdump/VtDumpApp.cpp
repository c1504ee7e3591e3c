// SPDX-License-Identifier: Apache-2.0
#include <vtdump/CaptureSource.h>
#include <vtdump/VtDumpApp.h>

#include <vtdecode/InputNormalizer.h>
#include <vtdecode/Report.h>

#include <crispy/CLI.h>
#include <crispy/logstore.h>

#include <cstdlib>
#include <iostream>

using namespace std::string_literals;

namespace CLI = crispy::cli;

namespace vtdump
{

void dump(Config const& config, std::istream& standardInput, std::ostream& output)
{
    if (!config.log.empty())
        logstore::configure(config.log);

    auto const mode = reportMode(config);
    auto source = createCaptureSource(config, standardInput);
    auto const captured = source->read();
    auto const data = vtdecode::normalizeInput(captured);

    output << vtdecode::formatReport(mode, data);
    output.flush();
}

VtDumpApp::VtDumpApp(): app("vtdump", "vtdump", VTDUMP_VERSION_STRING, "Apache-2.0")
{
    registerProject(project { "fmt", "MIT", "https://github.com/fmtlib/fmt" });
    registerProject(project { "libunicode", "Apache-2.0", "https://github.com/contour-terminal/libunicode" });
    registerProject(project { "range-v3", "Boost Software License 1.0", "https://github.com/ericniebler/range-v3" });
    registerProject(project { "yaml-cpp", "MIT", "https://github.com/jbeder/yaml-cpp" });
    registerProject(project { "GSL", "MIT", "https://github.com/microsoft/GSL" });
    registerProject(project { "boxed-cpp", "Apache-2.0", "https://github.com/contour-terminal/boxed-cpp" });
    registerProject(project { "nlohmann/json", "MIT", "https://github.com/nlohmann/json" });

    link("vtdump.dump", [this]() { return dumpAction(); });
}

int VtDumpApp::dumpAction()
{
    auto const config = loadConfig(parameters(), "vtdump.dump");
    dump(config, std::cin, std::cout);
    return EXIT_SUCCESS;
}

crispy::cli::command VtDumpApp::parameterDefinition() const
{
    // NOLINTBEGIN
    return CLI::command {
        "vtdump",
        "Terminal output inspector " VTDUMP_VERSION_STRING,
        CLI::option_list {},
        CLI::command_list {
            CLI::command { "help", "Shows this help and exits." },
            CLI::command { "version", "Shows the version and exits." },
            CLI::command { "license", "Shows the license, and project URL of the used projects and exits." },
            CLI::command { "list-debug-tags", "Lists all available debug tags and exits." },
            CLI::command {
                "dump",
                "Reports the captured terminal output bytes, either as hex dump or decoded into text and "
                "control sequences.",
                CLI::option_list {
                    CLI::option { { 'm', "mode" }, CLI::value { "hex"s }, "Output mode: hex or decode.", "MODE" },
                    CLI::option { { 's', "size" },
                                  CLI::value { 1000 },
                                  "Number of trailing bytes to read from the capture target.",
                                  "COUNT" },
                    CLI::option { "stdin", CLI::value { false }, "Reads the input from standard input." },
                    CLI::option { { 'i', "input" },
                                  CLI::value { ""s },
                                  "Reads the input from the given file instead of the capture target.",
                                  "FILE" },
                    CLI::option { { 't', "target" },
                                  CLI::value { ""s },
                                  "Capture target, a file the terminal session's output is written to.",
                                  "FILE" },
                    CLI::option { { 'c', "config" },
                                  CLI::value { ""s },
                                  "Configuration file to load instead of the default one.",
                                  "FILE" },
                    CLI::option { "log", CLI::value { ""s }, "Enables the given debug tags, e.g. vtdecode.*", "TAGS" },
                },
                CLI::command_list {},
                CLI::command_select::Implicit },
        }
    };
    // NOLINTEND
}

} // namespace vtdump
