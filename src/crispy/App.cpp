// SPDX-License-Identifier: Apache-2.0
#include <crispy/App.h>
#include <crispy/logstore.h>
#include <crispy/utils.h>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <numeric>

#if !defined(_WIN32)
    #include <sys/ioctl.h>

    #include <unistd.h>
#endif

using std::cout;
using std::exception;
using std::left;
using std::max;
using std::setw;
using std::string;

namespace CLI = crispy::cli;

namespace
{
unsigned screenWidth()
{
    constexpr auto DefaultWidth = 80u;

#if !defined(_WIN32)
    auto ws = winsize {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != -1 && ws.ws_col != 0)
        return ws.ws_col;
#endif

    return DefaultWidth;
}
} // namespace

namespace crispy
{

app::app(std::string appName, std::string appTitle, std::string appVersion, std::string appLicense):
    _appName { std::move(appName) },
    _appTitle { std::move(appTitle) },
    _appVersion { std::move(appVersion) },
    _appLicense { std::move(appLicense) }
{
    basicSetup();

    link(_appName + ".help", [this]() { return helpAction(); });
    link(_appName + ".version", [this]() { return versionAction(); });
    link(_appName + ".license", [this]() { return licenseAction(); });
    link(_appName + ".list-debug-tags", [this]() { return listDebugTagsAction(); });
}

app::~app() = default;

void app::basicSetup()
{
    if (char const* logFilterString = getenv("LOG"); logFilterString && *logFilterString)
        logstore::configure(logFilterString);
}

void app::link(std::string command, std::function<int()> handler)
{
    _handlers[std::move(command)] = std::move(handler);
}

int app::listDebugTagsAction()
{
    auto categories = logstore::get();
    std::sort(begin(categories), end(categories), [](auto const& a, auto const& b) {
        return a.get().name() < b.get().name();
    });

    auto const maxNameLength =
        std::accumulate(begin(categories), end(categories), size_t { 0 }, [](auto acc, auto const& cat) {
            return max(acc, cat.get().name().size());
        });
    auto const column1Length = maxNameLength + 2;

    for (auto const& category: categories)
        cout << left << setw(static_cast<int>(column1Length)) << category.get().name() << "; "
             << category.get().description() << '\n';
    return EXIT_SUCCESS;
}

int app::helpAction()
{
    cout << CLI::helpText(_syntax.value(), screenWidth());
    return EXIT_SUCCESS;
}

int app::licenseAction()
{
    auto const titleWidth = std::accumulate(
        _projects.begin(), _projects.end(), size_t { 7 }, [](size_t a, auto const& b) { return max(a, b.title.size()); });
    auto const licenseWidth = std::accumulate(_projects.begin(), _projects.end(), size_t { 7 }, [](size_t a, auto const& b) {
        return max(a, b.license.size());
    });

    cout << '\n'
         << _appTitle << ' ' << _appVersion << '\n'
         << "License: " << _appLicense << '\n'
         << string(_appTitle.size() + _appVersion.size() + 1, '=') << "\n\n";

    cout << left << setw(static_cast<int>(titleWidth)) << "Project"
         << " | " << setw(static_cast<int>(licenseWidth)) << "License"
         << " | Project URL\n";
    for (auto const& project: _projects)
        cout << left << setw(static_cast<int>(titleWidth)) << project.title << " | "
             << setw(static_cast<int>(licenseWidth)) << project.license << " | " << project.url << '\n';

    return EXIT_SUCCESS;
}

int app::versionAction()
{
    cout << fmt::format("{} {}\n", _appTitle, _appVersion);
    return EXIT_SUCCESS;
}

int app::run(int argc, char const* argv[])
{
    try
    {
        _syntax = parameterDefinition();
        _flags = CLI::parse(_syntax.value(), argc, argv);

        // The most specific selected command wins, e.g. "vtdump.dump" over "vtdump".
        std::function<int()> const* selected = nullptr;
        auto selectedName = string {};
        for (auto const& [name, handler]: _handlers)
            if (parameters().contains(name) && parameters().get<bool>(name) && name.size() > selectedName.size())
            {
                selected = &handler;
                selectedName = name;
            }

        if (!selected)
        {
            errorLog()("Usage error. Try \"{} help\".", _appName);
            return EXIT_FAILURE;
        }

        return (*selected)();
    }
    catch (CLI::parser_error const& e)
    {
        errorLog()("Failed to parse command line parameters. {}", e.what());
        return EXIT_FAILURE;
    }
    catch (exception const& e)
    {
        errorLog()("{}", e.what());
        return EXIT_FAILURE;
    }
}

} // namespace crispy
