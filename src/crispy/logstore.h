// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace logstore
{

class category;
class sink;

/// Location of a log statement, captured at the call site.
struct source_location
{
    char const* fileName = "";
    int line = 0;

    static source_location current(char const* fileName = __builtin_FILE(),
                                   int line = __builtin_LINE()) noexcept
    {
        return source_location { fileName, line };
    }
};

/// Collects one log message and hands it to the category's sink when destroyed.
class message_builder
{
  public:
    message_builder(category const& cat, source_location location);
    message_builder(message_builder const&) = delete;
    message_builder& operator=(message_builder const&) = delete;
    ~message_builder();

    [[nodiscard]] category const& get_category() const noexcept { return _category; }
    [[nodiscard]] source_location const& location() const noexcept { return _location; }
    [[nodiscard]] std::string const& text() const noexcept { return _buffer; }

    message_builder& operator()(std::string_view msg)
    {
        _buffer += msg;
        return *this;
    }

    template <typename... T>
    message_builder& operator()(fmt::format_string<T...> fmt, T&&... args)
    {
        _buffer += fmt::vformat(fmt, fmt::make_format_args(args...));
        return *this;
    }

    /// Returns the final, newline-terminated text as it is written to the sink.
    [[nodiscard]] std::string message() const;

  private:
    category const& _category;
    source_location _location;
    std::string _buffer;
};

/// A named logging category, such as "error" or "vtdecode.scanner".
///
/// Categories register themselves in a process wide store on construction, so that
/// they can be enabled by name or by a wildcard filter at runtime.
class category
{
  public:
    using formatter = std::function<std::string(message_builder const&)>;

    enum class state : uint8_t
    {
        Enabled,
        Disabled
    };

    category(std::string_view name, std::string_view description, state initialState = state::Disabled);
    category(category const&) = delete;
    category& operator=(category const&) = delete;
    ~category();

    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] std::string_view description() const noexcept { return _description; }

    [[nodiscard]] bool is_enabled() const noexcept { return _state == state::Enabled; }
    void enable(bool enabled = true) noexcept { _state = enabled ? state::Enabled : state::Disabled; }

    explicit operator bool() const noexcept { return is_enabled(); }

    [[nodiscard]] formatter const& get_formatter() const noexcept { return _formatter; }
    void set_formatter(formatter f) { _formatter = std::move(f); }

    [[nodiscard]] logstore::sink& get_sink() const noexcept { return *_sink; }
    void set_sink(logstore::sink& s) noexcept { _sink = &s; }

    [[nodiscard]] message_builder operator()(source_location location = source_location::current()) const
    {
        return message_builder(*this, location);
    }

    static std::string defaultFormatter(message_builder const& message);

  private:
    std::string_view _name;
    std::string_view _description;
    state _state;
    formatter _formatter;
    logstore::sink* _sink;
};

/// Destination of log messages, such as the console or a file.
class sink
{
  public:
    using writer = std::function<void(std::string_view)>;

    sink(bool enabled, writer w);
    sink(bool enabled, std::ostream& output);

    void set_enabled(bool enabled) noexcept { _enabled = enabled; }
    [[nodiscard]] bool is_enabled() const noexcept { return _enabled; }

    void write(message_builder const& message);

    /// Standard error sink. Log output never goes to standard output, which is
    /// reserved for the report.
    static sink& error_console();

  private:
    bool _enabled;
    writer _writer;
};

std::vector<std::reference_wrapper<category>>& get();
category* get(std::string_view name);

/// Enables all categories matching the comma separated @p filterString.
///
/// Each filter is either a category name, a prefix ending in '*' (e.g. "vtdecode.*"),
/// or "all". Categories not matched keep their current state.
void configure(std::string_view filterString);

inline auto ErrorLog = category("error", "Error Logger", category::state::Enabled);

} // namespace logstore

#define errorLog() (::logstore::ErrorLog())
