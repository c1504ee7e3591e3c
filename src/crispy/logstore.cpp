// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

#include <iostream>

namespace logstore
{

message_builder::message_builder(category const& cat, source_location location):
    _category { cat }, _location { location }
{
}

message_builder::~message_builder()
{
    _category.get_sink().write(*this);
}

std::string message_builder::message() const
{
    if (_category.get_formatter())
        return _category.get_formatter()(*this);

    if (_buffer.empty() || _buffer.back() == '\n')
        return _buffer;

    return _buffer + '\n';
}

category::category(std::string_view name, std::string_view description, state initialState):
    _name { name },
    _description { description },
    _state { initialState },
    _formatter { &category::defaultFormatter },
    _sink { &sink::error_console() }
{
    get().emplace_back(*this);
}

category::~category()
{
    auto& store = get();
    store.erase(std::remove_if(store.begin(), store.end(), [this](auto const& x) { return &x.get() == this; }),
                store.end());
}

std::string category::defaultFormatter(message_builder const& message)
{
    if (message.get_category().name() == "error")
        return fmt::format("{}\n", message.text());

    auto fileName = std::string_view(message.location().fileName);
    if (auto const i = fileName.rfind('/'); i != std::string_view::npos)
        fileName.remove_prefix(i + 1);

    return fmt::format("[{}:{}:{}]: {}\n",
                       message.get_category().name(),
                       fileName,
                       message.location().line,
                       message.text());
}

sink::sink(bool enabled, writer w): _enabled { enabled }, _writer { std::move(w) }
{
}

sink::sink(bool enabled, std::ostream& output):
    sink(enabled, [out = &output](std::string_view text) {
        *out << text;
        out->flush();
    })
{
}

void sink::write(message_builder const& message)
{
    if (_enabled && message.get_category().is_enabled() && _writer)
        _writer(message.message());
}

sink& sink::error_console()
{
    static auto instance = sink(true, std::cerr);
    return instance;
}

std::vector<std::reference_wrapper<category>>& get()
{
    static std::vector<std::reference_wrapper<category>> store;
    return store;
}

category* get(std::string_view name)
{
    for (auto const& cat: get())
        if (cat.get().name() == name)
            return &cat.get();
    return nullptr;
}

void configure(std::string_view filterString)
{
    auto const matches = [](std::string_view pattern, category const& cat) -> bool {
        if (pattern == "all")
            return true;
        if (!pattern.empty() && pattern.back() == '*')
            return crispy::startsWith(cat.name(), pattern.substr(0, pattern.size() - 1));
        return cat.name() == pattern;
    };

    crispy::split(filterString, ',', [&](std::string_view pattern) {
        pattern = crispy::trimmed(pattern);
        if (pattern.empty())
            return true;
        for (auto& cat: get())
            if (matches(pattern, cat.get()))
                cat.get().enable();
        return true;
    });
}

} // namespace logstore
