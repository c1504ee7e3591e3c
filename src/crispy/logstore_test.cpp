// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

#include <catch2/catch.hpp>

#include <string>

using namespace std::string_view_literals;

TEST_CASE("logstore.category.registration")
{
    CHECK(logstore::get("error") == &logstore::ErrorLog);
    CHECK(logstore::ErrorLog.is_enabled());

    {
        auto local = logstore::category("test.local", "Local test category");
        CHECK(logstore::get("test.local") == &local);
        CHECK_FALSE(local.is_enabled());
    }

    CHECK(logstore::get("test.local") == nullptr);
}

TEST_CASE("logstore.configure")
{
    auto alpha = logstore::category("test.alpha", "alpha");
    auto beta = logstore::category("test.beta", "beta");
    auto other = logstore::category("other.gamma", "gamma");

    SECTION("by name")
    {
        logstore::configure("test.beta");
        CHECK_FALSE(alpha.is_enabled());
        CHECK(beta.is_enabled());
        CHECK_FALSE(other.is_enabled());
    }

    SECTION("by prefix")
    {
        logstore::configure(" test.* ");
        CHECK(alpha.is_enabled());
        CHECK(beta.is_enabled());
        CHECK_FALSE(other.is_enabled());
    }

    SECTION("list")
    {
        logstore::configure("test.alpha,other.gamma");
        CHECK(alpha.is_enabled());
        CHECK_FALSE(beta.is_enabled());
        CHECK(other.is_enabled());
    }
}

TEST_CASE("logstore.sink")
{
    auto output = std::string {};
    auto sink = logstore::sink(true, [&](std::string_view text) { output += text; });

    auto cat = logstore::category("test.sink", "sink test", logstore::category::state::Enabled);
    cat.set_sink(sink);
    cat.set_formatter([](logstore::message_builder const& message) { return message.text() + "\n"; });

    cat()("value is {}", 42);
    CHECK(output == "value is 42\n");

    cat.enable(false);
    cat()("hidden");
    CHECK(output == "value is 42\n");

    cat.enable(true);
    sink.set_enabled(false);
    cat()("hidden too");
    CHECK(output == "value is 42\n");
}

TEST_CASE("logstore.defaultFormatter")
{
    auto output = std::string {};
    auto sink = logstore::sink(true, [&](std::string_view text) { output += text; });

    auto cat = logstore::category("test.format", "format test", logstore::category::state::Enabled);
    cat.set_sink(sink);
    cat(logstore::source_location { "/some/dir/File.cpp", 17 })("hello");

    CHECK(output == "[test.format:File.cpp:17]: hello\n");
}
