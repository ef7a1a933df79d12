// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace codeloop;

TEST_CASE("log::parseLevel accepts level names", "[log]")
{
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK(log::parseLevel("WARN") == log::Level::Warning);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("Info") == log::Level::Info);
    CHECK(log::parseLevel("debug") == log::Level::Debug);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
    CHECK(!log::parseLevel("").has_value());
}

TEST_CASE("log messages below the level are filtered", "[log]")
{
    auto const previous = log::getLevel();
    auto received = std::vector<std::pair<log::Level, std::string>> {};
    log::setCallback([&](log::Level level, std::string_view message) { received.emplace_back(level, message); });

    log::setLevel(log::Level::Warning);
    log::error("disk {}", "full");
    log::warning("low on {}", 3);
    log::info("not shown");
    log::debug("not shown");

    REQUIRE(received.size() == 2);
    CHECK(received[0] == std::pair { log::Level::Error, std::string("disk full") });
    CHECK(received[1].second == "low on 3");

    received.clear();
    log::setLevel(log::Level::Trace);
    log::trace("step {}", 1);
    REQUIRE(received.size() == 1);
    CHECK(received[0].first == log::Level::Trace);

    log::setCallback({});
    log::setLevel(previous);
}
