// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <print>
#include <string>

namespace codeloop::log
{

namespace
{
    auto globalLevel = Level::Warning;
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lowered = std::string(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "error")
        return Level::Error;
    if (lowered == "warning" || lowered == "warn")
        return Level::Warning;
    if (lowered == "info")
        return Level::Info;
    if (lowered == "debug")
        return Level::Debug;
    if (lowered == "trace")
        return Level::Trace;
    return std::nullopt;
}

void initFromEnvironment()
{
    auto const* const value = std::getenv(std::string(LevelEnvironmentVariable).c_str());
    if (!value || !*value)
        return;

    if (auto const level = parseLevel(value); level)
        setLevel(*level);
    else
        warning("Ignoring unknown {} value '{}'", LevelEnvironmentVariable, value);
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[codeloop {}] {}", levelPrefix(level), message);
}

} // namespace codeloop::log
