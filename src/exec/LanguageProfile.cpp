// SPDX-License-Identifier: Apache-2.0
#include "LanguageProfile.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>

namespace codeloop
{

namespace
{
    constexpr auto MarkerPrefix = std::string_view { "##active_line" };
    constexpr auto MarkerSuffix = std::string_view { "##" };

    auto equalsIgnoreCase(std::string_view a, std::string_view b) -> bool
    {
        return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
    }

    auto isWordChar(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    auto containsWord(std::string_view line, std::string_view word) -> bool
    {
        auto pos = line.find(word);
        while (pos != std::string_view::npos)
        {
            auto const before = pos == 0 || !isWordChar(line[pos - 1]);
            auto const after = pos + word.size() >= line.size() || !isWordChar(line[pos + word.size()]);
            if (before && after)
                return true;
            pos = line.find(word, pos + 1);
        }
        return false;
    }

    auto rtrim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }
} // namespace

auto LanguageProfile::matches(std::string_view language) const -> bool
{
    if (equalsIgnoreCase(name, language))
        return true;
    return std::ranges::any_of(aliases, [&](const auto& alias) { return equalsIgnoreCase(alias, language); });
}

auto defaultLanguageProfiles() -> std::vector<LanguageProfile>
{
    return {
        LanguageProfile {
            .name = "python",
            .command = "python3",
            .args = { "-u" },
            .aliases = { "py" },
            .extension = "py",
            .activeLineMarkers = false,
        },
        LanguageProfile {
            .name = "shell",
            .command = "bash",
            .args = {},
            .aliases = { "bash", "sh", "zsh" },
            .extension = "sh",
            .activeLineMarkers = true,
        },
        LanguageProfile {
            .name = "javascript",
            .command = "node",
            .args = {},
            .aliases = { "js" },
            .extension = "js",
            .activeLineMarkers = false,
        },
        LanguageProfile {
            .name = "ruby",
            .command = "ruby",
            .args = {},
            .aliases = { "rb" },
            .extension = "rb",
            .activeLineMarkers = false,
        },
    };
}

auto findLanguageProfile(std::span<const LanguageProfile> profiles, std::string_view language)
    -> std::optional<LanguageProfile>
{
    auto const it = std::ranges::find_if(profiles, [&](const auto& profile) { return profile.matches(language); });
    if (it == profiles.end())
        return std::nullopt;
    return *it;
}

auto hasMultilineCommands(std::string_view code) -> bool
{
    constexpr auto continuationEndings = std::array<std::string_view, 7> { "\\", "|", "&&", "||", "<(", "(", "{" };
    constexpr auto blockKeywords = std::array<std::string_view, 3> { "if", "while", "for" };
    constexpr auto blockEndings = std::array<std::string_view, 2> { "do", "then" };

    auto rest = code;
    while (!rest.empty())
    {
        auto const newline = rest.find('\n');
        auto const line = rtrim(rest.substr(0, newline));
        rest = newline == std::string_view::npos ? std::string_view {} : rest.substr(newline + 1);

        if (std::ranges::any_of(continuationEndings, [&](auto ending) { return line.ends_with(ending); }))
            return true;
        if (std::ranges::any_of(blockKeywords, [&](auto keyword) { return containsWord(line, keyword); }))
            return true;
        if (std::ranges::any_of(blockEndings, [&](auto ending) { return line.ends_with(ending); }))
            return true;
    }
    return false;
}

auto addActiveLineMarkers(std::string_view code) -> std::string
{
    if (hasMultilineCommands(code))
        return std::string(code);

    auto result = std::string {};
    auto lineNumber = 1;
    auto rest = code;
    while (true)
    {
        auto const newline = rest.find('\n');
        if (lineNumber > 1)
            result += '\n';
        result += std::format("echo \"{}{}{}\"\n", MarkerPrefix, lineNumber, MarkerSuffix);
        result += rest.substr(0, newline);
        if (newline == std::string_view::npos)
            break;
        rest = rest.substr(newline + 1);
        ++lineNumber;
    }
    return result;
}

auto parseActiveLineMarker(std::string_view line) -> std::optional<int>
{
    auto const prefix = line.find(MarkerPrefix);
    if (prefix == std::string_view::npos)
        return std::nullopt;

    auto const digits = line.substr(prefix + MarkerPrefix.size());
    auto value = 0;
    auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc {})
        return std::nullopt;

    auto const consumed = static_cast<std::size_t>(ptr - digits.data());
    if (!digits.substr(consumed).starts_with(MarkerSuffix))
        return std::nullopt;
    return value;
}

} // namespace codeloop
