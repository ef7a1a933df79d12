// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codeloop
{

/// @brief How to run code written in one language.
///
/// The code is saved to a temporary file with @c extension, whose path is passed to
/// @c command after @c args.
struct LanguageProfile
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> aliases;
    std::string extension;

    /// @brief Prefix each line with an echo of its line number (shell-like languages).
    bool activeLineMarkers = false;

    /// @brief Returns true if @p language names this profile (case-insensitive).
    [[nodiscard]] auto matches(std::string_view language) const -> bool;
};

/// @brief Returns the built-in profiles: python, shell, javascript, ruby.
[[nodiscard]] auto defaultLanguageProfiles() -> std::vector<LanguageProfile>;

/// @brief Finds the profile for @p language.
[[nodiscard]] auto findLanguageProfile(std::span<const LanguageProfile> profiles, std::string_view language)
    -> std::optional<LanguageProfile>;

/// @brief Inserts active line markers into a shell script.
///
/// Scripts with constructs spanning several lines (continuations, pipes at line end,
/// if/while/for blocks) are returned unchanged.
[[nodiscard]] auto addActiveLineMarkers(std::string_view code) -> std::string;

/// @brief Returns true if the shell script contains a construct spanning several lines.
[[nodiscard]] auto hasMultilineCommands(std::string_view code) -> bool;

/// @brief Extracts the line number from a marker line written by addActiveLineMarkers().
[[nodiscard]] auto parseActiveLineMarker(std::string_view line) -> std::optional<int>;

} // namespace codeloop
