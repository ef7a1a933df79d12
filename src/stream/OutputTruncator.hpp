// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace codeloop
{

/// @brief Default bound for a single console output message, in characters.
inline constexpr auto DefaultMaxOutputChars = std::size_t { 2800 };

/// @brief Returns the banner prepended to truncated output.
/// @param maxChars The character bound quoted by the banner.
/// @param includeScrollbarHint Whether to append the "first page" retrieval hint.
[[nodiscard]] auto truncationBanner(std::size_t maxChars, bool includeScrollbarHint) -> std::string;

/// @brief Bounds a growing console output to its last @p maxChars characters.
///
/// A banner left by a previous call is stripped first, so repeated calls on a string
/// that only grows never stack banners. Characters are UTF-8 code points.
/// @param content The output accumulated so far.
/// @param maxChars The number of trailing characters to keep.
/// @param includeScrollbarHint Whether the banner mentions the first-page retrieval hint.
/// @return The content, unchanged or as banner plus tail window.
[[nodiscard]] auto truncateOutput(std::string_view content,
                                  std::size_t maxChars = DefaultMaxOutputChars,
                                  bool includeScrollbarHint = false) -> std::string;

/// @brief Counts the UTF-8 code points in @p text.
[[nodiscard]] auto countCharacters(std::string_view text) -> std::size_t;

} // namespace codeloop
