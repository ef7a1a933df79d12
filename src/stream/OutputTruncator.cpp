// SPDX-License-Identifier: Apache-2.0
#include "OutputTruncator.hpp"

#include <core/Log.hpp>

#include <format>

namespace codeloop
{

namespace
{
    constexpr auto isContinuationByte(char c) -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    // Byte offset at which the last `count` code points of `text` begin.
    auto tailOffset(std::string_view text, std::size_t count) -> std::size_t
    {
        auto offset = text.size();
        auto seen = std::size_t { 0 };
        while (offset > 0 && seen < count)
        {
            --offset;
            if (!isContinuationByte(text[offset]))
                ++seen;
        }
        // A window that ran out on a continuation byte must not start mid-sequence.
        while (offset < text.size() && isContinuationByte(text[offset]))
            ++offset;
        return offset;
    }
} // namespace

auto truncationBanner(std::size_t maxChars, bool includeScrollbarHint) -> std::string
{
    auto banner = std::format("Output truncated. Showing the last {} characters. You should try again and use "
                              "computer.ai.summarize(output) over the output, or break it down into smaller "
                              "steps.",
                              maxChars);
    if (includeScrollbarHint)
        banner += std::format(" Run `get_last_output()[0:{}]` to see the first page.", maxChars);
    banner += "\n\n";
    return banner;
}

auto countCharacters(std::string_view text) -> std::size_t
{
    auto count = std::size_t { 0 };
    for (auto const c: text)
    {
        if (!isContinuationByte(c))
            ++count;
    }
    return count;
}

auto truncateOutput(std::string_view content, std::size_t maxChars, bool includeScrollbarHint) -> std::string
{
    auto const banner = truncationBanner(maxChars, includeScrollbarHint);

    auto needsTruncation = false;
    if (content.starts_with(banner))
    {
        content.remove_prefix(banner.size());
        needsTruncation = true;
    }

    if (!needsTruncation && countCharacters(content) <= maxChars)
        return std::string(content);

    auto const offset = tailOffset(content, maxChars);
    if (offset > 0)
        log::trace("Truncating console output: dropping {} leading bytes", offset);

    auto result = banner;
    result.append(content.substr(offset));
    return result;
}

} // namespace codeloop
