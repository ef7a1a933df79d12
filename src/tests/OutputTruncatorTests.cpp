// SPDX-License-Identifier: Apache-2.0
#include <stream/OutputTruncator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace codeloop;

TEST_CASE("truncateOutput leaves short content unchanged", "[truncator]")
{
    CHECK(truncateOutput("", 10) == "");
    CHECK(truncateOutput("hello", 10) == "hello");
    CHECK(truncateOutput("0123456789", 10) == "0123456789");
}

TEST_CASE("truncateOutput keeps the last characters behind a banner", "[truncator]")
{
    auto const result = truncateOutput("0123456789abcdef", 10);
    CHECK(result == truncationBanner(10, false) + "6789abcdef");
    CHECK(result.starts_with("Output truncated. Showing the last 10 characters."));
}

TEST_CASE("truncateOutput is idempotent", "[truncator]")
{
    auto const input = std::string(500, 'x') + "tail";

    for (auto const maxChars: { std::size_t { 1 }, std::size_t { 4 }, std::size_t { 100 }, std::size_t { 1000 } })
    {
        auto const once = truncateOutput(input, maxChars);
        CHECK(truncateOutput(once, maxChars) == once);
    }
}

TEST_CASE("truncateOutput never stacks banners on growing output", "[truncator]")
{
    auto content = std::string {};
    for (auto i = 0; i < 50; ++i)
    {
        content += "line " + std::to_string(i) + "\n";
        content = truncateOutput(content, 40);
    }

    auto const banner = truncationBanner(40, false);
    REQUIRE(content.starts_with(banner));
    CHECK(content.find(banner, 1) == std::string::npos);
    CHECK(content.ends_with("line 49\n"));
}

TEST_CASE("truncateOutput respects the length bound", "[truncator]")
{
    auto const banner = truncationBanner(25, false);
    auto const result = truncateOutput(std::string(1000, 'a'), 25);
    CHECK(result.size() <= banner.size() + 25);
    CHECK(countCharacters(result) == countCharacters(banner) + 25);
}

TEST_CASE("truncateOutput re-derives the window after stripping a banner", "[truncator]")
{
    auto const banner = truncationBanner(10, false);
    CHECK(truncateOutput(banner + "abc", 10) == banner + "abc");
}

TEST_CASE("truncateOutput counts code points and never splits one", "[truncator]")
{
    // Each "ä" is two bytes.
    auto const input = std::string("abcäöüäöü");
    auto const result = truncateOutput(input, 4);
    CHECK(result == truncationBanner(4, false) + "üäöü");
    CHECK(countCharacters("äöü") == 3);
}

TEST_CASE("truncationBanner optionally mentions the first page", "[truncator]")
{
    auto const plain = truncationBanner(2800, false);
    auto const hinted = truncationBanner(2800, true);

    CHECK(plain.ends_with("\n\n"));
    CHECK(plain.find("get_last_output") == std::string::npos);
    CHECK(hinted.find("Run `get_last_output()[0:2800]` to see the first page.") != std::string::npos);
    CHECK(truncateOutput(std::string(3000, 'z'), 2800, true).starts_with(hinted));
}
