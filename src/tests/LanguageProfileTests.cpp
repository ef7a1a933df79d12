// SPDX-License-Identifier: Apache-2.0
#include <exec/LanguageProfile.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace codeloop;

TEST_CASE("Built-in language profiles match names and aliases", "[exec]")
{
    auto const profiles = defaultLanguageProfiles();

    auto const shell = findLanguageProfile(profiles, "BASH");
    REQUIRE(shell.has_value());
    CHECK(shell->name == "shell");
    CHECK(shell->activeLineMarkers);

    auto const python = findLanguageProfile(profiles, "py");
    REQUIRE(python.has_value());
    CHECK(python->command == "python3");
    CHECK(python->extension == "py");

    CHECK(findLanguageProfile(profiles, "javascript").has_value());
    CHECK(!findLanguageProfile(profiles, "cobol").has_value());
    CHECK(!findLanguageProfile(profiles, "").has_value());
}

TEST_CASE("hasMultilineCommands detects constructs spanning lines", "[exec]")
{
    CHECK(!hasMultilineCommands("ls\npwd"));
    CHECK(!hasMultilineCommands("echo information"));
    CHECK(hasMultilineCommands("ls \\\n  -la"));
    CHECK(hasMultilineCommands("cat file |\n  wc -l"));
    CHECK(hasMultilineCommands("make &&\nmake install"));
    CHECK(hasMultilineCommands("for f in *; do\necho $f\ndone"));
    CHECK(hasMultilineCommands("if true\nthen echo\nfi"));
    CHECK(hasMultilineCommands("f() {\n  ls\n}"));
}

TEST_CASE("addActiveLineMarkers echoes a marker before every line", "[exec]")
{
    CHECK(addActiveLineMarkers("ls") == "echo \"##active_line1##\"\nls");
    CHECK(addActiveLineMarkers("ls\npwd")
          == "echo \"##active_line1##\"\nls\necho \"##active_line2##\"\npwd");

    SECTION("scripts with multi-line constructs are left alone")
    {
        auto const script = std::string_view { "while true; do\n  sleep 1\ndone" };
        CHECK(addActiveLineMarkers(script) == script);
    }
}

TEST_CASE("parseActiveLineMarker reads marker lines", "[exec]")
{
    CHECK(parseActiveLineMarker("##active_line1##") == 1);
    CHECK(parseActiveLineMarker("##active_line42##") == 42);
    CHECK(!parseActiveLineMarker("hello").has_value());
    CHECK(!parseActiveLineMarker("##active_line##").has_value());
    CHECK(!parseActiveLineMarker("##active_line3").has_value());
}
