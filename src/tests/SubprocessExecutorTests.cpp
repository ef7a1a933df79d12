// SPDX-License-Identifier: Apache-2.0
#include <exec/SubprocessExecutor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace codeloop;

#ifndef _WIN32

namespace
{

auto collect(ChunkSource& source) -> Result<std::vector<Chunk>>
{
    auto chunks = std::vector<Chunk> {};
    while (true)
    {
        auto chunk = source.next();
        if (!chunk)
            return std::unexpected(chunk.error());
        if (!*chunk)
            return chunks;
        chunks.push_back(std::move(**chunk));
    }
}

auto outputOf(const std::vector<Chunk>& chunks) -> std::string
{
    auto text = std::string {};
    for (const auto& chunk: chunks)
    {
        if (chunk.kind == ChunkKind::ConsoleOutput)
            text += chunk.content.value_or("");
    }
    return text;
}

} // namespace

TEST_CASE("SubprocessExecutor runs shell scripts line by line", "[exec][subprocess]")
{
    auto executor = SubprocessExecutor();
    REQUIRE(executor.supports("sh"));

    auto source = executor.run("shell", "echo one\necho two >&2");
    REQUIRE(source.has_value());

    auto chunks = collect(**source);
    REQUIRE(chunks.has_value());
    CHECK(outputOf(*chunks) == "one\ntwo\n");

    auto activeLines = std::vector<std::string> {};
    for (const auto& chunk: *chunks)
    {
        if (chunk.kind == ChunkKind::ConsoleActiveLine && chunk.content)
            activeLines.push_back(*chunk.content);
    }
    CHECK(activeLines == std::vector<std::string> { "1", "2" });

    REQUIRE(!chunks->empty());
    CHECK(chunks->back().kind == ChunkKind::ConsoleActiveLine);
    CHECK(!chunks->back().content.has_value());
}

TEST_CASE("SubprocessExecutor keeps output without a trailing newline", "[exec][subprocess]")
{
    auto executor = SubprocessExecutor();
    auto source = executor.run("bash", "printf 'no newline'");
    REQUIRE(source.has_value());

    auto chunks = collect(**source);
    REQUIRE(chunks.has_value());
    CHECK(outputOf(*chunks) == "no newline");
}

TEST_CASE("SubprocessExecutor passes extra environment variables", "[exec][subprocess]")
{
    auto config = SubprocessExecutorConfig {};
    config.env["CODELOOP_TEST_VALUE"] = "42";
    auto executor = SubprocessExecutor(config);

    auto source = executor.run("shell", "echo $CODELOOP_TEST_VALUE");
    REQUIRE(source.has_value());
    auto chunks = collect(**source);
    REQUIRE(chunks.has_value());
    CHECK(outputOf(*chunks) == "42\n");
}

TEST_CASE("SubprocessExecutor rejects unknown languages", "[exec][subprocess]")
{
    auto executor = SubprocessExecutor();
    CHECK(!executor.supports("cobol"));

    auto source = executor.run("cobol", "DISPLAY 1");
    REQUIRE(!source.has_value());
    CHECK(source.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SubprocessExecutor reports a missing interpreter as output", "[exec][subprocess]")
{
    auto config = SubprocessExecutorConfig {};
    config.languages = { LanguageProfile {
        .name = "missing",
        .command = "codeloop-no-such-interpreter",
        .args = {},
        .aliases = {},
        .extension = "txt",
        .activeLineMarkers = false,
    } };
    auto executor = SubprocessExecutor(config);

    auto source = executor.run("missing", "x");
    if (!source)
    {
        CHECK(source.error().code == ErrorCode::ExecutionError);
        return;
    }

    auto chunks = collect(**source);
    REQUIRE(chunks.has_value());
    REQUIRE(!chunks->empty());
    CHECK(!chunks->back().content.has_value());
}

#endif
