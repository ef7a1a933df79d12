// SPDX-License-Identifier: Apache-2.0
#include <stream/MessageAggregator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <stop_token>

using namespace codeloop;

namespace
{

/// @brief Mock upstream replaying queued results.
class MockChunkSource: public ChunkSource
{
  public:
    std::deque<Result<std::optional<Chunk>>> results;
    int pulls = 0;

    void push(Chunk chunk) { results.emplace_back(std::optional<Chunk>(std::move(chunk))); }
    void fail(ErrorCode code, std::string message) { results.emplace_back(makeError(code, std::move(message))); }

    auto next() -> Result<std::optional<Chunk>> override
    {
        ++pulls;
        if (results.empty())
            return std::nullopt;
        auto result = std::move(results.front());
        results.pop_front();
        return result;
    }
};

auto prose(std::string content) -> Chunk
{
    return Chunk { .role = Role::Assistant, .kind = ChunkKind::Message, .content = std::move(content) };
}

auto code(std::string language, std::string content) -> Chunk
{
    return Chunk {
        .role = Role::Assistant,
        .kind = ChunkKind::Code,
        .format = std::move(language),
        .content = std::move(content),
    };
}

auto output(std::string content) -> Chunk
{
    return Chunk { .role = Role::Computer, .kind = ChunkKind::ConsoleOutput, .content = std::move(content) };
}

auto activeLine(std::optional<std::string> line) -> Chunk
{
    return Chunk { .role = Role::Computer, .kind = ChunkKind::ConsoleActiveLine, .content = std::move(line) };
}

auto confirmation(std::string language, std::string content) -> Chunk
{
    return Chunk {
        .role = Role::Computer,
        .kind = ChunkKind::Confirmation,
        .format = std::move(language),
        .content = std::move(content),
    };
}

auto drain(MessageAggregator& aggregator) -> std::vector<Chunk>
{
    auto chunks = std::vector<Chunk> {};
    while (true)
    {
        auto chunk = aggregator.next();
        REQUIRE(chunk.has_value());
        if (!*chunk)
            return chunks;
        chunks.push_back(std::move(**chunk));
    }
}

auto isStart(const Chunk& chunk, Role role, ChunkKind kind) -> bool
{
    return chunk.start && !chunk.end && chunk.role == role && chunk.kind == kind && !chunk.content;
}

auto isEnd(const Chunk& chunk, Role role, ChunkKind kind) -> bool
{
    return chunk.end && !chunk.start && chunk.role == role && chunk.kind == kind && !chunk.content;
}

} // namespace

TEST_CASE("MessageAggregator merges a run of same-typed chunks into one message", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose("Hel"));
    source.push(prose("lo"));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    auto const chunks = drain(aggregator);

    REQUIRE(chunks.size() == 4);
    CHECK(isStart(chunks[0], Role::Assistant, ChunkKind::Message));
    CHECK(chunks[1] == prose("Hel"));
    CHECK(chunks[2] == prose("lo"));
    CHECK(isEnd(chunks[3], Role::Assistant, ChunkKind::Message));

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == Message { .role = Role::Assistant, .kind = ChunkKind::Message, .content = "Hello" });
    CHECK(!aggregator.hasOpenGroup());
}

TEST_CASE("MessageAggregator closes a group when the chunk type changes", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose("Let me check.\n"));
    source.push(code("python", "print("));
    source.push(code("python", "1)\n"));
    source.push(code("shell", "ls\n"));
    source.push(prose("Done."));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    auto const chunks = drain(aggregator);

    REQUIRE(chunks.size() == 13);
    CHECK(isStart(chunks[0], Role::Assistant, ChunkKind::Message));
    CHECK(isEnd(chunks[2], Role::Assistant, ChunkKind::Message));
    CHECK(isStart(chunks[3], Role::Assistant, ChunkKind::Code));
    CHECK(chunks[3].format == "python");
    CHECK(isEnd(chunks[6], Role::Assistant, ChunkKind::Code));
    CHECK(chunks[6].format == "python");
    CHECK(isStart(chunks[7], Role::Assistant, ChunkKind::Code));
    CHECK(chunks[7].format == "shell");
    CHECK(isEnd(chunks[9], Role::Assistant, ChunkKind::Code));
    CHECK(isStart(chunks[10], Role::Assistant, ChunkKind::Message));
    CHECK(isEnd(chunks[12], Role::Assistant, ChunkKind::Message));

    REQUIRE(messages.size() == 4);
    CHECK(messages[0].content == "Let me check.\n");
    CHECK(messages[1].format == "python");
    CHECK(messages[1].content == "print(1)\n");
    CHECK(messages[2].format == "shell");
    CHECK(messages[3].content == "Done.");

    // Merge invariant: no two adjacent messages share role, kind and format.
    for (auto i = std::size_t { 1 }; i < messages.size(); ++i)
    {
        auto const same = messages[i].role == messages[i - 1].role && messages[i].kind == messages[i - 1].kind
                          && messages[i].format == messages[i - 1].format;
        CHECK(!same);
    }
}

TEST_CASE("MessageAggregator drops chunks with empty content", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose(""));
    source.push(output(""));
    source.push(Chunk { .role = Role::Assistant, .kind = ChunkKind::Message, .content = std::nullopt });

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});

    CHECK(drain(aggregator).empty());
    CHECK(messages.empty());
}

TEST_CASE("MessageAggregator records an empty output for silent executions", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(code("python", "x = 1\n"));
    source.push(activeLine(std::nullopt));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    auto const chunks = drain(aggregator);

    REQUIRE(messages.size() == 2);
    CHECK(messages[1] == Message { .role = Role::Computer, .kind = ChunkKind::ConsoleOutput, .content = "" });

    REQUIRE(chunks.size() == 6);
    CHECK(isEnd(chunks[2], Role::Assistant, ChunkKind::Code));
    CHECK(isStart(chunks[3], Role::Computer, ChunkKind::ConsoleOutput));
    CHECK(chunks[4] == activeLine(std::nullopt));
    CHECK(isEnd(chunks[5], Role::Computer, ChunkKind::ConsoleOutput));
}

TEST_CASE("MessageAggregator does not synthesize when output was recorded", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(code("python", "print(1)\n"));
    source.push(output("1\n"));
    source.push(activeLine(std::nullopt));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    (void) drain(aggregator);

    REQUIRE(messages.size() == 2);
    CHECK(messages[1].content == "1\n");
}

TEST_CASE("MessageAggregator never stores active lines", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(code("shell", "echo hi\necho x\n"));
    source.push(activeLine("1"));
    source.push(output("hi\n"));
    source.push(activeLine("2"));
    source.push(output("x\n"));
    source.push(activeLine(std::nullopt));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    auto const chunks = drain(aggregator);

    REQUIRE(messages.size() == 2);
    CHECK(messages[1] == Message { .role = Role::Computer, .kind = ChunkKind::ConsoleOutput, .content = "hi\nx\n" });

    auto starts = 0;
    for (const auto& chunk: chunks)
    {
        if (chunk.start && chunk.role == Role::Computer)
            ++starts;
    }
    CHECK(starts == 1);
    CHECK(chunks.size() == 3 + 7);
}

TEST_CASE("MessageAggregator starts a new message when the group matches but the last message does not",
          "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(code("shell", "ls\n"));
    source.push(activeLine("1"));
    source.push(output("a.txt\n"));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    (void) drain(aggregator);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0].content == "ls\n");
    CHECK(messages[1].role == Role::Computer);
    CHECK(messages[1].content == "a.txt\n");
}

TEST_CASE("MessageAggregator confirmation gate", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(code("python", "print(1)\n"));
    source.push(confirmation("python", "print(1)\n"));
    source.push(output("1\n"));

    auto messages = std::vector<Message> {};

    SECTION("auto-run off forwards the confirmation")
    {
        auto aggregator = MessageAggregator(source, messages, AggregatorConfig { .autoRun = false });
        auto const chunks = drain(aggregator);

        REQUIRE(chunks.size() == 7);
        CHECK(isEnd(chunks[2], Role::Assistant, ChunkKind::Code));
        CHECK(chunks[3] == confirmation("python", "print(1)\n"));
        CHECK(isStart(chunks[4], Role::Computer, ChunkKind::ConsoleOutput));
    }

    SECTION("auto-run on consumes the confirmation")
    {
        auto aggregator = MessageAggregator(source, messages, AggregatorConfig { .autoRun = true });
        auto const chunks = drain(aggregator);

        REQUIRE(chunks.size() == 6);
        for (const auto& chunk: chunks)
            CHECK(chunk.kind != ChunkKind::Confirmation);
    }

    REQUIRE(messages.size() == 2);
    CHECK(messages[0].kind == ChunkKind::Code);
    CHECK(messages[1].kind == ChunkKind::ConsoleOutput);
}

TEST_CASE("MessageAggregator truncates console output in place", "[aggregator]")
{
    auto source = MockChunkSource {};
    for (auto i = 0; i < 20; ++i)
        source.push(output("0123456789\n"));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig { .maxOutputChars = 100 });
    auto const chunks = drain(aggregator);

    REQUIRE(messages.size() == 1);
    auto const banner = truncationBanner(100, false);
    CHECK(messages[0].content.starts_with(banner));
    CHECK(messages[0].content.size() == banner.size() + 100);
    CHECK(messages[0].content.ends_with("0123456789\n"));

    // Passthrough chunks are never truncated.
    CHECK(chunks[1] == output("0123456789\n"));
    CHECK(aggregator.openMessage() == std::optional<std::size_t> { 0 });
}

TEST_CASE("MessageAggregator stops without closing the open group on cancellation", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose("first"));
    source.push(prose("second"));
    source.push(prose("third"));

    auto stopSource = std::stop_source {};
    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {}, stopSource.get_token());

    auto start = aggregator.next();
    REQUIRE(start.has_value());
    REQUIRE(*start);
    CHECK((*start)->start);

    auto first = aggregator.next();
    REQUIRE(first.has_value());
    CHECK(**first == prose("first"));

    stopSource.request_stop();

    auto cancelled = aggregator.next();
    REQUIRE(!cancelled.has_value());
    CHECK(cancelled.error().code == ErrorCode::Cancelled);
    CHECK(aggregator.cancelled());
    CHECK(aggregator.hasOpenGroup());

    auto again = aggregator.next();
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::Cancelled);

    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "first");
    CHECK(source.results.size() == 2);
}

TEST_CASE("MessageAggregator propagates upstream errors unchanged", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose("partial"));
    source.fail(ErrorCode::ModelError, "connection reset");

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});

    REQUIRE(aggregator.next().has_value());
    REQUIRE(aggregator.next().has_value());

    auto failed = aggregator.next();
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::ModelError);
    CHECK(failed.error().message == "connection reset");

    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "partial");
}

TEST_CASE("MessageAggregator is exhausted after the closing boundary", "[aggregator]")
{
    auto source = MockChunkSource {};
    source.push(prose("hi"));

    auto messages = std::vector<Message> {};
    auto aggregator = MessageAggregator(source, messages, AggregatorConfig {});
    CHECK(drain(aggregator).size() == 3);

    auto const pulls = source.pulls;
    auto after = aggregator.next();
    REQUIRE(after.has_value());
    CHECK(!after->has_value());
    CHECK(source.pulls == pulls);
}
