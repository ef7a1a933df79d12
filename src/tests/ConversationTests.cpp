// SPDX-License-Identifier: Apache-2.0
#include <agent/Conversation.hpp>
#include <core/Wire.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace codeloop;

TEST_CASE("Conversation stores user messages in order", "[conversation]")
{
    auto conversation = Conversation();
    CHECK(conversation.empty());

    conversation.addUserMessage("first");
    conversation.addUserMessage("second");

    REQUIRE(conversation.size() == 2);
    CHECK(conversation.messages()[0].role == Role::User);
    CHECK(conversation.messages()[1].content == "second");

    auto const since = conversation.messagesSince(1);
    REQUIRE(since.size() == 1);
    CHECK(since[0].content == "second");
    CHECK(conversation.messagesSince(5).empty());

    conversation.reset();
    CHECK(conversation.empty());
}

TEST_CASE("Conversation finds the last message of a role and kind", "[conversation]")
{
    auto conversation = Conversation(std::vector<Message> {
        Message { .role = Role::Assistant, .kind = ChunkKind::Message, .content = "one" },
        Message { .role = Role::Assistant, .kind = ChunkKind::Code, .format = "python", .content = "x" },
        Message { .role = Role::Assistant, .kind = ChunkKind::Message, .content = "two" },
        Message { .role = Role::Computer, .kind = ChunkKind::ConsoleOutput, .content = "" },
    });

    auto const* last = conversation.lastMessageOf(Role::Assistant, ChunkKind::Message);
    REQUIRE(last != nullptr);
    CHECK(last->content == "two");
    CHECK(conversation.lastMessageOf(Role::User, ChunkKind::Message) == nullptr);
}

TEST_CASE("Conversation transcript survives a JSON round trip", "[conversation]")
{
    auto original = Conversation(std::vector<Message> {
        Message { .role = Role::User, .kind = ChunkKind::Message, .content = "hi" },
        Message { .role = Role::Assistant, .kind = ChunkKind::Code, .format = "shell", .content = "ls\n" },
        Message { .role = Role::Computer, .kind = ChunkKind::ConsoleOutput, .content = "" },
    });

    auto const json = original.toJson();
    REQUIRE(json.is_array());
    CHECK(json[1]["format"] == "shell");
    CHECK(json[2]["content"] == "");
    CHECK(!json[0].contains("format"));

    auto restored = Conversation::fromJson(json);
    REQUIRE(restored.has_value());
    REQUIRE(restored->size() == 3);
    CHECK(restored->messages()[1] == original.messages()[1]);
    CHECK(restored->messages()[2] == original.messages()[2]);
}

TEST_CASE("Conversation rejects malformed transcripts", "[conversation]")
{
    SECTION("not an array")
    {
        auto result = Conversation::fromJson(nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("unknown role")
    {
        auto result = Conversation::fromJson(nlohmann::json::array({
            { { "role", "robot" }, { "kind", "message" }, { "content", "x" } },
        }));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Unknown role: robot");
    }

    SECTION("missing kind")
    {
        auto result = Conversation::fromJson(nlohmann::json::array({
            { { "role", "user" }, { "content", "x" } },
        }));
        REQUIRE(!result.has_value());
    }
}

TEST_CASE("Wire shape of chunks", "[wire]")
{
    SECTION("boundary markers carry only the flag that is set")
    {
        auto const json = wire::toJson(Chunk {
            .role = Role::Computer,
            .kind = ChunkKind::ConsoleOutput,
            .format = std::nullopt,
            .content = std::nullopt,
            .start = true,
            .end = false,
        });
        CHECK(json == nlohmann::json { { "role", "computer" }, { "kind", "console_output" }, { "start", true } });
    }

    SECTION("content chunks")
    {
        auto const json = wire::toJson(
            Chunk { .role = Role::Assistant, .kind = ChunkKind::Code, .format = "python", .content = "print(1)" });
        CHECK(json["kind"] == "code");
        CHECK(json["format"] == "python");
        CHECK(json["content"] == "print(1)");
        CHECK(!json.contains("start"));
        CHECK(!json.contains("end"));
    }

    SECTION("parsing restores every field")
    {
        auto const parsed = wire::chunkFromJson(nlohmann::json {
            { "role", "computer" },
            { "kind", "console_active_line" },
            { "end", true },
        });
        REQUIRE(parsed.has_value());
        CHECK(parsed->kind == ChunkKind::ConsoleActiveLine);
        CHECK(!parsed->content.has_value());
        CHECK(parsed->end);
        CHECK(!parsed->start);
    }

    SECTION("every kind has a wire name")
    {
        for (auto const kind: { ChunkKind::Message,
                                ChunkKind::Code,
                                ChunkKind::ConsoleActiveLine,
                                ChunkKind::ConsoleOutput,
                                ChunkKind::Confirmation,
                                ChunkKind::Review })
            CHECK(chunkKindFromString(chunkKindToString(kind)) == kind);
    }
}
