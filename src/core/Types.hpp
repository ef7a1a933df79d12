// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace codeloop
{

/// @brief The participant that produced a chunk or message.
enum class Role
{
    User,
    Assistant,
    Computer,
    System,
};

/// @brief Converts a Role enum to its wire representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Computer: return "computer";
        case Role::System: return "system";
    }
    return "unknown";
}

/// @brief Parses the wire representation of a Role.
/// @return The role, or std::nullopt if the name is unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> std::optional<Role>
{
    if (str == "user")
        return Role::User;
    if (str == "assistant")
        return Role::Assistant;
    if (str == "computer")
        return Role::Computer;
    if (str == "system")
        return Role::System;
    return std::nullopt;
}

/// @brief Classification of a chunk in the response stream.
enum class ChunkKind
{
    Message,
    Code,
    ConsoleActiveLine,
    ConsoleOutput,
    Confirmation,
    Review,
};

/// @brief Converts a ChunkKind to its wire representation.
[[nodiscard]] constexpr auto chunkKindToString(ChunkKind kind) -> std::string_view
{
    switch (kind)
    {
        case ChunkKind::Message: return "message";
        case ChunkKind::Code: return "code";
        case ChunkKind::ConsoleActiveLine: return "console_active_line";
        case ChunkKind::ConsoleOutput: return "console_output";
        case ChunkKind::Confirmation: return "confirmation";
        case ChunkKind::Review: return "review";
    }
    return "unknown";
}

/// @brief Parses the wire representation of a ChunkKind.
[[nodiscard]] constexpr auto chunkKindFromString(std::string_view str) -> std::optional<ChunkKind>
{
    if (str == "message")
        return ChunkKind::Message;
    if (str == "code")
        return ChunkKind::Code;
    if (str == "console_active_line")
        return ChunkKind::ConsoleActiveLine;
    if (str == "console_output")
        return ChunkKind::ConsoleOutput;
    if (str == "confirmation")
        return ChunkKind::Confirmation;
    if (str == "review")
        return ChunkKind::Review;
    return std::nullopt;
}

/// @brief Returns true for the two console kinds, which share one display group.
[[nodiscard]] constexpr auto isConsoleKind(ChunkKind kind) -> bool
{
    return kind == ChunkKind::ConsoleActiveLine || kind == ChunkKind::ConsoleOutput;
}

/// @brief A single event of the response stream. Never mutated after construction.
///
/// Group boundary markers are chunks without content that carry exactly one of
/// @c start or @c end.
struct Chunk
{
    Role role = Role::Assistant;
    ChunkKind kind = ChunkKind::Message;
    std::optional<std::string> format;
    std::optional<std::string> content;
    bool start = false;
    bool end = false;

    /// @brief Returns true if this chunk is a group boundary marker.
    [[nodiscard]] auto isBoundary() const -> bool { return start || end; }

    /// @brief Returns true if this chunk must never be stored as a Message.
    [[nodiscard]] auto isEphemeral() const -> bool
    {
        return kind == ChunkKind::ConsoleActiveLine || kind == ChunkKind::Review;
    }

    auto operator==(const Chunk&) const -> bool = default;
};

/// @brief A persisted entry of the conversation transcript.
struct Message
{
    Role role = Role::User;
    ChunkKind kind = ChunkKind::Message;
    std::optional<std::string> format;
    std::string content;

    auto operator==(const Message&) const -> bool = default;
};

} // namespace codeloop
