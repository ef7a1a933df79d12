// SPDX-License-Identifier: Apache-2.0
#include "Wire.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace codeloop::wire
{

namespace
{
    struct Header
    {
        Role role;
        ChunkKind kind;
        std::optional<std::string> format;
    };

    auto parseHeader(const nlohmann::json& value) -> Result<Header>
    {
        if (!value.is_object())
            return makeError(ErrorCode::ProtocolError, "Expected a JSON object");

        auto roleName = json::getString(value, "role");
        if (!roleName)
            return std::unexpected(roleName.error());
        auto const role = roleFromString(*roleName);
        if (!role)
            return makeError(ErrorCode::ProtocolError, std::format("Unknown role: {}", *roleName));

        auto kindName = json::getString(value, "kind");
        if (!kindName)
            return std::unexpected(kindName.error());
        auto const kind = chunkKindFromString(*kindName);
        if (!kind)
            return makeError(ErrorCode::ProtocolError, std::format("Unknown kind: {}", *kindName));

        return Header { .role = *role, .kind = *kind, .format = json::getOptionalString(value, "format") };
    }
} // namespace

auto toJson(const Chunk& chunk) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "role", std::string(roleToString(chunk.role)) },
        { "kind", std::string(chunkKindToString(chunk.kind)) },
    };
    if (chunk.format)
        out["format"] = *chunk.format;
    if (chunk.content)
        out["content"] = *chunk.content;
    if (chunk.start)
        out["start"] = true;
    if (chunk.end)
        out["end"] = true;
    return out;
}

auto toJson(const Message& message) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "role", std::string(roleToString(message.role)) },
        { "kind", std::string(chunkKindToString(message.kind)) },
    };
    if (message.format)
        out["format"] = *message.format;
    out["content"] = message.content;
    return out;
}

auto toJson(std::span<const Message> messages) -> nlohmann::json
{
    auto out = nlohmann::json::array();
    for (const auto& message: messages)
        out.push_back(toJson(message));
    return out;
}

auto chunkFromJson(const nlohmann::json& value) -> Result<Chunk>
{
    return parseHeader(value).transform([&](Header header) {
        return Chunk {
            .role = header.role,
            .kind = header.kind,
            .format = std::move(header.format),
            .content = json::getOptionalString(value, "content"),
            .start = json::getBoolOr(value, "start", false),
            .end = json::getBoolOr(value, "end", false),
        };
    });
}

auto messageFromJson(const nlohmann::json& value) -> Result<Message>
{
    return parseHeader(value).transform([&](Header header) {
        return Message {
            .role = header.role,
            .kind = header.kind,
            .format = std::move(header.format),
            .content = json::getStringOr(value, "content", ""),
        };
    });
}

auto transcriptFromJson(const nlohmann::json& value) -> Result<std::vector<Message>>
{
    if (!value.is_array())
        return makeError(ErrorCode::ProtocolError, "Transcript must be a JSON array");

    auto messages = std::vector<Message> {};
    messages.reserve(value.size());
    for (const auto& entry: value)
    {
        auto message = messageFromJson(entry);
        if (!message)
            return std::unexpected(message.error());
        messages.push_back(std::move(*message));
    }
    return messages;
}

} // namespace codeloop::wire
