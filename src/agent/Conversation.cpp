// SPDX-License-Identifier: Apache-2.0
#include "Conversation.hpp"

#include <core/Wire.hpp>

#include <utility>

namespace codeloop
{

Conversation::Conversation(std::vector<Message> messages): _messages(std::move(messages))
{
}

void Conversation::addUserMessage(std::string content)
{
    _messages.push_back(Message {
        .role = Role::User,
        .kind = ChunkKind::Message,
        .format = std::nullopt,
        .content = std::move(content),
    });
}

auto Conversation::messages() const -> std::span<const Message>
{
    return _messages;
}

auto Conversation::messagesSince(std::size_t index) const -> std::span<const Message>
{
    if (index >= _messages.size())
        return {};
    return std::span<const Message>(_messages).subspan(index);
}

auto Conversation::lastMessageOf(Role role, ChunkKind kind) const -> const Message*
{
    for (auto it = _messages.rbegin(); it != _messages.rend(); ++it)
    {
        if (it->role == role && it->kind == kind)
            return &*it;
    }
    return nullptr;
}

void Conversation::reset()
{
    _messages.clear();
}

auto Conversation::toJson() const -> nlohmann::json
{
    return wire::toJson(std::span<const Message>(_messages));
}

auto Conversation::fromJson(const nlohmann::json& value) -> Result<Conversation>
{
    return wire::transcriptFromJson(value).transform(
        [](std::vector<Message> messages) { return Conversation(std::move(messages)); });
}

} // namespace codeloop
