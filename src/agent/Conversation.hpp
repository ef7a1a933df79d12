// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace codeloop
{

class ResponseLoop;

/// @brief Owns the transcript of one conversation.
///
/// The message list is written by user-facing calls between responses and by the
/// aggregator of the running response, never by both at once.
class Conversation
{
  public:
    Conversation() = default;

    /// @brief Restores a conversation from a previously saved transcript.
    explicit Conversation(std::vector<Message> messages);

    /// @brief Appends a user message.
    void addUserMessage(std::string content);

    /// @brief Returns all messages in order.
    [[nodiscard]] auto messages() const -> std::span<const Message>;

    /// @brief Returns the messages from @p index on (empty if past the end).
    [[nodiscard]] auto messagesSince(std::size_t index) const -> std::span<const Message>;

    /// @brief Returns the last message with the given role and kind, if any.
    [[nodiscard]] auto lastMessageOf(Role role, ChunkKind kind) const -> const Message*;

    [[nodiscard]] auto size() const -> std::size_t { return _messages.size(); }
    [[nodiscard]] auto empty() const -> bool { return _messages.empty(); }

    /// @brief Removes every message.
    void reset();

    /// @brief Serializes the transcript as a JSON array of wire records.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /// @brief Parses a transcript produced by toJson().
    [[nodiscard]] static auto fromJson(const nlohmann::json& value) -> Result<Conversation>;

  private:
    friend class ResponseLoop;

    std::vector<Message> _messages;
};

} // namespace codeloop
