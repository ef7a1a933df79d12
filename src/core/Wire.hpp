// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <span>
#include <vector>

namespace codeloop::wire
{

/// @brief Serializes a chunk. Absent fields and false flags are omitted.
[[nodiscard]] auto toJson(const Chunk& chunk) -> nlohmann::json;

/// @brief Serializes a message.
[[nodiscard]] auto toJson(const Message& message) -> nlohmann::json;

/// @brief Serializes a whole transcript as a JSON array.
[[nodiscard]] auto toJson(std::span<const Message> messages) -> nlohmann::json;

/// @brief Parses a chunk record.
[[nodiscard]] auto chunkFromJson(const nlohmann::json& value) -> Result<Chunk>;

/// @brief Parses a message record. A missing content field reads as empty.
[[nodiscard]] auto messageFromJson(const nlohmann::json& value) -> Result<Message>;

/// @brief Parses a transcript array.
[[nodiscard]] auto transcriptFromJson(const nlohmann::json& value) -> Result<std::vector<Message>>;

} // namespace codeloop::wire
