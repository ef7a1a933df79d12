// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeloop
{

/// @brief A message in the form a chat model consumes it.
struct ModelMessage
{
    Role role = Role::User;
    std::string content;

    auto operator==(const ModelMessage&) const -> bool = default;
};

/// @brief A complete request to a chat model.
struct ModelRequest
{
    std::string systemMessage;
    std::vector<ModelMessage> messages;
};

/// @brief One streamed record from the model. Records without content are skipped.
struct TextDelta
{
    std::optional<std::string> content;
};

/// @brief Pull sequence of text deltas, terminated by std::nullopt.
class DeltaSource
{
  public:
    virtual ~DeltaSource() = default;

    [[nodiscard]] virtual auto next() -> Result<std::optional<TextDelta>> = 0;
};

/// @brief Abstract chat model client.
class ModelClient
{
  public:
    virtual ~ModelClient() = default;

    /// @brief Starts a streamed completion for @p request.
    /// @return The delta stream or an error.
    [[nodiscard]] virtual auto stream(const ModelRequest& request) -> Result<std::unique_ptr<DeltaSource>> = 0;
};

} // namespace codeloop
