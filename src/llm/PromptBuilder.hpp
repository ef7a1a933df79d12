// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <llm/ModelClient.hpp>

#include <span>
#include <string>
#include <string_view>

namespace codeloop
{

inline constexpr auto DefaultSystemMessage = std::string_view {
    "You are a world-class programmer that can complete any goal by executing code.\n"
    "When you execute code, it will be executed on the user's machine. The user has given you full and "
    "complete permission to execute any code necessary to complete the task.\n"
    "Write messages to the user in Markdown. Keep code blocks small and run them step by step."
};

inline constexpr auto DefaultCodeOutputTemplate = std::string_view {
    "Code output: {content}\n\nWhat does this output mean / what's next (if anything, or are we done)?"
};

inline constexpr auto DefaultEmptyCodeOutputTemplate = std::string_view {
    "The code above was executed on my machine. It produced no text output. what's next (if anything, or "
    "are we done?)"
};

/// @brief How the transcript is rendered for the model.
struct PromptConfig
{
    std::string systemMessage = std::string(DefaultSystemMessage);
    std::string customInstructions;
    std::string userMessageTemplate = "{content}";
    bool alwaysApplyUserMessageTemplate = false;
    std::string codeOutputTemplate = std::string(DefaultCodeOutputTemplate);
    std::string emptyCodeOutputTemplate = std::string(DefaultEmptyCodeOutputTemplate);

    /// @brief Role that reports execution output to the model (User or Assistant).
    Role codeOutputSender = Role::User;
};

/// @brief Replaces every "{content}" placeholder in @p tmpl.
[[nodiscard]] auto fillTemplate(std::string_view tmpl, std::string_view content) -> std::string;

/// @brief Renders the transcript into a model request.
[[nodiscard]] auto buildModelRequest(std::span<const Message> messages, const PromptConfig& config)
    -> ModelRequest;

} // namespace codeloop
