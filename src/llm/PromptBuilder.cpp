// SPDX-License-Identifier: Apache-2.0
#include "PromptBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace codeloop
{

namespace
{
    constexpr auto Placeholder = std::string_view { "{content}" };

    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    auto renderCode(const Message& message) -> std::string
    {
        auto const& code = message.content;
        auto const newline = code.ends_with('\n') ? "" : "\n";
        return std::format("```{}\n{}{}```", message.format.value_or(""), code, newline);
    }

    void append(std::vector<ModelMessage>& out, Role role, std::string content)
    {
        if (!out.empty() && out.back().role == role)
        {
            out.back().content += "\n\n";
            out.back().content += content;
            return;
        }
        out.push_back(ModelMessage { .role = role, .content = std::move(content) });
    }
} // namespace

auto fillTemplate(std::string_view tmpl, std::string_view content) -> std::string
{
    auto result = std::string {};
    auto pos = std::size_t { 0 };
    while (true)
    {
        auto const found = tmpl.find(Placeholder, pos);
        if (found == std::string_view::npos)
        {
            result.append(tmpl.substr(pos));
            return result;
        }
        result.append(tmpl.substr(pos, found - pos));
        result.append(content);
        pos = found + Placeholder.size();
    }
}

auto buildModelRequest(std::span<const Message> messages, const PromptConfig& config) -> ModelRequest
{
    auto request = ModelRequest {};
    request.systemMessage = config.systemMessage;
    if (!config.customInstructions.empty())
        request.systemMessage += "\n\n" + config.customInstructions;

    auto const templated = config.userMessageTemplate != Placeholder;

    for (auto index = std::size_t { 0 }; index < messages.size(); ++index)
    {
        auto const& message = messages[index];
        switch (message.role)
        {
            case Role::System:
                request.systemMessage += "\n\n" + message.content;
                break;

            case Role::User:
            {
                auto const isLatest = index + 1 == messages.size();
                if (templated && (config.alwaysApplyUserMessageTemplate || isLatest))
                    append(request.messages, Role::User, fillTemplate(config.userMessageTemplate, message.content));
                else
                    append(request.messages, Role::User, message.content);
                break;
            }

            case Role::Assistant:
                if (message.kind == ChunkKind::Code)
                    append(request.messages, Role::Assistant, renderCode(message));
                else if (message.kind == ChunkKind::Message)
                    append(request.messages, Role::Assistant, message.content);
                break;

            case Role::Computer:
                if (message.kind != ChunkKind::ConsoleOutput)
                    break;
                if (isBlank(message.content))
                    append(request.messages, config.codeOutputSender, config.emptyCodeOutputTemplate);
                else
                    append(request.messages,
                           config.codeOutputSender,
                           fillTemplate(config.codeOutputTemplate, message.content));
                break;
        }
    }

    return request;
}

} // namespace codeloop
