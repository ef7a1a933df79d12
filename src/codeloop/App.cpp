// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/Conversation.hpp>
#include <agent/ResponseLoop.hpp>
#include <core/Log.hpp>
#include <core/Wire.hpp>
#include <exec/SubprocessExecutor.hpp>
#include <llm/ScriptedModelClient.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <print>

namespace codeloop
{

namespace
{
    auto isYes(std::string_view answer) -> bool
    {
        auto lowered = std::string {};
        for (auto const c: answer)
        {
            if (!std::isspace(static_cast<unsigned char>(c)))
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return lowered == "y" || lowered == "yes";
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    AppOptions options;
    std::unique_ptr<ScriptedModelClient> client;
    std::unique_ptr<SubprocessExecutor> executor;
    Conversation conversation;
    std::unique_ptr<ResponseLoop> loop;

    // Text rendering state
    bool atLineStart = true;

    void print(std::string_view text)
    {
        if (text.empty())
            return;
        std::print("{}", text);
        std::fflush(stdout);
        atLineStart = text.back() == '\n';
    }

    void newline()
    {
        if (!atLineStart)
            print("\n");
    }

    void render(const Chunk& chunk)
    {
        if (options.json)
        {
            std::println("{}", wire::toJson(chunk).dump());
            std::fflush(stdout);
            return;
        }

        switch (chunk.kind)
        {
            case ChunkKind::Message:
                if (chunk.content)
                    print(*chunk.content);
                else if (chunk.end)
                    newline();
                break;
            case ChunkKind::Code:
                if (chunk.start)
                {
                    newline();
                    print(std::format("```{}\n", chunk.format.value_or("")));
                }
                else if (chunk.end)
                {
                    newline();
                    print("```\n");
                }
                else if (chunk.content)
                {
                    print(*chunk.content);
                }
                break;
            case ChunkKind::ConsoleActiveLine:
                if (chunk.content)
                    log::trace("Active line {}", *chunk.content);
                break;
            case ChunkKind::ConsoleOutput:
                if (chunk.start)
                {
                    newline();
                    print("Output:\n");
                }
                else if (chunk.end)
                {
                    newline();
                }
                else if (chunk.content)
                {
                    print(*chunk.content);
                }
                break;
            case ChunkKind::Confirmation:
            case ChunkKind::Review: break;
        }
    }

    auto confirm(const Chunk& confirmation) -> ExecutionDecision
    {
        newline();
        log::debug("Confirmation requested for {} code", confirmation.format.value_or(""));
        std::print(stderr, "Run this code? (y/n) ");
        std::fflush(stderr);

        auto answer = std::string {};
        if (!std::getline(std::cin, answer))
            return ExecutionDecision::Skip;
        return isYes(answer) ? ExecutionDecision::Run : ExecutionDecision::Skip;
    }

    auto respond(std::string message) -> VoidResult
    {
        auto result = loop->run(
            std::move(message),
            [this](const Chunk& chunk) { render(chunk); },
            [this](const Chunk& chunk) { return confirm(chunk); });
        if (!result)
            return std::unexpected(result.error());

        newline();
        log::debug("Response added {} message(s) after {} execution(s)", result->size(), loop->executions());
        return {};
    }

    auto writeTranscript() const -> VoidResult
    {
        auto file = std::ofstream(options.outputPath);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write transcript: {}", options.outputPath));
        file << conversation.toJson().dump(2) << '\n';
        return {};
    }
};

App::App(AppConfig config, AppOptions options): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->options = std::move(options);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto valid = validateConfig(_impl->config); !valid)
        return valid;

    auto script = loadScript(_impl->options.replayPath);
    if (!script)
        return std::unexpected(script.error());

    log::info("Loaded {} scripted response(s) from {}", script->size(), _impl->options.replayPath);

    _impl->client = std::make_unique<ScriptedModelClient>(std::move(*script), _impl->options.deltaSize);
    _impl->executor = std::make_unique<SubprocessExecutor>(makeExecutorConfig(_impl->config));
    _impl->loop = std::make_unique<ResponseLoop>(
        *_impl->client, *_impl->executor, _impl->conversation, makeResponseConfig(_impl->config));
    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;

    auto result = impl.respond(impl.options.message);

    // Loop turns stop once the script has nothing left to say.
    while (result && continueLoop(impl.conversation, impl.config.loop) && impl.client->remaining() > 0)
    {
        log::info("No breaker phrase found, continuing the loop");
        result = impl.respond(impl.config.loop.message);
    }

    if (!result)
        log::error("Response failed: {}", result.error());

    if (!impl.options.outputPath.empty())
    {
        if (auto written = impl.writeTranscript(); !written)
        {
            log::error("{}", written.error());
            return 1;
        }
    }

    return result ? 0 : 1;
}

} // namespace codeloop
