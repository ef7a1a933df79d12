// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Conversation.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <exec/CodeExecutor.hpp>
#include <llm/ModelClient.hpp>
#include <llm/PromptBuilder.hpp>
#include <stream/CodeBlockExtractor.hpp>
#include <stream/MessageAggregator.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace codeloop
{

/// @brief Configuration for one response.
struct ResponseConfig
{
    ExtractorConfig extractor;
    AggregatorConfig aggregator;
    PromptConfig prompt;

    /// @brief Maximum number of code executions per response.
    int maxSteps = 10;
};

/// @brief Answer to a pending confirmation.
enum class ExecutionDecision
{
    Run,
    Skip,
};

/// @brief Settings for repeating a response until the model says it is done.
struct LoopConfig
{
    bool enabled = false;
    std::string message = "Proceed. You CAN run code on my machine. If the entire task is done, say exactly 'The "
                          "task is done.' If you need some specific information (like username or password) say "
                          "EXACTLY 'Please provide more information.' If it's impossible, say 'The task is "
                          "impossible.' (If I haven't provided a task, say exactly 'Let me know what you'd like to "
                          "do next.') Otherwise keep going.";
    std::vector<std::string> breakers = {
        "The task is done.",
        "The task is impossible.",
        "Let me know what you'd like to do next.",
        "Please provide more information.",
    };
};

/// @brief Receives every chunk yielded by a response.
using ChunkCallback = std::function<void(const Chunk& chunk)>;

/// @brief Decides whether the code carried by a confirmation chunk may run.
using ConfirmCallback = std::function<ExecutionDecision(const Chunk& confirmation)>;

/// @brief Drives responses: model turns, confirmations and code execution.
///
/// A response alternates between streaming a model turn and running the code block the
/// turn ended with, until a turn ends without code. Every chunk passes through a
/// MessageAggregator that records the transcript in the conversation.
///
/// Pulling is the caller's job: start() a response, then call next() until it yields
/// std::nullopt. When a confirmation chunk has been yielded, answer it with resume()
/// before pulling again.
class ResponseLoop
{
  public:
    ResponseLoop(ModelClient& client, CodeExecutor& executor, Conversation& conversation, ResponseConfig config);
    ~ResponseLoop();

    ResponseLoop(const ResponseLoop&) = delete;
    ResponseLoop& operator=(const ResponseLoop&) = delete;

    /// @brief Appends @p userMessage to the conversation and begins a response.
    /// @return An error if a response is still running.
    [[nodiscard]] auto start(std::string userMessage, std::stop_token stopToken = {}) -> VoidResult;

    /// @brief Pulls the next chunk of the running response.
    /// @return The chunk, std::nullopt once the response is complete, or an error.
    ///         ErrorCode::ConfirmationRequired is returned while a decision is outstanding.
    [[nodiscard]] auto next() -> Result<std::optional<Chunk>>;

    /// @brief Answers the outstanding confirmation.
    [[nodiscard]] auto resume(ExecutionDecision decision) -> VoidResult;

    /// @brief Returns true once a confirmation chunk has been yielded and not yet answered.
    [[nodiscard]] auto awaitingConfirmation() const -> bool;

    /// @brief Returns true between start() and the end of the response.
    [[nodiscard]] auto running() const -> bool { return _running; }

    /// @brief Runs a whole response, answering confirmations through @p confirm.
    ///
    /// Without a confirm callback every execution is skipped.
    /// @return The messages added by this response, starting with the user message.
    [[nodiscard]] auto run(std::string userMessage,
                           const ChunkCallback& onChunk,
                           const ConfirmCallback& confirm = {},
                           std::stop_token stopToken = {}) -> Result<std::vector<Message>>;

    [[nodiscard]] auto config() const -> const ResponseConfig& { return _config; }

    /// @brief Number of code executions started by the current (or last) response.
    [[nodiscard]] auto executions() const -> int;

  private:
    class Responder;

    ModelClient& _client;
    CodeExecutor& _executor;
    Conversation& _conversation;
    ResponseConfig _config;

    std::unique_ptr<Responder> _responder;
    std::unique_ptr<MessageAggregator> _aggregator;
    std::size_t _firstMessage = 0;
    bool _running = false;
    bool _confirmationDelivered = false;
};

/// @brief Returns true if loop mode is on and the last assistant message contains no breaker phrase.
[[nodiscard]] auto continueLoop(const Conversation& conversation, const LoopConfig& config) -> bool;

} // namespace codeloop
