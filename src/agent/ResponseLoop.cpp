// SPDX-License-Identifier: Apache-2.0
#include "ResponseLoop.hpp"

#include <core/Log.hpp>
#include <stream/CodeBlockStream.hpp>

#include <algorithm>
#include <cctype>
#include <deque>
#include <format>

namespace codeloop
{

namespace
{
    auto consoleOutput(std::string content) -> Chunk
    {
        return Chunk {
            .role = Role::Computer,
            .kind = ChunkKind::ConsoleOutput,
            .format = std::nullopt,
            .content = std::move(content),
            .start = false,
            .end = false,
        };
    }

    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    auto executionFinished() -> Chunk
    {
        return Chunk {
            .role = Role::Computer,
            .kind = ChunkKind::ConsoleActiveLine,
            .format = std::nullopt,
            .content = std::nullopt,
            .start = false,
            .end = false,
        };
    }
} // namespace

/// @brief Raw chunk source of one response, upstream of the aggregator.
///
/// Decisions about what to do after a model turn are taken from the transcript, which
/// the aggregator has brought up to date by the time the turn's stream is exhausted.
class ResponseLoop::Responder: public ChunkSource
{
  public:
    enum class Phase
    {
        Model,
        AwaitingDecision,
        Execute,
        Output,
        Done,
    };

    Responder(ModelClient& client,
              CodeExecutor& executor,
              const std::vector<Message>& messages,
              const ResponseConfig& config):
        _client(client), _executor(executor), _messages(messages), _config(config)
    {
    }

    auto next() -> Result<std::optional<Chunk>> override
    {
        while (_pending.empty())
        {
            switch (_phase)
            {
                case Phase::Model: {
                    auto result = pullModel();
                    if (!result || *result)
                        return result;
                    break;
                }
                case Phase::AwaitingDecision:
                    return makeError(ErrorCode::ConfirmationRequired,
                                     std::format("Waiting for a decision on the {} code block", _language));
                case Phase::Execute: startExecution(); break;
                case Phase::Output: {
                    auto result = pullOutput();
                    if (!result || *result)
                        return result;
                    break;
                }
                case Phase::Done: return std::nullopt;
            }
        }

        auto chunk = std::move(_pending.front());
        _pending.pop_front();
        return chunk;
    }

    void resume(ExecutionDecision decision)
    {
        if (decision == ExecutionDecision::Run)
        {
            _phase = Phase::Execute;
            return;
        }
        log::info("Execution of the {} code block declined", _language);
        _phase = Phase::Done;
    }

    [[nodiscard]] auto phase() const -> Phase { return _phase; }
    [[nodiscard]] auto executions() const -> int { return _executions; }

  private:
    ModelClient& _client;
    CodeExecutor& _executor;
    const std::vector<Message>& _messages;
    const ResponseConfig& _config;

    Phase _phase = Phase::Model;
    std::unique_ptr<CodeBlockStream> _model;
    std::unique_ptr<ChunkSource> _output;
    std::deque<Chunk> _pending;
    std::string _language;
    std::string _code;
    int _executions = 0;

    auto pullModel() -> Result<std::optional<Chunk>>
    {
        if (!_model)
        {
            _model = std::make_unique<CodeBlockStream>(
                _client, buildModelRequest(_messages, _config.prompt), _config.extractor);
        }

        auto chunk = _model->next();
        if (!chunk || *chunk)
            return chunk;

        _model.reset();
        afterModelTurn();
        return std::nullopt;
    }

    // Trailing whitespace after a closing fence does not hide the block from execution.
    [[nodiscard]] auto pendingCodeBlock() const -> const Message*
    {
        for (auto it = _messages.rbegin(); it != _messages.rend(); ++it)
        {
            if (it->role == Role::Assistant && it->kind == ChunkKind::Code)
                return &*it;
            if (it->role != Role::Assistant || it->kind != ChunkKind::Message || !isBlank(it->content))
                return nullptr;
        }
        return nullptr;
    }

    void afterModelTurn()
    {
        auto const* block = pendingCodeBlock();
        if (!block)
        {
            _phase = Phase::Done;
            return;
        }

        if (_executions >= _config.maxSteps)
        {
            log::warning("Reached the limit of {} code execution(s), ending the response", _config.maxSteps);
            _phase = Phase::Done;
            return;
        }

        ++_executions;
        _language = block->format.value_or(std::string {});
        _code = block->content;

        if (!_executor.supports(_language))
        {
            log::info("No executor for language '{}'", _language);
            _pending.push_back(consoleOutput(std::format("`{}` disabled or not supported.\n", _language)));
            _pending.push_back(executionFinished());
            _phase = Phase::Model;
            return;
        }

        _pending.push_back(Chunk {
            .role = Role::Computer,
            .kind = ChunkKind::Confirmation,
            .format = _language,
            .content = _code,
            .start = false,
            .end = false,
        });
        _phase = _config.aggregator.autoRun ? Phase::Execute : Phase::AwaitingDecision;
    }

    void startExecution()
    {
        log::debug("Running {} code block ({} of at most {})", _language, _executions, _config.maxSteps);

        auto source = _executor.run(_language, _code);
        if (!source)
        {
            log::error("Execution failed to start: {}", source.error());
            _pending.push_back(consoleOutput(std::format("Error: {}\n", source.error().message)));
            _pending.push_back(executionFinished());
            _phase = Phase::Model;
            return;
        }

        _output = std::move(*source);
        _phase = Phase::Output;
    }

    auto pullOutput() -> Result<std::optional<Chunk>>
    {
        auto chunk = _output->next();
        if (!chunk)
            return std::unexpected(chunk.error());

        if (!*chunk)
        {
            _output.reset();
            _phase = Phase::Model;
            return std::nullopt;
        }

        (*chunk)->role = Role::Computer;
        return chunk;
    }
};

ResponseLoop::ResponseLoop(ModelClient& client,
                           CodeExecutor& executor,
                           Conversation& conversation,
                           ResponseConfig config):
    _client(client), _executor(executor), _conversation(conversation), _config(std::move(config))
{
}

ResponseLoop::~ResponseLoop() = default;

auto ResponseLoop::start(std::string userMessage, std::stop_token stopToken) -> VoidResult
{
    if (_running)
        return makeError(ErrorCode::InvalidArgument, "A response is already running");

    _firstMessage = _conversation.size();
    _conversation.addUserMessage(std::move(userMessage));
    _confirmationDelivered = false;

    // The aggregator refers to the responder, so it must go first.
    _aggregator.reset();
    _responder = std::make_unique<Responder>(_client, _executor, _conversation._messages, _config);
    _aggregator = std::make_unique<MessageAggregator>(
        *_responder, _conversation._messages, _config.aggregator, std::move(stopToken));
    _running = true;
    return {};
}

auto ResponseLoop::next() -> Result<std::optional<Chunk>>
{
    if (!_running)
        return std::nullopt;

    if (awaitingConfirmation())
        return makeError(ErrorCode::ConfirmationRequired, "A confirmation must be answered before continuing");

    auto chunk = _aggregator->next();
    if (!chunk)
    {
        if (chunk.error().code == ErrorCode::Cancelled)
            _executor.terminate();
        _running = false;
        return chunk;
    }

    if (!*chunk)
        _running = false;
    else if ((*chunk)->kind == ChunkKind::Confirmation)
        _confirmationDelivered = true;
    return chunk;
}

auto ResponseLoop::resume(ExecutionDecision decision) -> VoidResult
{
    if (!awaitingConfirmation())
        return makeError(ErrorCode::InvalidArgument, "No confirmation is pending");

    _confirmationDelivered = false;
    _responder->resume(decision);
    return {};
}

auto ResponseLoop::awaitingConfirmation() const -> bool
{
    return _running && _confirmationDelivered && _responder
           && _responder->phase() == Responder::Phase::AwaitingDecision;
}

auto ResponseLoop::executions() const -> int
{
    return _responder ? _responder->executions() : 0;
}

auto ResponseLoop::run(std::string userMessage,
                       const ChunkCallback& onChunk,
                       const ConfirmCallback& confirm,
                       std::stop_token stopToken) -> Result<std::vector<Message>>
{
    if (auto started = start(std::move(userMessage), std::move(stopToken)); !started)
        return std::unexpected(started.error());

    while (true)
    {
        auto chunk = next();
        if (!chunk)
            return std::unexpected(chunk.error());
        if (!*chunk)
            break;

        if (onChunk)
            onChunk(**chunk);

        if ((*chunk)->kind == ChunkKind::Confirmation && awaitingConfirmation())
        {
            auto const decision = confirm ? confirm(**chunk) : ExecutionDecision::Skip;
            if (auto resumed = resume(decision); !resumed)
                return std::unexpected(resumed.error());
        }
    }

    auto const added = _conversation.messagesSince(_firstMessage);
    return std::vector<Message>(added.begin(), added.end());
}

auto continueLoop(const Conversation& conversation, const LoopConfig& config) -> bool
{
    if (!config.enabled)
        return false;

    auto const* last = conversation.lastMessageOf(Role::Assistant, ChunkKind::Message);
    if (!last)
        return true;

    return std::ranges::none_of(config.breakers, [&](const auto& breaker) {
        return last->content.find(breaker) != std::string::npos;
    });
}

} // namespace codeloop
