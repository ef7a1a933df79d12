// SPDX-License-Identifier: Apache-2.0
#include "MessageAggregator.hpp"

#include <core/Log.hpp>

namespace codeloop
{

namespace
{
    auto sameType(const Message& message, const Chunk& chunk) -> bool
    {
        return message.role == chunk.role && message.kind == chunk.kind && message.format == chunk.format;
    }

    // Empty content carries nothing to store or display. Chunks whose meaning is the
    // event itself (end of execution, confirmation, review) may come without content.
    auto carriesNothing(const Chunk& chunk) -> bool
    {
        if (chunk.content)
            return chunk.content->empty();
        return !chunk.isEphemeral() && chunk.kind != ChunkKind::Confirmation;
    }
} // namespace

MessageAggregator::MessageAggregator(ChunkSource& upstream,
                                     std::vector<Message>& messages,
                                     AggregatorConfig config,
                                     std::stop_token stopToken):
    _upstream(upstream), _messages(messages), _config(config), _stopToken(std::move(stopToken))
{
}

auto MessageAggregator::next() -> Result<std::optional<Chunk>>
{
    while (_pending.empty())
    {
        if (_cancelled)
            return makeError(ErrorCode::Cancelled, "Response cancelled");

        if (_finished)
            return std::nullopt;

        if (_stopToken.stop_requested())
        {
            log::info("Stop requested, abandoning the response");
            _cancelled = true;
            continue;
        }

        auto chunk = _upstream.next();
        if (!chunk)
            return std::unexpected(chunk.error());

        if (!*chunk)
        {
            closeGroup();
            _finished = true;
            continue;
        }

        process(std::move(**chunk));
    }

    auto chunk = std::move(_pending.front());
    _pending.pop_front();
    return chunk;
}

void MessageAggregator::process(Chunk chunk)
{
    auto const executionFinished = chunk.kind == ChunkKind::ConsoleActiveLine && !chunk.content;

    if (carriesNothing(chunk))
        return;

    // Every execution leaves exactly one output record, even when nothing was printed.
    if (executionFinished && (_messages.empty() || _messages.back().role != Role::Computer))
    {
        log::trace("Execution finished without output, recording an empty console output");
        _messages.push_back(Message {
            .role = Role::Computer,
            .kind = ChunkKind::ConsoleOutput,
            .format = std::nullopt,
            .content = {},
        });
        _openMessage = _messages.size() - 1;
    }

    if (chunk.kind == ChunkKind::Confirmation)
    {
        closeGroup();
        if (!_config.autoRun)
            _pending.push_back(std::move(chunk));
        return;
    }

    auto key = groupKeyOf(chunk);
    if (_openGroup && *_openGroup == key)
    {
        if (!chunk.isEphemeral())
        {
            if (!_messages.empty() && sameType(_messages.back(), chunk))
            {
                _messages.back().content += *chunk.content;
                _openMessage = _messages.size() - 1;
            }
            else
            {
                store(chunk);
            }
        }
    }
    else
    {
        closeGroup();
        log::trace("Opening {} {} group", roleToString(key.role), chunkKindToString(key.kind));
        _pending.push_back(boundary(key, true));
        _openGroup = std::move(key);

        if (!chunk.isEphemeral())
            store(chunk);
    }

    auto const isOutput = chunk.kind == ChunkKind::ConsoleOutput;
    _pending.push_back(std::move(chunk));

    if (isOutput && _openMessage)
    {
        auto& message = _messages[*_openMessage];
        message.content = truncateOutput(message.content, _config.maxOutputChars, _config.scrollbarHint);
    }
}

void MessageAggregator::closeGroup()
{
    if (!_openGroup)
        return;

    _pending.push_back(boundary(*_openGroup, false));
    _openGroup.reset();
}

void MessageAggregator::store(const Chunk& chunk)
{
    _messages.push_back(Message {
        .role = chunk.role,
        .kind = chunk.kind,
        .format = chunk.format,
        .content = chunk.content.value_or(std::string {}),
    });
    _openMessage = _messages.size() - 1;
}

auto MessageAggregator::groupKeyOf(const Chunk& chunk) -> GroupKey
{
    // Active lines and printed output form one console group; their format is not compared.
    if (isConsoleKind(chunk.kind))
        return GroupKey { .role = chunk.role, .kind = ChunkKind::ConsoleOutput, .format = std::nullopt };
    return GroupKey { .role = chunk.role, .kind = chunk.kind, .format = chunk.format };
}

auto MessageAggregator::boundary(const GroupKey& key, bool start) -> Chunk
{
    return Chunk {
        .role = key.role,
        .kind = key.kind,
        .format = key.format,
        .content = std::nullopt,
        .start = start,
        .end = !start,
    };
}

} // namespace codeloop
