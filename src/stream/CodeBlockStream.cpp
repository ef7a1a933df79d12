// SPDX-License-Identifier: Apache-2.0
#include "CodeBlockStream.hpp"

#include <core/Log.hpp>

namespace codeloop
{

CodeBlockStream::CodeBlockStream(ModelClient& client, ModelRequest request, ExtractorConfig config):
    _client(client), _request(std::move(request)), _extractor(std::move(config))
{
}

auto CodeBlockStream::open() -> VoidResult
{
    auto const& config = _extractor.config();
    if (config.appendExecutionInstructions && !config.executionInstructions.empty())
    {
        if (!_request.systemMessage.empty())
            _request.systemMessage += "\n";
        _request.systemMessage += config.executionInstructions;
    }

    log::debug("Requesting completion with {} message(s)", _request.messages.size());

    auto deltas = _client.stream(_request);
    if (!deltas)
        return std::unexpected(deltas.error());

    _deltas = std::move(*deltas);
    return {};
}

auto CodeBlockStream::next() -> Result<std::optional<Chunk>>
{
    while (_pending.empty())
    {
        if (_exhausted)
            return std::nullopt;

        if (!_deltas)
        {
            if (auto opened = open(); !opened)
                return std::unexpected(opened.error());
        }

        auto delta = _deltas->next();
        if (!delta)
            return std::unexpected(delta.error());

        if (!*delta)
        {
            _exhausted = true;
            for (auto& chunk: _extractor.finish())
                _pending.push_back(std::move(chunk));
            log::debug("Model stream finished after {} code block(s)", _extractor.blockCount());
            continue;
        }

        if (!(*delta)->content)
            continue;

        for (auto& chunk: _extractor.feed(*(*delta)->content))
            _pending.push_back(std::move(chunk));
    }

    auto chunk = std::move(_pending.front());
    _pending.pop_front();
    return chunk;
}

} // namespace codeloop
