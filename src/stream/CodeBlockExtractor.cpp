// SPDX-License-Identifier: Apache-2.0
#include "CodeBlockExtractor.hpp"

#include <core/Log.hpp>

#include <cctype>

namespace codeloop
{

namespace
{
    constexpr auto Fence = std::string_view { "```" };

    // Length of the backtick run ending the buffer. Without a complete fence in the
    // buffer this is at most two; those bytes may still become a fence.
    auto trailingBackticks(std::string_view buffer) -> std::size_t
    {
        auto count = std::size_t { 0 };
        while (count < buffer.size() && count < Fence.size() - 1 && buffer[buffer.size() - 1 - count] == '`')
            ++count;
        return count;
    }
} // namespace

auto normalizeLanguageTag(std::string_view infoLine) -> std::string
{
    auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    auto begin = std::size_t { 0 };
    while (begin < infoLine.size() && isSpace(infoLine[begin]))
        ++begin;
    auto end = begin;
    while (end < infoLine.size() && !isSpace(infoLine[end]))
        ++end;

    auto tag = std::string {};
    for (auto const c: infoLine.substr(begin, end - begin))
    {
        auto const uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalpha(uc))
            tag.push_back(static_cast<char>(std::tolower(uc)));
    }
    return tag;
}

CodeBlockExtractor::CodeBlockExtractor(ExtractorConfig config): _config(std::move(config))
{
}

auto CodeBlockExtractor::defaultLanguage() const -> std::string_view
{
    return _config.defaultLanguageIsText ? "text" : "python";
}

auto CodeBlockExtractor::feed(std::string_view delta) -> std::vector<Chunk>
{
    auto out = std::vector<Chunk> {};
    if (delta.empty())
        return out;

    _buffer.append(delta);
    process(out);
    return out;
}

auto CodeBlockExtractor::finish() -> std::vector<Chunk>
{
    auto out = std::vector<Chunk> {};
    process(out);

    switch (_state)
    {
        case State::Outside: emit(out, ChunkKind::Message, _buffer); break;
        case State::InBody:
            log::debug("Stream ended inside a {} code block, flushing {} bytes", _language, _buffer.size());
            emit(out, ChunkKind::Code, _buffer);
            break;
        case State::AwaitingLanguage:
            log::debug("Stream ended before the info line of a code block; dropping '{}'", _buffer);
            break;
    }

    _buffer.clear();
    _state = State::Outside;
    return out;
}

void CodeBlockExtractor::process(std::vector<Chunk>& out)
{
    while (true)
    {
        switch (_state)
        {
            case State::Outside:
            {
                auto const fence = _buffer.find(Fence);
                if (fence == std::string::npos)
                {
                    // A partial fence in the tail keeps the whole buffer until it resolves.
                    if (trailingBackticks(_buffer) == 0)
                    {
                        emit(out, ChunkKind::Message, _buffer);
                        _buffer.clear();
                    }
                    return;
                }

                emit(out, ChunkKind::Message, std::string_view(_buffer).substr(0, fence));
                _buffer.erase(0, fence + Fence.size());
                _state = State::AwaitingLanguage;
                ++_blockCount;
                break;
            }

            case State::AwaitingLanguage:
            {
                auto const newline = _buffer.find('\n');
                auto const fence = _buffer.find(Fence);

                // Fence closed on the opening line, e.g. ```ls```.
                if (fence != std::string::npos && (newline == std::string::npos || fence < newline))
                {
                    _language = std::string(defaultLanguage());
                    emit(out, ChunkKind::Code, std::string_view(_buffer).substr(0, fence));
                    _buffer.erase(0, fence + Fence.size());
                    _state = State::Outside;
                    break;
                }

                if (newline == std::string::npos)
                    return;

                _language = normalizeLanguageTag(std::string_view(_buffer).substr(0, newline));
                if (_language.empty())
                    _language = std::string(defaultLanguage());
                log::debug("Code block #{} language: {}", _blockCount, _language);

                _buffer.erase(0, newline + 1);
                _state = State::InBody;
                break;
            }

            case State::InBody:
            {
                auto const fence = _buffer.find(Fence);
                if (fence == std::string::npos)
                {
                    // A partial fence in the tail keeps the whole buffer until it resolves.
                    if (trailingBackticks(_buffer) == 0)
                    {
                        emit(out, ChunkKind::Code, _buffer);
                        _buffer.clear();
                    }
                    return;
                }

                emit(out, ChunkKind::Code, std::string_view(_buffer).substr(0, fence));
                _buffer.erase(0, fence + Fence.size());
                _state = State::Outside;
                break;
            }
        }
    }
}

void CodeBlockExtractor::emit(std::vector<Chunk>& out, ChunkKind kind, std::string_view content) const
{
    if (content.empty())
        return;

    out.push_back(Chunk {
        .role = Role::Assistant,
        .kind = kind,
        .format = kind == ChunkKind::Code ? std::optional<std::string>(_language) : std::nullopt,
        .content = std::string(content),
        .start = false,
        .end = false,
    });
}

} // namespace codeloop
