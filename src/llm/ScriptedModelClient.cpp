// SPDX-License-Identifier: Apache-2.0
#include "ScriptedModelClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace codeloop
{

namespace
{
    class VectorDeltaSource: public DeltaSource
    {
      public:
        explicit VectorDeltaSource(std::vector<std::string> deltas): _deltas(std::move(deltas)) {}

        auto next() -> Result<std::optional<TextDelta>> override
        {
            if (_index >= _deltas.size())
                return std::nullopt;
            return TextDelta { .content = std::move(_deltas[_index++]) };
        }

      private:
        std::vector<std::string> _deltas;
        std::size_t _index = 0;
    };
} // namespace

auto splitIntoDeltas(std::string_view text, std::size_t size) -> std::vector<std::string>
{
    auto deltas = std::vector<std::string> {};
    if (size == 0)
        size = 1;

    auto current = std::string {};
    auto count = std::size_t { 0 };
    for (auto const c: text)
    {
        auto const startsCharacter = (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        if (startsCharacter && count == size)
        {
            deltas.push_back(std::move(current));
            current.clear();
            count = 0;
        }
        if (startsCharacter)
            ++count;
        current.push_back(c);
    }
    if (!current.empty())
        deltas.push_back(std::move(current));
    return deltas;
}

ScriptedModelClient::ScriptedModelClient(std::vector<std::string> responses, std::size_t deltaSize):
    _responses(std::move(responses)), _deltaSize(deltaSize)
{
}

auto ScriptedModelClient::stream(const ModelRequest& request) -> Result<std::unique_ptr<DeltaSource>>
{
    _requests.push_back(request);

    if (_cursor >= _responses.size())
    {
        log::debug("Replay script exhausted, returning an empty completion");
        return std::make_unique<VectorDeltaSource>(std::vector<std::string> {});
    }

    auto const& response = _responses[_cursor++];
    return std::make_unique<VectorDeltaSource>(splitIntoDeltas(response, _deltaSize));
}

auto loadScript(std::string_view path) -> Result<std::vector<std::string>>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open replay script: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse(ss.str());
    if (!parsed)
        return std::unexpected(parsed.error());

    if (!parsed->is_array())
        return makeError(ErrorCode::ProtocolError, "Replay script must be a JSON array of strings");

    auto responses = std::vector<std::string> {};
    for (const auto& entry: *parsed)
    {
        if (!entry.is_string())
            return makeError(ErrorCode::ProtocolError, "Replay script entries must be strings");
        responses.push_back(entry.get<std::string>());
    }
    return responses;
}

} // namespace codeloop
