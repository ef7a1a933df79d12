// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ModelClient.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codeloop
{

/// @brief Model client that replays canned responses.
///
/// Each call to stream() consumes the next response and delivers it in deltas of
/// @c deltaSize code points. Once the script is exhausted, streams are empty.
class ScriptedModelClient: public ModelClient
{
  public:
    explicit ScriptedModelClient(std::vector<std::string> responses, std::size_t deltaSize = 1);

    [[nodiscard]] auto stream(const ModelRequest& request) -> Result<std::unique_ptr<DeltaSource>> override;

    /// @brief Requests received so far, in order.
    [[nodiscard]] auto requests() const -> const std::vector<ModelRequest>& { return _requests; }

    /// @brief Number of responses not yet replayed.
    [[nodiscard]] auto remaining() const -> std::size_t { return _responses.size() - _cursor; }

  private:
    std::vector<std::string> _responses;
    std::size_t _deltaSize;
    std::size_t _cursor = 0;
    std::vector<ModelRequest> _requests;
};

/// @brief Splits @p text into pieces of at most @p size code points each.
[[nodiscard]] auto splitIntoDeltas(std::string_view text, std::size_t size) -> std::vector<std::string>;

/// @brief Loads a replay script: a JSON array of response strings.
[[nodiscard]] auto loadScript(std::string_view path) -> Result<std::vector<std::string>>;

} // namespace codeloop
