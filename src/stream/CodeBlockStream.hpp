// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ModelClient.hpp>
#include <stream/ChunkSource.hpp>
#include <stream/CodeBlockExtractor.hpp>

#include <deque>
#include <memory>

namespace codeloop
{

/// @brief Streams a model completion through a CodeBlockExtractor.
///
/// The model is contacted on the first pull. Errors from the model client or its delta
/// stream are returned unchanged.
class CodeBlockStream: public ChunkSource
{
  public:
    CodeBlockStream(ModelClient& client, ModelRequest request, ExtractorConfig config);

    [[nodiscard]] auto next() -> Result<std::optional<Chunk>> override;

  private:
    ModelClient& _client;
    ModelRequest _request;
    CodeBlockExtractor _extractor;
    std::unique_ptr<DeltaSource> _deltas;
    std::deque<Chunk> _pending;
    bool _exhausted = false;

    [[nodiscard]] auto open() -> VoidResult;
};

} // namespace codeloop
