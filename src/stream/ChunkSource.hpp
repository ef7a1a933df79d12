// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>

namespace codeloop
{

/// @brief Pull-based sequence of chunks.
///
/// Every stage of the response pipeline is a ChunkSource that pulls from its upstream
/// only when its own consumer pulls. std::nullopt marks exhaustion.
class ChunkSource
{
  public:
    virtual ~ChunkSource() = default;

    /// @brief Produces the next chunk (blocking on upstream I/O if needed).
    /// @return The next chunk, std::nullopt once exhausted, or an error.
    [[nodiscard]] virtual auto next() -> Result<std::optional<Chunk>> = 0;
};

} // namespace codeloop
