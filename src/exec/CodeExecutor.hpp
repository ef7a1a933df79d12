// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/ChunkSource.hpp>

#include <memory>
#include <string_view>

namespace codeloop
{

/// @brief Abstract interface for running code blocks.
///
/// The returned source yields ConsoleActiveLine and ConsoleOutput chunks and is
/// terminated by a ConsoleActiveLine chunk without content.
class CodeExecutor
{
  public:
    virtual ~CodeExecutor() = default;

    /// @brief Returns true if @p language (or one of its aliases) can be run.
    [[nodiscard]] virtual auto supports(std::string_view language) const -> bool = 0;

    /// @brief Starts running @p code.
    /// @return The output stream or an error if execution could not start.
    [[nodiscard]] virtual auto run(std::string_view language, std::string_view code)
        -> Result<std::unique_ptr<ChunkSource>> = 0;

    /// @brief Stops every running execution.
    virtual void terminate() = 0;
};

} // namespace codeloop
