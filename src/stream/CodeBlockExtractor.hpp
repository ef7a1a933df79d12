// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codeloop
{

/// @brief Instructions appended to the system message for models that answer in markdown.
inline constexpr auto DefaultExecutionInstructions = std::string_view {
    "To execute code on the user's machine, write a markdown code block. Specify the language after the ```. "
    "You will receive the output. Use any programming language."
};

/// @brief Policy flags for markdown code block extraction.
struct ExtractorConfig
{
    /// @brief Untagged blocks are "text" instead of "python" (operating-system control mode).
    bool defaultLanguageIsText = false;

    /// @brief Append executionInstructions to the model's system message.
    bool appendExecutionInstructions = false;

    std::string executionInstructions = std::string(DefaultExecutionInstructions);
};

/// @brief Incremental splitter of model text into prose and fenced code chunks.
///
/// Deltas may be cut anywhere, down to single bytes. The concatenated content of the
/// emitted chunks, grouped by kind and block, does not depend on where the cuts are.
/// Malformed or unterminated fences never raise; emission is best-effort and forward-only.
class CodeBlockExtractor
{
  public:
    enum class State
    {
        Outside,
        AwaitingLanguage,
        InBody,
    };

    explicit CodeBlockExtractor(ExtractorConfig config = {});

    /// @brief Consumes one delta.
    /// @return The chunks that became classifiable with this delta, in order.
    [[nodiscard]] auto feed(std::string_view delta) -> std::vector<Chunk>;

    /// @brief Flushes the remainder at the end of the stream and resets the extractor.
    ///
    /// An unterminated block is emitted as a final code chunk; held-back text outside a
    /// block is emitted as prose.
    [[nodiscard]] auto finish() -> std::vector<Chunk>;

    [[nodiscard]] auto state() const -> State { return _state; }

    /// @brief Language of the current (or most recent) block.
    [[nodiscard]] auto language() const -> const std::string& { return _language; }

    /// @brief Number of fences opened so far.
    [[nodiscard]] auto blockCount() const -> std::size_t { return _blockCount; }

    /// @brief Language assigned to blocks without a usable tag.
    [[nodiscard]] auto defaultLanguage() const -> std::string_view;

    [[nodiscard]] auto config() const -> const ExtractorConfig& { return _config; }

  private:
    ExtractorConfig _config;
    State _state = State::Outside;
    std::string _buffer;
    std::string _language;
    std::size_t _blockCount = 0;

    void process(std::vector<Chunk>& out);
    void emit(std::vector<Chunk>& out, ChunkKind kind, std::string_view content) const;
};

/// @brief Normalizes the info line after an opening fence to a language tag.
///
/// Only the first word is considered and only its ASCII letters are kept, lower-cased,
/// so "Python3" becomes "python". An empty result means "use the default language".
[[nodiscard]] auto normalizeLanguageTag(std::string_view infoLine) -> std::string;

} // namespace codeloop
