// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/ChunkSource.hpp>
#include <stream/OutputTruncator.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace codeloop
{

/// @brief Policy for one aggregation run. Immutable while the run lasts.
struct AggregatorConfig
{
    /// @brief Confirmation gate: when set, confirmation chunks are consumed silently.
    bool autoRun = false;

    std::size_t maxOutputChars = DefaultMaxOutputChars;

    /// @brief Mention the first-page retrieval hint in the truncation banner.
    bool scrollbarHint = false;
};

/// @brief Groups an interleaved chunk stream into transcript messages.
///
/// Pulling from the aggregator yields group boundary markers and every upstream chunk
/// passed through, while the message list is extended as a side effect. The aggregator
/// is the only writer of that list for as long as it is alive.
///
/// The stop token is polled once per upstream chunk. Once a stop is observed the
/// aggregator returns ErrorCode::Cancelled from every later pull and leaves the open
/// group without a closing boundary.
class MessageAggregator: public ChunkSource
{
  public:
    MessageAggregator(ChunkSource& upstream,
                      std::vector<Message>& messages,
                      AggregatorConfig config,
                      std::stop_token stopToken = {});

    [[nodiscard]] auto next() -> Result<std::optional<Chunk>> override;

    /// @brief Returns true while a group has been started but not yet ended.
    [[nodiscard]] auto hasOpenGroup() const -> bool { return _openGroup.has_value(); }

    /// @brief Index of the message the last chunk was written to, if any.
    [[nodiscard]] auto openMessage() const -> std::optional<std::size_t> { return _openMessage; }

    [[nodiscard]] auto cancelled() const -> bool { return _cancelled; }

  private:
    struct GroupKey
    {
        Role role;
        ChunkKind kind;
        std::optional<std::string> format;

        auto operator==(const GroupKey&) const -> bool = default;
    };

    ChunkSource& _upstream;
    std::vector<Message>& _messages;
    AggregatorConfig _config;
    std::stop_token _stopToken;

    std::optional<GroupKey> _openGroup;
    std::optional<std::size_t> _openMessage;
    std::deque<Chunk> _pending;
    bool _finished = false;
    bool _cancelled = false;

    void process(Chunk chunk);
    void closeGroup();
    void store(const Chunk& chunk);

    [[nodiscard]] static auto groupKeyOf(const Chunk& chunk) -> GroupKey;
    [[nodiscard]] static auto boundary(const GroupKey& key, bool start) -> Chunk;
};

} // namespace codeloop
