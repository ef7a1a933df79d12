// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <exec/CodeExecutor.hpp>
#include <exec/LanguageProfile.hpp>

#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace codeloop
{

/// @brief Configuration for running code in child processes.
struct SubprocessExecutorConfig
{
    std::vector<LanguageProfile> languages = defaultLanguageProfiles();

    /// @brief Extra environment variables on top of the inherited environment.
    std::map<std::string, std::string> env;
};

/// @brief Runs code blocks as interpreter child processes.
///
/// Each run saves the code to a temporary file and spawns the language's interpreter on
/// it with stdout and stderr merged into one pipe. Every output line becomes a console
/// output chunk; active line markers become console active line chunks.
class SubprocessExecutor: public CodeExecutor
{
  public:
    explicit SubprocessExecutor(SubprocessExecutorConfig config = {});
    ~SubprocessExecutor() override;

    SubprocessExecutor(const SubprocessExecutor&) = delete;
    SubprocessExecutor& operator=(const SubprocessExecutor&) = delete;

    [[nodiscard]] auto supports(std::string_view language) const -> bool override;
    [[nodiscard]] auto run(std::string_view language, std::string_view code)
        -> Result<std::unique_ptr<ChunkSource>> override;
    void terminate() override;

    [[nodiscard]] auto languages() const -> std::span<const LanguageProfile>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace codeloop
