// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <codeloop/Config.hpp>
#include <core/Error.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace codeloop
{

/// @brief Command line settings that are not part of the configuration file.
struct AppOptions
{
    /// @brief JSON array of canned model responses.
    std::string replayPath;
    std::size_t deltaSize = 1;

    /// @brief Print every chunk as a wire JSON line instead of rendered text.
    bool json = false;

    /// @brief Where to write the transcript after the run (optional).
    std::string outputPath;

    std::string message;
};

/// @brief Command line driver: one user message, its response and optional loop turns.
class App
{
  public:
    App(AppConfig config, AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration and sets up the model client and executor.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the response(s).
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace codeloop
