// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ResponseLoop.hpp>
#include <core/Error.hpp>
#include <exec/LanguageProfile.hpp>
#include <exec/SubprocessExecutor.hpp>
#include <llm/PromptBuilder.hpp>
#include <stream/CodeBlockExtractor.hpp>
#include <stream/OutputTruncator.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codeloop
{

/// @brief Model prompt configuration section.
struct LlmConfig
{
    std::string systemMessage = std::string(DefaultSystemMessage);
    std::string customInstructions;
    std::string userMessageTemplate = "{content}";
    bool alwaysApplyUserMessageTemplate = false;
    std::string codeOutputTemplate = std::string(DefaultCodeOutputTemplate);
    std::string emptyCodeOutputTemplate = std::string(DefaultEmptyCodeOutputTemplate);

    /// @brief "user" or "assistant".
    std::string codeOutputSender = "user";

    std::string executionInstructions = std::string(DefaultExecutionInstructions);
    bool appendExecutionInstructions = false;
};

/// @brief Safety configuration section.
struct SafetyConfig
{
    /// @brief Run code without asking for confirmation.
    bool autoRun = false;
};

/// @brief Display configuration section.
struct DisplayConfig
{
    /// @brief Character limit of stored console output.
    int maxOutput = static_cast<int>(DefaultMaxOutputChars);
};

/// @brief Computer configuration section.
struct ComputerConfig
{
    /// @brief The model may call the output summarization API; enables the first-page hint.
    bool importComputerApi = false;

    /// @brief Operating-system control mode: untagged code blocks are "text".
    bool osMode = false;
};

/// @brief Agent configuration section.
struct AgentConfig
{
    int maxSteps = 10;
    bool verbose = false;
};

/// @brief Override of a language profile, keyed by language name.
struct LanguageOverride
{
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> aliases;
    std::string extension;

    /// @brief Unset keeps the built-in profile's setting.
    std::optional<bool> activeLineMarkers;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    SafetyConfig safety;
    DisplayConfig display;
    ComputerConfig computer;
    LoopConfig loop;
    AgentConfig agent;
    std::map<std::string, LanguageOverride> languages;
};

inline constexpr auto MinMaxOutput = 100;
inline constexpr auto MaxMaxOutput = 100000;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, the defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing sections and fields keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and enumerations.
/// @return ErrorCode::ConfigError naming the first offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/codeloop or ~/.config/codeloop
/// On macOS: ~/Library/Application Support/codeloop
/// On Windows: %APPDATA%\codeloop
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Derives the pipeline configuration of one response.
[[nodiscard]] auto makeResponseConfig(const AppConfig& config) -> ResponseConfig;

/// @brief Applies the language overrides to the built-in language profiles.
[[nodiscard]] auto makeExecutorConfig(const AppConfig& config) -> SubprocessExecutorConfig;

} // namespace codeloop
