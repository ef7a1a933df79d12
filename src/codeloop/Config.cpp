// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace codeloop
{

namespace
{
    auto toJsonArray(const std::vector<std::string>& values) -> nlohmann::json
    {
        auto array = nlohmann::json::array();
        for (const auto& value: values)
            array.push_back(value);
        return array;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\codeloop";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/codeloop";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/codeloop";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/codeloop";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    // LLM section
    if (root.contains("llm"))
    {
        auto const& llm = root["llm"];
        config.llm.systemMessage = json::getStringOr(llm, "systemMessage", defaults.llm.systemMessage);
        config.llm.customInstructions = json::getStringOr(llm, "customInstructions", "");
        config.llm.userMessageTemplate = json::getStringOr(llm, "userMessageTemplate", "{content}");
        config.llm.alwaysApplyUserMessageTemplate = json::getBoolOr(llm, "alwaysApplyUserMessageTemplate", false);
        config.llm.codeOutputTemplate =
            json::getStringOr(llm, "codeOutputTemplate", defaults.llm.codeOutputTemplate);
        config.llm.emptyCodeOutputTemplate =
            json::getStringOr(llm, "emptyCodeOutputTemplate", defaults.llm.emptyCodeOutputTemplate);
        config.llm.codeOutputSender = json::getStringOr(llm, "codeOutputSender", "user");
        config.llm.executionInstructions =
            json::getStringOr(llm, "executionInstructions", defaults.llm.executionInstructions);
        config.llm.appendExecutionInstructions = json::getBoolOr(llm, "appendExecutionInstructions", false);
    }

    // Safety section
    if (root.contains("safety"))
        config.safety.autoRun = json::getBoolOr(root["safety"], "autoRun", false);

    // Display section
    if (root.contains("display"))
        config.display.maxOutput = json::getIntOr(root["display"], "maxOutput", defaults.display.maxOutput);

    // Computer section
    if (root.contains("computer"))
    {
        auto const& computer = root["computer"];
        config.computer.importComputerApi = json::getBoolOr(computer, "importComputerApi", false);
        config.computer.osMode = json::getBoolOr(computer, "osMode", false);
    }

    // Loop section
    if (root.contains("loop"))
    {
        auto const& loop = root["loop"];
        config.loop.enabled = json::getBoolOr(loop, "enabled", false);
        config.loop.message = json::getStringOr(loop, "message", defaults.loop.message);
        config.loop.breakers = json::getStringArrayOr(loop, "breakers", defaults.loop.breakers);
    }

    // Agent section
    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.maxSteps = json::getIntOr(agent, "maxSteps", 10);
        config.agent.verbose = json::getBoolOr(agent, "verbose", false);
    }

    // Languages section
    if (root.contains("languages") && root["languages"].is_object())
    {
        for (const auto& [name, language]: root["languages"].items())
        {
            if (!language.is_object())
            {
                log::warning("Ignoring language '{}': expected an object", name);
                continue;
            }

            config.languages[name] = LanguageOverride {
                .command = json::getStringOr(language, "command", ""),
                .args = json::getStringArrayOr(language, "args", {}),
                .aliases = json::getStringArrayOr(language, "aliases", {}),
                .extension = json::getStringOr(language, "extension", ""),
                .activeLineMarkers = std::nullopt,
            };
            if (language.contains("activeLineMarkers") && language["activeLineMarkers"].is_boolean())
                config.languages[name].activeLineMarkers = language["activeLineMarkers"].get<bool>();
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // LLM section
    auto llm = nlohmann::json::object();
    llm["systemMessage"] = config.llm.systemMessage;
    if (!config.llm.customInstructions.empty())
        llm["customInstructions"] = config.llm.customInstructions;
    llm["userMessageTemplate"] = config.llm.userMessageTemplate;
    llm["alwaysApplyUserMessageTemplate"] = config.llm.alwaysApplyUserMessageTemplate;
    llm["codeOutputTemplate"] = config.llm.codeOutputTemplate;
    llm["emptyCodeOutputTemplate"] = config.llm.emptyCodeOutputTemplate;
    llm["codeOutputSender"] = config.llm.codeOutputSender;
    llm["executionInstructions"] = config.llm.executionInstructions;
    llm["appendExecutionInstructions"] = config.llm.appendExecutionInstructions;
    root["llm"] = std::move(llm);

    root["safety"] = nlohmann::json { { "autoRun", config.safety.autoRun } };
    root["display"] = nlohmann::json { { "maxOutput", config.display.maxOutput } };
    root["computer"] = nlohmann::json {
        { "importComputerApi", config.computer.importComputerApi },
        { "osMode", config.computer.osMode },
    };

    // Loop section
    auto loop = nlohmann::json::object();
    loop["enabled"] = config.loop.enabled;
    loop["message"] = config.loop.message;
    loop["breakers"] = toJsonArray(config.loop.breakers);
    root["loop"] = std::move(loop);

    root["agent"] = nlohmann::json {
        { "maxSteps", config.agent.maxSteps },
        { "verbose", config.agent.verbose },
    };

    // Languages section
    if (!config.languages.empty())
    {
        auto languages = nlohmann::json::object();
        for (const auto& [name, language]: config.languages)
        {
            auto entry = nlohmann::json::object();
            if (!language.command.empty())
                entry["command"] = language.command;
            if (!language.args.empty())
                entry["args"] = toJsonArray(language.args);
            if (!language.aliases.empty())
                entry["aliases"] = toJsonArray(language.aliases);
            if (!language.extension.empty())
                entry["extension"] = language.extension;
            if (language.activeLineMarkers)
                entry["activeLineMarkers"] = *language.activeLineMarkers;
            languages[name] = std::move(entry);
        }
        root["languages"] = std::move(languages);
    }

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.display.maxOutput < MinMaxOutput || config.display.maxOutput > MaxMaxOutput)
        return makeError(ErrorCode::ConfigError,
                         std::format("display.maxOutput must be between {} and {}, got {}",
                                     MinMaxOutput,
                                     MaxMaxOutput,
                                     config.display.maxOutput));

    if (config.llm.codeOutputSender != "user" && config.llm.codeOutputSender != "assistant")
        return makeError(ErrorCode::ConfigError,
                         std::format("llm.codeOutputSender must be \"user\" or \"assistant\", got \"{}\"",
                                     config.llm.codeOutputSender));

    if (config.agent.maxSteps < 1)
        return makeError(ErrorCode::ConfigError,
                         std::format("agent.maxSteps must be at least 1, got {}", config.agent.maxSteps));

    for (const auto& [name, language]: config.languages)
    {
        if (name.empty())
            return makeError(ErrorCode::ConfigError, "languages: empty language name");
    }

    return {};
}

auto makeResponseConfig(const AppConfig& config) -> ResponseConfig
{
    return ResponseConfig {
        .extractor =
            ExtractorConfig {
                .defaultLanguageIsText = config.computer.osMode,
                .appendExecutionInstructions = config.llm.appendExecutionInstructions,
                .executionInstructions = config.llm.executionInstructions,
            },
        .aggregator =
            AggregatorConfig {
                .autoRun = config.safety.autoRun,
                .maxOutputChars = static_cast<std::size_t>(std::max(config.display.maxOutput, 0)),
                .scrollbarHint = config.computer.importComputerApi,
            },
        .prompt =
            PromptConfig {
                .systemMessage = config.llm.systemMessage,
                .customInstructions = config.llm.customInstructions,
                .userMessageTemplate = config.llm.userMessageTemplate,
                .alwaysApplyUserMessageTemplate = config.llm.alwaysApplyUserMessageTemplate,
                .codeOutputTemplate = config.llm.codeOutputTemplate,
                .emptyCodeOutputTemplate = config.llm.emptyCodeOutputTemplate,
                .codeOutputSender = config.llm.codeOutputSender == "assistant" ? Role::Assistant : Role::User,
            },
        .maxSteps = config.agent.maxSteps,
    };
}

auto makeExecutorConfig(const AppConfig& config) -> SubprocessExecutorConfig
{
    auto executorConfig = SubprocessExecutorConfig {};
    auto& profiles = executorConfig.languages;

    for (const auto& [name, language]: config.languages)
    {
        auto const it = std::ranges::find_if(profiles, [&](const auto& profile) { return profile.name == name; });
        if (it == profiles.end())
        {
            if (language.command.empty())
            {
                log::warning("Ignoring language '{}': no command configured", name);
                continue;
            }
            profiles.push_back(LanguageProfile {
                .name = name,
                .command = language.command,
                .args = language.args,
                .aliases = language.aliases,
                .extension = language.extension,
                .activeLineMarkers = language.activeLineMarkers.value_or(false),
            });
            continue;
        }

        if (!language.command.empty())
        {
            it->command = language.command;
            it->args = language.args;
        }
        if (!language.aliases.empty())
            it->aliases = language.aliases;
        if (!language.extension.empty())
            it->extension = language.extension;
        if (language.activeLineMarkers)
            it->activeLineMarkers = *language.activeLineMarkers;
    }

    return executorConfig;
}

} // namespace codeloop
