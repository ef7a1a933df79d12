// SPDX-License-Identifier: Apache-2.0
#include <codeloop/App.hpp>
#include <codeloop/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <cstddef>
#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "codeloop - streams model responses, extracts code blocks and runs them" };

    auto options = codeloop::AppOptions {};
    auto configPath = std::string {};
    auto autoRun = false;
    auto osMode = false;
    auto maxOutput = 0;
    auto loop = false;
    auto verbose = false;

    app.add_option("message", options.message, "Message to send")->required();
    app.add_option("--replay", options.replayPath, "JSON array of canned model responses")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--delta-size", options.deltaSize, "Code points per replayed delta")
        ->check(CLI::PositiveNumber);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-y,--auto-run", autoRun, "Run code without asking for confirmation");
    app.add_flag("--os", osMode, "Operating-system control mode (untagged code is text)");
    app.add_option("--max-output", maxOutput, "Character limit of stored console output");
    app.add_flag("--json", options.json, "Print every chunk as a JSON line");
    app.add_option("-o,--output", options.outputPath, "Write the transcript as JSON to this file");
    app.add_flag("--loop", loop, "Keep responding until the model says it is done");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    codeloop::log::initFromEnvironment();

    // Load config
    auto configResult =
        configPath.empty() ? codeloop::loadConfig() : codeloop::loadConfigFromFile(configPath);

    if (!configResult)
    {
        codeloop::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (autoRun)
        config.safety.autoRun = true;
    if (osMode)
        config.computer.osMode = true;
    if (maxOutput > 0)
        config.display.maxOutput = maxOutput;
    if (loop)
        config.loop.enabled = true;
    if (verbose)
        config.agent.verbose = true;

    if (config.agent.verbose)
        codeloop::log::setLevel(codeloop::log::Level::Debug);

    auto application = codeloop::App(std::move(config), std::move(options));
    auto initResult = application.initialize();
    if (!initResult)
    {
        codeloop::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
