// SPDX-License-Identifier: Apache-2.0
#include "SubprocessExecutor.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <stdlib.h>
#include <unistd.h>

extern char** environ;

namespace codeloop
{

namespace
{
    /// @brief A spawned interpreter and the script it runs.
    struct ChildProcess
    {
        pid_t pid = -1;
        int outputRead = -1;
        std::filesystem::path scriptPath;
        bool reaped = false;

        ChildProcess() = default;
        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        ~ChildProcess()
        {
            if (outputRead >= 0)
                ::close(outputRead);
            if (pid > 0 && !reaped)
            {
                ::kill(pid, SIGTERM);
                (void) reap();
            }
            if (!scriptPath.empty())
            {
                auto ec = std::error_code {};
                std::filesystem::remove(scriptPath, ec);
            }
        }

        void terminate() const
        {
            if (pid > 0 && !reaped)
                ::kill(pid, SIGTERM);
        }

        /// @brief Waits for the child and returns its exit code (-1 if killed by a signal).
        auto reap() -> int
        {
            auto status = 0;
            while (::waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    reaped = true;
                    return -1;
                }
            }
            reaped = true;
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
    };

    auto writeScript(const LanguageProfile& profile, std::string_view code) -> Result<std::filesystem::path>
    {
        auto ec = std::error_code {};
        auto const dir = std::filesystem::temp_directory_path(ec);
        if (ec)
            return makeError(ErrorCode::IoError, std::format("No temporary directory: {}", ec.message()));

        auto const suffix = profile.extension.empty() ? std::string {} : "." + profile.extension;
        auto pattern = (dir / ("codeloop-XXXXXX" + suffix)).string();

        auto const fd = ::mkstemps(pattern.data(), static_cast<int>(suffix.size()));
        if (fd < 0)
            return makeError(ErrorCode::IoError, std::format("Cannot create script file: {}", strerror(errno)));

        auto remaining = code;
        while (!remaining.empty())
        {
            auto const written = ::write(fd, remaining.data(), remaining.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                auto const reason = std::string(strerror(errno));
                ::close(fd);
                std::filesystem::remove(pattern, ec);
                return makeError(ErrorCode::IoError, std::format("Cannot write script file: {}", reason));
            }
            remaining.remove_prefix(static_cast<std::size_t>(written));
        }

        ::close(fd);
        return std::filesystem::path(pattern);
    }

    /// @brief Console output of one child process, one chunk per line.
    class ProcessOutputSource: public ChunkSource
    {
      public:
        ProcessOutputSource(std::shared_ptr<ChildProcess> child, bool activeLineMarkers):
            _child(std::move(child)), _activeLineMarkers(activeLineMarkers)
        {
        }

        auto next() -> Result<std::optional<Chunk>> override
        {
            while (!_done)
            {
                auto const newline = _buffer.find('\n');
                if (newline != std::string::npos)
                {
                    auto line = _buffer.substr(0, newline);
                    _buffer.erase(0, newline + 1);
                    return lineChunk(std::move(line), true);
                }

                if (_eof)
                {
                    if (!_buffer.empty())
                    {
                        auto line = std::move(_buffer);
                        _buffer.clear();
                        return lineChunk(std::move(line), false);
                    }

                    auto const exitCode = _child->reap();
                    log::debug("Process {} exited with code {}", _child->pid, exitCode);
                    _done = true;
                    return Chunk {
                        .role = Role::Computer,
                        .kind = ChunkKind::ConsoleActiveLine,
                        .format = std::nullopt,
                        .content = std::nullopt,
                        .start = false,
                        .end = false,
                    };
                }

                auto buf = std::array<char, 4096> {};
                auto const bytesRead = ::read(_child->outputRead, buf.data(), buf.size());
                if (bytesRead < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return makeError(ErrorCode::ExecutionError,
                                     std::format("Failed to read process output: {}", strerror(errno)));
                }
                if (bytesRead == 0)
                    _eof = true;
                else
                    _buffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
            }
            return std::nullopt;
        }

      private:
        std::shared_ptr<ChildProcess> _child;
        bool _activeLineMarkers;
        std::string _buffer;
        bool _eof = false;
        bool _done = false;

        auto lineChunk(std::string line, bool terminated) const -> Chunk
        {
            if (_activeLineMarkers)
            {
                if (auto const lineNumber = parseActiveLineMarker(line); lineNumber)
                {
                    return Chunk {
                        .role = Role::Computer,
                        .kind = ChunkKind::ConsoleActiveLine,
                        .format = std::nullopt,
                        .content = std::to_string(*lineNumber),
                        .start = false,
                        .end = false,
                    };
                }
            }

            if (terminated)
                line += '\n';
            return Chunk {
                .role = Role::Computer,
                .kind = ChunkKind::ConsoleOutput,
                .format = std::nullopt,
                .content = std::move(line),
                .start = false,
                .end = false,
            };
        }
    };
} // namespace

struct SubprocessExecutor::Impl
{
    SubprocessExecutorConfig config;
    std::vector<std::weak_ptr<ChildProcess>> children;

    auto spawn(const LanguageProfile& profile, std::string_view code) -> Result<std::shared_ptr<ChildProcess>>
    {
        auto const script = profile.activeLineMarkers ? addActiveLineMarkers(code) : std::string(code);

        auto child = std::make_shared<ChildProcess>();
        auto path = writeScript(profile, script);
        if (!path)
            return std::unexpected(path.error());
        child->scriptPath = std::move(*path);

        int outputPipe[2];
        if (::pipe2(outputPipe, O_CLOEXEC) != 0)
            return makeError(ErrorCode::ExecutionError, "Failed to create output pipe");

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDERR_FILENO);

        // Build argv: command, profile args, script path
        auto argStrings = std::vector<std::string> {};
        argStrings.push_back(profile.command);
        argStrings.insert(argStrings.end(), profile.args.begin(), profile.args.end());
        argStrings.push_back(child->scriptPath.string());

        auto argv = std::vector<char*> {};
        for (auto& arg: argStrings)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        // Build environment (inherit + config overrides)
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
                envStrings.emplace_back(*e);
        }
        for (const auto& [key, value]: config.env)
            envStrings.push_back(std::format("{}={}", key, value));

        auto envp = std::vector<char*> {};
        for (auto& s: envStrings)
            envp.push_back(s.data());
        envp.push_back(nullptr);

        pid_t pid;
        auto const status = posix_spawnp(&pid, profile.command.c_str(), &actions, nullptr, argv.data(), envp.data());
        posix_spawn_file_actions_destroy(&actions);

        ::close(outputPipe[1]);

        if (status != 0)
        {
            ::close(outputPipe[0]);
            return makeError(ErrorCode::ExecutionError,
                             std::format("Failed to spawn '{}': {}", profile.command, strerror(status)));
        }

        child->pid = pid;
        child->outputRead = outputPipe[0];
        log::debug("Started {} process {} for {}", profile.command, pid, child->scriptPath.string());
        return child;
    }
};

SubprocessExecutor::SubprocessExecutor(SubprocessExecutorConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

SubprocessExecutor::~SubprocessExecutor()
{
    terminate();
}

auto SubprocessExecutor::supports(std::string_view language) const -> bool
{
    return findLanguageProfile(_impl->config.languages, language).has_value();
}

auto SubprocessExecutor::run(std::string_view language, std::string_view code) -> Result<std::unique_ptr<ChunkSource>>
{
    auto const profile = findLanguageProfile(_impl->config.languages, language);
    if (!profile)
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported language: {}", language));

    auto child = _impl->spawn(*profile, code);
    if (!child)
        return std::unexpected(child.error());

    std::erase_if(_impl->children, [](const auto& weak) { return weak.expired(); });
    _impl->children.push_back(*child);

    return std::make_unique<ProcessOutputSource>(std::move(*child), profile->activeLineMarkers);
}

void SubprocessExecutor::terminate()
{
    for (const auto& weak: _impl->children)
    {
        if (auto child = weak.lock(); child)
        {
            log::info("Terminating process {}", child->pid);
            child->terminate();
        }
    }
    _impl->children.clear();
}

auto SubprocessExecutor::languages() const -> std::span<const LanguageProfile>
{
    return _impl->config.languages;
}

} // namespace codeloop
