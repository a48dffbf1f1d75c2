// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/remuxer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace hlsgrab::media {

namespace {

// Owns posix_spawn_file_actions_t for the lifetime of one spawn
class SpawnActions {
public:
    SpawnActions() noexcept { ok_ = posix_spawn_file_actions_init(&actions_) == 0; }
    ~SpawnActions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] posix_spawn_file_actions_t* get() noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
    bool ok_{false};
};

std::string read_tail(const std::filesystem::path& path, std::size_t limit = 2048) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto text = buffer.str();
    if (text.size() > limit) {
        text.erase(0, text.size() - limit);
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

FfmpegRemuxer::FfmpegRemuxer(std::string tool)
    : tool_(std::move(tool)) {}

std::vector<std::string>
FfmpegRemuxer::build_arguments(const std::string& tool,
                               const std::filesystem::path& manifest,
                               const std::filesystem::path& output) {
    return {
        tool,
        "-hide_banner",
        "-loglevel", "error",
        "-f", "concat",
        "-safe", "0",
        "-i", manifest.string(),
        "-c", "copy",
        "-y", output.string(),
    };
}

std::error_code FfmpegRemuxer::concat(const std::filesystem::path& manifest,
                                      const std::filesystem::path& output) noexcept {
    try {
        auto args = build_arguments(tool_, manifest, output);
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        // Tool diagnostics land next to the manifest, inside the scratch dir
        const auto log_path = manifest.parent_path() / "remux.log";

        SpawnActions actions;
        if (!actions.ok()) {
            return make_error_code(MediaErrc::remux_unavailable);
        }
        posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(actions.get(), STDERR_FILENO, log_path.c_str(),
                                         O_WRONLY | O_CREAT | O_TRUNC, 0644);

        spdlog::debug("Running {} concat on {}", tool_, manifest.string());

        pid_t pid = 0;
        int rc = posix_spawnp(&pid, tool_.c_str(), actions.get(), nullptr, argv.data(), environ);
        if (rc != 0) {
            if (rc == ENOENT || rc == EACCES) {
                spdlog::warn("{} not found in PATH", tool_);
            } else {
                spdlog::warn("Could not start {}: {}", tool_, std::generic_category().message(rc));
            }
            return make_error_code(MediaErrc::remux_unavailable);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                spdlog::warn("Lost track of {} (pid {})", tool_, pid);
                return make_error_code(MediaErrc::remux_failed);
            }
        }

        if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
            return {};
        }

        // posix_spawnp in glibc reports a missing binary as exit code 127
        if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
            spdlog::warn("{} not found in PATH", tool_);
            return make_error_code(MediaErrc::remux_unavailable);
        }

        auto diagnostics = read_tail(log_path);
        if (WIFEXITED(status)) {
            spdlog::warn("{} exited with code {}", tool_, WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            spdlog::warn("{} killed by signal {}", tool_, WTERMSIG(status));
        }
        if (!diagnostics.empty()) {
            spdlog::warn("{} said: {}", tool_, diagnostics);
        }
        return make_error_code(MediaErrc::remux_failed);
    } catch (const std::exception& e) {
        spdlog::error("Remux setup failed: {}", e.what());
        return make_error_code(MediaErrc::remux_failed);
    }
}

} // namespace hlsgrab::media
