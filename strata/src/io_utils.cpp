#include "strata/io_utils.hpp"

#include <fcntl.h>     // for O_CLOEXEC
#include <sys/wait.h>  // for waitpid
#include <unistd.h>    // for execvp, fork, pipe2

#include <cerrno>   // for errno
#include <cstdlib>  // for getenv
#include <cstring>  // for strerror

#include <algorithm>  // for transform
#include <array>      // for array
#include <iterator>   // for back_inserter
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

auto write_all(int fd, std::string_view data) noexcept -> bool {
    while (!data.empty()) {
        const auto written = ::write(fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return true;
}

}  // namespace

namespace strata::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto format_command(const std::vector<std::string>& args) noexcept -> std::string {
    std::string res{};
    for (const auto& arg : args) {
        if (!res.empty()) {
            res += ' ';
        }
        if (arg.find(' ') != std::string::npos) {
            res += fmt::format(FMT_COMPILE("'{}'"), arg);
        } else {
            res += arg;
        }
    }
    return res;
}

auto run_checked(CommandRunner& runner, const std::vector<std::string>& args, std::string_view device, ProvisionStep step, std::string_view input) noexcept -> Result<std::string> {
    auto result = runner.run(args, input);
    if (!result.success()) {
        spdlog::error("Command '{}' failed with exit code {}", utils::format_command(args), result.exit_code);
        return make_error(ErrorKind::CommandFailed,
            fmt::format(FMT_COMPILE("'{}' exited with {}"), utils::format_command(args), result.exit_code), std::string{device}, step);
    }
    return std::move(result.output);
}

// https://gist.github.com/konstantint/d49ab683b978b3d74172
auto SystemCommandRunner::run(const std::vector<std::string>& args, std::string_view input) noexcept -> CommandResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (args.empty()) {
        spdlog::error("[exec] refusing to run empty command");
        return CommandResult{.exit_code = -1, .output = {}};
    }
    if ((log_exec_cmds || dirty_cmd_run) && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", utils::format_command(args));
    }
    if (dirty_cmd_run) {
        return CommandResult{.exit_code = 0, .output = {}};
    }

    std::array<int, 2> in_pipe{-1, -1};
    std::array<int, 2> out_pipe{-1, -1};
    if (::pipe2(in_pipe.data(), O_CLOEXEC) != 0 || ::pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
        spdlog::error("[exec] pipe failed for '{}': {}", args.front(), std::strerror(errno));
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return CommandResult{.exit_code = -1, .output = {}};
    }

    // argv has to be prepared before fork, allocation in the child is unsafe
    std::vector<char*> argv;
    std::transform(args.cbegin(), args.cend(), std::back_inserter(argv),
        [=](const std::string& arg) -> char* { return const_cast<char*>(arg.data()); });
    argv.push_back(nullptr);

    const auto pid = ::fork();
    if (pid < 0) {
        spdlog::error("[exec] fork failed for '{}': {}", args.front(), std::strerror(errno));
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return CommandResult{.exit_code = -1, .output = {}};
    }
    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    if (!input.empty() && !write_all(in_pipe[1], input)) {
        spdlog::warn("[exec] failed to feed stdin of '{}': {}", args.front(), std::strerror(errno));
    }
    close_fd(in_pipe[1]);

    std::string result{};
    std::array<char, 256> buffer{};
    while (true) {
        const auto count = ::read(out_pipe[0], buffer.data(), buffer.size());
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        result.append(buffer.data(), static_cast<std::size_t>(count));
    }
    close_fd(out_pipe[0]);

    std::int32_t status{};
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[exec] waitpid failed for '{}': {}", args.front(), std::strerror(errno));
            return CommandResult{.exit_code = -1, .output = std::move(result)};
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    std::int32_t exit_code{-1};
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    }
    if (exit_code != 0) {
        spdlog::debug("[exec] '{}' exited with {}", args.front(), exit_code);
    }
    return CommandResult{.exit_code = exit_code, .output = std::move(result)};
}

}  // namespace strata::utils
