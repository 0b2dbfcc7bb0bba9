#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include "strata/error.hpp"

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace strata::utils {

struct CommandResult final {
    std::int32_t exit_code{};
    /// Captured standard output, trailing newline stripped.
    std::string output{};

    [[nodiscard]] constexpr bool success() const noexcept { return exit_code == 0; }
};

/// @brief Seam through which every external tool is invoked.
///
/// Provisioning never shells out directly, so that tests can substitute
/// a simulated machine for the real one.
class CommandRunner {
 public:
    virtual ~CommandRunner() = default;

    /// @brief Runs argv-style command, feeding @p input to its stdin.
    /// @param args Program name followed by its arguments, no shell involved.
    /// @param input Data written to the child's stdin (e.g. a passphrase). Never logged.
    virtual auto run(const std::vector<std::string>& args, std::string_view input = {}) noexcept -> CommandResult = 0;
};

/// @brief Runs commands on the host via fork/execvp.
///
/// Honours DIRTY_CMD_RUN=1 (log only, report success) and
/// LOG_EXEC_CMDS=1 (log every command at debug level).
class SystemCommandRunner final : public CommandRunner {
 public:
    auto run(const std::vector<std::string>& args, std::string_view input = {}) noexcept -> CommandResult override;
};

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Joins argv into a printable command line for logs and error messages.
auto format_command(const std::vector<std::string>& args) noexcept -> std::string;

/// @brief Runs a command and turns a non-zero exit into CommandFailed.
/// @param device Device the command acts on, recorded in the error.
/// @param step Provisioning step the command belongs to, recorded in the error.
/// @return Captured standard output.
auto run_checked(CommandRunner& runner, const std::vector<std::string>& args, std::string_view device, ProvisionStep step, std::string_view input = {}) noexcept -> Result<std::string>;

}  // namespace strata::utils

#endif  // IO_UTILS_HPP
