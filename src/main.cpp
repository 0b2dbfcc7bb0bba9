#include "provision_config.hpp"  // for parse_provision_settings

// import strata
#include "strata/crypttab.hpp"
#include "strata/device_inventory.hpp"
#include "strata/file_utils.hpp"
#include "strata/fstab.hpp"
#include "strata/io_utils.hpp"
#include "strata/layout_json.hpp"
#include "strata/logger.hpp"
#include "strata/provisioner.hpp"

#include <unistd.h>  // for geteuid

#include <chrono>       // for seconds
#include <csignal>      // for signal, SIGPIPE
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

#include <fmt/core.h>

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace {

void error_inter(std::string_view msg) noexcept {
    fmt::print(stderr, "\033[1;31m{}\033[0m\n", msg);
    spdlog::error("{}", msg);
}

auto run(std::string_view settings_path) noexcept -> int {
    const auto& settings_content = strata::file_utils::read_whole_file(settings_path);
    auto settings                = driver::parse_provision_settings(settings_content);
    if (!settings) {
        error_inter(fmt::format("Invalid settings in {}: {}", settings_path, settings.error()));
        return 1;
    }

    std::string password{};
    if (settings->password_file) {
        auto loaded = driver::load_password(*settings);
        if (!loaded) {
            error_inter(loaded.error());
            return 1;
        }
        password = std::move(*loaded);
    }

    strata::utils::SystemCommandRunner runner{};
    strata::disk::LsblkProbe probe{runner};
    strata::disk::DeviceInventory inventory{probe};
    if (auto devices = inventory.list_devices(); !devices) {
        error_inter(devices.error().describe());
        return 1;
    }

    const auto& layout_content = strata::file_utils::read_whole_file(settings->layout_file);
    if (layout_content.empty()) {
        error_inter(fmt::format("Layout file {} is empty or unreadable", settings->layout_file));
        return 1;
    }
    auto parsed = strata::disk::parse_layout(layout_content, inventory, password);
    if (!parsed) {
        error_inter(parsed.error().describe());
        return 1;
    }

    strata::provision::Provisioner provisioner{runner, probe, driver::to_provisioning_config(*settings)};
    auto result = provisioner.provision(parsed->layout, parsed->encryption);
    if (!result) {
        error_inter(fmt::format("Provisioning failed: {}", result.error().describe()));
        return 1;
    }

    const auto& target_root = parsed->layout.mountpoint().value_or(settings->target_root);
    if (!strata::fs::generate_fstab(result->mount_plan, result->swap, target_root)) {
        error_inter("Failed to write fstab");
        return 1;
    }
    if (!result->crypt_targets.empty() && !strata::fs::install_keyfiles(result->crypt_targets, target_root)) {
        error_inter("Failed to install LUKS keyfiles");
        return 1;
    }

    fmt::print("Target mounted at {}\n", target_root);
    if (result->root) {
        fmt::print("root: UUID={} PARTUUID={}\n", result->root->uuid, result->root->partuuid);
    }
    if (result->boot) {
        fmt::print("boot: UUID={} PARTUUID={}\n", result->boot->uuid, result->boot->partuuid);
    }
    for (const auto& target : result->crypt_targets) {
        fmt::print("luks: {} on {} (UUID={})\n", target.mapper_name, target.device, target.luks_uuid);
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        fmt::print(stderr, "usage: {} <settings.json>\n", argc > 0 ? argv[0] : "strata-provision");
        return 2;
    }

    // Check if we have enough permissions.
    if (::geteuid() != 0 && strata::utils::safe_getenv("DIRTY_CMD_RUN") != "1") {
        error_inter("strata-provision must be launched with root privileges!");
        return 1;
    }

    // Writes into closed pipes of child processes must not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("strata_logger", "/tmp/strata-provision.log");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set strata logger.
    strata::logger::set_logger(logger);

    const auto status = run(argv[1]);
    spdlog::shutdown();
    return status;
}
