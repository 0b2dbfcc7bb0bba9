#include "strata/error.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace strata {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::InvalidConversion:
        return "InvalidConversion"sv;
    case ErrorKind::InvalidState:
        return "InvalidState"sv;
    case ErrorKind::ProbeError:
        return "ProbeError"sv;
    case ErrorKind::PartitionNeverAppeared:
        return "PartitionNeverAppeared"sv;
    case ErrorKind::MountVerificationFailed:
        return "MountVerificationFailed"sv;
    case ErrorKind::UnknownFilesystemFormat:
        return "UnknownFilesystemFormat"sv;
    case ErrorKind::PartitionTableMismatch:
        return "PartitionTableMismatch"sv;
    case ErrorKind::InvalidMountOrder:
        return "InvalidMountOrder"sv;
    case ErrorKind::CommandFailed:
        return "CommandFailed"sv;
    }
    return "Unknown"sv;
}

auto provision_step_to_string(ProvisionStep step) noexcept -> std::string_view {
    switch (step) {
    case ProvisionStep::None:
        return "none"sv;
    case ProvisionStep::PartitionTable:
        return "partition-table"sv;
    case ProvisionStep::PartitionCreation:
        return "partition-creation"sv;
    case ProvisionStep::Lvm:
        return "lvm"sv;
    case ProvisionStep::Encryption:
        return "encryption"sv;
    case ProvisionStep::Format:
        return "format"sv;
    case ProvisionStep::MountPlan:
        return "mount-plan"sv;
    case ProvisionStep::Mount:
        return "mount"sv;
    }
    return "unknown"sv;
}

auto Error::describe() const noexcept -> std::string {
    const auto& kind_str = error_kind_to_string(kind);
    if (step == ProvisionStep::None && device.empty()) {
        return fmt::format(FMT_COMPILE("{}: {}"), kind_str, message);
    }
    return fmt::format(FMT_COMPILE("[{}] {}: {}: {}"), provision_step_to_string(step), device.empty() ? "-"sv : std::string_view{device}, kind_str, message);
}

}  // namespace strata
