#ifndef PROVISIONER_HPP
#define PROVISIONER_HPP

#include "strata/block_devices.hpp"
#include "strata/device_inventory.hpp"
#include "strata/disk_layout.hpp"
#include "strata/error.hpp"
#include "strata/io_utils.hpp"
#include "strata/leaf_target.hpp"
#include "strata/luks.hpp"
#include "strata/mount_partitions.hpp"
#include "strata/poll.hpp"
#include "strata/size.hpp"

#include <map>       // for map
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace strata::provision {

struct ProvisioningConfig final {
    /// Budget of every wait for the kernel (partitions, mappers, UUIDs, mounts).
    utils::PollPolicy poll{};
    /// Granularity the last logical volume is shrunk by when a group is short on space.
    disk::Size alignment_buffer{1, disk::Unit::MiB};
    /// Host directory the target system gets mounted at.
    std::string target_root{"/mnt"};
    /// Protected directory keyfiles are staged in before installation copies them.
    std::string keyfile_dir{"/run/strata/keys"};
    /// Temporary mountpoint used while creating btrfs subvolumes.
    std::string btrfs_scratch_dir{"/run/strata/btrfs"};
};

struct ResolvedIds final {
    std::string partuuid{};
    std::string uuid{};

    bool operator==(const ResolvedIds&) const = default;
};

/// @brief What later installation stages (bootloader, fstab) need to know.
struct ProvisioningResult final {
    /// Mounts in the order they were performed.
    std::vector<mount::MountEntry> mount_plan{};
    std::vector<mount::MountEntry> swap{};
    /// Mountpoint (inside the target) to device or mapper path.
    std::map<std::string, std::string> mount_devices{};
    std::optional<ResolvedIds> root{};
    std::optional<ResolvedIds> boot{};
    std::vector<crypto::CryptTarget> crypt_targets{};
};

/// @brief Applies a layout to the machine in seven fixed steps.
///
/// 1. partition tables (wipe or verify, deletions)
/// 2. partition creation
/// 3. LVM (PVs, groups, volumes)
/// 4. encryption (format, unlock, keyfiles)
/// 5. filesystem creation
/// 6. mount plan
/// 7. mounting
///
/// Every wait for the kernel is a bounded poll against a fresh probe.
/// A failure aborts the run and leaves the devices as the last successful
/// command left them. Step 1 destroys data irreversibly.
class Provisioner final {
 public:
    Provisioner(utils::CommandRunner& runner, disk::DeviceProbe& probe, ProvisioningConfig config) noexcept
      : m_runner(runner), m_inventory(probe), m_config(std::move(config)) { }

    /// @brief Runs all steps against @p layout, recording resolved paths and UUIDs in it.
    /// @param encryption Must have passed layout.validate_encryption().
    auto provision(disk::DiskLayoutConfiguration& layout, const std::optional<crypto::DiskEncryption>& encryption = std::nullopt) noexcept -> Result<ProvisioningResult>;

 private:
    auto refresh(ProvisionStep step) noexcept -> Result<void>;
    auto reread_partitions(std::string_view device, ProvisionStep step) noexcept -> Result<void>;

    auto prepare_partition_table(disk::DeviceModification& device_mod) noexcept -> Result<void>;
    auto create_partitions(disk::DeviceModification& device_mod) noexcept -> Result<void>;
    auto realize_lvm(disk::DiskLayoutConfiguration& layout) noexcept -> Result<void>;
    auto encrypt_partitions(disk::DiskLayoutConfiguration& layout, const crypto::DiskEncryption& encryption) noexcept -> Result<void>;
    auto encrypt_volumes(disk::DiskLayoutConfiguration& layout, const crypto::DiskEncryption& encryption) noexcept -> Result<void>;
    auto encrypt_target(const std::string& obj_id, const std::string& device, const std::string& mapper_name, bool is_root,
        const crypto::DiskEncryption& encryption) noexcept -> Result<void>;
    auto collect_leaves(disk::DiskLayoutConfiguration& layout) const noexcept -> std::vector<LeafTarget>;
    auto format_leaf(LeafTarget& leaf) noexcept -> Result<void>;
    auto mount_entry(const mount::MountEntry& entry, std::string_view target_root, bool issue_mount) noexcept -> Result<void>;

    utils::CommandRunner& m_runner;
    disk::DeviceInventory m_inventory;
    ProvisioningConfig m_config;
    /// Object id to /dev/mapper path of every unlocked target.
    std::map<std::string, std::string> m_mappers{};
    std::vector<crypto::CryptTarget> m_crypt_targets{};
};

}  // namespace strata::provision

#endif  // PROVISIONER_HPP
