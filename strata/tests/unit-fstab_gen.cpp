#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/file_utils.hpp"
#include "strata/fstab.hpp"

#include <filesystem>   // for temp_directory_path, remove_all
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

using namespace std::string_view_literals;
using strata::fs::FilesystemType;
using strata::mount::MountEntry;

namespace {

const MountEntry BOOT_ENTRY{.source = "/dev/sda1", .mountpoint = "/boot", .fs_type = FilesystemType::Fat32, .options = {"umask=0077"}, .uuid = "8EFB-4B84"};
const MountEntry ROOT_ENTRY{.source = "/dev/sda2", .mountpoint = "/", .fs_type = FilesystemType::Btrfs, .options = {"noatime"}, .subvolume = "@", .uuid = "6bdb3301"};
const MountEntry SWAP_ENTRY{.source = "/dev/sda3", .fs_type = FilesystemType::LinuxSwap, .uuid = "swap-uuid"};

}  // namespace

TEST_CASE("fstab gen test")
{
    strata::test::install_null_logger();

    SECTION("single entries")
    {
        REQUIRE_EQ(strata::fs::gen_fstab_entry(BOOT_ENTRY), "# /dev/sda1\nUUID=8EFB-4B84                            /boot          vfat    umask=0077 0 2\n\n");
        REQUIRE_EQ(strata::fs::gen_fstab_entry(ROOT_ENTRY), "# /dev/sda2\nUUID=6bdb3301                             /              btrfs   subvol=@,noatime 0 0\n\n");
        REQUIRE_EQ(strata::fs::gen_fstab_entry(SWAP_ENTRY), "# /dev/sda3\nUUID=swap-uuid                            none           swap    defaults   0 0\n\n");
    }
    SECTION("entries without uuid or options")
    {
        const MountEntry entry{.source = "/dev/mapper/vg0-home", .mountpoint = "/home", .fs_type = FilesystemType::Ext4};
        const auto line = strata::fs::gen_fstab_entry(entry);
        REQUIRE(line.has_value());
        REQUIRE(line->starts_with("# /dev/mapper/vg0-home\n/dev/mapper/vg0-home "sv));
        REQUIRE(line->ends_with(" defaults   0 2\n\n"sv));
    }
    SECTION("entries without mountpoint are skipped")
    {
        const MountEntry entry{.source = "/dev/sda4", .fs_type = FilesystemType::Ext4};
        REQUIRE_FALSE(strata::fs::gen_fstab_entry(entry).has_value());
    }
    SECTION("whole file")
    {
        const auto content = strata::fs::generate_fstab_content({ROOT_ENTRY, BOOT_ENTRY}, {SWAP_ENTRY});
        REQUIRE(content.starts_with("# Static information about the filesystems.\n"sv));
        const auto root_pos = content.find("# /dev/sda2");
        const auto boot_pos = content.find("# /dev/sda1");
        const auto swap_pos = content.find("# /dev/sda3");
        REQUIRE(root_pos != std::string::npos);
        REQUIRE(root_pos < boot_pos);
        REQUIRE(boot_pos < swap_pos);
    }
    SECTION("written below the target root")
    {
        const auto root = (std::filesystem::temp_directory_path() / "strata-unit-fstab").string();
        std::filesystem::remove_all(root);

        REQUIRE(strata::fs::generate_fstab({ROOT_ENTRY, BOOT_ENTRY}, {}, root));
        REQUIRE_EQ(strata::file_utils::read_whole_file(root + "/etc/fstab"), strata::fs::generate_fstab_content({ROOT_ENTRY, BOOT_ENTRY}));

        std::filesystem::remove_all(root);
    }
}
