#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/btrfs.hpp"

#include <filesystem>  // for temp_directory_path, remove_all
#include <string>      // for string
#include <vector>      // for vector

namespace fs = std::filesystem;

TEST_CASE("btrfs subvolume test")
{
    strata::test::install_null_logger();

    const auto scratch = (fs::temp_directory_path() / "strata-unit-btrfs").string();
    fs::remove_all(scratch);

    strata::test::FakeSystem system{};
    system.add_disk(strata::test::FakeDisk{
        .path       = "/dev/sda",
        .size_bytes = 64ULL << 30,
        .pttype     = "gpt",
        .partitions = {{.path = "/dev/sda2", .partn = 2, .start_bytes = 1025ULL << 20, .size_bytes = 20ULL << 30, .fstype = "btrfs", .uuid = "fs-uuid"}},
    });

    const std::vector<strata::disk::SubvolumeModification> subvols{
        {.name = "@", .mountpoint = "/"},
        {.name = "@home", .mountpoint = "/home"},
        {.name = "@/var/lib/portables"},
    };

    SECTION("mounted, created, unmounted")
    {
        REQUIRE(strata::fs::btrfs_create_subvols(system, subvols, "/dev/sda2", scratch).has_value());

        const auto& cmds = system.commands();
        REQUIRE_EQ(cmds.size(), 5);
        REQUIRE_EQ(cmds.front().args, std::vector<std::string>{"mount", "-t", "btrfs", "/dev/sda2", scratch});
        REQUIRE_EQ(cmds[1].args, strata::fs::gen_subvolume_create_command(scratch + "/@"));
        REQUIRE_EQ(cmds[3].args, std::vector<std::string>{"btrfs", "subvolume", "create", scratch + "/@/var/lib/portables"});
        REQUIRE_EQ(cmds.back().args, std::vector<std::string>{"umount", scratch});
        REQUIRE(fs::is_directory(scratch + "/@/var/lib"));
        REQUIRE(system.disk("/dev/sda")->partitions[0].mountpoints.empty());
    }
    SECTION("unmounted after a failure")
    {
        system.failing_programs["btrfs"] = 1;
        const auto res = strata::fs::btrfs_create_subvols(system, subvols, "/dev/sda2", scratch);
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().kind, strata::ErrorKind::CommandFailed);
        REQUIRE_EQ(res.error().step, strata::ProvisionStep::Format);
        REQUIRE_EQ(system.commands().back().args.front(), "umount");
        REQUIRE_EQ(system.commands_of("btrfs").size(), 1);
    }
    SECTION("mount failure")
    {
        system.failing_programs["mount"] = 32;
        REQUIRE_FALSE(strata::fs::btrfs_create_subvols(system, subvols, "/dev/sda2", scratch).has_value());
        REQUIRE(system.commands_of("umount").empty());
    }
    SECTION("nothing to do")
    {
        REQUIRE(strata::fs::btrfs_create_subvols(system, {}, "/dev/sda2", scratch).has_value());
        REQUIRE(system.commands().empty());
    }

    fs::remove_all(scratch);
}
