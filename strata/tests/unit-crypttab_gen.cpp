#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/crypttab.hpp"
#include "strata/file_utils.hpp"

#include <filesystem>   // for temp_directory_path, remove_all, status
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

using namespace std::string_view_literals;
using strata::crypto::CryptTarget;

TEST_CASE("crypttab gen test")
{
    strata::test::install_null_logger();

    const CryptTarget root{.mapper_name = "luks-sda2", .device = "/dev/sda2", .luks_uuid = "luks-uuid-2", .is_root = true};
    const CryptTarget home{.mapper_name = "luks-sda3", .device = "/dev/sda3", .luks_uuid = "luks-uuid-3", .keyfile = "/run/keys/luks-sda3.key"};
    const CryptTarget data{.mapper_name = "luks-sdb1", .device = "/dev/sdb1", .luks_uuid = "luks-uuid-4", .hsm_enrolled = true};

    SECTION("root is unlocked by the initramfs")
    {
        REQUIRE_FALSE(strata::fs::gen_crypttab_entry(root).has_value());
        REQUIRE_FALSE(strata::fs::gen_crypttab_entry(CryptTarget{.mapper_name = "luks-sdc1"}).has_value());
    }
    SECTION("keyfile and fido2 entries")
    {
        REQUIRE_EQ(strata::fs::gen_crypttab_entry(home), "luks-sda3             UUID=luks-uuid-3                              /etc/cryptsetup-keys.d/luks-sda3.key luks\n");
        REQUIRE_EQ(strata::fs::gen_crypttab_entry(data), "luks-sdb1             UUID=luks-uuid-4                              none                    luks,fido2-device=auto\n");
    }
    SECTION("whole file")
    {
        const auto content = strata::fs::generate_crypttab_content({root, home, data});
        REQUIRE(content.starts_with("# Configuration for encrypted block devices\n"sv));
        REQUIRE(content.find("luks-sda2") == std::string::npos);
        REQUIRE(content.find("luks-sda3 ") != std::string::npos);
        REQUIRE(content.find("luks-sdb1 ") != std::string::npos);
    }
    SECTION("keyfiles are installed into the target")
    {
        namespace fs = std::filesystem;

        const auto base = fs::temp_directory_path() / "strata-unit-crypttab";
        fs::remove_all(base);
        const auto staged = (base / "staged" / "luks-sda3.key").string();
        const auto target = (base / "target").string();
        REQUIRE(strata::file_utils::create_file_for_overwrite(staged, "0123456789abcdef"));

        CryptTarget staged_home = home;
        staged_home.keyfile     = staged;
        REQUIRE(strata::fs::install_keyfiles({root, staged_home}, target));

        const auto installed = target + "/etc/cryptsetup-keys.d/luks-sda3.key";
        REQUIRE_EQ(strata::file_utils::read_whole_file(installed), "0123456789abcdef");
        REQUIRE(fs::status(installed).permissions() == fs::perms::owner_read);
        REQUIRE(fs::status(target + "/etc/cryptsetup-keys.d").permissions() == fs::perms::owner_all);
        REQUIRE_EQ(strata::file_utils::read_whole_file(target + "/etc/crypttab"), strata::fs::generate_crypttab_content({root, staged_home}));

        fs::permissions(installed, fs::perms::owner_all);
        fs::remove_all(base);
    }
    SECTION("missing staged keyfile")
    {
        const auto target = (std::filesystem::temp_directory_path() / "strata-unit-crypttab-missing").string();
        CryptTarget lost = home;
        lost.keyfile     = "/nonexistent/luks-sda3.key";
        REQUIRE_FALSE(strata::fs::install_keyfiles({lost}, target));
        std::filesystem::remove_all(target);
    }
}
