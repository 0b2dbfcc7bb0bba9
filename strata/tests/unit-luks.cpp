#include "doctest_compatibility.h"

#include "fake_system.hpp"
#include "strata/luks.hpp"

#include <algorithm>  // for find
#include <string>     // for string
#include <vector>     // for vector

using namespace strata::crypto;

TEST_CASE("disk encryption test")
{
    strata::test::install_null_logger();

    SECTION("target kinds are exclusive")
    {
        const auto res = DiskEncryption::create(EncryptionType::Luks, "secret", {"p1"}, {"lv1"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE_EQ(res.error().kind, strata::ErrorKind::InvalidState);
    }
    SECTION("each type needs its kind of target")
    {
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::Luks, "secret", {}, {}).has_value());
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::LvmOnLuks, "secret", {}, {}).has_value());
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::LuksOnLvm, "secret", {"p1"}, {}).has_value());
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::NoEncryption, "", {"p1"}, {}).has_value());
        REQUIRE(DiskEncryption::create(EncryptionType::NoEncryption, "", {}, {}).has_value());
    }
    SECTION("password and parameters")
    {
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::Luks, "", {"p1"}, {}).has_value());
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::Luks, "secret", {"p1"}, {}, std::nullopt, 0).has_value());
        REQUIRE_FALSE(DiskEncryption::create(EncryptionType::Luks, "secret", {"p1"}, {}, Fido2Device{}).has_value());

        auto encryption = DiskEncryption::create(EncryptionType::Luks, "secret", {"p1", "p2"}, {}, Fido2Device{.path = "/dev/hidraw0"}, 2000);
        REQUIRE(encryption.has_value());
        REQUIRE_EQ(encryption->iter_time(), 2000);
        REQUIRE(encryption->should_encrypt_partition("p2"));
        REQUIRE_FALSE(encryption->should_encrypt_partition("p3"));
        REQUIRE_FALSE(encryption->should_encrypt_volume("p1"));

        REQUIRE_FALSE(encryption->set_password("").has_value());
        REQUIRE_EQ(encryption->password(), "secret");
        REQUIRE(encryption->set_password("hunter2").has_value());
        REQUIRE_EQ(encryption->password(), "hunter2");
    }
    SECTION("type names")
    {
        REQUIRE_EQ(encryption_type_to_string(EncryptionType::LvmOnLuks), "lvm_on_luks");
        REQUIRE_EQ(string_to_encryption_type("luks_on_lvm"), EncryptionType::LuksOnLvm);
        REQUIRE_FALSE(string_to_encryption_type("luks1").has_value());
    }
}

TEST_CASE("luks commands test")
{
    strata::test::install_null_logger();

    SECTION("format reads the key from stdin")
    {
        const auto cmd = gen_luks_format_command("/dev/sda2", DEFAULT_ITER_TIME);
        REQUIRE_EQ(cmd.front(), "cryptsetup");
        REQUIRE_EQ(cmd.back(), "/dev/sda2");
        REQUIRE(std::ranges::find(cmd, "luksFormat") != cmd.end());
        REQUIRE(std::ranges::find(cmd, "10000") != cmd.end());
        REQUIRE(std::ranges::find(cmd, "secret") == cmd.end());

        const auto key_file = std::ranges::find(cmd, "--key-file");
        REQUIRE(key_file != cmd.end());
        REQUIRE_EQ(*(key_file + 1), "-");
    }
    SECTION("open and add key")
    {
        REQUIRE_EQ(gen_luks_open_command("/dev/sda2", "luks-sda2"),
            std::vector<std::string>{"cryptsetup", "open", "/dev/sda2", "luks-sda2", "--key-file", "-", "--type", "luks2"});
        REQUIRE_EQ(gen_luks_add_key_command("/dev/sda3", "/run/keys/luks-sda3.key"),
            std::vector<std::string>{"cryptsetup", "--batch-mode", "luksAddKey", "/dev/sda3", "/run/keys/luks-sda3.key", "--key-file", "-"});
    }
    SECTION("keyfiles")
    {
        REQUIRE_EQ(keyfile_path("/run/keys", "luks-sda3"), "/run/keys/luks-sda3.key");
        const auto cmd = gen_keyfile_command("/run/keys/luks-sda3.key");
        REQUIRE_EQ(cmd.front(), "dd");
        REQUIRE(std::ranges::find(cmd, "of=/run/keys/luks-sda3.key") != cmd.end());
    }
    SECTION("fido2 enrollment")
    {
        const auto cmd = gen_fido2_enroll_command("/dev/sda2", Fido2Device{.path = "/dev/hidraw0", .product = "YubiKey"});
        REQUIRE_EQ(cmd, std::vector<std::string>{"systemd-cryptenroll", "--fido2-device=/dev/hidraw0", "--unlock-key-file=/dev/stdin", "/dev/sda2"});
    }
}
