#include "testing.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>

namespace kiosk {
namespace {

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

// A fake removable disk whose only partition is already mounted at <base>/usb.
class MainCliTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Base() const { return tmp.Path(); }
    std::string AppRoot() const { return Base() + "/app"; }
    std::string Package() const { return Base() + "/usb/atc_update_package"; }
    std::string ConfigPath() const { return Base() + "/updater.conf"; }

    void SetUp() override {
        ASSERT_TRUE(testutil::WriteTextFile(Base() + "/sys/block/sdz/removable", "1\n"));
        ASSERT_TRUE(testutil::WriteTextFile(Base() + "/sys/block/sdz/sdz1/partition", "1\n"));
        ASSERT_TRUE(testutil::WriteTextFile(Base() + "/mounts",
                                            "/dev/sdz1 " + Base() + "/usb vfat ro 0 0\n"));

        nlohmann::json cfg = {
            {"app_root", AppRoot()},
            {"sysfs_block_dir", Base() + "/sys/block"},
            {"mounts_file", Base() + "/mounts"},
            {"mount_base_dir", Base() + "/mnt"},
            {"status_file", Base() + "/status.json"},
            {"log_level", "error"},
        };
        ASSERT_TRUE(testutil::WriteTextFile(ConfigPath(), cfg.dump()));

        ASSERT_TRUE(testutil::WriteTextFile(AppRoot() + "/atc_engine/config.json",
                                            testutil::SignageConfig({"atc_engine/image_sets/old.jpg"})));
        ASSERT_TRUE(testutil::WriteTextFile(AppRoot() + "/atc_engine/image_sets/old.jpg", "old"));
    }

    int RunOnce() {
        const std::string cmd = "KIOSK_UPDATER_CONFIG=" + ShellQuote(ConfigPath()) + " " +
                                ShellQuote(KIOSK_UPDATER_BIN) + " --once >/dev/null 2>&1";
        return ExitCodeFromSystem(std::system(cmd.c_str()));
    }
};

TEST_F(MainCliTest, AppliesPackageFromMountedDrive) {
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/config.json",
                                        testutil::SignageConfig({"assets/slides/a.jpg"})));
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/assets/slides/a.jpg", "jpeg"));

    ASSERT_EQ(RunOnce(), 0);

    EXPECT_EQ(testutil::ReadTextFile(AppRoot() + "/atc_engine/image_sets/slides/a.jpg").value_or(""),
              "jpeg");
    const auto live = nlohmann::json::parse(
        testutil::ReadTextFile(AppRoot() + "/atc_engine/config.json").value_or("null"));
    EXPECT_EQ(live["media"]["m0"]["path"], "atc_engine/image_sets/slides/a.jpg");
    EXPECT_FALSE(std::filesystem::exists(AppRoot() + "/atc_engine/image_sets/old.jpg"));

    const auto status = nlohmann::json::parse(testutil::ReadTextFile(Base() + "/status.json").value_or("null"));
    EXPECT_TRUE(status.contains("message"));
}

TEST_F(MainCliTest, InvalidPackageExitsWithFailure) {
    auto bad = nlohmann::json::parse(testutil::SignageConfig({"assets/a.jpg"}));
    bad["buttons"]["next"]["mode"] = "hold";
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/config.json", bad.dump()));
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/assets/a.jpg", "jpeg"));
    const auto before = testutil::ReadTextFile(AppRoot() + "/atc_engine/config.json");

    EXPECT_EQ(RunOnce(), 1);
    EXPECT_EQ(testutil::ReadTextFile(AppRoot() + "/atc_engine/config.json"), before);
    EXPECT_EQ(testutil::ReadTextFile(AppRoot() + "/atc_engine/image_sets/old.jpg").value_or(""), "old");
}

TEST_F(MainCliTest, MissingPackageExitsWithFailure) {
    ASSERT_TRUE(testutil::WriteTextFile(Base() + "/usb/readme.txt", "nothing here"));
    EXPECT_EQ(RunOnce(), 1);
}

TEST_F(MainCliTest, ExplicitConfigFlagWins) {
    const std::string cmd = "KIOSK_UPDATER_CONFIG=/nonexistent.conf " + ShellQuote(KIOSK_UPDATER_BIN) +
                            " --once -c " + ShellQuote(ConfigPath()) + " >/dev/null 2>&1";
    ASSERT_TRUE(testutil::WriteTextFile(Base() + "/usb/readme.txt", "nothing here"));
    // Config loads, so the failure is the missing package rather than the config.
    EXPECT_EQ(ExitCodeFromSystem(std::system(cmd.c_str())), 1);

    const auto status = nlohmann::json::parse(testutil::ReadTextFile(Base() + "/status.json").value_or("null"));
    ASSERT_TRUE(status.is_object());
}

TEST_F(MainCliTest, UnreadableConfigFails) {
    const std::string cmd = "KIOSK_UPDATER_CONFIG=" + ShellQuote(Base() + "/missing.conf") + " " +
                            ShellQuote(KIOSK_UPDATER_BIN) + " --once >/dev/null 2>&1";
    EXPECT_EQ(ExitCodeFromSystem(std::system(cmd.c_str())), 1);
    EXPECT_FALSE(std::filesystem::exists(Base() + "/status.json"));
}

} // namespace
} // namespace kiosk
