#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeSeparatorsCleansInput) {
    EXPECT_EQ(kiosk::NormalizeSeparators("assets\\sets\\a.png"), "assets/sets/a.png");
    EXPECT_EQ(kiosk::NormalizeSeparators("./assets//x.png"), "assets/x.png");
    EXPECT_EQ(kiosk::NormalizeSeparators("././a//b"), "a/b");
    EXPECT_EQ(kiosk::NormalizeSeparators(""), "");
}

TEST(PathUtilsTest, JoinPathAddsSingleSeparator) {
    EXPECT_EQ(kiosk::JoinPath("/opt/app", "atc_engine"), "/opt/app/atc_engine");
    EXPECT_EQ(kiosk::JoinPath("/opt/app/", "/atc_engine"), "/opt/app/atc_engine");
    EXPECT_EQ(kiosk::JoinPath("", "x"), "x");
    EXPECT_EQ(kiosk::JoinPath("x", ""), "x");
}

TEST(PathUtilsTest, IsSafeRelativePath) {
    EXPECT_TRUE(kiosk::IsSafeRelativePath("sets/a.png"));
    EXPECT_TRUE(kiosk::IsSafeRelativePath("a..b/c"));
    EXPECT_FALSE(kiosk::IsSafeRelativePath(""));
    EXPECT_FALSE(kiosk::IsSafeRelativePath("/etc/passwd"));
    EXPECT_FALSE(kiosk::IsSafeRelativePath("../escape.png"));
    EXPECT_FALSE(kiosk::IsSafeRelativePath("sets/../../escape.png"));
}

TEST(PathUtilsTest, IsUnderDirectory) {
    EXPECT_TRUE(kiosk::IsUnderDirectory("/mnt/usb/sdb1", "/mnt/usb"));
    EXPECT_TRUE(kiosk::IsUnderDirectory("/mnt/usb", "/mnt/usb/"));
    EXPECT_FALSE(kiosk::IsUnderDirectory("/mnt/usb2/sdb1", "/mnt/usb"));
    EXPECT_FALSE(kiosk::IsUnderDirectory("/mnt/usb", ""));
}
