#include "kiosk/package_locator.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace kiosk {
namespace {

class PackageLocatorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    PackageLocator locator{"atc_update_package"};

    std::string Package() const { return tmp.Path() + "/atc_update_package"; }
};

TEST_F(PackageLocatorTest, FindsCompletePackage) {
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/config.json", "{}"));
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/assets/a.jpg", "A"));

    const auto found = locator.Find(tmp.Path());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, Package());
}

TEST_F(PackageLocatorTest, MissingDirectoryIsNotFound) {
    EXPECT_FALSE(locator.Find(tmp.Path()).has_value());
    EXPECT_FALSE(locator.Find(tmp.Path() + "/no-such-mount").has_value());
    EXPECT_FALSE(locator.Find("").has_value());
}

TEST_F(PackageLocatorTest, MissingConfigIsNotFound) {
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/assets/a.jpg", "A"));
    EXPECT_FALSE(locator.Find(tmp.Path()).has_value());
}

TEST_F(PackageLocatorTest, MissingAssetsIsNotFound) {
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/config.json", "{}"));
    EXPECT_FALSE(locator.Find(tmp.Path()).has_value());

    // A file named "assets" is not an asset tree.
    ASSERT_TRUE(testutil::WriteTextFile(Package() + "/assets", "x"));
    EXPECT_FALSE(locator.Find(tmp.Path()).has_value());
}

TEST_F(PackageLocatorTest, PackageMustSitAtMountRoot) {
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Path() + "/nested/atc_update_package/config.json", "{}"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Path() + "/nested/atc_update_package/assets/a", "A"));
    EXPECT_FALSE(locator.Find(tmp.Path()).has_value());
}

} // namespace
} // namespace kiosk
