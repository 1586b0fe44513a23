#include "kiosk/block_devices.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace kiosk {
namespace {

class SysfsDeviceTableTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Sysfs() const { return tmp.Path() + "/sys/block"; }
    std::string Mounts() const { return tmp.Path() + "/mounts"; }

    void AddDisk(const std::string& disk, bool removable, std::initializer_list<const char*> parts) {
        ASSERT_TRUE(testutil::WriteTextFile(Sysfs() + "/" + disk + "/removable",
                                            removable ? "1\n" : "0\n"));
        for (const char* p : parts) {
            ASSERT_TRUE(testutil::WriteTextFile(Sysfs() + "/" + disk + "/" + p + "/partition", "1\n"));
        }
    }

    SysfsDeviceTable Table() const { return SysfsDeviceTable(Sysfs(), Mounts(), "/dev"); }
};

TEST(MountTableTest, ParsesDevicesAndDecodesEscapes) {
    const auto mounts = ParseMountTable(
        "/dev/root / ext4 rw 0 0\n"
        "/dev/sdb1 /media/pi/MY\\040USB vfat rw 0 0\n"
        "\n"
        "/dev/sdb1 /mnt/second vfat rw 0 0\n");

    ASSERT_EQ(mounts.size(), 2u);
    EXPECT_EQ(mounts.at("/dev/root"), "/");
    EXPECT_EQ(mounts.at("/dev/sdb1"), "/media/pi/MY USB");
}

TEST_F(SysfsDeviceTableTest, ListsPartitionsOfRemovableDisksOnly) {
    AddDisk("mmcblk0", false, {"mmcblk0p1", "mmcblk0p2"});
    AddDisk("sdb", true, {"sdb2", "sdb1"});
    // Bare subdirectories such as "queue" are not partitions.
    ASSERT_TRUE(testutil::WriteTextFile(Sysfs() + "/sdb/queue/rotational", "0\n"));
    ASSERT_TRUE(testutil::WriteTextFile(Mounts(), "/dev/sdb2 /media/usb vfat rw 0 0\n"));

    const auto parts = Table().ListRemovablePartitions();
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].name, "sdb1");
    EXPECT_EQ(parts[0].device_path, "/dev/sdb1");
    EXPECT_TRUE(parts[0].mount_point.empty());
    EXPECT_EQ(parts[1].name, "sdb2");
    EXPECT_EQ(parts[1].mount_point, "/media/usb");
}

TEST_F(SysfsDeviceTableTest, MissingSysfsYieldsNothing) {
    EXPECT_TRUE(Table().ListRemovablePartitions().empty());
}

TEST_F(SysfsDeviceTableTest, IsMountPointReadsMountTable) {
    ASSERT_TRUE(testutil::WriteTextFile(Mounts(), "/dev/sdc1 /mnt/kiosk_usb_update/sdc1 vfat ro 0 0\n"));
    EXPECT_TRUE(Table().IsMountPoint("/mnt/kiosk_usb_update/sdc1"));
    EXPECT_FALSE(Table().IsMountPoint("/mnt/kiosk_usb_update/sdd1"));
}

} // namespace
} // namespace kiosk
