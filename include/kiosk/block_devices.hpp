#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk {

struct BlockDevice {
    std::string name;         // "sdb1"
    std::string device_path;  // "/dev/sdb1"
    std::string mount_point;  // empty when not mounted
};

class IDeviceTable {
  public:
    virtual ~IDeviceTable() = default;
    // Partitions of removable disks, ordered by disk then partition name.
    virtual std::vector<BlockDevice> ListRemovablePartitions() const = 0;
    virtual bool IsMountPoint(const std::string& path) const = 0;
};

// device -> mount point, first entry wins. Octal escapes ("\040") are decoded.
std::map<std::string, std::string> ParseMountTable(std::string_view contents);

// Reads /sys/block/<disk>/removable, the partition subdirectories of each
// removable disk, and the kernel mount table.
class SysfsDeviceTable final : public IDeviceTable {
  public:
    SysfsDeviceTable(std::string sysfs_block_dir, std::string mounts_file, std::string dev_dir);

    std::vector<BlockDevice> ListRemovablePartitions() const override;
    bool IsMountPoint(const std::string& path) const override;

  private:
    std::map<std::string, std::string> ReadMounts() const;

    std::string sysfs_block_dir_;
    std::string mounts_file_;
    std::string dev_dir_;
};

} // namespace kiosk
