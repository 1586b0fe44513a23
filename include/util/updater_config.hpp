#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace kiosk {

// On-device settings of the updater itself (not the signage config it updates).
struct UpdaterConfig {
    std::string app_root;
    std::string engine_dir = "atc_engine";
    std::string asset_subdir = "image_sets";
    std::string config_filename = "config.json";

    std::string package_dir_name = "atc_update_package";
    std::string staging_dir_name = ".update_staging";
    std::string backup_dir_name = ".update_backup";

    std::string mount_base_dir = "/mnt/kiosk_usb_update";
    std::string sysfs_block_dir = "/sys/block";
    std::string mounts_file = "/proc/self/mounts";
    std::string dev_dir = "/dev";
    std::vector<std::string> fs_types = {"vfat", "exfat", "ext4", "ntfs3"};
    bool mount_read_only = true;

    std::string status_file;
    LogLevel log_level = LogLevel::Info;

    static Result LoadFromFile(const std::string& path, UpdaterConfig& out);
};

} // namespace kiosk
