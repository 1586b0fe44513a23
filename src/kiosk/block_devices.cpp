#include "kiosk/block_devices.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

std::string DecodeMountField(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size()) {
            const auto oct = s.substr(i + 1, 3);
            if (oct.size() == 3 && std::all_of(oct.begin(), oct.end(), [](char c) {
                    return c >= '0' && c <= '7';
                })) {
                out.push_back(static_cast<char>(((oct[0] - '0') << 6) | ((oct[1] - '0') << 3) |
                                                (oct[2] - '0')));
                i += 3;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

bool ReadFirstLine(const fs::path& path, std::string& out) {
    std::ifstream is(path);
    if (!is.good()) return false;
    std::getline(is, out);
    return true;
}

std::vector<std::string> SortedSubdirs(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

std::map<std::string, std::string> ParseMountTable(std::string_view contents) {
    std::map<std::string, std::string> mounts;
    std::istringstream is{std::string(contents)};
    std::string line;
    while (std::getline(is, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mount_point;
        if (!(fields >> device >> mount_point)) continue;
        mounts.emplace(DecodeMountField(device), DecodeMountField(mount_point));
    }
    return mounts;
}

SysfsDeviceTable::SysfsDeviceTable(std::string sysfs_block_dir,
                                   std::string mounts_file,
                                   std::string dev_dir)
    : sysfs_block_dir_(std::move(sysfs_block_dir)),
      mounts_file_(std::move(mounts_file)),
      dev_dir_(std::move(dev_dir)) {}

std::map<std::string, std::string> SysfsDeviceTable::ReadMounts() const {
    std::ifstream is(mounts_file_);
    if (!is.good()) {
        LogWarn("cannot read mount table %s", mounts_file_.c_str());
        return {};
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return ParseMountTable(ss.str());
}

std::vector<BlockDevice> SysfsDeviceTable::ListRemovablePartitions() const {
    std::vector<BlockDevice> out;
    const auto mounts = ReadMounts();

    for (const auto& disk : SortedSubdirs(sysfs_block_dir_)) {
        const fs::path disk_dir = fs::path(sysfs_block_dir_) / disk;
        std::string removable;
        if (!ReadFirstLine(disk_dir / "removable", removable) || removable != "1")
            continue;

        for (const auto& part : SortedSubdirs(disk_dir)) {
            std::error_code ec;
            if (!fs::exists(disk_dir / part / "partition", ec))
                continue;

            BlockDevice dev;
            dev.name = part;
            dev.device_path = JoinPath(dev_dir_, part);
            if (auto it = mounts.find(dev.device_path); it != mounts.end())
                dev.mount_point = it->second;
            LogDebug("removable partition %s mounted=%s",
                     dev.device_path.c_str(),
                     dev.mount_point.empty() ? "no" : dev.mount_point.c_str());
            out.push_back(std::move(dev));
        }
    }
    return out;
}

bool SysfsDeviceTable::IsMountPoint(const std::string& path) const {
    const auto mounts = ReadMounts();
    return std::any_of(mounts.begin(), mounts.end(), [&](const auto& kv) {
        return kv.second == path;
    });
}

} // namespace kiosk
