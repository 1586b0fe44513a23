#include "kiosk/media_locator.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/mount.h>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

class PosixSystemOps final : public MediaLocator::ISystemOps {
  public:
    Result CreateMountPoint(const std::string& dir, bool& created) const override {
        std::error_code ec;
        created = fs::create_directories(dir, ec);
        if (ec) {
            return Result::Fail(ec.value(), "mkdir " + dir + " failed: " + ec.message());
        }
        return Result::Ok();
    }

    Result Mount(const std::string& device,
                 const std::string& target_dir,
                 const std::string& fs_type,
                 unsigned long mount_flags) const override {
        if (::mount(device.c_str(), target_dir.c_str(), fs_type.c_str(), mount_flags, nullptr) != 0) {
            const int err = errno;
            return Result::Fail(err, "mount failed: " + std::string(std::strerror(err)));
        }
        return Result::Ok();
    }

    Result Unmount(const std::string& target_dir) const override {
        if (::umount2(target_dir.c_str(), 0) != 0) {
            const int err = errno;
            return Result::Fail(err, "umount failed: " + std::string(std::strerror(err)));
        }
        return Result::Ok();
    }

    // rmdir semantics: a non-empty directory stays.
    void RemoveDirectory(const std::string& dir) const override {
        std::error_code ec;
        fs::remove(fs::path(dir), ec);
        if (ec) LogDebug("rmdir %s: %s", dir.c_str(), ec.message().c_str());
    }
};

} // namespace

std::shared_ptr<const MediaLocator::ISystemOps> MediaLocator::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

MediaLocator::MediaLocator(Options options,
                           std::shared_ptr<const IDeviceTable> devices,
                           std::shared_ptr<const ISystemOps> system_ops)
    : options_(std::move(options)),
      devices_(std::move(devices)),
      system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

unsigned long MediaLocator::MountFlags() const {
    unsigned long flags = MS_NOSUID | MS_NODEV | MS_NOEXEC;
    if (options_.read_only) flags |= MS_RDONLY;
    return flags;
}

std::string MediaLocator::MountPointFor(const BlockDevice& dev) const {
    return JoinPath(options_.mount_base_dir, fs::path(dev.device_path).filename().string());
}

std::optional<std::string> MediaLocator::Locate() {
    const auto partitions = devices_->ListRemovablePartitions();

    for (const auto& dev : partitions) {
        if (!dev.mount_point.empty()) {
            LogInfo("removable partition %s already mounted at %s",
                    dev.device_path.c_str(), dev.mount_point.c_str());
            return dev.mount_point;
        }
    }

    if (partitions.empty()) {
        LogInfo("no removable partition found");
        return std::nullopt;
    }

    const BlockDevice& dev = partitions.front();
    const std::string target = MountPointFor(dev);

    bool created = false;
    auto create_result = system_ops_->CreateMountPoint(target, created);
    if (!create_result.is_ok()) {
        LogError("cannot create mount point %s: %s", target.c_str(), create_result.message().c_str());
        return std::nullopt;
    }

    for (const auto& fs_type : options_.fs_types) {
        auto mount_result = system_ops_->Mount(dev.device_path, target, fs_type, MountFlags());
        if (mount_result.is_ok()) {
            LogInfo("mounted %s (%s) at %s", dev.device_path.c_str(), fs_type.c_str(), target.c_str());
            return target;
        }
        LogDebug("mount %s as %s: %s", dev.device_path.c_str(), fs_type.c_str(),
                 mount_result.message().c_str());
    }

    LogError("could not mount %s with any of %zu filesystem types",
             dev.device_path.c_str(), options_.fs_types.size());
    if (created) {
        system_ops_->RemoveDirectory(target);
    }
    return std::nullopt;
}

bool MediaLocator::Unmount(const std::string& mount_path) {
    if (mount_path.empty() || !devices_->IsMountPoint(mount_path)) {
        return true;
    }

    auto unmount_result = system_ops_->Unmount(mount_path);
    if (!unmount_result.is_ok()) {
        LogError("unmount %s: %s", mount_path.c_str(), unmount_result.message().c_str());
        return false;
    }

    if (IsUnderDirectory(mount_path, options_.mount_base_dir) &&
        NormalizeSeparators(mount_path) != NormalizeSeparators(options_.mount_base_dir)) {
        system_ops_->RemoveDirectory(mount_path);
    }
    return true;
}

} // namespace kiosk
