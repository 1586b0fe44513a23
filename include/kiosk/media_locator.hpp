#pragma once

#include "kiosk/block_devices.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

// Removable media as seen by the update engine.
class IMediaSource {
  public:
    virtual ~IMediaSource() = default;
    virtual std::optional<std::string> Locate() = 0;
    virtual bool Unmount(const std::string& mount_path) = 0;
};

class MediaLocator final : public IMediaSource {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        // `created` tells the caller whether it owns the directory for cleanup.
        virtual Result CreateMountPoint(const std::string& dir, bool& created) const = 0;
        virtual Result Mount(const std::string& device,
                             const std::string& target_dir,
                             const std::string& fs_type,
                             unsigned long mount_flags) const = 0;
        virtual Result Unmount(const std::string& target_dir) const = 0;
        virtual void RemoveDirectory(const std::string& dir) const = 0;
    };

    struct Options {
        std::string mount_base_dir = "/mnt/kiosk_usb_update";
        std::vector<std::string> fs_types = {"vfat", "exfat", "ext4", "ntfs3"};
        bool read_only = true;
    };

    MediaLocator(Options options,
                 std::shared_ptr<const IDeviceTable> devices,
                 std::shared_ptr<const ISystemOps> system_ops = nullptr);

    // Mount point of the first already-mounted removable partition, else the
    // first unmounted one mounted at "<mount_base_dir>/<device name>".
    std::optional<std::string> Locate() override;
    // True when nothing is mounted at the path or the unmount succeeded.
    bool Unmount(const std::string& mount_path) override;

    std::string MountPointFor(const BlockDevice& dev) const;

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();
    unsigned long MountFlags() const;

    Options options_;
    std::shared_ptr<const IDeviceTable> devices_;
    std::shared_ptr<const ISystemOps> system_ops_;
};

} // namespace kiosk
