#include "kiosk/package_locator.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace kiosk {

PackageLocator::PackageLocator(std::string package_dir_name, std::shared_ptr<const IFileSystem> fs)
    : package_dir_name_(std::move(package_dir_name)),
      fs_(fs ? std::move(fs) : LocalFileSystem::Default()) {}

std::optional<std::string> PackageLocator::Find(const std::string& mount_path) const {
    if (mount_path.empty() || !fs_->IsDirectory(mount_path))
        return std::nullopt;

    const std::string package = JoinPath(mount_path, package_dir_name_);
    if (!fs_->IsDirectory(package)) {
        LogDebug("no package directory at %s", package.c_str());
        return std::nullopt;
    }
    if (!fs_->IsRegularFile(JoinPath(package, kConfigFileName))) {
        LogInfo("package %s has no %s", package.c_str(), kConfigFileName);
        return std::nullopt;
    }
    if (!fs_->IsDirectory(JoinPath(package, kAssetsDirName))) {
        LogInfo("package %s has no %s/ directory", package.c_str(), kAssetsDirName);
        return std::nullopt;
    }
    return package;
}

} // namespace kiosk
