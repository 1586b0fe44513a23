#pragma once

#include "io/file_system.hpp"

#include <memory>
#include <optional>
#include <string>

namespace kiosk {

class PackageLocator {
  public:
    static constexpr const char* kConfigFileName = "config.json";
    static constexpr const char* kAssetsDirName = "assets";

    explicit PackageLocator(std::string package_dir_name,
                            std::shared_ptr<const IFileSystem> fs = LocalFileSystem::Default());

    // Path of "<mount>/<package_dir_name>" when it holds both config.json and
    // assets/. A missing or malformed package is simply not found.
    std::optional<std::string> Find(const std::string& mount_path) const;

  private:
    std::string package_dir_name_;
    std::shared_ptr<const IFileSystem> fs_;
};

} // namespace kiosk
