#pragma once

#include "kiosk/config_document.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kiosk {

// Package-relative media references look like "assets/<relpath>".
inline constexpr std::string_view kPackageAssetPrefix = "assets/";

// Relative remainder of an asset reference with separators normalized, or
// nullopt when `path` does not use the package convention.
std::optional<std::string> StripAssetPrefix(std::string_view path);

// relative path -> first original reference seen
using AssetMap = std::map<std::string, std::string>;

class AssetResolver {
  public:
    // Only media paths are scanned; they are the only path fields in the schema.
    static AssetMap Gather(const ConfigDocument& doc);
};

} // namespace kiosk
