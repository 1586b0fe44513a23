#include "kiosk/asset_resolver.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace kiosk {

std::optional<std::string> StripAssetPrefix(std::string_view path) {
    if (!StartsWith(path, kPackageAssetPrefix))
        return std::nullopt;
    return NormalizeSeparators(std::string(path.substr(kPackageAssetPrefix.size())));
}

AssetMap AssetResolver::Gather(const ConfigDocument& doc) {
    AssetMap assets;
    for (const auto& m : doc.media) {
        auto rel = StripAssetPrefix(m.path);
        if (!rel) {
            LogDebug("media '%s': path '%s' is not package-relative", m.name.c_str(), m.path.c_str());
            continue;
        }
        // emplace keeps the first reference for a relative path
        assets.emplace(std::move(*rel), m.path);
    }
    return assets;
}

} // namespace kiosk
