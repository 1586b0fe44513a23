#include "kiosk/path_rewriter.hpp"

#include "kiosk/asset_resolver.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <string>

namespace kiosk {

ConfigDocument PathRewriter::Rewrite(const ConfigDocument& doc, std::string_view new_prefix) {
    ConfigDocument out = doc;
    const std::string prefix = NormalizeSeparators(std::string(new_prefix));

    for (auto& m : out.media) {
        const auto rel = StripAssetPrefix(m.path);
        if (!rel) {
            // TODO: reject non-package paths once the product owner confirms
            // absolute/external media paths are not a supported use case.
            LogWarn("media '%s': path '%s' passed through unchanged", m.name.c_str(), m.path.c_str());
            continue;
        }
        m.path = NormalizeSeparators(JoinPath(prefix, *rel));
    }
    return out;
}

} // namespace kiosk
