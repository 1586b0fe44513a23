#pragma once

#include "kiosk/config_document.hpp"

#include <string_view>

namespace kiosk {

class PathRewriter {
  public:
    // Returns an independent copy of `doc` whose "assets/<rel>" media paths read
    // "<new_prefix>/<rel>" with '/' separators. Other paths are left as they are.
    static ConfigDocument Rewrite(const ConfigDocument& doc, std::string_view new_prefix);
};

} // namespace kiosk
