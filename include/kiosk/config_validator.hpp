#pragma once

#include "kiosk/config_document.hpp"

#include <expected>
#include <string>

namespace kiosk {

struct SchemaError {
    std::string field;   // e.g. "media.home.mode"
    std::string reason;

    std::string ToString() const { return field + ": " + reason; }
};

// Fail-fast schema check. Returns the typed document for the first document
// that passes, or the first violation found.
class ConfigValidator {
  public:
    std::expected<ConfigDocument, SchemaError> Validate(const Json& doc) const;
    // Syntax errors are reported on field "<document>".
    std::expected<ConfigDocument, SchemaError> ValidateText(const std::string& text) const;
};

} // namespace kiosk
