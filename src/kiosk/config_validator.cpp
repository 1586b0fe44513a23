#include "kiosk/config_validator.hpp"

#include "kiosk/asset_resolver.hpp"
#include "util/path_utils.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string_view>

namespace kiosk {

namespace {

using Unexpected = std::unexpected<SchemaError>;

constexpr std::array<const char*, 4> kSections = {"buttons", "media", "actions", "settings"};

enum class SettingType { Number, Integer, String, StringOrNull };

struct KnownSetting {
    const char* key;
    SettingType type;
    bool required;
};

constexpr std::array<KnownSetting, 10> kKnownSettings = {{
    {"debounce_time", SettingType::Number, false},
    {"poll_interval", SettingType::Number, false},
    {"default_combo_hold_time", SettingType::Number, false},
    {"default_media_name", SettingType::String, true},
    {"image_flash_duty_cycle", SettingType::Number, false},
    {"image_flash_duration", SettingType::Number, false},
    {"scroll_text_speed", SettingType::Integer, false},
    {"scroll_text_font_size", SettingType::Integer, false},
    {"scroll_text_font_color", SettingType::String, false},
    {"scroll_text_bg_color", SettingType::StringOrNull, false},
}};

std::string FieldName(const char* section, const std::string& entry, const char* key) {
    return std::string(section) + "." + entry + "." + key;
}

std::string Quoted(const Json& j) {
    return j.is_string() ? "'" + j.get<std::string>() + "'" : j.dump();
}

Json ExtrasOf(const Json& entry, std::initializer_list<std::string_view> known) {
    Json extras = Json::object();
    for (const auto& [key, val] : entry.items()) {
        bool is_known = false;
        for (auto k : known) {
            if (key == k) {
                is_known = true;
                break;
            }
        }
        if (!is_known) extras[key] = val;
    }
    return extras;
}

std::expected<ButtonRef, SchemaError> ParseButtonRef(const char* section,
                                                     const std::string& entry,
                                                     const Json& j,
                                                     const ConfigDocument& doc) {
    const std::string field = FieldName(section, entry, "button");
    ButtonRef ref;
    if (j.is_string()) {
        ref.names.push_back(j.get<std::string>());
    } else if (j.is_array() && !j.empty()) {
        ref.as_list = true;
        for (const auto& item : j) {
            if (!item.is_string()) {
                return Unexpected({field, "must be a string or a list of strings"});
            }
            ref.names.push_back(item.get<std::string>());
        }
    } else {
        return Unexpected({field, "must be a string or a non-empty list of strings"});
    }

    for (const auto& name : ref.names) {
        if (!doc.FindButton(name)) {
            return Unexpected({field, "references unknown button '" + name + "'"});
        }
    }
    return ref;
}

std::expected<std::optional<Json>, SchemaError> ParseHoldTime(const char* section,
                                                              const std::string& entry,
                                                              const Json& details) {
    auto it = details.find("hold_time");
    if (it == details.end()) return std::optional<Json>{};
    const std::string field = FieldName(section, entry, "hold_time");
    if (!it->is_number()) {
        return Unexpected({field, "must be a number"});
    }
    if (it->get<double>() < 0.0) {
        return Unexpected({field, "must not be negative"});
    }
    return std::optional<Json>{*it};
}

std::expected<void, SchemaError> CheckAssetPath(const std::string& field, const std::string& path) {
    const auto rel = StripAssetPrefix(path);
    if (!rel) return {};
    if (!IsSafeRelativePath(*rel) || *rel == ".") {
        return Unexpected({field, "asset path '" + path + "' must name a file inside the package asset directory"});
    }
    return {};
}

std::expected<void, SchemaError> ParseButtons(const Json& section, ConfigDocument& doc) {
    for (const auto& [name, details] : section.items()) {
        if (!details.is_object()) {
            return Unexpected({"buttons." + name, "details must be an object"});
        }
        ButtonEntry b;
        b.name = name;

        auto value = details.find("value");
        if (value == details.end() || !value->is_number_integer()) {
            return Unexpected({FieldName("buttons", name, "value"), "must be an integer"});
        }
        if (value->is_number_unsigned() &&
            value->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Unexpected({FieldName("buttons", name, "value"), "is out of range, found " + value->dump()});
        }
        b.value = value->get<std::int64_t>();

        auto mode = details.find("mode");
        const auto parsed =
            (mode != details.end() && mode->is_string()) ? ParseButtonMode(mode->get<std::string>())
                                                         : std::nullopt;
        if (!parsed) {
            return Unexpected({FieldName("buttons", name, "mode"),
                               "must be one of press/toggle, found " +
                                   (mode == details.end() ? std::string("nothing") : Quoted(*mode))});
        }
        b.mode = *parsed;
        b.extras = ExtrasOf(details, {"value", "mode"});
        doc.buttons.push_back(std::move(b));
    }
    return {};
}

std::expected<void, SchemaError> ParseMedia(const Json& section, ConfigDocument& doc) {
    for (const auto& [name, details] : section.items()) {
        if (!details.is_object()) {
            return Unexpected({"media." + name, "details must be an object"});
        }
        MediaEntry m;
        m.name = name;

        auto mode = details.find("mode");
        const auto parsed =
            (mode != details.end() && mode->is_string()) ? ParseMediaMode(mode->get<std::string>())
                                                         : std::nullopt;
        if (!parsed) {
            return Unexpected({FieldName("media", name, "mode"),
                               "must be one of image_still/image_flash/scroll_text/slide, found " +
                                   (mode == details.end() ? std::string("nothing") : Quoted(*mode))});
        }
        m.mode = *parsed;

        auto path = details.find("path");
        if (path == details.end() || !path->is_string()) {
            return Unexpected({FieldName("media", name, "path"), "must be a string"});
        }
        m.path = path->get<std::string>();
        if (auto ok = CheckAssetPath(FieldName("media", name, "path"), m.path); !ok) {
            return Unexpected(ok.error());
        }

        if (auto btn = details.find("button"); btn != details.end()) {
            auto ref = ParseButtonRef("media", name, *btn, doc);
            if (!ref) return Unexpected(ref.error());
            m.button = std::move(*ref);
        }

        auto hold = ParseHoldTime("media", name, details);
        if (!hold) return Unexpected(hold.error());
        m.hold_time = *hold;

        m.extras = ExtrasOf(details, {"mode", "path", "button", "hold_time"});
        doc.media.push_back(std::move(m));
    }
    return {};
}

std::expected<void, SchemaError> ParseActions(const Json& section, ConfigDocument& doc) {
    for (const auto& [name, details] : section.items()) {
        if (!details.is_object()) {
            return Unexpected({"actions." + name, "details must be an object"});
        }
        ActionEntry a;
        a.name = name;

        auto mode = details.find("mode");
        const auto parsed =
            (mode != details.end() && mode->is_string()) ? ParseActionMode(mode->get<std::string>())
                                                         : std::nullopt;
        if (!parsed) {
            return Unexpected({FieldName("actions", name, "mode"),
                               "must be one of hdmi_control/load_config, found " +
                                   (mode == details.end() ? std::string("nothing") : Quoted(*mode))});
        }
        a.mode = *parsed;

        if (auto btn = details.find("button"); btn != details.end()) {
            auto ref = ParseButtonRef("actions", name, *btn, doc);
            if (!ref) return Unexpected(ref.error());
            a.button = std::move(*ref);
        }

        auto hold = ParseHoldTime("actions", name, details);
        if (!hold) return Unexpected(hold.error());
        a.hold_time = *hold;

        a.extras = ExtrasOf(details, {"mode", "button", "hold_time"});
        doc.actions.push_back(std::move(a));
    }
    return {};
}

std::expected<void, SchemaError> CheckSettings(const Json& settings) {
    for (const auto& [key, val] : settings.items()) {
        if (val.is_object() || val.is_array()) {
            return Unexpected({"settings." + key, "settings must be flat scalar values"});
        }
    }

    for (const auto& s : kKnownSettings) {
        const std::string field = std::string("settings.") + s.key;
        auto it = settings.find(s.key);
        if (it == settings.end()) {
            if (s.required) return Unexpected({field, "required setting is missing"});
            continue;
        }
        bool ok = false;
        const char* expected = "";
        switch (s.type) {
            case SettingType::Number:
                ok = it->is_number();
                expected = "a number";
                break;
            case SettingType::Integer:
                ok = it->is_number_integer();
                expected = "an integer";
                break;
            case SettingType::String:
                ok = it->is_string();
                expected = "a string";
                break;
            case SettingType::StringOrNull:
                ok = it->is_string() || it->is_null();
                expected = "a string or null";
                break;
        }
        if (!ok) {
            return Unexpected({field, std::string("must be ") + expected + ", found " + it->dump()});
        }
    }
    return {};
}

} // namespace

std::expected<ConfigDocument, SchemaError> ConfigValidator::Validate(const Json& doc) const {
    if (!doc.is_object()) {
        return Unexpected({"<document>", "root must be an object"});
    }
    for (const char* section : kSections) {
        auto it = doc.find(section);
        if (it == doc.end()) {
            return Unexpected({section, "missing required top-level section"});
        }
        if (!it->is_object()) {
            return Unexpected({section, "top-level section must be an object"});
        }
    }

    ConfigDocument out;
    // Buttons first: media and actions reference them by name.
    if (auto r = ParseButtons(doc.at("buttons"), out); !r) return Unexpected(r.error());
    if (auto r = ParseMedia(doc.at("media"), out); !r) return Unexpected(r.error());
    if (auto r = ParseActions(doc.at("actions"), out); !r) return Unexpected(r.error());
    if (auto r = CheckSettings(doc.at("settings")); !r) return Unexpected(r.error());
    out.settings = doc.at("settings");
    return out;
}

std::expected<ConfigDocument, SchemaError> ConfigValidator::ValidateText(const std::string& text) const {
    if (text.find_first_not_of(" \t\n\r") == std::string::npos) {
        return Unexpected({"<document>", "empty input"});
    }
    Json doc;
    try {
        doc = Json::parse(text);
    } catch (const Json::parse_error& e) {
        return Unexpected({"<document>", std::string("Syntax Error: ") + e.what()});
    } catch (const Json::exception& e) {
        // e.g. out_of_range for numbers that do not fit a double
        return Unexpected({"<document>", e.what()});
    }
    return Validate(doc);
}

} // namespace kiosk
