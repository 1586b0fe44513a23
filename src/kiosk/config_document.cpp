#include "kiosk/config_document.hpp"

namespace kiosk {

namespace {

Json ButtonRefToJson(const ButtonRef& ref) {
    if (!ref.as_list && ref.names.size() == 1) {
        return ref.names.front();
    }
    Json arr = Json::array();
    for (const auto& n : ref.names) arr.push_back(n);
    return arr;
}

// Known keys first, then whatever else the entry carried.
void AppendExtras(Json& out, const Json& extras) {
    for (const auto& [key, val] : extras.items()) {
        if (!out.contains(key)) out[key] = val;
    }
}

} // namespace

const char* ToString(ButtonMode mode) {
    switch (mode) {
        case ButtonMode::Press:  return "press";
        case ButtonMode::Toggle: return "toggle";
    }
    return "press";
}

const char* ToString(MediaMode mode) {
    switch (mode) {
        case MediaMode::ImageStill: return "image_still";
        case MediaMode::ImageFlash: return "image_flash";
        case MediaMode::ScrollText: return "scroll_text";
        case MediaMode::Slide:      return "slide";
    }
    return "image_still";
}

const char* ToString(ActionMode mode) {
    switch (mode) {
        case ActionMode::HdmiControl: return "hdmi_control";
        case ActionMode::LoadConfig:  return "load_config";
    }
    return "hdmi_control";
}

std::optional<ButtonMode> ParseButtonMode(std::string_view s) {
    if (s == "press") return ButtonMode::Press;
    if (s == "toggle") return ButtonMode::Toggle;
    return std::nullopt;
}

std::optional<MediaMode> ParseMediaMode(std::string_view s) {
    if (s == "image_still") return MediaMode::ImageStill;
    if (s == "image_flash") return MediaMode::ImageFlash;
    if (s == "scroll_text") return MediaMode::ScrollText;
    if (s == "slide") return MediaMode::Slide;
    return std::nullopt;
}

std::optional<ActionMode> ParseActionMode(std::string_view s) {
    if (s == "hdmi_control") return ActionMode::HdmiControl;
    if (s == "load_config") return ActionMode::LoadConfig;
    return std::nullopt;
}

const ButtonEntry* ConfigDocument::FindButton(std::string_view name) const {
    for (const auto& b : buttons) {
        if (b.name == name) return &b;
    }
    return nullptr;
}

Json ConfigDocument::ToJson() const {
    Json root = Json::object();

    Json btns = Json::object();
    for (const auto& b : buttons) {
        Json e = Json::object();
        e["value"] = b.value;
        e["mode"] = ToString(b.mode);
        AppendExtras(e, b.extras);
        btns[b.name] = std::move(e);
    }

    Json med = Json::object();
    for (const auto& m : media) {
        Json e = Json::object();
        e["mode"] = ToString(m.mode);
        e["path"] = m.path;
        if (m.button) e["button"] = ButtonRefToJson(*m.button);
        if (m.hold_time) e["hold_time"] = *m.hold_time;
        AppendExtras(e, m.extras);
        med[m.name] = std::move(e);
    }

    Json acts = Json::object();
    for (const auto& a : actions) {
        Json e = Json::object();
        e["mode"] = ToString(a.mode);
        if (a.button) e["button"] = ButtonRefToJson(*a.button);
        if (a.hold_time) e["hold_time"] = *a.hold_time;
        AppendExtras(e, a.extras);
        acts[a.name] = std::move(e);
    }

    root["buttons"] = std::move(btns);
    root["media"] = std::move(med);
    root["actions"] = std::move(acts);
    root["settings"] = settings;
    return root;
}

std::string ConfigDocument::Dump() const {
    return ToJson().dump(4) + "\n";
}

} // namespace kiosk
