#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk {

// Document order matters (first reference wins during asset gathering).
using Json = nlohmann::ordered_json;

enum class ButtonMode { Press, Toggle };
enum class MediaMode { ImageStill, ImageFlash, ScrollText, Slide };
enum class ActionMode { HdmiControl, LoadConfig };

const char* ToString(ButtonMode mode);
const char* ToString(MediaMode mode);
const char* ToString(ActionMode mode);

std::optional<ButtonMode> ParseButtonMode(std::string_view s);
std::optional<MediaMode> ParseMediaMode(std::string_view s);
std::optional<ActionMode> ParseActionMode(std::string_view s);

// "button": "a" or "button": ["a", "b"] (a combination).
struct ButtonRef {
    std::vector<std::string> names;
    bool as_list = false;
};

struct ButtonEntry {
    std::string name;
    std::int64_t value = 0;
    ButtonMode mode = ButtonMode::Press;
    Json extras = Json::object();
};

struct MediaEntry {
    std::string name;
    MediaMode mode = MediaMode::ImageStill;
    std::string path;
    std::optional<ButtonRef> button;
    // Non-negative number, kept exactly as written.
    std::optional<Json> hold_time;
    Json extras = Json::object();
};

struct ActionEntry {
    std::string name;
    ActionMode mode = ActionMode::HdmiControl;
    std::optional<ButtonRef> button;
    std::optional<Json> hold_time;
    Json extras = Json::object();
};

struct ConfigDocument {
    std::vector<ButtonEntry> buttons;
    std::vector<MediaEntry> media;
    std::vector<ActionEntry> actions;
    Json settings = Json::object();

    const ButtonEntry* FindButton(std::string_view name) const;

    Json ToJson() const;
    // Pretty-printed, 4-space indent, trailing newline.
    std::string Dump() const;
};

} // namespace kiosk
