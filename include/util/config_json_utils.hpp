#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace kiosk::config::detail {

enum class Field {
    Absent,
    Ok,
    WrongType,
};

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

Field GetString(const nlohmann::json& j, const char* key, std::string& out);
Field GetBool(const nlohmann::json& j, const char* key, bool& out);
Field GetStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out);

} // namespace kiosk::config::detail
