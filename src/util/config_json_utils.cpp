#include "util/config_json_utils.hpp"

#include <fstream>

namespace kiosk::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

Field GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Field::Absent;
    if (!it->is_string())
        return Field::WrongType;
    out = it->get<std::string>();
    return Field::Ok;
}

Field GetBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Field::Absent;
    if (!it->is_boolean())
        return Field::WrongType;
    out = it->get<bool>();
    return Field::Ok;
}

Field GetStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Field::Absent;
    if (!it->is_array())
        return Field::WrongType;

    std::vector<std::string> values;
    values.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string())
            return Field::WrongType;
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return Field::Ok;
}

} // namespace kiosk::config::detail
