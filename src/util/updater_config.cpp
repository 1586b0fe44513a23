#include "util/updater_config.hpp"

#include "util/config_json_utils.hpp"

#include <iterator>
#include <nlohmann/json.hpp>
#include <string>

namespace kiosk {

namespace {

using config::detail::Field;

Result ReadString(const nlohmann::json& j, const char* key, std::string& out) {
    if (config::detail::GetString(j, key, out) == Field::WrongType) {
        return Result::Fail(-1, std::string("updater config: '") + key + "' must be a string");
    }
    return Result::Ok();
}

// Directory names are joined under app_root, so they must stay single segments.
Result ReadDirName(const nlohmann::json& j, const char* key, std::string& out) {
    auto r = ReadString(j, key, out);
    if (!r.is_ok())
        return r;
    if (out.empty() || out == "." || out == ".." || out.find('/') != std::string::npos) {
        return Result::Fail(-1,
                            std::string("updater config: '") + key +
                                "' must be a single path segment (got: '" + out + "')");
    }
    return Result::Ok();
}

} // namespace

Result UpdaterConfig::LoadFromFile(const std::string& path, UpdaterConfig& out) {
    out = UpdaterConfig{};

    nlohmann::json j;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(-1, "updater config: " + err);
    }

    const char* const kStringKeys[] = {"app_root", "mount_base_dir", "sysfs_block_dir",
                                       "mounts_file", "dev_dir", "status_file"};
    std::string* const kStringTargets[] = {&out.app_root, &out.mount_base_dir,
                                           &out.sysfs_block_dir, &out.mounts_file,
                                           &out.dev_dir, &out.status_file};
    for (size_t i = 0; i < std::size(kStringKeys); ++i) {
        auto r = ReadString(j, kStringKeys[i], *kStringTargets[i]);
        if (!r.is_ok())
            return r;
    }

    const char* const kDirKeys[] = {"engine_dir", "asset_subdir", "config_filename",
                                    "package_dir_name", "staging_dir_name", "backup_dir_name"};
    std::string* const kDirTargets[] = {&out.engine_dir, &out.asset_subdir,
                                        &out.config_filename, &out.package_dir_name,
                                        &out.staging_dir_name, &out.backup_dir_name};
    for (size_t i = 0; i < std::size(kDirKeys); ++i) {
        auto r = ReadDirName(j, kDirKeys[i], *kDirTargets[i]);
        if (!r.is_ok())
            return r;
    }

    if (config::detail::GetStringList(j, "fs_types", out.fs_types) == Field::WrongType) {
        return Result::Fail(-1, "updater config: 'fs_types' must be an array of strings");
    }
    if (out.fs_types.empty()) {
        return Result::Fail(-1, "updater config: 'fs_types' must not be empty");
    }

    if (config::detail::GetBool(j, "mount_read_only", out.mount_read_only) == Field::WrongType) {
        return Result::Fail(-1, "updater config: 'mount_read_only' must be a boolean");
    }

    std::string level;
    if (config::detail::GetString(j, "log_level", level) == Field::WrongType) {
        return Result::Fail(-1, "updater config: 'log_level' must be a string");
    }
    if (!level.empty()) {
        const auto parsed = ParseLogLevel(level);
        if (!parsed) {
            return Result::Fail(-1, "updater config: unknown log_level '" + level + "'");
        }
        out.log_level = *parsed;
    }

    if (out.app_root.empty()) {
        return Result::Fail(-1, "updater config missing app_root");
    }
    if (out.staging_dir_name == out.backup_dir_name) {
        return Result::Fail(-1, "updater config: staging_dir_name and backup_dir_name must differ");
    }

    return Result::Ok();
}

} // namespace kiosk
