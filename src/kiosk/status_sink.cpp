#include "kiosk/status_sink.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <nlohmann/json.hpp>

namespace kiosk {

FileStatusSink::FileStatusSink(std::string path) : path_(std::move(path)) {}

void FileStatusSink::DisplayStatus(std::string_view message) {
    std::lock_guard<std::mutex> lk(mu_);

    nlohmann::json j;
    j["seq"] = ++seq_;
    j["time"] = static_cast<std::int64_t>(std::time(nullptr));
    j["message"] = std::string(message);

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogWarn("status file %s: cannot open for writing", tmp_path.c_str());
        return;
    }
    // Paths from removable media are not guaranteed to be UTF-8.
    os << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    os.close();
    if (!os) {
        LogWarn("status file %s: write failed", tmp_path.c_str());
        return;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogWarn("status file %s: rename failed: %s", path_.c_str(), std::strerror(errno));
    }
}

} // namespace kiosk
