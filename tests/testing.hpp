#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/kiosk_updater_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public kiosk::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

// Creates parent directories as needed.
inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

// Empty optional when the file cannot be opened.
inline std::optional<std::string> ReadTextFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

// relative path -> content, for every regular file below `root`.
inline std::vector<std::pair<std::string, std::string>> SnapshotTree(const std::string& root) {
    namespace fs = std::filesystem;
    std::vector<std::pair<std::string, std::string>> out;
    std::error_code ec;
    if (!fs::exists(root, ec)) return out;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (!e.is_regular_file()) continue;
        const std::string rel = e.path().lexically_relative(root).generic_string();
        out.emplace_back(rel, ReadTextFile(e.path().string()).value_or(""));
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Smallest document that passes validation, with one media entry per path.
inline std::string SignageConfig(const std::vector<std::string>& media_paths) {
    nlohmann::ordered_json doc;
    doc["buttons"]["next"] = {{"value", 17}, {"mode", "press"}};
    doc["buttons"]["screen"] = {{"value", 27}, {"mode", "toggle"}};
    doc["media"] = nlohmann::ordered_json::object();
    for (size_t i = 0; i < media_paths.size(); ++i) {
        doc["media"]["m" + std::to_string(i)] = {
            {"mode", "image_still"}, {"path", media_paths[i]}, {"button", "next"}};
    }
    doc["actions"]["hdmi"] = {{"mode", "hdmi_control"}, {"button", "screen"}, {"hold_time", 2}};
    doc["settings"] = {{"default_media_name", "m0"}, {"debounce_time", 0.05}};
    return doc.dump(4);
}

} // namespace testutil
