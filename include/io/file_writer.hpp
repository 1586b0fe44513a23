#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace kiosk {

// Creates or truncates a regular file.
class FileWriter final : public IWriter {
public:
    static Result Open(std::string path, mode_t mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    int GetFd() const { return fd_.Get(); }
    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
};

} // namespace kiosk
