#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/stat.h>

namespace kiosk {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Metadata of the opened file, used to carry mode and times over to copies.
    const struct stat& Stat() const { return st_; }

private:
    std::string path_;
    Fd fd_;
    struct stat st_{};
};

} // namespace kiosk
