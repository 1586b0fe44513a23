#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace kiosk {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "open " + out.path_ + ": " + std::strerror(e));
    }
    out.fd_.Reset(fd);

    if (::fstat(fd, &out.st_) != 0) {
        const int e = errno;
        return Result::Fail(e, "stat " + out.path_ + ": " + std::strerror(e));
    }
    if (!S_ISREG(out.st_.st_mode)) {
        return Result::Fail(EINVAL, "not a regular file: " + out.path_);
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const {
    return static_cast<std::uint64_t>(st_.st_size);
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace kiosk
