// file_writer.cpp - Writer for staged, backed-up and committed files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace kiosk {

Result FileWriter::Open(std::string path, mode_t mode, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "create " + out.path_ + ": " + std::strerror(e));
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(e, "write " + path_ + ": " + std::strerror(e));
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync " + path_ + ": " + std::strerror(e));
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (fd_.CloseChecked() != 0) {
        const int e = errno;
        return Result::Fail(e, "close " + path_ + ": " + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace kiosk
