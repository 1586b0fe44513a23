#include "io/file_system.hpp"

#include "crypto/sha256.hpp"
#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

Result FromErrorCode(const char* op, const std::string& path, const std::error_code& ec) {
    return Result::Fail(ec.value(), std::string(op) + " " + path + ": " + ec.message());
}

std::string ParentOf(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

} // namespace

std::shared_ptr<const IFileSystem> LocalFileSystem::Default() {
    static const std::shared_ptr<const IFileSystem> kDefault = std::make_shared<LocalFileSystem>();
    return kDefault;
}

bool LocalFileSystem::Exists(const std::string& path) const {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    return !ec && st.type() != fs::file_type::not_found;
}

bool LocalFileSystem::IsDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool LocalFileSystem::IsRegularFile(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Result LocalFileSystem::CreateDirectories(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        return FromErrorCode("mkdir", path, ec);
    if (!IsDirectory(path))
        return Result::Fail(ENOTDIR, "mkdir " + path + ": exists and is not a directory");
    SyncDirectory(ParentOf(path));
    return Result::Ok();
}

Result LocalFileSystem::RemoveAll(const std::string& path) const {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        return FromErrorCode("remove", path, ec);
    SyncDirectory(ParentOf(path));
    return Result::Ok();
}

Result LocalFileSystem::CopyFile(const std::string& from, const std::string& to) const {
    FileReader reader;
    auto r = FileReader::Open(from, reader);
    if (!r.is_ok())
        return r;

    const struct stat& st = reader.Stat();
    FileWriter writer;
    r = FileWriter::Open(to, st.st_mode & 07777, writer);
    if (!r.is_ok())
        return r;

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, "read " + from + ": " + std::strerror(e));
        }
        const auto chunk = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        hasher.Update(chunk);
        r = writer.WriteAll(chunk);
        if (!r.is_ok())
            return r;
    }

    // umask may have narrowed the mode given to open(2).
    if (::fchmod(writer.GetFd(), st.st_mode & 07777) != 0) {
        LogWarn("fchmod %s failed: %s", to.c_str(), std::strerror(errno));
    }
    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::futimens(writer.GetFd(), times) != 0) {
        LogWarn("futimens %s failed: %s", to.c_str(), std::strerror(errno));
    }

    r = writer.FsyncNow();
    if (!r.is_ok())
        return r;
    r = writer.Close();
    if (!r.is_ok())
        return r;

    const std::string expected = hasher.FinalHex();
    std::string actual;
    r = Sha256HexFile(to, actual);
    if (!r.is_ok())
        return r;
    if (expected.empty() || expected != actual) {
        return Result::Fail(EIO,
                            "copy verification failed for " + to + ": expected=" + expected +
                                " actual=" + actual);
    }

    SyncDirectory(ParentOf(to));
    return Result::Ok();
}

Result LocalFileSystem::CopyTree(const std::string& from, const std::string& to) const {
    if (!IsDirectory(from))
        return Result::Fail(ENOTDIR, "copy tree: not a directory: " + from);
    if (Exists(to))
        return Result::Fail(EEXIST, "copy tree: destination exists: " + to);

    auto r = CreateDirectories(to);
    if (!r.is_ok())
        return r;

    std::error_code ec;
    fs::recursive_directory_iterator it(from, ec);
    if (ec)
        return FromErrorCode("scan", from, ec);

    const fs::recursive_directory_iterator end{};
    while (it != end) {
        const fs::path rel = it->path().lexically_relative(from);
        const std::string dest = (fs::path(to) / rel).string();
        const auto st = it->symlink_status(ec);
        if (ec)
            return FromErrorCode("stat", it->path().string(), ec);

        if (fs::is_symlink(st)) {
            fs::copy_symlink(it->path(), dest, ec);
            if (ec)
                return FromErrorCode("copy symlink", it->path().string(), ec);
        } else if (fs::is_directory(st)) {
            fs::create_directory(dest, ec);
            if (ec)
                return FromErrorCode("mkdir", dest, ec);
        } else if (fs::is_regular_file(st)) {
            r = CopyFile(it->path().string(), dest);
            if (!r.is_ok())
                return r;
        } else {
            LogWarn("copy tree: skipping special file %s", it->path().c_str());
        }

        it.increment(ec);
        if (ec)
            return FromErrorCode("scan", from, ec);
    }

    SyncDirectory(to);
    return Result::Ok();
}

Result LocalFileSystem::Rename(const std::string& from, const std::string& to) const {
    if (::rename(from.c_str(), to.c_str()) == 0) {
        SyncDirectory(ParentOf(to));
        if (ParentOf(from) != ParentOf(to))
            SyncDirectory(ParentOf(from));
        return Result::Ok();
    }

    const int e = errno;
    if (e != EXDEV)
        return Result::Fail(e, "rename " + from + " -> " + to + ": " + std::strerror(e));

    LogDebug("rename across filesystems, copying %s -> %s", from.c_str(), to.c_str());
    Result r = IsDirectory(from) ? CopyTree(from, to) : CopyFile(from, to);
    if (!r.is_ok())
        return r;
    return RemoveAll(from);
}

Result LocalFileSystem::ReadTextFile(const std::string& path, std::string& out) const {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok())
        return r;

    std::string text;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, "read " + path + ": " + std::strerror(e));
        }
        text.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    out = std::move(text);
    return Result::Ok();
}

Result LocalFileSystem::WriteTextFile(const std::string& path, std::string_view content) const {
    FileWriter writer;
    auto r = FileWriter::Open(path, 0644, writer);
    if (!r.is_ok())
        return r;
    r = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    if (!r.is_ok())
        return r;
    r = writer.FsyncNow();
    if (!r.is_ok())
        return r;
    r = writer.Close();
    if (!r.is_ok())
        return r;
    SyncDirectory(ParentOf(path));
    return Result::Ok();
}

void LocalFileSystem::SyncDirectory(const std::string& dir) {
    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.Valid()) {
        LogDebug("open dir %s for fsync failed: %s", dir.c_str(), std::strerror(errno));
        return;
    }
    if (::fsync(fd.Get()) != 0) {
        LogWarn("fsync dir %s failed: %s", dir.c_str(), std::strerror(errno));
    }
}

} // namespace kiosk
