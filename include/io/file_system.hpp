#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace kiosk {

// File operations the update engine performs on the live tree, staging and backup.
// Every mutating call is durable on success (data and parent directory fsynced).
class IFileSystem {
  public:
    virtual ~IFileSystem() = default;

    virtual bool Exists(const std::string& path) const = 0;
    virtual bool IsDirectory(const std::string& path) const = 0;
    virtual bool IsRegularFile(const std::string& path) const = 0;

    virtual Result CreateDirectories(const std::string& path) const = 0;
    // Succeeds when the path is already absent.
    virtual Result RemoveAll(const std::string& path) const = 0;

    // Copies content, mode and timestamps, then checks the SHA-256 of both sides.
    virtual Result CopyFile(const std::string& from, const std::string& to) const = 0;
    // `to` must not exist. Symlinks are copied as symlinks.
    virtual Result CopyTree(const std::string& from, const std::string& to) const = 0;
    // rename(2); across filesystems falls back to copy + remove.
    virtual Result Rename(const std::string& from, const std::string& to) const = 0;

    virtual Result ReadTextFile(const std::string& path, std::string& out) const = 0;
    virtual Result WriteTextFile(const std::string& path, std::string_view content) const = 0;
};

class LocalFileSystem : public IFileSystem {
  public:
    static std::shared_ptr<const IFileSystem> Default();

    bool Exists(const std::string& path) const override;
    bool IsDirectory(const std::string& path) const override;
    bool IsRegularFile(const std::string& path) const override;

    Result CreateDirectories(const std::string& path) const override;
    Result RemoveAll(const std::string& path) const override;

    Result CopyFile(const std::string& from, const std::string& to) const override;
    Result CopyTree(const std::string& from, const std::string& to) const override;
    Result Rename(const std::string& from, const std::string& to) const override;

    Result ReadTextFile(const std::string& path, std::string& out) const override;
    Result WriteTextFile(const std::string& path, std::string_view content) const override;

  protected:
    // fsync(2) on a directory so that entry changes survive power loss.
    static void SyncDirectory(const std::string& dir);
};

} // namespace kiosk
