#pragma once

#include "io/file_system.hpp"
#include "kiosk/config_document.hpp"
#include "kiosk/config_validator.hpp"
#include "kiosk/media_locator.hpp"
#include "kiosk/package_locator.hpp"
#include "kiosk/status_sink.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace kiosk {

enum class UpdateState : int {
    Idle,
    Locating,
    LocatingPackage,
    PreValidating,
    Staging,
    Rewriting,
    PostValidating,
    BackingUp,
    Committing,
    CleaningUp,
    RollingBack,
};

const char* ToString(UpdateState state);

// Where the live application, staging area and backup live on disk.
struct UpdateLayout {
    std::string app_root;
    std::string engine_dir = "atc_engine";
    std::string asset_subdir = "image_sets";
    std::string config_filename = "config.json";
    std::string package_dir_name = "atc_update_package";
    std::string staging_dir_name = ".update_staging";
    std::string backup_dir_name = ".update_backup";

    static UpdateLayout FromConfig(const UpdaterConfig& cfg);

    std::string LiveConfigPath() const;
    std::string LiveAssetDir() const;
    // Prefix written into committed configs, relative to app_root.
    std::string LiveAssetPrefix() const;
    // Old asset tree parked here during the swap.
    std::string AsideAssetDir() const;

    std::string StagingDir() const;
    std::string StagingConfigPath() const;
    std::string StagingAssetDir() const;

    std::string BackupDir() const;
    std::string BackupConfigPath() const;
    std::string BackupAssetDir() const;
};

// Verbatim copy of the live state taken right before commit. The most recent
// snapshot is kept after a successful update and replaced by the next one.
struct BackupSnapshot {
    bool had_config = false;
    bool had_assets = false;
    bool complete = false;
};

class UpdateCoordinator {
  public:
    UpdateCoordinator(UpdateLayout layout,
                      std::shared_ptr<IMediaSource> media,
                      std::shared_ptr<const IFileSystem> fs = LocalFileSystem::Default());

    UpdateCoordinator(const UpdateCoordinator&) = delete;
    UpdateCoordinator& operator=(const UpdateCoordinator&) = delete;

    void SetStatusSink(IStatusSink* sink) { status_sink_ = sink; }

    // One complete update attempt: locate media and package, apply it
    // all-or-nothing, unmount. Blocks until a terminal state is reached.
    Result Run();

    // Applies an already located package directory. Run() calls this.
    Result ApplyPackage(const std::string& package_dir);

    UpdateState State() const { return state_.load(); }
    const UpdateLayout& Layout() const { return layout_; }

    // Logs and forwards to the status sink.
    void ReportStatus(std::string_view message);

  private:
    struct Transaction;

    void SetState(UpdateState next);

    Result PreValidate(Transaction& tx);
    Result Stage(Transaction& tx);
    Result Rewrite(Transaction& tx);
    Result PostValidate(Transaction& tx);
    Result Backup(Transaction& tx);
    Result Commit(Transaction& tx);
    void Cleanup();

    Result RollBack(Transaction& tx, const Result& failure);
    Result RestoreFromBackup(const Transaction& tx);
    Result VerifyAssetsPresent(const ConfigDocument& doc, const std::string& asset_dir) const;

    UpdateLayout layout_;
    std::shared_ptr<IMediaSource> media_;
    std::shared_ptr<const IFileSystem> fs_;
    PackageLocator packages_;
    ConfigValidator validator_;
    IStatusSink* status_sink_ = nullptr;
    std::atomic<UpdateState> state_{UpdateState::Idle};
};

} // namespace kiosk
