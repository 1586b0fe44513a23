#include "kiosk/update_coordinator.hpp"

#include "kiosk/asset_resolver.hpp"
#include "kiosk/path_rewriter.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace kiosk {

namespace {

std::string ParentOf(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

} // namespace

const char* ToString(UpdateState state) {
    switch (state) {
        case UpdateState::Idle:            return "Idle";
        case UpdateState::Locating:        return "Locating";
        case UpdateState::LocatingPackage: return "LocatingPackage";
        case UpdateState::PreValidating:   return "PreValidating";
        case UpdateState::Staging:         return "Staging";
        case UpdateState::Rewriting:       return "Rewriting";
        case UpdateState::PostValidating:  return "PostValidating";
        case UpdateState::BackingUp:       return "BackingUp";
        case UpdateState::Committing:      return "Committing";
        case UpdateState::CleaningUp:      return "CleaningUp";
        case UpdateState::RollingBack:     return "RollingBack";
    }
    return "Unknown";
}

UpdateLayout UpdateLayout::FromConfig(const UpdaterConfig& cfg) {
    UpdateLayout layout;
    layout.app_root = cfg.app_root;
    layout.engine_dir = cfg.engine_dir;
    layout.asset_subdir = cfg.asset_subdir;
    layout.config_filename = cfg.config_filename;
    layout.package_dir_name = cfg.package_dir_name;
    layout.staging_dir_name = cfg.staging_dir_name;
    layout.backup_dir_name = cfg.backup_dir_name;
    return layout;
}

std::string UpdateLayout::LiveConfigPath() const {
    return JoinPath(JoinPath(app_root, engine_dir), config_filename);
}

std::string UpdateLayout::LiveAssetDir() const {
    return JoinPath(app_root, LiveAssetPrefix());
}

std::string UpdateLayout::LiveAssetPrefix() const {
    return JoinPath(engine_dir, asset_subdir);
}

std::string UpdateLayout::AsideAssetDir() const {
    return LiveAssetDir() + ".old";
}

std::string UpdateLayout::StagingDir() const {
    return JoinPath(app_root, staging_dir_name);
}

std::string UpdateLayout::StagingConfigPath() const {
    return JoinPath(StagingDir(), config_filename + ".tmp");
}

std::string UpdateLayout::StagingAssetDir() const {
    return JoinPath(StagingDir(), LiveAssetPrefix());
}

std::string UpdateLayout::BackupDir() const {
    return JoinPath(app_root, backup_dir_name);
}

std::string UpdateLayout::BackupConfigPath() const {
    return JoinPath(BackupDir(), config_filename + ".bak");
}

std::string UpdateLayout::BackupAssetDir() const {
    return JoinPath(BackupDir(), LiveAssetPrefix()) + ".bak";
}

struct UpdateCoordinator::Transaction {
    std::string package_dir;
    ConfigDocument package_doc;
    ConfigDocument staged_doc;
    AssetMap assets;
    BackupSnapshot backup;
    // Set right before the first rename that touches live paths.
    bool live_touched = false;
};

UpdateCoordinator::UpdateCoordinator(UpdateLayout layout,
                                     std::shared_ptr<IMediaSource> media,
                                     std::shared_ptr<const IFileSystem> fs)
    : layout_(std::move(layout)),
      media_(std::move(media)),
      fs_(fs ? std::move(fs) : LocalFileSystem::Default()),
      packages_(layout_.package_dir_name, fs_) {}

void UpdateCoordinator::ReportStatus(std::string_view message) {
    LogInfo("%.*s", static_cast<int>(message.size()), message.data());
    if (status_sink_) status_sink_->DisplayStatus(message);
}

void UpdateCoordinator::SetState(UpdateState next) {
    const UpdateState prev = state_.exchange(next);
    LogDebug("update state %s -> %s", ToString(prev), ToString(next));
}

Result UpdateCoordinator::Run() {
    SetState(UpdateState::Locating);
    ReportStatus("Checking for USB drive...");

    const auto mount = media_ ? media_->Locate() : std::nullopt;
    if (!mount) {
        ReportStatus("No USB drive found or failed to mount.");
        SetState(UpdateState::Idle);
        return Result::Fail(ErrorCode::MediaNotFound, 0, "no removable media available");
    }
    ReportStatus("USB drive found at " + *mount);

    SetState(UpdateState::LocatingPackage);
    Result outcome;
    if (const auto package = packages_.Find(*mount)) {
        ReportStatus("Update package found.");
        outcome = ApplyPackage(*package);
    } else {
        ReportStatus("No '" + layout_.package_dir_name + "' package found on USB drive.");
        outcome = Result::Fail(ErrorCode::PackageNotFound, 0,
                               "no package '" + layout_.package_dir_name + "' on " + *mount);
    }

    if (media_->Unmount(*mount)) {
        ReportStatus("USB drive unmounted. You can safely remove the drive.");
    } else {
        ReportStatus("Failed to unmount USB drive from " + *mount + ". Please check manually.");
    }

    SetState(UpdateState::Idle);
    return outcome;
}

Result UpdateCoordinator::ApplyPackage(const std::string& package_dir) {
    Transaction tx;
    tx.package_dir = package_dir;

    SetState(UpdateState::PreValidating);
    if (auto r = PreValidate(tx); !r.is_ok()) {
        ReportStatus("Update package is invalid: " + r.msg);
        SetState(UpdateState::Idle);
        return r;
    }

    SetState(UpdateState::Staging);
    if (auto r = Stage(tx); !r.is_ok()) return RollBack(tx, r);

    SetState(UpdateState::Rewriting);
    if (auto r = Rewrite(tx); !r.is_ok()) return RollBack(tx, r);

    SetState(UpdateState::PostValidating);
    if (auto r = PostValidate(tx); !r.is_ok()) return RollBack(tx, r);

    SetState(UpdateState::BackingUp);
    if (auto r = Backup(tx); !r.is_ok()) return RollBack(tx, r);

    SetState(UpdateState::Committing);
    if (auto r = Commit(tx); !r.is_ok()) return RollBack(tx, r);

    SetState(UpdateState::CleaningUp);
    ReportStatus("Cleaning up...");
    Cleanup();

    ReportStatus("Update successful! Please restart the application.");
    SetState(UpdateState::Idle);
    return Result::Ok();
}

Result UpdateCoordinator::PreValidate(Transaction& tx) {
    ReportStatus("Validating new configuration...");

    const std::string config_path = JoinPath(tx.package_dir, PackageLocator::kConfigFileName);
    std::string text;
    if (auto r = fs_->ReadTextFile(config_path, text); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "read package config");
    }

    auto doc = validator_.ValidateText(text);
    if (!doc) {
        return Result::Fail(ErrorCode::SchemaInvalid, 0, doc.error().ToString());
    }
    tx.package_doc = std::move(*doc);
    tx.assets = AssetResolver::Gather(tx.package_doc);
    return Result::Ok();
}

Result UpdateCoordinator::Stage(Transaction& tx) {
    ReportStatus("Staging assets...");

    const std::string staging_assets = layout_.StagingAssetDir();
    if (auto r = fs_->RemoveAll(layout_.StagingDir()); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "clear staging area");
    }
    if (auto r = fs_->CreateDirectories(staging_assets); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "create staging area");
    }

    if (tx.assets.empty()) {
        ReportStatus("No assets referenced with 'assets/' prefix; config-only update.");
        return Result::Ok();
    }

    const std::string package_assets = JoinPath(tx.package_dir, PackageLocator::kAssetsDirName);
    for (const auto& [rel, original] : tx.assets) {
        const std::string src = JoinPath(package_assets, rel);
        if (!fs_->IsRegularFile(src)) {
            return Result::Fail(ErrorCode::AssetMissing, 0,
                                "asset '" + original + "' referenced by config not found in package");
        }
        const std::string dst = JoinPath(staging_assets, rel);
        if (auto r = fs_->CreateDirectories(ParentOf(dst)); !r.is_ok()) {
            return Result::Wrap(ErrorCode::IoFailure, r, "stage " + rel);
        }
        if (auto r = fs_->CopyFile(src, dst); !r.is_ok()) {
            return Result::Wrap(ErrorCode::IoFailure, r, "stage " + rel);
        }
        LogDebug("staged %s", rel.c_str());
    }
    LogInfo("staged %zu asset(s) into %s", tx.assets.size(), staging_assets.c_str());
    return Result::Ok();
}

Result UpdateCoordinator::Rewrite(Transaction& tx) {
    ReportStatus("Rewriting asset paths...");
    tx.staged_doc = PathRewriter::Rewrite(tx.package_doc, layout_.LiveAssetPrefix());
    if (auto r = fs_->WriteTextFile(layout_.StagingConfigPath(), tx.staged_doc.Dump()); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "write staged config");
    }
    return Result::Ok();
}

// Validates what actually landed on disk, not the in-memory copy.
Result UpdateCoordinator::PostValidate(Transaction& tx) {
    ReportStatus("Validating staged configuration...");

    std::string text;
    if (auto r = fs_->ReadTextFile(layout_.StagingConfigPath(), text); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "read staged config");
    }
    auto doc = validator_.ValidateText(text);
    if (!doc) {
        return Result::Fail(ErrorCode::SchemaInvalid, 0, "staged config: " + doc.error().ToString());
    }
    tx.staged_doc = std::move(*doc);
    return VerifyAssetsPresent(tx.staged_doc, layout_.StagingAssetDir());
}

Result UpdateCoordinator::VerifyAssetsPresent(const ConfigDocument& doc,
                                              const std::string& asset_dir) const {
    const std::string prefix = layout_.LiveAssetPrefix() + "/";
    for (const auto& media : doc.media) {
        const std::string path = NormalizeSeparators(media.path);
        if (!StartsWith(path, prefix)) continue;
        const std::string rel = path.substr(prefix.size());
        if (!fs_->IsRegularFile(JoinPath(asset_dir, rel))) {
            return Result::Fail(ErrorCode::AssetMissing, 0,
                                "media '" + media.name + "' path '" + media.path + "' has no asset");
        }
    }
    return Result::Ok();
}

Result UpdateCoordinator::Backup(Transaction& tx) {
    ReportStatus("Backing up current configuration...");

    const std::string backup_dir = layout_.BackupDir();
    if (auto r = fs_->RemoveAll(backup_dir); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "remove previous backup");
    }
    if (auto r = fs_->CreateDirectories(backup_dir); !r.is_ok()) {
        return Result::Wrap(ErrorCode::IoFailure, r, "create backup directory");
    }

    tx.backup.had_config = fs_->IsRegularFile(layout_.LiveConfigPath());
    if (tx.backup.had_config) {
        if (auto r = fs_->CopyFile(layout_.LiveConfigPath(), layout_.BackupConfigPath()); !r.is_ok()) {
            return Result::Wrap(ErrorCode::IoFailure, r, "back up config");
        }
    } else {
        LogInfo("no live config at %s, nothing to back up", layout_.LiveConfigPath().c_str());
    }

    tx.backup.had_assets = fs_->IsDirectory(layout_.LiveAssetDir());
    if (tx.backup.had_assets) {
        const std::string dst = layout_.BackupAssetDir();
        if (auto r = fs_->CreateDirectories(ParentOf(dst)); !r.is_ok()) {
            return Result::Wrap(ErrorCode::IoFailure, r, "back up assets");
        }
        if (auto r = fs_->CopyTree(layout_.LiveAssetDir(), dst); !r.is_ok()) {
            return Result::Wrap(ErrorCode::IoFailure, r, "back up assets");
        }
    }

    tx.backup.complete = true;
    return Result::Ok();
}

Result UpdateCoordinator::Commit(Transaction& tx) {
    ReportStatus("Applying update...");

    const std::string live_assets = layout_.LiveAssetDir();
    const std::string aside = layout_.AsideAssetDir();

    if (auto r = fs_->RemoveAll(aside); !r.is_ok()) {
        return Result::Wrap(ErrorCode::CommitFailure, r, "clear " + aside);
    }

    tx.live_touched = true;
    if (fs_->Exists(live_assets)) {
        if (auto r = fs_->Rename(live_assets, aside); !r.is_ok()) {
            return Result::Wrap(ErrorCode::CommitFailure, r, "move live assets aside");
        }
    } else if (auto r = fs_->CreateDirectories(ParentOf(live_assets)); !r.is_ok()) {
        return Result::Wrap(ErrorCode::CommitFailure, r, "create asset parent");
    }

    if (auto r = fs_->Rename(layout_.StagingAssetDir(), live_assets); !r.is_ok()) {
        return Result::Wrap(ErrorCode::CommitFailure, r, "install staged assets");
    }
    if (auto r = fs_->Rename(layout_.StagingConfigPath(), layout_.LiveConfigPath()); !r.is_ok()) {
        return Result::Wrap(ErrorCode::CommitFailure, r, "install staged config");
    }

    if (auto r = VerifyAssetsPresent(tx.staged_doc, live_assets); !r.is_ok()) {
        return Result::Wrap(ErrorCode::CommitFailure, r, "post-commit check");
    }
    return Result::Ok();
}

void UpdateCoordinator::Cleanup() {
    for (const auto& dir : {layout_.StagingDir(), layout_.AsideAssetDir()}) {
        if (auto r = fs_->RemoveAll(dir); !r.is_ok()) {
            LogWarn("cleanup %s: %s", dir.c_str(), r.msg.c_str());
        }
    }
}

Result UpdateCoordinator::RollBack(Transaction& tx, const Result& failure) {
    SetState(UpdateState::RollingBack);
    LogError("update failed (%s): %s", ErrorCodeName(failure.code), failure.msg.c_str());
    ReportStatus("Update failed: " + failure.msg + ". Rolling back...");

    if (auto r = fs_->RemoveAll(layout_.StagingDir()); !r.is_ok()) {
        LogWarn("discard staging: %s", r.msg.c_str());
    }

    if (tx.live_touched) {
        if (auto r = RestoreFromBackup(tx); !r.is_ok()) {
            LogError("CRITICAL: rollback failed: %s", r.msg.c_str());
            ReportStatus("CRITICAL ERROR during rollback: " + r.msg +
                         ". Manual intervention required.");
            SetState(UpdateState::Idle);
            return Result::Fail(ErrorCode::RollbackFailure, r.err,
                                failure.msg + "; rollback: " + r.msg);
        }
        if (auto r = fs_->RemoveAll(layout_.AsideAssetDir()); !r.is_ok()) {
            LogWarn("discard %s: %s", layout_.AsideAssetDir().c_str(), r.msg.c_str());
        }
        ReportStatus("Rollback completed. Previous configuration restored.");
    } else {
        ReportStatus("Update aborted. Current configuration is unchanged.");
    }

    SetState(UpdateState::Idle);
    return failure;
}

Result UpdateCoordinator::RestoreFromBackup(const Transaction& tx) {
    if (!tx.backup.complete) {
        return Result::Fail(ErrorCode::RollbackFailure, 0, "no complete backup to restore from");
    }

    const std::string live_assets = layout_.LiveAssetDir();
    if (auto r = fs_->RemoveAll(live_assets); !r.is_ok()) {
        return Result::Wrap(ErrorCode::RollbackFailure, r, "remove live assets");
    }
    if (tx.backup.had_assets) {
        if (auto r = fs_->CopyTree(layout_.BackupAssetDir(), live_assets); !r.is_ok()) {
            return Result::Wrap(ErrorCode::RollbackFailure, r, "restore assets");
        }
    }

    const std::string live_config = layout_.LiveConfigPath();
    if (tx.backup.had_config) {
        const std::string tmp = live_config + ".restore";
        if (auto r = fs_->CopyFile(layout_.BackupConfigPath(), tmp); !r.is_ok()) {
            return Result::Wrap(ErrorCode::RollbackFailure, r, "restore config");
        }
        if (auto r = fs_->Rename(tmp, live_config); !r.is_ok()) {
            return Result::Wrap(ErrorCode::RollbackFailure, r, "restore config");
        }
    } else if (auto r = fs_->RemoveAll(live_config); !r.is_ok()) {
        return Result::Wrap(ErrorCode::RollbackFailure, r, "remove new config");
    }
    return Result::Ok();
}

} // namespace kiosk
