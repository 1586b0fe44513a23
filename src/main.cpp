#include "kiosk/block_devices.hpp"
#include "kiosk/media_locator.hpp"
#include "kiosk/status_sink.hpp"
#include "kiosk/update_coordinator.hpp"
#include "kiosk/update_service.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/updater_config.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/kiosk-updater/updater.conf";
constexpr const char *kConfigEnvVar = "KIOSK_UPDATER_CONFIG";

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitRollbackFailed = 3;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [--once] [-v]\n"
        "\n"
        "Runs as a daemon; SIGUSR1 starts an update from the inserted USB drive.\n"
        "\n"
        "Options:\n"
        "  -c, --config     Updater config (default $%s or %s)\n"
        "      --once       Run one update now and exit (0 ok, 1 failed, 3 rollback failed)\n"
        "  -v, --verbose    Debug logging\n"
        "  -h, --help       Show this help\n",
        argv, kConfigEnvVar, kDefaultConfigPath);
}

int ExitCodeFor(const kiosk::Result &r) {
    if (r.is_ok()) return kExitOk;
    if (r.code == kiosk::ErrorCode::RollbackFailure) return kExitRollbackFailed;
    return kExitFailed;
}

} // namespace

int main(int argc, char **argv) {
    kiosk::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    if (const char *env = std::getenv(kConfigEnvVar); env && *env) {
        config_path = env;
    }
    bool once = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"once", no_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                break;

            case 'o':
                once = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    kiosk::UpdaterConfig cfg;
    if (auto r = kiosk::UpdaterConfig::LoadFromFile(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitFailed;
    }
    kiosk::Logger::Instance().SetLevel(verbose ? kiosk::LogLevel::Debug : cfg.log_level);

    auto devices = std::make_shared<kiosk::SysfsDeviceTable>(cfg.sysfs_block_dir, cfg.mounts_file,
                                                             cfg.dev_dir);
    kiosk::MediaLocator::Options media_opt;
    media_opt.mount_base_dir = cfg.mount_base_dir;
    media_opt.fs_types = cfg.fs_types;
    media_opt.read_only = cfg.mount_read_only;
    auto media = std::make_shared<kiosk::MediaLocator>(media_opt, devices);

    auto coordinator = std::make_shared<kiosk::UpdateCoordinator>(
        kiosk::UpdateLayout::FromConfig(cfg), media);

    std::unique_ptr<kiosk::IStatusSink> sink;
    if (!cfg.status_file.empty()) {
        sink = std::make_unique<kiosk::FileStatusSink>(cfg.status_file);
        coordinator->SetStatusSink(sink.get());
    }

    if (once) {
        const auto r = coordinator->Run();
        return ExitCodeFor(r);
    }

    LogInfo("kiosk-updater ready (config=%s), waiting for SIGUSR1",
            coordinator->Layout().LiveConfigPath().c_str());
    int exit_code = kExitOk;
    {
        kiosk::UpdateService service(coordinator);
        while (!kiosk::g_stop_requested.load(std::memory_order_relaxed)) {
            if (kiosk::g_update_requested.exchange(false)) {
                service.RequestUpdate();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LogInfo("stop requested");
        service.Stop();
        service.Wait();
        if (auto last = service.LastOutcome(); last && last->code == kiosk::ErrorCode::RollbackFailure) {
            exit_code = kExitRollbackFailed;
        }
    }
    return exit_code;
}
