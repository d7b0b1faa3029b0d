#include "ota/connectivity_sources.hpp"
#include "ota/console_observer.hpp"
#include "ota/download_state_machine.hpp"
#include "ota/json_metadata_provider.hpp"
#include "ota/local_transfer_provider.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/settings_store.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-m <metadata.json>] [-d <dir>] [--download] [--delete] [--verbose]\n"
        "\n"
        "Options:\n"
        "  -c, --config           Config file (default %s)\n"
        "  -m, --metadata         Release metadata JSON (overrides MetadataPath)\n"
        "  -d, --download-dir     Store a new download directory in the settings\n"
        "      --download         Download and verify the update if one is available\n"
        "      --delete           Delete the downloaded file for the current update\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv,
        otafetch::config::kDefaultConfigPath);
}

otafetch::DownloadStateMachine::Options MachineOptions(const otafetch::config::FetcherConfigFromFile &cfg) {
    using std::chrono::milliseconds;

    otafetch::DownloadStateMachine::Options opt;
    if (cfg.worker_threads) opt.worker_threads = static_cast<std::size_t>(*cfg.worker_threads);
    if (cfg.progress_poll_interval_ms) opt.monitor.poll_interval = milliseconds(*cfg.progress_poll_interval_ms);
    if (cfg.grace_window_ms) opt.connectivity.grace_window = milliseconds(*cfg.grace_window_ms);
    if (cfg.grace_poll_interval_ms) opt.connectivity.poll_interval = milliseconds(*cfg.grace_poll_interval_ms);
    if (cfg.verify_chunk_bytes) opt.verify_chunk_bytes = static_cast<std::size_t>(*cfg.verify_chunk_bytes);
    return opt;
}

std::unique_ptr<otafetch::IConnectivitySource> MakeConnectivitySource(
    const otafetch::config::FetcherConfigFromFile &cfg) {
    if (cfg.route_watch_interval_ms && *cfg.route_watch_interval_ms == 0) {
        return std::make_unique<otafetch::ManualConnectivitySource>(otafetch::Network{.name = "local", .handle = 0});
    }
    otafetch::RouteTableConnectivitySource::Options opt;
    if (cfg.route_watch_interval_ms) {
        opt.poll_interval = std::chrono::milliseconds(*cfg.route_watch_interval_ms);
    }
    return std::make_unique<otafetch::RouteTableConnectivitySource>(opt);
}

// Waits for the observer, turning a signal into a Cancel command.
otafetch::ConsoleObserver::Outcome Await(otafetch::DownloadStateMachine &machine,
                                         otafetch::ConsoleObserver &observer) {
    const auto outcome = observer.WaitForOutcome(otafetch::g_cancel);
    if (outcome == otafetch::ConsoleObserver::Outcome::kNone) {
        LogWarn("Interrupted by signal %d, cancelling", otafetch::CancelSignal());
        machine.Cancel();
        if (!machine.WaitForCommands(std::chrono::seconds(10))) {
            LogWarn("Cancel did not complete in time");
        }
    }
    return outcome;
}

} // namespace

int main(int argc, char **argv) {
    if (!otafetch::InstallSignalHandlers()) {
        LogWarn("Signal handlers not fully installed; Ctrl-C may not cancel cleanly");
    }

    std::string config_path = otafetch::config::kDefaultConfigPath;
    bool config_from_cli = false;
    const char *metadata_cli = nullptr;
    const char *dir_cli = nullptr;
    bool download = false;
    bool delete_download = false;
    bool verbose = false;

    enum { kOptDownload = 1000, kOptDelete };

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"metadata", required_argument, nullptr, 'm'},
        {"download-dir", required_argument, nullptr, 'd'},
        {"download", no_argument, nullptr, kOptDownload},
        {"delete", no_argument, nullptr, kOptDelete},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:m:d:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                config_from_cli = true;
                break;

            case 'm':
                metadata_cli = optarg;
                break;

            case 'd':
                dir_cli = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case kOptDownload:
                download = true;
                break;

            case kOptDelete:
                delete_download = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind < argc || (download && delete_download)) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    otafetch::config::FetcherConfigFromFile cfg;
    const bool cfg_ok = cfg.LoadFile(config_path);
    if (!cfg_ok && (config_from_cli || !metadata_cli)) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", cfg.LastError().c_str());
        return kExitFailure;
    } else if (!cfg_ok) {
        std::fprintf(stderr, "WARN: cannot load config: %s (continuing due to -m)\n", cfg.LastError().c_str());
    }

    if (cfg.log_level) otafetch::Logger::Instance().SetLevel(*cfg.log_level);
    if (verbose) otafetch::Logger::Instance().SetLevel(otafetch::LogLevel::Debug);
    cfg.LogEffective();

    const std::string metadata_path = metadata_cli ? metadata_cli : cfg.metadata_path;
    if (metadata_path.empty()) {
        std::fprintf(stderr, "ERROR: no metadata file (set MetadataPath or use -m)\n");
        return kExitUsage;
    }

    otafetch::JsonSettingsStore settings(
        cfg.settings_path, cfg.download_directory.value_or(otafetch::kDefaultDownloadDirectory));
    if (dir_cli) {
        if (auto r = settings.SetDownloadDirectory(dir_cli); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailure;
        }
    }

    otafetch::JsonMetadataProvider metadata(metadata_path, cfg.current_version);

    otafetch::LocalTransferProvider::Options transfer_opt;
    if (cfg.throttle_bytes_per_sec) transfer_opt.throttle_bytes_per_sec = *cfg.throttle_bytes_per_sec;
    otafetch::LocalTransferProvider transfer(transfer_opt);

    auto connectivity = MakeConnectivitySource(cfg);
    auto observer = std::make_shared<otafetch::ConsoleObserver>();

    otafetch::DownloadStateMachine machine(metadata, transfer, *connectivity, settings, MachineOptions(cfg));
    machine.AttachObserver(observer);

    using Outcome = otafetch::ConsoleObserver::Outcome;

    machine.CheckForUpdate();
    Outcome outcome = Await(machine, *observer);

    int rc = kExitFailure;
    switch (outcome) {
        case Outcome::kNone:
        case Outcome::kCancelled:
            rc = kExitCancelled;
            break;

        case Outcome::kNoUpdate:
            rc = kExitOk;
            break;

        case Outcome::kVerifiedOk:
            // Already on disk from an earlier run.
            rc = kExitOk;
            break;

        case Outcome::kDescriptorFetched:
            if (download) {
                observer->ResetOutcome();
                machine.StartDownload();
                outcome = Await(machine, *observer);
                if (outcome == Outcome::kVerifiedOk) {
                    std::fprintf(stderr, "Saved to %s\n", machine.DestinationPath().c_str());
                    rc = kExitOk;
                } else if (outcome == Outcome::kNone || outcome == Outcome::kCancelled) {
                    rc = kExitCancelled;
                } else {
                    LogError("Download did not complete: %s", otafetch::ConsoleOutcomeName(outcome));
                }
            } else {
                rc = kExitOk;
            }
            break;

        default:
            LogDebug("Update check ended with %s", otafetch::ConsoleOutcomeName(outcome));
            break;
    }

    if (delete_download && rc == kExitOk && outcome != Outcome::kNoUpdate) {
        observer->ResetOutcome();
        machine.DeleteDownload();
        if (!machine.WaitForCommands(std::chrono::seconds(10)) ||
            observer->CurrentOutcome() == Outcome::kError) {
            rc = kExitFailure;
        }
    }

    machine.DetachObserver();
    machine.Shutdown();
    otafetch::ClearProgressLine();
    return rc;
}
