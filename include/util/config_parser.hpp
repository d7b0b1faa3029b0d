#pragma once

#include "util/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace otafetch::config {

inline constexpr const char* kDefaultConfigPath = "/etc/ota-fetcher/ota-fetcher.conf";
inline constexpr const char* kDefaultSettingsPath = "/var/lib/ota-fetcher/settings.json";
// Matches DownloadStateMachine::kMinWorkerThreads.
inline constexpr std::uint64_t kMinWorkerThreads = 4;

class FetcherConfigFromFile {
public:
    std::string metadata_path;
    std::string current_version = "0.0.0";
    std::string settings_path = kDefaultSettingsPath;

    std::optional<std::string> download_directory;
    std::optional<std::uint64_t> worker_threads;
    std::optional<std::uint64_t> progress_poll_interval_ms;
    std::optional<std::uint64_t> grace_window_ms;
    std::optional<std::uint64_t> grace_poll_interval_ms;
    std::optional<std::uint64_t> verify_chunk_bytes;
    std::optional<std::uint64_t> throttle_bytes_per_sec;
    std::optional<std::uint64_t> route_watch_interval_ms;
    std::optional<LogLevel> log_level;

    // On failure the reason is logged, kept in LastError() and the object
    // is left reset.
    bool LoadFile(const std::string &path);
    bool LoadString(const std::string &json_text);

    const std::string &LastError() const { return last_error_; }

    // Writes the effective settings at debug level.
    void LogEffective() const;

    void Reset();

private:
    std::string last_error_;
};

} // namespace otafetch::config
